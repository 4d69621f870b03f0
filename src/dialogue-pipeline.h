#pragma once

#include "audio-fragment.h"
#include "dialogue-parser.h"
#include "dtts-common.h"
#include "run-config.h"
#include "synthesis-engine.h"
#include "synthesis-orchestrator.h"
#include "voice-registry.h"

#include <cstdint>
#include <string>
#include <vector>

namespace dialogue_tts {

struct run_report {
    bool ok = false;
    error err; // fatal or run-level failure

    std::string input_file;
    std::string output_file;

    int32_t n_segments = 0;
    int32_t n_succeeded = 0;
    int32_t n_failed = 0;
    int32_t n_timed_out = 0;
    int32_t n_chunks = 0;
    int32_t n_pauses = 0;
    double duration_sec = 0.0;
    double elapsed_ms = 0.0;

    std::vector<segment_outcome> outcomes;
    audio_fragment audio; // the assembled track, also written to output_file
};

// Binds a voice to every segment; fails only when the registry has nothing
// to fall back on.
bool bind_voices(std::vector<dialogue_segment> & segments, const voice_registry & registry, error & err);

// Full run: read, parse, bind, synthesize, assemble, write. Succeeds when
// at least one segment was synthesized and the output was written.
bool run_dialogue(const run_config & cfg, const synthesis_engine_factory & factory, run_report & report);

// Same as run_dialogue with the script already in memory.
bool run_dialogue_text(
        const run_config & cfg,
        const std::string & script,
        const synthesis_engine_factory & factory,
        run_report & report);

std::string run_report_to_json(const run_report & report);
bool write_run_report(const std::string & path, const run_report & report, error & err);

// Synthesizes a short self-introduction for one character and writes it to
// `<output_dir>/test_<name>.wav`.
// Removes a chunk directory once nothing is left in it. A missing or
// non-empty directory is not an error.
bool remove_temp_dir_if_empty(const std::string & dir, error & err);

bool test_character_voice(
        const voice_registry & registry,
        const std::string & name,
        const synthesis_engine_factory & factory,
        const std::string & output_dir,
        std::string & output_file,
        error & err);

} // namespace dialogue_tts
