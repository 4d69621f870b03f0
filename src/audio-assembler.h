#pragma once

#include "audio-fragment.h"
#include "dialogue-parser.h"
#include "dtts-common.h"

#include <cstdint>
#include <vector>

namespace dialogue_tts {

struct assembly_stats {
    int32_t n_segments = 0;
    int32_t n_pauses = 0;
    size_t n_frames = 0;
};

// Concatenates segment audio in ascending index order and inserts
// `pause_ms` of silence whenever the speaker changes. Every fragment must
// share the format of the first one (ERROR_FORMAT_MISMATCH otherwise).
// Inputs are left untouched.
bool assemble_segments(
        const std::vector<dialogue_segment> & segments,
        int32_t pause_ms,
        audio_fragment & out,
        error & err,
        assembly_stats * stats = nullptr);

} // namespace dialogue_tts
