#pragma once

#include "dtts-common.h"
#include "http-synthesis-engine.h"
#include "synthesis-orchestrator.h"
#include "voice-registry.h"

#include <cstdint>
#include <string>
#include <vector>

namespace dialogue_tts {

// Largest timeout whose millisecond value still fits an int32_t.
constexpr int32_t k_max_task_timeout_sec = INT32_MAX / 1000;

struct processing_params {
    int32_t max_workers = 0; // 0 means "hardware concurrency minus one"
    int32_t chunk_size = 200;
    int32_t pause_between_speakers_ms = 300;
    bool cleanup_temp_files = true;
    int32_t task_timeout_sec = 120;
    std::string temp_dir;    // default: <output dir>/temp_segments
    std::string report_file;
};

// Immutable after loading; every component receives the part it needs.
struct run_config {
    std::string config_path;
    std::string input_file;
    std::string output_file;

    http_engine_params synthesis;
    processing_params processing;

    std::vector<character> characters;
    bool has_narrator = false;
    character narrator;
};

bool load_run_config(const std::string & path, run_config & out, error & err);

// Relative input/output/report paths are resolved against `base_dir`.
bool parse_run_config(const std::string & text, const std::string & base_dir, run_config & out, error & err);

bool build_voice_registry(const run_config & cfg, voice_registry & out, error & err);

orchestrator_params make_orchestrator_params(const run_config & cfg);

// <output dir>/temp_segments unless processing.temp_dir is set.
std::string resolve_temp_dir(const run_config & cfg);

} // namespace dialogue_tts
