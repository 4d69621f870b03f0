#include "dialogue-pipeline.h"
#include "dtts-log.h"
#include "http-synthesis-engine.h"
#include "run-config.h"
#include "voice-registry.h"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>
#include <string>

using namespace dialogue_tts;

struct cli_params {
    std::string config;

    std::string input;
    std::string output;
    std::string url;
    std::string report;
    std::string log_file;
    std::string test_voice;

    int32_t workers = -1;
    int32_t chunk_size = -1;
    int32_t pause_ms = -1;
    int32_t timeout_sec = -1;

    bool keep_temp = false;
    bool list_characters = false;
    bool verbose = false;
    bool show_help = false;
};

static void print_usage(const char * argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "  %s --config FNAME [options]\n\n"
        "Required:\n"
        "  -c, --config FNAME              character/run configuration JSON\n\n"
        "Modes:\n"
        "  --list-characters               print configured characters and exit\n"
        "  --test-voice NAME               synthesize a short sample for one character\n\n"
        "Overrides:\n"
        "  -i, --input FNAME               dialogue script (UTF-8)\n"
        "  -o, --output FNAME              output wav\n"
        "  -j, --workers N                 parallel synthesis workers (default: cores - 1)\n"
        "  --chunk-size N                  max characters per synthesis call (default: 200)\n"
        "  --pause-ms N                    silence between speakers (default: 300)\n"
        "  --timeout N                     per-segment timeout seconds (default: 120)\n"
        "  --url URL                       synthesis endpoint\n"
        "  --keep-temp                     keep per-segment wav files\n"
        "  --report FNAME                  write a JSON processing report\n\n"
        "Other:\n"
        "  --log-file FNAME                also append log lines to FNAME\n"
        "  -v, --verbose                   print debug log lines\n"
        "  -h, --help                      show this help\n",
        argv0);
}

static bool parse_i32(const char * s, int32_t & out) {
    if (s == nullptr) {
        return false;
    }
    char * end = nullptr;
    errno = 0;
    const long v = std::strtol(s, &end, 10);
    if (end == nullptr || *end != '\0' || end == s || errno == ERANGE || v < INT32_MIN || v > INT32_MAX) {
        return false;
    }
    out = (int32_t) v;
    return true;
}

static bool needs_value(int i, int argc) {
    return i + 1 < argc;
}

static bool parse_args(int argc, char ** argv, cli_params & p) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            p.show_help = true;
        } else if (arg == "-c" || arg == "--config") {
            if (!needs_value(i, argc)) return false;
            p.config = argv[++i];
        } else if (arg == "--list-characters") {
            p.list_characters = true;
        } else if (arg == "--test-voice") {
            if (!needs_value(i, argc)) return false;
            p.test_voice = argv[++i];
        } else if (arg == "-i" || arg == "--input") {
            if (!needs_value(i, argc)) return false;
            p.input = argv[++i];
        } else if (arg == "-o" || arg == "--output") {
            if (!needs_value(i, argc)) return false;
            p.output = argv[++i];
        } else if (arg == "-j" || arg == "--workers") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.workers) || p.workers < 0) return false;
        } else if (arg == "--chunk-size") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.chunk_size) || p.chunk_size <= 0) return false;
        } else if (arg == "--pause-ms") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.pause_ms) || p.pause_ms < 0) return false;
        } else if (arg == "--timeout") {
            if (!needs_value(i, argc) || !parse_i32(argv[++i], p.timeout_sec) || p.timeout_sec <= 0 ||
                p.timeout_sec > k_max_task_timeout_sec) return false;
        } else if (arg == "--url") {
            if (!needs_value(i, argc)) return false;
            p.url = argv[++i];
        } else if (arg == "--keep-temp") {
            p.keep_temp = true;
        } else if (arg == "--report") {
            if (!needs_value(i, argc)) return false;
            p.report = argv[++i];
        } else if (arg == "--log-file") {
            if (!needs_value(i, argc)) return false;
            p.log_file = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            p.verbose = true;
        } else {
            std::fprintf(stderr, "unknown argument: %s\n", arg.c_str());
            return false;
        }
    }

    if (!p.show_help && p.config.empty()) {
        std::fprintf(stderr, "--config is required\n");
        return false;
    }
    return true;
}

struct cli_log_sink {
    std::mutex mtx;
    FILE * file = nullptr;
    bool verbose = false;
};

static void log_callback_cli(log_level level, const char * text, void * user_data) {
    cli_log_sink * sink = (cli_log_sink *) user_data;
    if (level < LOG_LEVEL_INFO && !sink->verbose) {
        return;
    }

    std::lock_guard<std::mutex> lock(sink->mtx);
    std::fputs(text, stderr);
    if (sink->file != nullptr) {
        char ts[32] = {0};
        const std::time_t now = std::time(nullptr);
        std::tm tm_now {};
        localtime_r(&now, &tm_now);
        std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm_now);
        std::fprintf(sink->file, "%s - %s - %s", ts, log_level_name(level), text);
        std::fflush(sink->file);
    }
}

static void apply_overrides(const cli_params & p, run_config & cfg) {
    if (!p.input.empty()) {
        cfg.input_file = p.input;
    }
    if (!p.output.empty()) {
        cfg.output_file = p.output;
    }
    if (!p.url.empty()) {
        cfg.synthesis.url = p.url;
    }
    if (!p.report.empty()) {
        cfg.processing.report_file = p.report;
    }
    if (p.workers >= 0) {
        cfg.processing.max_workers = p.workers;
    }
    if (p.chunk_size > 0) {
        cfg.processing.chunk_size = p.chunk_size;
    }
    if (p.pause_ms >= 0) {
        cfg.processing.pause_between_speakers_ms = p.pause_ms;
    }
    if (p.timeout_sec > 0) {
        cfg.processing.task_timeout_sec = p.timeout_sec;
    }
    if (p.keep_temp) {
        cfg.processing.cleanup_temp_files = false;
    }
    cfg.synthesis.cleanup_temp_files = cfg.processing.cleanup_temp_files;
}

int main(int argc, char ** argv) {
    cli_params p;
    if (!parse_args(argc, argv, p)) {
        print_usage(argv[0]);
        return 1;
    }
    if (p.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    cli_log_sink sink;
    sink.verbose = p.verbose;
    if (!p.log_file.empty()) {
        sink.file = std::fopen(p.log_file.c_str(), "a");
        if (sink.file == nullptr) {
            std::fprintf(stderr, "failed to open log file: %s\n", p.log_file.c_str());
            return 1;
        }
    }
    log_set(log_callback_cli, &sink);

    auto finish = [&](int rc) {
        log_set(nullptr, nullptr);
        if (sink.file != nullptr) {
            std::fclose(sink.file);
        }
        return rc;
    };

    run_config cfg;
    error err;
    if (!load_run_config(p.config, cfg, err)) {
        DTTS_LOG_ERR("failed to load configuration: %s", err.message.c_str());
        return finish(1);
    }
    apply_overrides(p, cfg);

    voice_registry registry;
    if (!build_voice_registry(cfg, registry, err)) {
        DTTS_LOG_ERR("%s", err.message.c_str());
        return finish(1);
    }

    if (p.list_characters) {
        std::fputs(registry.format_listing().c_str(), stdout);
        return finish(0);
    }

    http_engine_params engine_params = cfg.synthesis;
    engine_params.temp_dir = resolve_temp_dir(cfg);
    const synthesis_engine_factory factory = make_http_engine_factory(engine_params);

    if (!p.test_voice.empty()) {
        std::string output_file;
        const bool ok = test_character_voice(registry, p.test_voice, factory, ".", output_file, err);
        if (!ok) {
            DTTS_LOG_ERR("%s", err.message.c_str());
        }
        if (cfg.processing.cleanup_temp_files) {
            error dir_err;
            if (!remove_temp_dir_if_empty(engine_params.temp_dir, dir_err)) {
                DTTS_LOG_WRN("%s", dir_err.message.c_str());
            }
        }
        return finish(ok ? 0 : 1);
    }

    run_report report;
    if (!run_dialogue(cfg, factory, report)) {
        DTTS_LOG_ERR("dialogue processing %s (%s error)",
                error_kind_is_fatal(report.err.kind) ? "aborted" : "failed", error_kind_name(report.err.kind));
        return finish(1);
    }
    return finish(0);
}
