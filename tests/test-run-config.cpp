#include "run-config.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "catch2/catch.hpp"

namespace dialogue_tts {

static const char * k_full_config = R"({
  "input_file": "scripts/dialogue.txt",
  "output_file": "out/dialogue.wav",
  "synthesis": {
    "url": "http://127.0.0.1:9000/mio/tts",
    "api_key": "secret",
    "headers": {"X-Extra": "1"},
    "timeout_sec": 30,
    "seed": 7
  },
  "characters": [
    {"name": "Naomi", "aliases": ["娜奥米", "Nagata"], "gender": "female",
     "voice_profile": {"am": "fastspeech2_aishell3", "voc": "hifigan_aishell3", "spk_id": 66, "reference_key": "naomi"}},
    {"name": "Amos", "gender": "male", "voice_profile": {"spk_id": 12}}
  ],
  "default_narrator": {"gender": "male", "voice_profile": {"spk_id": 3}},
  "processing": {
    "max_workers": 2, "chunk_size": 120, "pause_between_speakers_ms": 250,
    "cleanup_temp_files": false, "task_timeout_sec": 45
  }
})";

TEST_CASE("run configuration", "[unit]") {
    run_config cfg;
    error err;

    SECTION("a full document is parsed and paths are resolved") {
        REQUIRE(parse_run_config(k_full_config, "/data/project", cfg, err));

        REQUIRE(cfg.input_file == "/data/project/scripts/dialogue.txt");
        REQUIRE(cfg.output_file == "/data/project/out/dialogue.wav");

        REQUIRE(cfg.synthesis.url == "http://127.0.0.1:9000/mio/tts");
        REQUIRE(cfg.synthesis.api_key == "secret");
        REQUIRE(cfg.synthesis.headers.size() == 1);
        REQUIRE(cfg.synthesis.headers[0].first == "X-Extra");
        REQUIRE(cfg.synthesis.timeout_sec == 30);
        REQUIRE(cfg.synthesis.seed == 7);
        REQUIRE_FALSE(cfg.synthesis.cleanup_temp_files);

        REQUIRE(cfg.characters.size() == 2);
        REQUIRE(cfg.characters[0].name == "Naomi");
        REQUIRE(cfg.characters[0].aliases.size() == 2);
        REQUIRE(cfg.characters[0].voice.spk_id == 66);
        REQUIRE(cfg.characters[0].voice.reference_key == "naomi");
        REQUIRE(cfg.characters[1].voice.am == "fastspeech2_aishell3");
        REQUIRE(cfg.characters[1].voice.voc == "hifigan_aishell3");

        REQUIRE(cfg.has_narrator);
        REQUIRE(cfg.narrator.name == "Narrator");
        REQUIRE(cfg.narrator.voice.spk_id == 3);

        REQUIRE(cfg.processing.max_workers == 2);
        REQUIRE(cfg.processing.chunk_size == 120);
        REQUIRE(cfg.processing.pause_between_speakers_ms == 250);
        REQUIRE(cfg.processing.task_timeout_sec == 45);

        const orchestrator_params op = make_orchestrator_params(cfg);
        REQUIRE(op.max_workers == 2);
        REQUIRE(op.chunk_size == 120);
        REQUIRE(op.task_timeout_ms == 45000);

        REQUIRE(std::filesystem::path(resolve_temp_dir(cfg)) ==
                std::filesystem::path("/data/project/out/temp_segments"));

        voice_registry registry;
        REQUIRE(build_voice_registry(cfg, registry, err));
        REQUIRE(registry.characters().size() == 2);
        REQUIRE(registry.narrator() != nullptr);
    }

    SECTION("defaults apply when blocks are missing") {
        REQUIRE(parse_run_config(R"({"characters": [{"name": "A"}]})", "", cfg, err));
        REQUIRE(cfg.processing.max_workers == 0);
        REQUIRE(cfg.processing.chunk_size == 200);
        REQUIRE(cfg.processing.pause_between_speakers_ms == 300);
        REQUIRE(cfg.processing.cleanup_temp_files);
        REQUIRE(cfg.characters[0].voice.spk_id == 0);
        REQUIRE_FALSE(cfg.has_narrator);
    }

    SECTION("missing characters is a configuration error") {
        REQUIRE_FALSE(parse_run_config(R"({"input_file": "x.txt"})", "", cfg, err));
        REQUIRE(err.kind == ERROR_CONFIGURATION);
    }

    SECTION("malformed documents are configuration errors") {
        REQUIRE_FALSE(parse_run_config("{not json", "", cfg, err));
        REQUIRE(err.kind == ERROR_CONFIGURATION);

        err.clear();
        REQUIRE_FALSE(parse_run_config(R"({"characters": [{"name": "A", "voice_profile": {"spk_id": "x"}}]})", "", cfg, err));
        REQUIRE(err.kind == ERROR_CONFIGURATION);

        err.clear();
        REQUIRE_FALSE(parse_run_config(R"({"characters": [], "processing": {"chunk_size": 0}})", "", cfg, err));
        REQUIRE(err.kind == ERROR_CONFIGURATION);
    }

    SECTION("timeouts too large for millisecond arithmetic are rejected") {
        REQUIRE_FALSE(parse_run_config(R"({"characters": [], "processing": {"task_timeout_sec": 2592000}})", "", cfg, err));
        REQUIRE(err.kind == ERROR_CONFIGURATION);

        err.clear();
        REQUIRE_FALSE(parse_run_config(R"({"characters": [], "processing": {"task_timeout_sec": 100000000000}})", "", cfg, err));
        REQUIRE(err.kind == ERROR_CONFIGURATION);

        err.clear();
        REQUIRE(parse_run_config(R"({"characters": [], "processing": {"task_timeout_sec": 2147483}})", "", cfg, err));
        REQUIRE(make_orchestrator_params(cfg).task_timeout_ms == 2147483000);

        // values set directly (e.g. from the command line) are clamped, never wrapped
        cfg.processing.task_timeout_sec = 2592000;
        REQUIRE(make_orchestrator_params(cfg).task_timeout_ms == INT32_MAX);
    }

    SECTION("duplicate character names are rejected") {
        REQUIRE(parse_run_config(R"({"characters": [{"name": "A"}, {"name": "A"}]})", "", cfg, err));
        voice_registry registry;
        REQUIRE_FALSE(build_voice_registry(cfg, registry, err));
        REQUIRE(err.kind == ERROR_CONFIGURATION);
    }

    SECTION("an empty cast without narrator is rejected") {
        REQUIRE(parse_run_config(R"({"characters": []})", "", cfg, err));
        voice_registry registry;
        REQUIRE_FALSE(build_voice_registry(cfg, registry, err));
        REQUIRE(err.kind == ERROR_CONFIGURATION);
    }

    SECTION("a missing file is an io error") {
        REQUIRE_FALSE(load_run_config("/nonexistent/dtts/config.json", cfg, err));
        REQUIRE(err.kind == ERROR_IO);
    }

    SECTION("files resolve paths against their own directory") {
        const auto dir = std::filesystem::temp_directory_path() / "dtts-test-config";
        std::filesystem::create_directories(dir);
        const auto path = dir / "characters.json";
        {
            std::ofstream f(path);
            f << k_full_config;
        }
        REQUIRE(load_run_config(path.string(), cfg, err));
        REQUIRE(std::filesystem::path(cfg.input_file) == (dir / "scripts" / "dialogue.txt").lexically_normal());
        REQUIRE(cfg.config_path == path.string());
        std::filesystem::remove_all(dir);
    }
}

} // namespace dialogue_tts
