#include "dialogue-pipeline.h"

#include "mock-synthesis-engine.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "catch2/catch.hpp"

namespace dialogue_tts {

static run_config make_two_character_config(const std::filesystem::path & dir) {
    run_config cfg;
    cfg.input_file = (dir / "dialogue.txt").string();
    cfg.output_file = (dir / "out" / "dialogue.wav").string();

    character naomi;
    naomi.name = "Naomi";
    naomi.aliases = {"娜奥米"};
    naomi.voice = fake_voice(66);
    character holden;
    holden.name = "Holden";
    holden.voice = fake_voice(12);
    cfg.characters = {naomi, holden};

    cfg.processing.max_workers = 2;
    cfg.processing.pause_between_speakers_ms = 100;
    return cfg;
}

TEST_CASE("dialogue pipeline", "[integration]") {
    const auto dir = std::filesystem::temp_directory_path() / "dtts-test-pipeline";
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    run_config cfg = make_two_character_config(dir);

    fake_synthesis_engine::options opts;
    opts.frames_per_chunk = 2400;
    opts.min_latency_ms = 1;
    opts.max_latency_ms = 60;

    run_report report;

    SECTION("segments come out in script order whatever order workers finish in") {
        {
            std::ofstream f(cfg.input_file);
            f << "Naomi：我们到哪儿了？\n"
                 "Holden：在罗西南特号上。\n"
                 "娜奥米：那就好。\n"
                 "Holden: Let's go.\n";
        }
        cfg.processing.report_file = (dir / "report.json").string();

        REQUIRE(run_dialogue(cfg, make_fake_engine_factory(opts), report));
        REQUIRE(report.ok);
        REQUIRE(report.n_segments == 4);
        REQUIRE(report.n_succeeded == 4);
        REQUIRE(report.n_chunks == 4);
        REQUIRE(report.n_pauses == 3);

        const size_t pause = silence_frames(24000, 100);
        REQUIRE(report.audio.n_frames() == 4 * 2400 + 3 * pause);
        for (int32_t i = 0; i < 4; ++i) {
            const size_t start = (size_t) i * (2400 + pause);
            REQUIRE(report.audio.samples[start] == fake_synthesis_engine::value_for(i));
            REQUIRE(report.audio.samples[start + 2399] == fake_synthesis_engine::value_for(i));
        }

        audio_fragment written;
        error err;
        REQUIRE(load_wav_file(cfg.output_file, written, err));
        REQUIRE(written.n_frames() == report.audio.n_frames());
        REQUIRE_FALSE(std::filesystem::exists(resolve_temp_dir(cfg)));

        std::ifstream rf(cfg.processing.report_file);
        const nlohmann::ordered_json j = nlohmann::ordered_json::parse(rf);
        REQUIRE(j.at("ok") == true);
        REQUIRE(j.at("succeeded") == 4);
        REQUIRE(j.at("outcomes").size() == 4);
        REQUIRE(j.at("outcomes")[2].at("speaker") == "娜奥米");
    }

    SECTION("failed segments are skipped and per-segment files kept on request") {
        {
            std::ofstream f(cfg.input_file);
            f << "Naomi：first.\nHolden：FAIL here.\nNaomi：third.\n";
        }
        cfg.processing.cleanup_temp_files = false;

        REQUIRE(run_dialogue(cfg, make_fake_engine_factory(opts), report));
        REQUIRE(report.n_succeeded == 2);
        REQUIRE(report.n_failed == 1);
        REQUIRE(report.n_pauses == 0);
        REQUIRE(report.audio.n_frames() == 2 * 2400);
        REQUIRE(std::filesystem::exists(std::filesystem::path(resolve_temp_dir(cfg)) / "segment_0000.wav"));
        REQUIRE(std::filesystem::exists(std::filesystem::path(resolve_temp_dir(cfg)) / "segment_0002.wav"));
    }

    SECTION("a run where nothing succeeds writes no output") {
        REQUIRE_FALSE(run_dialogue_text(cfg, "Naomi: FAIL.\nHolden: FAIL too.", make_fake_engine_factory(opts), report));
        REQUIRE(report.err.kind == ERROR_SYNTHESIS);
        REQUIRE(report.n_failed == 2);
        REQUIRE_FALSE(std::filesystem::exists(cfg.output_file));
    }

    SECTION("scripts without labels are parse errors") {
        REQUIRE_FALSE(run_dialogue_text(cfg, "no speakers here.", make_fake_engine_factory(opts), report));
        REQUIRE(report.err.kind == ERROR_PARSE);
    }

    SECTION("a missing script is an io error") {
        REQUIRE_FALSE(run_dialogue(cfg, make_fake_engine_factory(opts), report));
        REQUIRE(report.err.kind == ERROR_IO);
    }

    SECTION("unknown speakers fall back to the first character") {
        std::vector<dialogue_segment> segs = parse_dialogue("Amos: hey.\nNaomi: hi.");
        voice_registry registry;
        error err;
        REQUIRE(build_voice_registry(cfg, registry, err));
        REQUIRE(bind_voices(segs, registry, err));
        REQUIRE(segs[0].voice_bound);
        REQUIRE(segs[0].voice.spk_id == 66);
        REQUIRE(segs[1].voice.spk_id == 66);
    }

    SECTION("a character voice can be tested on its own") {
        voice_registry registry;
        error err;
        REQUIRE(build_voice_registry(cfg, registry, err));

        std::string output_file;
        REQUIRE(test_character_voice(registry, "Holden", make_fake_engine_factory(opts), dir.string(), output_file, err));
        REQUIRE(std::filesystem::path(output_file).filename() == "test_Holden.wav");
        REQUIRE(std::filesystem::exists(output_file));

        REQUIRE_FALSE(test_character_voice(registry, "Bobbie", make_fake_engine_factory(opts), dir.string(), output_file, err));
        REQUIRE(err.kind == ERROR_CONFIGURATION);
    }

    SECTION("empty chunk directories are removed after a voice test") {
        voice_registry registry;
        error err;
        REQUIRE(build_voice_registry(cfg, registry, err));

        const std::string temp_dir = resolve_temp_dir(cfg);
        std::filesystem::create_directories(temp_dir);

        std::string output_file;
        REQUIRE(test_character_voice(registry, "Naomi", make_fake_engine_factory(opts), dir.string(), output_file, err));
        REQUIRE(remove_temp_dir_if_empty(temp_dir, err));
        REQUIRE_FALSE(std::filesystem::exists(temp_dir));

        // missing directories are fine, directories with files are kept
        REQUIRE(remove_temp_dir_if_empty(temp_dir, err));
        std::filesystem::create_directories(temp_dir);
        std::ofstream((std::filesystem::path(temp_dir) / "segment_0000_chunk_000.wav").string()) << "x";
        REQUIRE(remove_temp_dir_if_empty(temp_dir, err));
        REQUIRE(std::filesystem::exists(temp_dir));
    }

    std::filesystem::remove_all(dir);
}

} // namespace dialogue_tts
