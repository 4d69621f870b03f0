#include "dialogue-pipeline.h"

#include "audio-assembler.h"
#include "dtts-log.h"
#include "utf8-text.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>

using json = nlohmann::ordered_json;

namespace dialogue_tts {

static bool load_text_file(const std::string & path, std::string & out, error & err) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        err.set(ERROR_IO, "failed to open input file: " + path);
        return false;
    }
    out.assign((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!file.good() && !file.eof()) {
        err.set(ERROR_IO, "failed to read input file: " + path);
        return false;
    }
    // UTF-8 BOM
    if (out.size() >= 3 && (unsigned char) out[0] == 0xEF && (unsigned char) out[1] == 0xBB && (unsigned char) out[2] == 0xBF) {
        out.erase(0, 3);
    }
    return true;
}

static bool fail_run(run_report & report, error_kind kind, const std::string & msg) {
    report.ok = false;
    report.err.set(kind, msg);
    DTTS_LOG_ERR("%s", msg.c_str());
    return false;
}

static void finish_report(const run_config & cfg, run_report & report) {
    if (cfg.processing.report_file.empty()) {
        return;
    }
    error err;
    if (!write_run_report(cfg.processing.report_file, report, err)) {
        DTTS_LOG_WRN("%s", err.message.c_str());
    } else {
        DTTS_LOG_INF("processing report saved to: %s", cfg.processing.report_file.c_str());
    }
}

bool bind_voices(std::vector<dialogue_segment> & segments, const voice_registry & registry, error & err) {
    for (auto & seg : segments) {
        voice_resolution res;
        if (!registry.resolve(seg.speaker, res, err)) {
            err.message = "segment " + std::to_string(seg.index) + ": " + err.message;
            return false;
        }
        if (res.match == VOICE_MATCH_FIRST_CHARACTER) {
            DTTS_LOG_WRN("no character or narrator found for '%s', using first character %s",
                    seg.speaker.c_str(), res.character_name.c_str());
        } else {
            DTTS_LOG_DBG("speaker '%s' -> %s (%s, spk_id=%d)", seg.speaker.c_str(), res.character_name.c_str(),
                    voice_match_name(res.match), res.voice.spk_id);
        }
        seg.voice = res.voice;
        seg.voice_bound = true;
    }
    return true;
}

bool run_dialogue(const run_config & cfg, const synthesis_engine_factory & factory, run_report & report) {
    report = run_report();
    report.input_file = cfg.input_file;
    report.output_file = cfg.output_file;

    if (cfg.input_file.empty()) {
        fail_run(report, ERROR_CONFIGURATION, "input_file is not configured");
        finish_report(cfg, report);
        return false;
    }

    std::string script;
    if (!load_text_file(cfg.input_file, script, report.err)) {
        fail_run(report, report.err.kind, report.err.message);
        finish_report(cfg, report);
        return false;
    }
    DTTS_LOG_INF("loaded dialogue from: %s (%zu characters)", cfg.input_file.c_str(), utf8_length(script));

    return run_dialogue_text(cfg, script, factory, report);
}

bool run_dialogue_text(
        const run_config & cfg,
        const std::string & script,
        const synthesis_engine_factory & factory,
        run_report & report) {
    const auto t_begin = std::chrono::steady_clock::now();
    report.ok = false;
    report.err.clear();
    report.input_file = cfg.input_file;
    report.output_file = cfg.output_file;

    auto done = [&](bool ok) {
        report.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t_begin).count();
        finish_report(cfg, report);
        return ok;
    };

    if (cfg.output_file.empty()) {
        fail_run(report, ERROR_CONFIGURATION, "output_file is not configured");
        return done(false);
    }

    voice_registry registry;
    if (!build_voice_registry(cfg, registry, report.err)) {
        fail_run(report, report.err.kind, report.err.message);
        return done(false);
    }

    std::vector<dialogue_segment> segments = parse_dialogue(script);
    report.n_segments = (int32_t) segments.size();
    if (segments.empty()) {
        fail_run(report, ERROR_PARSE, "no dialogue segments found, expected lines like 'Speaker: text' or 'Speaker：text'");
        return done(false);
    }

    DTTS_LOG_INF("parsed %zu dialogue segment(s):", segments.size());
    for (const auto & seg : segments) {
        DTTS_LOG_INF("  [%d] %s: %.60s", seg.index, seg.speaker.c_str(), seg.text.c_str());
    }

    if (!bind_voices(segments, registry, report.err)) {
        fail_run(report, report.err.kind, report.err.message);
        return done(false);
    }

    const std::string temp_dir = resolve_temp_dir(cfg);
    {
        std::error_code ec;
        std::filesystem::create_directories(temp_dir, ec);
        if (ec) {
            fail_run(report, ERROR_IO, "failed to create temp directory " + temp_dir + ": " + ec.message());
            return done(false);
        }
    }

    synthesis_batch_result batch;
    {
        synthesis_orchestrator orchestrator(make_orchestrator_params(cfg));
        if (!orchestrator.init(factory, report.err)) {
            fail_run(report, report.err.kind, report.err.message);
            return done(false);
        }
        batch = orchestrator.synthesize_all(segments);
    }

    report.outcomes = batch.outcomes;
    report.n_succeeded = batch.count(SEGMENT_SUCCEEDED);
    report.n_failed = batch.count(SEGMENT_FAILED);
    report.n_timed_out = batch.count(SEGMENT_TIMED_OUT);
    report.n_chunks = batch.total_chunks_succeeded();

    DTTS_LOG_INF("processing complete:");
    DTTS_LOG_INF("  successful segments: %d/%d", report.n_succeeded, report.n_segments);
    DTTS_LOG_INF("  failed segments: %d (timed out: %d)", report.n_failed + report.n_timed_out, report.n_timed_out);
    DTTS_LOG_INF("  total text chunks: %d", report.n_chunks);

    if (batch.succeeded.empty()) {
        fail_run(report, ERROR_SYNTHESIS, "no segments were successfully processed");
        return done(false);
    }

    if (!cfg.processing.cleanup_temp_files) {
        for (const auto & seg : batch.succeeded) {
            char name[48];
            std::snprintf(name, sizeof(name), "segment_%04d.wav", seg.index);
            error seg_err;
            if (!save_wav16((std::filesystem::path(temp_dir) / name).string(), seg.audio, seg_err)) {
                DTTS_LOG_WRN("%s", seg_err.message.c_str());
            }
        }
    }

    assembly_stats stats;
    if (!assemble_segments(batch.succeeded, cfg.processing.pause_between_speakers_ms, report.audio, report.err, &stats)) {
        fail_run(report, report.err.kind, report.err.message);
        return done(false);
    }
    report.n_pauses = stats.n_pauses;
    report.duration_sec = report.audio.duration_sec();

    if (!save_wav16(cfg.output_file, report.audio, report.err)) {
        fail_run(report, report.err.kind, report.err.message);
        return done(false);
    }

    if (cfg.processing.cleanup_temp_files) {
        error dir_err;
        if (!remove_temp_dir_if_empty(temp_dir, dir_err)) {
            DTTS_LOG_WRN("%s", dir_err.message.c_str());
        }
    }

    DTTS_LOG_INF("combined audio saved to: %s (%.2f sec)", cfg.output_file.c_str(), report.duration_sec);
    report.ok = true;
    return done(true);
}

std::string run_report_to_json(const run_report & report) {
    json j;
    j["ok"] = report.ok;
    if (!report.err.ok()) {
        j["error"] = {
            {"kind", error_kind_name(report.err.kind)},
            {"message", report.err.message},
        };
    }
    j["input_file"] = report.input_file;
    j["output_file"] = report.output_file;
    j["segments"] = report.n_segments;
    j["succeeded"] = report.n_succeeded;
    j["failed"] = report.n_failed;
    j["timed_out"] = report.n_timed_out;
    j["total_chunks"] = report.n_chunks;
    j["pauses"] = report.n_pauses;
    j["duration_sec"] = report.duration_sec;
    j["elapsed_ms"] = report.elapsed_ms;

    json outcomes = json::array();
    for (const auto & o : report.outcomes) {
        json e = {
            {"index", o.index},
            {"speaker", o.speaker},
            {"status", segment_status_name(o.status)},
            {"chunks", o.n_chunks},
            {"elapsed_ms", o.elapsed_ms},
        };
        if (o.error != ERROR_NONE) {
            e["error"] = error_kind_name(o.error);
            e["message"] = o.message;
        }
        outcomes.push_back(std::move(e));
    }
    j["outcomes"] = std::move(outcomes);
    return j.dump(2);
}

bool write_run_report(const std::string & path, const run_report & report, error & err) {
    std::string text;
    try {
        text = run_report_to_json(report);
    } catch (const std::exception & e) {
        // invalid UTF-8 in a speaker label makes dump() throw
        err.set(ERROR_IO, std::string("failed to serialize processing report: ") + e.what());
        return false;
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        err.set(ERROR_IO, "failed to open report file: " + path);
        return false;
    }
    file << text << "\n";
    if (!file.good()) {
        err.set(ERROR_IO, "failed while writing report file: " + path);
        return false;
    }
    return true;
}

bool remove_temp_dir_if_empty(const std::string & dir, error & err) {
    if (dir.empty()) {
        return true;
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return true;
    }
    if (!std::filesystem::is_empty(dir, ec) && !ec) {
        DTTS_LOG_DBG("temp directory %s is not empty, left in place", dir.c_str());
        return true;
    }
    if (!ec) {
        std::filesystem::remove(dir, ec);
    }
    if (ec) {
        err.set(ERROR_IO, "failed to remove temp directory " + dir + ": " + ec.message());
        return false;
    }
    return true;
}

bool test_character_voice(
        const voice_registry & registry,
        const std::string & name,
        const synthesis_engine_factory & factory,
        const std::string & output_dir,
        std::string & output_file,
        error & err) {
    const character * c = registry.find_character(name);
    if (c == nullptr) {
        err.set(ERROR_CONFIGURATION, "character '" + name + "' not found in configuration");
        return false;
    }

    DTTS_LOG_INF("testing voice for: %s", c->name.c_str());
    DTTS_LOG_INF("  gender: %s", c->gender.c_str());
    DTTS_LOG_INF("  speaker id: %d", c->voice.spk_id);
    std::string aliases;
    for (const auto & a : c->aliases) {
        aliases += (aliases.empty() ? "" : ", ") + a;
    }
    DTTS_LOG_INF("  aliases: %s", aliases.c_str());

    std::string engine_err;
    std::unique_ptr<synthesis_engine> engine = factory ? factory(0, engine_err) : nullptr;
    if (!engine) {
        err.set(ERROR_CONFIGURATION, engine_err.empty() ? "no synthesis engine" : engine_err);
        return false;
    }

    synthesis_request req;
    req.text = "你好，我是" + c->name + "，这是我的声音。";
    req.voice = c->voice;

    audio_fragment audio;
    std::string synth_err;
    if (!engine->synthesize(req, audio, synth_err)) {
        err.set(ERROR_SYNTHESIS, "test synthesis failed: " + synth_err);
        return false;
    }

    std::string file_name = c->name;
    for (char & ch : file_name) {
        if (ch == ' ' || ch == '/' || ch == '\\') {
            ch = '_';
        }
    }
    output_file = (std::filesystem::path(output_dir.empty() ? "." : output_dir) / ("test_" + file_name + ".wav")).string();
    if (!save_wav16(output_file, audio, err)) {
        return false;
    }

    DTTS_LOG_INF("test audio saved to: %s", output_file.c_str());
    return true;
}

} // namespace dialogue_tts
