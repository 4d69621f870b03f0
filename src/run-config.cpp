#include "run-config.h"

#include "dtts-log.h"
#include "utf8-text.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

using json = nlohmann::ordered_json;

namespace dialogue_tts {

static bool get_json_string(const json & j, const char * key, std::string & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_string()) {
        throw std::runtime_error(std::string("field '") + key + "' must be string");
    }
    out = it->get<std::string>();
    return true;
}

template<typename T>
static bool get_json_number(const json & j, const char * key, T & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_number()) {
        throw std::runtime_error(std::string("field '") + key + "' must be number");
    }
    out = it->get<T>();
    return true;
}

static bool get_json_bool(const json & j, const char * key, bool & out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return false;
    }
    if (!it->is_boolean()) {
        throw std::runtime_error(std::string("field '") + key + "' must be bool");
    }
    out = it->get<bool>();
    return true;
}

static std::string resolve_path(const std::string & base_dir, const std::string & p) {
    if (p.empty() || base_dir.empty()) {
        return p;
    }
    const std::filesystem::path path(p);
    if (path.is_absolute()) {
        return p;
    }
    return (std::filesystem::path(base_dir) / path).lexically_normal().string();
}

static voice_profile parse_voice_profile(const json & owner, const std::string & gender, const std::string & description) {
    voice_profile v;
    v.gender = gender;
    v.description = description;

    auto it = owner.find("voice_profile");
    if (it == owner.end() || it->is_null()) {
        return v;
    }
    if (!it->is_object()) {
        throw std::runtime_error("field 'voice_profile' must be object");
    }
    get_json_string(*it, "am", v.am);
    get_json_string(*it, "voc", v.voc);
    get_json_number(*it, "spk_id", v.spk_id);
    get_json_string(*it, "reference_key", v.reference_key);
    return v;
}

static character parse_character(const json & j, size_t idx) {
    if (!j.is_object()) {
        throw std::runtime_error("characters[" + std::to_string(idx) + "] must be object");
    }

    character c;
    if (!get_json_string(j, "name", c.name) || trim_copy(c.name).empty()) {
        throw std::runtime_error("characters[" + std::to_string(idx) + "] requires string field 'name'");
    }
    get_json_string(j, "gender", c.gender);
    get_json_string(j, "description", c.description);

    auto it_aliases = j.find("aliases");
    if (it_aliases != j.end() && !it_aliases->is_null()) {
        if (!it_aliases->is_array()) {
            throw std::runtime_error("characters[" + std::to_string(idx) + "].aliases must be array");
        }
        for (const auto & a : *it_aliases) {
            if (!a.is_string()) {
                throw std::runtime_error("characters[" + std::to_string(idx) + "].aliases must hold strings");
            }
            c.aliases.push_back(a.get<std::string>());
        }
    }

    c.voice = parse_voice_profile(j, c.gender, c.description);
    return c;
}

static void parse_synthesis_block(const json & j, http_engine_params & out) {
    if (!j.is_object()) {
        throw std::runtime_error("field 'synthesis' must be object");
    }
    get_json_string(j, "url", out.url);
    get_json_string(j, "api_key", out.api_key);
    get_json_number(j, "timeout_sec", out.timeout_sec);
    get_json_number(j, "seed", out.seed);

    auto it = j.find("headers");
    if (it == j.end() || it->is_null()) {
        return;
    }
    if (!it->is_object()) {
        throw std::runtime_error("field 'synthesis.headers' must be object");
    }
    for (auto h = it->begin(); h != it->end(); ++h) {
        const std::string key = trim_copy(h.key());
        if (key.empty()) {
            throw std::runtime_error("synthesis.headers contains empty header name");
        }
        if (!h.value().is_string()) {
            throw std::runtime_error("synthesis.headers['" + key + "'] must be string");
        }
        out.headers.emplace_back(key, h.value().get<std::string>());
    }
}

static void parse_processing_block(const json & j, processing_params & out) {
    if (!j.is_object()) {
        throw std::runtime_error("field 'processing' must be object");
    }
    get_json_number(j, "max_workers", out.max_workers);
    get_json_number(j, "chunk_size", out.chunk_size);
    get_json_number(j, "pause_between_speakers_ms", out.pause_between_speakers_ms);
    get_json_bool(j, "cleanup_temp_files", out.cleanup_temp_files);
    int64_t timeout_sec = out.task_timeout_sec;
    get_json_number(j, "task_timeout_sec", timeout_sec);
    get_json_string(j, "temp_dir", out.temp_dir);
    get_json_string(j, "report_file", out.report_file);

    if (out.max_workers < 0) {
        throw std::runtime_error("processing.max_workers must be >= 0");
    }
    if (out.chunk_size < 1) {
        throw std::runtime_error("processing.chunk_size must be >= 1");
    }
    if (out.pause_between_speakers_ms < 0) {
        throw std::runtime_error("processing.pause_between_speakers_ms must be >= 0");
    }
    if (timeout_sec < 1 || timeout_sec > k_max_task_timeout_sec) {
        throw std::runtime_error("processing.task_timeout_sec must be in [1, " + std::to_string(k_max_task_timeout_sec) + "]");
    }
    out.task_timeout_sec = (int32_t) timeout_sec;
}

bool parse_run_config(const std::string & text, const std::string & base_dir, run_config & out, error & err) {
    run_config cfg;
    try {
        const json j = json::parse(text);
        if (!j.is_object()) {
            err.set(ERROR_CONFIGURATION, "configuration must be a JSON object");
            return false;
        }

        get_json_string(j, "input_file", cfg.input_file);
        get_json_string(j, "output_file", cfg.output_file);

        auto it_synth = j.find("synthesis");
        if (it_synth != j.end() && !it_synth->is_null()) {
            parse_synthesis_block(*it_synth, cfg.synthesis);
        }

        auto it_proc = j.find("processing");
        if (it_proc != j.end() && !it_proc->is_null()) {
            parse_processing_block(*it_proc, cfg.processing);
        }

        auto it_chars = j.find("characters");
        if (it_chars == j.end() || !it_chars->is_array()) {
            err.set(ERROR_CONFIGURATION, "configuration requires array field 'characters'");
            return false;
        }
        for (size_t i = 0; i < it_chars->size(); ++i) {
            cfg.characters.push_back(parse_character((*it_chars)[i], i));
        }

        auto it_narrator = j.find("default_narrator");
        if (it_narrator != j.end() && !it_narrator->is_null()) {
            if (!it_narrator->is_object()) {
                throw std::runtime_error("field 'default_narrator' must be object");
            }
            if (!it_narrator->empty()) {
                std::string gender = "unknown";
                get_json_string(*it_narrator, "gender", gender);
                cfg.narrator = make_default_narrator(parse_voice_profile(*it_narrator, gender, ""), gender);
                cfg.has_narrator = true;
            }
        }
    } catch (const std::exception & e) {
        err.set(ERROR_CONFIGURATION, std::string("invalid configuration: ") + e.what());
        return false;
    }

    try {
        cfg.input_file = resolve_path(base_dir, cfg.input_file);
        cfg.output_file = resolve_path(base_dir, cfg.output_file);
        cfg.processing.report_file = resolve_path(base_dir, cfg.processing.report_file);
        cfg.processing.temp_dir = resolve_path(base_dir, cfg.processing.temp_dir);
    } catch (const std::exception & e) {
        err.set(ERROR_CONFIGURATION, std::string("invalid path in configuration: ") + e.what());
        return false;
    }
    cfg.synthesis.cleanup_temp_files = cfg.processing.cleanup_temp_files;

    out = std::move(cfg);
    return true;
}

bool load_run_config(const std::string & path, run_config & out, error & err) {
    std::ifstream file(path);
    if (!file) {
        err.set(ERROR_IO, "failed to open configuration file: " + path);
        return false;
    }
    const std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (!file.good() && !file.eof()) {
        err.set(ERROR_IO, "failed to read configuration file: " + path);
        return false;
    }

    const std::string base_dir = std::filesystem::path(path).parent_path().string();
    if (!parse_run_config(text, base_dir, out, err)) {
        err.message += " (" + path + ")";
        return false;
    }
    out.config_path = path;

    DTTS_LOG_INF("loaded %zu character(s)%s from %s", out.characters.size(),
            out.has_narrator ? " and a default narrator" : "", path.c_str());
    return true;
}

bool build_voice_registry(const run_config & cfg, voice_registry & out, error & err) {
    voice_registry reg;
    for (const auto & c : cfg.characters) {
        if (!reg.add_character(c, err)) {
            return false;
        }
        DTTS_LOG_DBG("character: %s (spk_id=%d, %zu alias(es))", c.name.c_str(), c.voice.spk_id, c.aliases.size());
    }
    if (cfg.has_narrator) {
        reg.set_narrator(cfg.narrator);
    }
    if (reg.characters().empty() && reg.narrator() == nullptr) {
        err.set(ERROR_CONFIGURATION, "configuration defines no characters and no default narrator");
        return false;
    }
    out = std::move(reg);
    return true;
}

orchestrator_params make_orchestrator_params(const run_config & cfg) {
    orchestrator_params p;
    p.max_workers = cfg.processing.max_workers;
    p.chunk_size = cfg.processing.chunk_size;
    const int64_t timeout_ms = (int64_t) cfg.processing.task_timeout_sec * 1000;
    p.task_timeout_ms = (int32_t) std::clamp<int64_t>(timeout_ms, 1, INT32_MAX);
    return p;
}

std::string resolve_temp_dir(const run_config & cfg) {
    if (!cfg.processing.temp_dir.empty()) {
        return cfg.processing.temp_dir;
    }
    const std::filesystem::path out(cfg.output_file);
    const std::filesystem::path dir = out.has_parent_path() ? out.parent_path() : std::filesystem::path(".");
    return (dir / "temp_segments").string();
}

} // namespace dialogue_tts
