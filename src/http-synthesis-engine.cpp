#include "http-synthesis-engine.h"

#include "dtts-log.h"

#include <cpp-httplib/httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <regex>

using json = nlohmann::ordered_json;

namespace dialogue_tts {

static bool ieq_ascii(std::string a, std::string b) {
    if (a.size() != b.size()) {
        return false;
    }
    std::transform(a.begin(), a.end(), a.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
    });
    std::transform(b.begin(), b.end(), b.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
    });
    return a == b;
}

static void headers_upsert_ci(httplib::Headers & headers, const std::string & key, const std::string & value) {
    for (auto it = headers.begin(); it != headers.end();) {
        if (ieq_ascii(it->first, key)) {
            it = headers.erase(it);
        } else {
            ++it;
        }
    }
    headers.emplace(key, value);
}

static bool headers_find_ci(const httplib::Headers & headers, const std::string & key, std::string * value_out = nullptr) {
    for (const auto & kv : headers) {
        if (ieq_ascii(kv.first, key)) {
            if (value_out != nullptr) {
                *value_out = kv.second;
            }
            return true;
        }
    }
    return false;
}

static std::string truncate_text(const std::string & s, size_t max_len = 240) {
    if (s.size() <= max_len) {
        return s;
    }
    return s.substr(0, max_len) + "...";
}

static std::string error_from_response_body(const std::string & body) {
    try {
        const json j = json::parse(body);
        const auto it_err = j.find("error");
        if (it_err != j.end()) {
            if (it_err->is_string()) {
                return it_err->get<std::string>();
            }
            if (it_err->is_object()) {
                const auto it_msg = it_err->find("message");
                if (it_msg != it_err->end() && it_msg->is_string()) {
                    return it_msg->get<std::string>();
                }
            }
        }
    } catch (const std::exception &) {
        // not JSON, fall through to the raw body
    }
    return truncate_text(body);
}

bool parse_http_url(const std::string & raw, parsed_http_url & out, std::string & err) {
    static const std::regex re(R"(^(https?)://([^/:?#]+)(?::([0-9]+))?([^?#]*)?(\?[^#]*)?$)", std::regex::icase);
    std::smatch m;
    if (!std::regex_match(raw, m, re)) {
        err = "invalid synthesis url: " + raw;
        return false;
    }

    std::string scheme = m[1].str();
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char c) {
        return (char) std::tolower(c);
    });

    out.https = scheme == "https";
    out.host = m[2].str();
    out.port = out.https ? 443 : 80;
    if (m[3].matched && !m[3].str().empty()) {
        char * end = nullptr;
        const long p = std::strtol(m[3].str().c_str(), &end, 10);
        if (end == nullptr || *end != '\0' || p < 1 || p > 65535) {
            err = "invalid port in synthesis url: " + raw;
            return false;
        }
        out.port = (int32_t) p;
    }
    out.path = m[4].matched ? m[4].str() : "/";
    if (out.path.empty()) {
        out.path = "/";
    }
    if (m[5].matched) {
        out.path += m[5].str();
    }
    return true;
}

// Only files this engine asked for, or files under its temp dir, may be
// removed; the server decides which path it reports back.
bool http_synthesis_engine::owns_chunk_file(const std::string & written, const std::string & requested) const {
    try {
        const std::filesystem::path w = std::filesystem::absolute(written).lexically_normal();
        if (w == std::filesystem::absolute(requested).lexically_normal()) {
            return true;
        }
        if (params_.temp_dir.empty()) {
            return false;
        }
        const std::filesystem::path dir = std::filesystem::absolute(params_.temp_dir).lexically_normal();
        const std::filesystem::path rel = w.lexically_relative(dir);
        return !rel.empty() && rel != "." && *rel.begin() != "..";
    } catch (const std::exception &) {
        return false;
    }
}

http_synthesis_engine::http_synthesis_engine(const http_engine_params & params) : params_(params) {}

http_synthesis_engine::~http_synthesis_engine() = default;

bool http_synthesis_engine::init(std::string & err) {
    if (!parse_http_url(params_.url, endpoint_, err)) {
        return false;
    }

    if (endpoint_.https) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        client_ = std::make_unique<httplib::SSLClient>(endpoint_.host, endpoint_.port);
#else
        err = "https URL requires CPPHTTPLIB_OPENSSL_SUPPORT";
        return false;
#endif
    } else {
        client_ = std::make_unique<httplib::ClientImpl>(endpoint_.host, endpoint_.port);
    }

    const int32_t timeout = std::max<int32_t>(1, params_.timeout_sec);
    client_->set_follow_location(true);
    client_->set_keep_alive(true);
    client_->set_connection_timeout(timeout, 0);
    client_->set_read_timeout(timeout, 0);
    client_->set_write_timeout(timeout, 0);
    return true;
}

std::string http_synthesis_engine::chunk_output_path(const synthesis_request & req) const {
    char name[64];
    std::snprintf(name, sizeof(name), "segment_%04d_chunk_%03d.wav", req.segment_index, req.chunk_index);
    std::filesystem::path dir(params_.temp_dir.empty() ? std::filesystem::temp_directory_path() : std::filesystem::path(params_.temp_dir));
    return std::filesystem::absolute(dir / name).string();
}

bool http_synthesis_engine::synthesize(const synthesis_request & req, audio_fragment & out, std::string & err) {
    if (!client_) {
        err = "synthesis engine is not initialized";
        return false;
    }

    std::string output_file;
    try {
        output_file = chunk_output_path(req);
    } catch (const std::exception & e) {
        err = std::string("failed to build chunk output path: ") + e.what();
        return false;
    }

    const std::string reference_key = req.voice.reference_key.empty()
            ? "spk_" + std::to_string(req.voice.spk_id)
            : req.voice.reference_key;

    json body;
    body["text"] = req.text;
    body["reference_key"] = reference_key;
    body["output_file"] = output_file;
    body["am"] = req.voice.am;
    body["voc"] = req.voice.voc;
    body["spk_id"] = req.voice.spk_id;
    body["seed"] = params_.seed;

    httplib::Headers headers;
    for (const auto & kv : params_.headers) {
        headers_upsert_ci(headers, kv.first, kv.second);
    }
    if (!params_.api_key.empty() && !headers_find_ci(headers, "Authorization")) {
        headers_upsert_ci(headers, "Authorization", "Bearer " + params_.api_key);
    }
    std::string content_type = "application/json";
    headers_find_ci(headers, "Content-Type", &content_type);
    for (auto it = headers.begin(); it != headers.end();) {
        if (ieq_ascii(it->first, "Content-Type")) {
            it = headers.erase(it);
        } else {
            ++it;
        }
    }

    const std::string payload = body.dump();
    httplib::Result res = client_->Post(endpoint_.path.c_str(), headers, payload, content_type.c_str());
    if (!res) {
        err = "synthesis request failed: " + httplib::to_string(res.error());
        return false;
    }
    if (res->status < 200 || res->status >= 300) {
        err = "synthesis server returned HTTP " + std::to_string(res->status) + ": " + error_from_response_body(res->body);
        return false;
    }

    const std::string rsp_type = res->get_header_value("Content-Type");
    if (rsp_type.rfind("audio/", 0) == 0 || rsp_type.rfind("application/octet-stream", 0) == 0) {
        error load_err;
        if (!load_wav_memory(res->body.data(), res->body.size(), out, load_err)) {
            err = "failed to decode synthesized audio: " + load_err.message;
            return false;
        }
        return true;
    }

    std::string written_file;
    try {
        const json rsp = json::parse(res->body);
        if (!rsp.value("ok", false)) {
            err = "synthesis server reported failure: " + error_from_response_body(res->body);
            return false;
        }
        written_file = rsp.value("output_file", output_file);
    } catch (const std::exception & e) {
        err = std::string("invalid synthesis response JSON: ") + e.what();
        return false;
    }

    error load_err;
    const bool loaded = load_wav_file(written_file, out, load_err);
    if (params_.cleanup_temp_files && owns_chunk_file(written_file, output_file)) {
        std::error_code ec;
        std::filesystem::remove(written_file, ec);
        if (ec) {
            DTTS_LOG_WRN("failed to remove chunk file %s: %s", written_file.c_str(), ec.message().c_str());
        }
    }
    if (!loaded) {
        err = "failed to load synthesized audio: " + load_err.message;
        return false;
    }
    return true;
}

synthesis_engine_factory make_http_engine_factory(const http_engine_params & params) {
    return [params](int32_t worker_id, std::string & err) -> std::unique_ptr<synthesis_engine> {
        auto engine = std::make_unique<http_synthesis_engine>(params);
        if (!engine->init(err)) {
            err = "worker[" + std::to_string(worker_id) + "] engine init failed: " + err;
            return nullptr;
        }
        return engine;
    };
}

} // namespace dialogue_tts
