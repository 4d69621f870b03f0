#include "http-synthesis-engine.h"

#include <cpp-httplib/httplib.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "catch2/catch.hpp"

using json = nlohmann::ordered_json;

namespace dialogue_tts {

namespace {

// Minimal stand-in for a tts server: writes the requested output_file,
// streams wav bytes, or fails, depending on the route.
class fake_tts_server {
public:
    fake_tts_server() {
        svr_.Post("/mio/tts", [this](const httplib::Request & req, httplib::Response & res) {
            const json body = json::parse(req.body);
            {
                std::lock_guard<std::mutex> lock(mtx_);
                requests_.push_back(body);
                auth_.push_back(req.get_header_value("Authorization"));
            }
            error err;
            if (!save_wav16(body.at("output_file").get<std::string>(), tone(), err)) {
                res.status = 500;
                res.set_content(json{{"ok", false}, {"error", {{"message", err.message}}}}.dump(), "application/json");
                return;
            }
            res.set_content(json{{"ok", true}, {"output_file", body.at("output_file")}, {"sample_rate", 24000}}.dump(),
                    "application/json");
        });
        // reports a file it wrote somewhere the client never asked for
        svr_.Post("/elsewhere", [](const httplib::Request &, httplib::Response & res) {
            const std::string foreign = foreign_path();
            error err;
            save_wav16(foreign, tone(), err);
            res.set_content(json{{"ok", true}, {"output_file", foreign}}.dump(), "application/json");
        });
        svr_.Post("/raw", [this](const httplib::Request &, httplib::Response & res) {
            res.set_content(wav_bytes_, "audio/wav");
        });
        svr_.Post("/fail", [](const httplib::Request &, httplib::Response & res) {
            res.status = 503;
            res.set_content(R"({"ok":false,"error":{"message":"model not loaded"}})", "application/json");
        });

        const auto path = std::filesystem::temp_directory_path() / "dtts-test-http-tone.wav";
        error err;
        save_wav16(path.string(), tone(), err);
        std::ifstream f(path, std::ios::binary);
        wav_bytes_.assign((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        std::filesystem::remove(path);

        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this]() {
            svr_.listen_after_bind();
        });
    }

    ~fake_tts_server() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    static std::string foreign_path() {
        return (std::filesystem::temp_directory_path() / "dtts-test-http-foreign.wav").string();
    }

    static audio_fragment tone() {
        audio_fragment a;
        a.samples.assign(1200, 0.25f);
        return a;
    }

    std::string url(const std::string & path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<json> requests() {
        std::lock_guard<std::mutex> lock(mtx_);
        return requests_;
    }

    std::vector<std::string> auth() {
        std::lock_guard<std::mutex> lock(mtx_);
        return auth_;
    }

private:
    httplib::Server svr_;
    std::thread thread_;
    int port_ = 0;
    std::string wav_bytes_;

    std::mutex mtx_;
    std::vector<json> requests_;
    std::vector<std::string> auth_;
};

} // namespace

TEST_CASE("synthesis url parsing", "[unit]") {
    parsed_http_url u;
    std::string err;

    REQUIRE(parse_http_url("http://127.0.0.1:18089/mio/tts", u, err));
    REQUIRE_FALSE(u.https);
    REQUIRE(u.host == "127.0.0.1");
    REQUIRE(u.port == 18089);
    REQUIRE(u.path == "/mio/tts");

    REQUIRE(parse_http_url("HTTPS://tts.example.com", u, err));
    REQUIRE(u.https);
    REQUIRE(u.port == 443);
    REQUIRE(u.path == "/");

    REQUIRE_FALSE(parse_http_url("ftp://example.com/x", u, err));
    REQUIRE_FALSE(parse_http_url("http://host:99999/", u, err));
}

TEST_CASE("http synthesis engine", "[integration]") {
    fake_tts_server server;

    const auto temp_dir = std::filesystem::temp_directory_path() / "dtts-test-http";
    std::filesystem::remove_all(temp_dir);
    std::filesystem::create_directories(temp_dir);

    http_engine_params params;
    params.temp_dir = temp_dir.string();
    params.timeout_sec = 5;

    synthesis_request req;
    req.text = "你好。";
    req.voice.spk_id = 42;
    req.segment_index = 3;
    req.chunk_index = 1;

    audio_fragment out;
    std::string err;

    SECTION("json responses point at a written file that is loaded and removed") {
        params.url = server.url("/mio/tts");
        params.api_key = "token";
        http_synthesis_engine engine(params);
        REQUIRE(engine.init(err));

        REQUIRE(engine.synthesize(req, out, err));
        REQUIRE(out.n_frames() == 1200);
        REQUIRE(out.format.sample_rate == 24000);

        const auto requests = server.requests();
        REQUIRE(requests.size() == 1);
        REQUIRE(requests[0].at("text") == "你好。");
        REQUIRE(requests[0].at("reference_key") == "spk_42");
        REQUIRE(requests[0].at("spk_id") == 42);
        const std::string written = requests[0].at("output_file").get<std::string>();
        REQUIRE(std::filesystem::path(written).filename() == "segment_0003_chunk_001.wav");
        REQUIRE_FALSE(std::filesystem::exists(written));
        REQUIRE(server.auth()[0] == "Bearer token");
    }

    SECTION("chunk files are kept when cleanup is off") {
        params.url = server.url("/mio/tts");
        params.cleanup_temp_files = false;
        req.voice.reference_key = "naomi";
        http_synthesis_engine engine(params);
        REQUIRE(engine.init(err));

        REQUIRE(engine.synthesize(req, out, err));
        REQUIRE(server.requests()[0].at("reference_key") == "naomi");
        REQUIRE(std::filesystem::exists(engine.chunk_output_path(req)));
    }

    SECTION("files outside the request and temp dir are never removed") {
        std::filesystem::remove(fake_tts_server::foreign_path());
        params.url = server.url("/elsewhere");
        http_synthesis_engine engine(params);
        REQUIRE(engine.init(err));

        REQUIRE(engine.synthesize(req, out, err));
        REQUIRE(out.n_frames() == 1200);
        REQUIRE(std::filesystem::exists(fake_tts_server::foreign_path()));
        std::filesystem::remove(fake_tts_server::foreign_path());

        REQUIRE(engine.owns_chunk_file(engine.chunk_output_path(req), engine.chunk_output_path(req)));
        REQUIRE(engine.owns_chunk_file((temp_dir / "other.wav").string(), engine.chunk_output_path(req)));
        REQUIRE_FALSE(engine.owns_chunk_file((temp_dir / ".." / "escape.wav").string(), engine.chunk_output_path(req)));
        REQUIRE_FALSE(engine.owns_chunk_file("/etc/passwd", engine.chunk_output_path(req)));
    }

    SECTION("audio responses are decoded directly") {
        params.url = server.url("/raw");
        http_synthesis_engine engine(params);
        REQUIRE(engine.init(err));

        REQUIRE(engine.synthesize(req, out, err));
        REQUIRE(out.n_frames() == 1200);
    }

    SECTION("server errors carry the reported message") {
        params.url = server.url("/fail");
        http_synthesis_engine engine(params);
        REQUIRE(engine.init(err));

        REQUIRE_FALSE(engine.synthesize(req, out, err));
        REQUIRE(err.find("503") != std::string::npos);
        REQUIRE(err.find("model not loaded") != std::string::npos);
    }

    SECTION("unreachable endpoints fail the request") {
        params.url = "http://127.0.0.1:1/mio/tts";
        params.timeout_sec = 1;
        http_synthesis_engine engine(params);
        REQUIRE(engine.init(err));

        REQUIRE_FALSE(engine.synthesize(req, out, err));
        REQUIRE(err.find("synthesis request failed") == 0);
    }

    SECTION("the factory rejects bad urls") {
        params.url = "not a url";
        std::string ferr;
        REQUIRE(make_http_engine_factory(params)(0, ferr) == nullptr);
        REQUIRE(ferr.find("worker[0]") == 0);
    }

    std::filesystem::remove_all(temp_dir);
}

} // namespace dialogue_tts
