#pragma once

#include "synthesis-engine.h"

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace httplib {
class ClientImpl;
}

namespace dialogue_tts {

struct http_engine_params {
    std::string url = "http://127.0.0.1:18089/mio/tts";
    std::string api_key;
    std::vector<std::pair<std::string, std::string>> headers;
    int32_t timeout_sec = 120;
    uint32_t seed = 0;

    // Directory the server writes chunk files into; it must see the same
    // filesystem as this process when the server answers with JSON.
    std::string temp_dir;
    bool cleanup_temp_files = true;
};

struct parsed_http_url {
    bool https = false;
    std::string host;
    int32_t port = 0;
    std::string path = "/";
};

bool parse_http_url(const std::string & raw, parsed_http_url & out, std::string & err);

// Talks to a Mio TTS server (`/mio/tts`, `/v1/audio/speech`) or anything
// that accepts the same JSON body. WAV bodies are decoded directly; JSON
// bodies must name the written `output_file`.
class http_synthesis_engine : public synthesis_engine {
public:
    explicit http_synthesis_engine(const http_engine_params & params);
    ~http_synthesis_engine() override;

    http_synthesis_engine(const http_synthesis_engine &) = delete;
    http_synthesis_engine & operator=(const http_synthesis_engine &) = delete;

    bool init(std::string & err);

    bool synthesize(const synthesis_request & req, audio_fragment & out, std::string & err) override;

    std::string chunk_output_path(const synthesis_request & req) const;

    bool owns_chunk_file(const std::string & written, const std::string & requested) const;

private:
    http_engine_params params_;
    parsed_http_url endpoint_;
    std::unique_ptr<httplib::ClientImpl> client_;
};

synthesis_engine_factory make_http_engine_factory(const http_engine_params & params);

} // namespace dialogue_tts
