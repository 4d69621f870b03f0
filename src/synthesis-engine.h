#pragma once

#include "audio-fragment.h"
#include "voice-registry.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace dialogue_tts {

struct synthesis_request {
    std::string text;
    voice_profile voice;
    int32_t segment_index = 0;
    int32_t chunk_index = 0;
};

// One handle per worker thread; implementations need not be thread-safe.
class synthesis_engine {
public:
    virtual ~synthesis_engine() = default;

    virtual bool synthesize(const synthesis_request & req, audio_fragment & out, std::string & err) = 0;
};

typedef std::function<std::unique_ptr<synthesis_engine>(int32_t worker_id, std::string & err)> synthesis_engine_factory;

} // namespace dialogue_tts
