#pragma once

#include "synthesis-engine.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <thread>

namespace dialogue_tts {

// Produces a constant-valued fragment per request. The sample value encodes the
// segment index so tests can check the order audio ends up in.
class fake_synthesis_engine : public synthesis_engine {
public:
    struct options {
        audio_format format;
        size_t frames_per_chunk = 2400;
        int32_t min_latency_ms = 0;
        int32_t max_latency_ms = 0;
        std::string fail_marker = "FAIL";
        std::string slow_marker = "SLOW";
        int32_t slow_ms = 0;
        std::atomic<int32_t> * calls = nullptr;
    };

    fake_synthesis_engine(const options & opts, uint32_t seed) : opts_(opts), rng_(seed) {}

    static float value_for(int32_t segment_index) {
        return 0.01f * (float) (segment_index + 1);
    }

    bool synthesize(const synthesis_request & req, audio_fragment & out, std::string & err) override {
        if (opts_.calls != nullptr) {
            opts_.calls->fetch_add(1);
        }

        int32_t delay_ms = opts_.min_latency_ms;
        if (opts_.max_latency_ms > opts_.min_latency_ms) {
            std::uniform_int_distribution<int32_t> dist(opts_.min_latency_ms, opts_.max_latency_ms);
            delay_ms = dist(rng_);
        }
        if (!opts_.slow_marker.empty() && req.text.find(opts_.slow_marker) != std::string::npos) {
            delay_ms = opts_.slow_ms;
        }
        if (delay_ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
        }

        if (!opts_.fail_marker.empty() && req.text.find(opts_.fail_marker) != std::string::npos) {
            err = "fake engine refused segment " + std::to_string(req.segment_index);
            return false;
        }

        out.format = opts_.format;
        out.samples.assign(opts_.frames_per_chunk * (size_t) opts_.format.channels, value_for(req.segment_index));
        return true;
    }

private:
    options opts_;
    std::mt19937 rng_;
};

inline synthesis_engine_factory make_fake_engine_factory(const fake_synthesis_engine::options & opts) {
    return [opts](int32_t worker_id, std::string & /* err */) -> std::unique_ptr<synthesis_engine> {
        return std::make_unique<fake_synthesis_engine>(opts, 1234u + (uint32_t) worker_id);
    };
}

inline voice_profile fake_voice(int32_t spk_id) {
    voice_profile v;
    v.spk_id = spk_id;
    return v;
}

} // namespace dialogue_tts
