#pragma once

#include "dialogue-parser.h"
#include "dtts-common.h"
#include "synthesis-engine.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dialogue_tts {

enum segment_status {
    SEGMENT_PENDING = 0,
    SEGMENT_CHUNKING,
    SEGMENT_DISPATCHED,
    SEGMENT_SUCCEEDED,
    SEGMENT_FAILED,
    SEGMENT_TIMED_OUT,
};

const char * segment_status_name(segment_status status);

struct segment_outcome {
    int32_t index = 0;
    std::string speaker;
    segment_status status = SEGMENT_PENDING;
    int32_t n_chunks = 0;
    error_kind error = ERROR_NONE;
    std::string message;
    double elapsed_ms = 0.0;
};

struct orchestrator_params {
    int32_t max_workers = 0; // 0 means "hardware concurrency minus one"
    int32_t chunk_size = 200;
    int32_t task_timeout_ms = 120000;
};

int32_t default_max_workers();

struct synthesis_batch_result {
    std::vector<dialogue_segment> succeeded; // ascending index, audio attached
    std::vector<segment_outcome> outcomes;   // one per input segment, ascending index

    int32_t count(segment_status status) const;
    int32_t total_chunks_succeeded() const;
};

// Fixed pool of workers, each owning one engine handle for its lifetime.
// Chunks go out through a task queue and come back through a completion
// channel; results are keyed by segment index, never by arrival order.
class synthesis_orchestrator {
public:
    explicit synthesis_orchestrator(const orchestrator_params & params);
    ~synthesis_orchestrator();

    synthesis_orchestrator(const synthesis_orchestrator &) = delete;
    synthesis_orchestrator & operator=(const synthesis_orchestrator &) = delete;

    // Creates one engine per worker on the calling thread, then starts the
    // workers. Fails if any engine cannot be created.
    bool init(const synthesis_engine_factory & factory, error & err);

    // Segments need a bound voice. A timed-out engine call keeps its worker
    // busy until it returns; its result is dropped.
    synthesis_batch_result synthesize_all(const std::vector<dialogue_segment> & segments);

    int32_t n_workers() const { return (int32_t) workers_.size(); }
    const orchestrator_params & params() const { return params_; }

private:
    struct chunk_task {
        uint64_t batch = 0;
        int32_t segment = 0; // position in the input vector
        int32_t chunk = 0;
        synthesis_request request;
    };

    struct chunk_event {
        uint64_t batch = 0;
        int32_t segment = 0;
        int32_t chunk = 0;
        bool started = false;
        bool ok = false;
        std::chrono::steady_clock::time_point time;
        audio_fragment audio;
        std::string err;
    };

    void worker_loop(int32_t worker_id, std::unique_ptr<synthesis_engine> engine);
    void drop_queued_locked(uint64_t batch, int32_t segment);

    orchestrator_params params_;
    std::vector<std::thread> workers_;

    std::mutex mtx_;
    std::condition_variable task_cv_;
    std::condition_variable event_cv_;
    std::deque<chunk_task> queue_;
    std::deque<chunk_event> events_;
    uint64_t batch_id_ = 0;
    bool stop_ = false;
};

} // namespace dialogue_tts
