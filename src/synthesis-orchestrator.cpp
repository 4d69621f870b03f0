#include "synthesis-orchestrator.h"

#include "dtts-log.h"
#include "text-segmenter.h"

#include <algorithm>

namespace dialogue_tts {

namespace {

struct segment_progress {
    segment_status status = SEGMENT_PENDING;
    int32_t n_chunks = 0;
    int32_t n_done = 0;
    std::vector<audio_fragment> chunks;
    bool started = false;
    std::chrono::steady_clock::time_point t_dispatch;
    std::chrono::steady_clock::time_point t_start;
    std::chrono::steady_clock::time_point t_end;
    error_kind error = ERROR_NONE;
    std::string message;
};

static bool is_terminal(segment_status s) {
    return s == SEGMENT_SUCCEEDED || s == SEGMENT_FAILED || s == SEGMENT_TIMED_OUT;
}

static double ms_since(
        std::chrono::steady_clock::time_point begin,
        std::chrono::steady_clock::time_point end) {
    return std::chrono::duration<double, std::milli>(end - begin).count();
}

} // namespace

const char * segment_status_name(segment_status status) {
    switch (status) {
        case SEGMENT_PENDING:    return "pending";
        case SEGMENT_CHUNKING:   return "chunking";
        case SEGMENT_DISPATCHED: return "dispatched";
        case SEGMENT_SUCCEEDED:  return "succeeded";
        case SEGMENT_FAILED:     return "failed";
        case SEGMENT_TIMED_OUT:  return "timed_out";
    }
    return "unknown";
}

int32_t default_max_workers() {
    const unsigned hc = std::thread::hardware_concurrency();
    return hc > 1 ? (int32_t) hc - 1 : 1;
}

int32_t synthesis_batch_result::count(segment_status status) const {
    return (int32_t) std::count_if(outcomes.begin(), outcomes.end(), [status](const segment_outcome & o) {
        return o.status == status;
    });
}

int32_t synthesis_batch_result::total_chunks_succeeded() const {
    int32_t n = 0;
    for (const auto & o : outcomes) {
        if (o.status == SEGMENT_SUCCEEDED) {
            n += o.n_chunks;
        }
    }
    return n;
}

synthesis_orchestrator::synthesis_orchestrator(const orchestrator_params & params) : params_(params) {
    if (params_.max_workers <= 0) {
        params_.max_workers = default_max_workers();
    }
    params_.chunk_size = std::max<int32_t>(1, params_.chunk_size);
    params_.task_timeout_ms = std::max<int32_t>(1, params_.task_timeout_ms);
}

synthesis_orchestrator::~synthesis_orchestrator() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stop_ = true;
        queue_.clear();
    }
    task_cv_.notify_all();
    for (auto & t : workers_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

bool synthesis_orchestrator::init(const synthesis_engine_factory & factory, error & err) {
    if (!workers_.empty()) {
        err.set(ERROR_CONFIGURATION, "synthesis orchestrator is already initialized");
        return false;
    }
    if (!factory) {
        err.set(ERROR_CONFIGURATION, "no synthesis engine factory");
        return false;
    }

    std::vector<std::unique_ptr<synthesis_engine>> engines;
    engines.reserve((size_t) params_.max_workers);
    for (int32_t i = 0; i < params_.max_workers; ++i) {
        std::string engine_err;
        std::unique_ptr<synthesis_engine> engine = factory(i, engine_err);
        if (!engine) {
            err.set(ERROR_CONFIGURATION, engine_err.empty()
                    ? "worker[" + std::to_string(i) + "] engine init failed"
                    : engine_err);
            return false;
        }
        engines.push_back(std::move(engine));
    }

    workers_.reserve(engines.size());
    for (size_t i = 0; i < engines.size(); ++i) {
        workers_.emplace_back(&synthesis_orchestrator::worker_loop, this, (int32_t) i, std::move(engines[i]));
    }

    DTTS_LOG_INF("synthesis pool: %d worker(s), chunk_size=%d, task_timeout_ms=%d",
            params_.max_workers, params_.chunk_size, params_.task_timeout_ms);
    return true;
}

void synthesis_orchestrator::worker_loop(int32_t worker_id, std::unique_ptr<synthesis_engine> engine) {
    while (true) {
        chunk_task task;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            task_cv_.wait(lock, [&]() {
                return stop_ || !queue_.empty();
            });
            if (stop_) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();

            chunk_event ev;
            ev.batch = task.batch;
            ev.segment = task.segment;
            ev.chunk = task.chunk;
            ev.started = true;
            ev.time = std::chrono::steady_clock::now();
            events_.push_back(std::move(ev));
        }
        event_cv_.notify_all();

        chunk_event done;
        done.batch = task.batch;
        done.segment = task.segment;
        done.chunk = task.chunk;
        try {
            done.ok = engine->synthesize(task.request, done.audio, done.err);
        } catch (const std::exception & e) {
            done.ok = false;
            done.err = std::string("engine threw: ") + e.what();
        }
        if (done.ok && done.audio.empty()) {
            done.ok = false;
            done.err = "engine returned no audio";
        }
        done.time = std::chrono::steady_clock::now();

        DTTS_LOG_DBG("worker[%d] segment %d chunk %d %s", worker_id, task.request.segment_index,
                task.chunk, done.ok ? "done" : done.err.c_str());

        {
            std::lock_guard<std::mutex> lock(mtx_);
            events_.push_back(std::move(done));
        }
        event_cv_.notify_all();
    }
}

void synthesis_orchestrator::drop_queued_locked(uint64_t batch, int32_t segment) {
    queue_.erase(std::remove_if(queue_.begin(), queue_.end(), [&](const chunk_task & t) {
        return t.batch == batch && t.segment == segment;
    }), queue_.end());
}

synthesis_batch_result synthesis_orchestrator::synthesize_all(const std::vector<dialogue_segment> & segments) {
    synthesis_batch_result result;
    std::vector<segment_progress> progress(segments.size());
    const auto timeout = std::chrono::milliseconds(params_.task_timeout_ms);

    auto finish = [&](size_t k, segment_status status, error_kind kind, const std::string & msg) {
        progress[k].status = status;
        progress[k].error = kind;
        progress[k].message = msg;
        progress[k].t_end = std::chrono::steady_clock::now();
    };

    std::vector<chunk_task> tasks;
    const auto t_dispatch = std::chrono::steady_clock::now();
    for (size_t k = 0; k < segments.size(); ++k) {
        const dialogue_segment & seg = segments[k];
        segment_progress & p = progress[k];
        p.t_dispatch = t_dispatch;

        if (workers_.empty()) {
            finish(k, SEGMENT_FAILED, ERROR_CONFIGURATION, "synthesis orchestrator is not initialized");
            continue;
        }
        if (!seg.voice_bound) {
            finish(k, SEGMENT_FAILED, ERROR_CONFIGURATION, "no voice bound to segment");
            continue;
        }

        p.status = SEGMENT_CHUNKING;
        const std::vector<std::string> chunks = segment_text(seg.text, params_.chunk_size);
        if (chunks.empty()) {
            finish(k, SEGMENT_FAILED, ERROR_SYNTHESIS, "segment has no text to synthesize");
            continue;
        }

        p.n_chunks = (int32_t) chunks.size();
        p.chunks.resize(chunks.size());
        for (size_t c = 0; c < chunks.size(); ++c) {
            chunk_task t;
            t.segment = (int32_t) k;
            t.chunk = (int32_t) c;
            t.request.text = chunks[c];
            t.request.voice = seg.voice;
            t.request.segment_index = seg.index;
            t.request.chunk_index = (int32_t) c;
            tasks.push_back(std::move(t));
        }
        p.status = SEGMENT_DISPATCHED;
    }

    size_t remaining = 0;
    for (const auto & p : progress) {
        if (p.status == SEGMENT_DISPATCHED) {
            ++remaining;
        }
    }

    if (!tasks.empty()) {
        DTTS_LOG_INF("dispatching %zu chunk(s) from %zu segment(s) to %d worker(s)",
                tasks.size(), remaining, n_workers());
    }

    std::unique_lock<std::mutex> lock(mtx_);
    const uint64_t batch = ++batch_id_;
    for (auto & t : tasks) {
        t.batch = batch;
        queue_.push_back(std::move(t));
    }
    task_cv_.notify_all();

    while (remaining > 0) {
        bool have_deadline = false;
        std::chrono::steady_clock::time_point deadline;
        for (const auto & p : progress) {
            if (p.status == SEGMENT_DISPATCHED && p.started) {
                const auto d = p.t_start + timeout;
                if (!have_deadline || d < deadline) {
                    deadline = d;
                    have_deadline = true;
                }
            }
        }

        if (events_.empty()) {
            if (have_deadline) {
                event_cv_.wait_until(lock, deadline);
            } else {
                event_cv_.wait(lock);
            }
        }

        while (!events_.empty()) {
            chunk_event ev = std::move(events_.front());
            events_.pop_front();
            if (ev.batch != batch) {
                continue; // abandoned call from an earlier batch
            }

            const size_t k = (size_t) ev.segment;
            segment_progress & p = progress[k];
            if (is_terminal(p.status)) {
                continue;
            }

            if (ev.started) {
                if (!p.started) {
                    p.started = true;
                    p.t_start = ev.time;
                }
                continue;
            }

            if (!ev.ok) {
                finish(k, SEGMENT_FAILED, ERROR_SYNTHESIS, ev.err);
                drop_queued_locked(batch, ev.segment);
                --remaining;
                continue;
            }

            p.chunks[(size_t) ev.chunk] = std::move(ev.audio);
            if (++p.n_done < p.n_chunks) {
                continue;
            }

            audio_fragment merged;
            error merge_err;
            bool merged_ok = true;
            for (const auto & c : p.chunks) {
                if (!append_fragment(merged, c, merge_err)) {
                    merged_ok = false;
                    break;
                }
            }
            if (!merged_ok) {
                finish(k, SEGMENT_FAILED, ERROR_FORMAT_MISMATCH, merge_err.message);
            } else {
                finish(k, SEGMENT_SUCCEEDED, ERROR_NONE, "");
                p.chunks.clear();
                p.chunks.push_back(std::move(merged));
            }
            --remaining;
        }

        const auto now = std::chrono::steady_clock::now();
        for (size_t k = 0; k < progress.size(); ++k) {
            segment_progress & p = progress[k];
            if (p.status == SEGMENT_DISPATCHED && p.started && now >= p.t_start + timeout) {
                finish(k, SEGMENT_TIMED_OUT, ERROR_TIMEOUT,
                        "no result within " + std::to_string(params_.task_timeout_ms) + " ms");
                drop_queued_locked(batch, (int32_t) k);
                --remaining;
            }
        }
    }
    lock.unlock();

    result.outcomes.reserve(segments.size());
    for (size_t k = 0; k < segments.size(); ++k) {
        const dialogue_segment & seg = segments[k];
        segment_progress & p = progress[k];

        segment_outcome o;
        o.index = seg.index;
        o.speaker = seg.speaker;
        o.status = p.status;
        o.n_chunks = p.n_chunks;
        o.error = p.error;
        o.message = p.message;
        o.elapsed_ms = ms_since(p.started ? p.t_start : p.t_dispatch, p.t_end);

        if (p.status == SEGMENT_SUCCEEDED) {
            DTTS_LOG_INF("segment %d: %s ok (%d chunk(s), %.0f ms)", o.index, o.speaker.c_str(), o.n_chunks, o.elapsed_ms);
            dialogue_segment done = seg;
            done.audio = std::move(p.chunks.front());
            result.succeeded.push_back(std::move(done));
        } else if (p.status == SEGMENT_TIMED_OUT) {
            DTTS_LOG_ERR("segment %d: %s timed out: %s", o.index, o.speaker.c_str(), o.message.c_str());
        } else {
            DTTS_LOG_ERR("segment %d: %s failed: %s", o.index, o.speaker.c_str(), o.message.c_str());
        }
        result.outcomes.push_back(std::move(o));
    }

    std::sort(result.succeeded.begin(), result.succeeded.end(), [](const dialogue_segment & a, const dialogue_segment & b) {
        return a.index < b.index;
    });
    std::sort(result.outcomes.begin(), result.outcomes.end(), [](const segment_outcome & a, const segment_outcome & b) {
        return a.index < b.index;
    });

    return result;
}

} // namespace dialogue_tts
