#include "audio-assembler.h"

#include "dtts-log.h"

#include <algorithm>

namespace dialogue_tts {

bool assemble_segments(
        const std::vector<dialogue_segment> & segments,
        int32_t pause_ms,
        audio_fragment & out,
        error & err,
        assembly_stats * stats) {
    if (segments.empty()) {
        err.set(ERROR_SYNTHESIS, "no segments to combine");
        return false;
    }

    std::vector<const dialogue_segment *> ordered;
    ordered.reserve(segments.size());
    for (const auto & seg : segments) {
        ordered.push_back(&seg);
    }
    std::stable_sort(ordered.begin(), ordered.end(), [](const dialogue_segment * a, const dialogue_segment * b) {
        return a->index < b->index;
    });

    const audio_format ref = ordered.front()->audio.format;
    size_t total_samples = 0;
    for (const dialogue_segment * seg : ordered) {
        if (seg->audio.empty()) {
            err.set(ERROR_SYNTHESIS, "segment " + std::to_string(seg->index) + " has no audio");
            return false;
        }
        if (seg->audio.format != ref) {
            err.set(ERROR_FORMAT_MISMATCH,
                    "segment " + std::to_string(seg->index) + " (" + seg->speaker + ") is " +
                    audio_format_to_string(seg->audio.format) + ", expected " + audio_format_to_string(ref));
            return false;
        }
        total_samples += seg->audio.samples.size();
    }

    const audio_fragment pause = make_silence(ref, pause_ms);

    audio_fragment result;
    result.format = ref;
    result.samples.reserve(total_samples + pause.samples.size() * ordered.size());

    assembly_stats st;
    const std::string * prev_speaker = nullptr;
    for (const dialogue_segment * seg : ordered) {
        if (prev_speaker != nullptr && *prev_speaker != seg->speaker && !pause.empty()) {
            result.samples.insert(result.samples.end(), pause.samples.begin(), pause.samples.end());
            ++st.n_pauses;
        }
        result.samples.insert(result.samples.end(), seg->audio.samples.begin(), seg->audio.samples.end());
        prev_speaker = &seg->speaker;
        ++st.n_segments;
    }
    st.n_frames = result.n_frames();

    DTTS_LOG_INF("combined %d segment(s) with %d pause(s): %.2f sec", st.n_segments, st.n_pauses, result.duration_sec());

    out = std::move(result);
    if (stats != nullptr) {
        *stats = st;
    }
    return true;
}

} // namespace dialogue_tts
