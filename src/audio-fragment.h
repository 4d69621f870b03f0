#pragma once

#include "dtts-common.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace dialogue_tts {

struct audio_format {
    int32_t sample_rate     = 24000;
    int32_t channels        = 1;
    int32_t bits_per_sample = 16;

    bool operator==(const audio_format & other) const {
        return sample_rate == other.sample_rate &&
               channels == other.channels &&
               bits_per_sample == other.bits_per_sample;
    }
    bool operator!=(const audio_format & other) const {
        return !(*this == other);
    }
};

std::string audio_format_to_string(const audio_format & fmt);

// Interleaved float samples in [-1, 1].
struct audio_fragment {
    audio_format format;
    std::vector<float> samples;

    size_t n_frames() const;
    double duration_sec() const;
    bool empty() const { return samples.empty(); }
};

size_t silence_frames(int32_t sample_rate, int32_t duration_ms);

audio_fragment make_silence(const audio_format & fmt, int32_t duration_ms);

// Raw append. Formats must match unless `dst` holds no samples yet, in which
// case it adopts the format of `src`.
bool append_fragment(audio_fragment & dst, const audio_fragment & src, error & err);

// Decoded at the native rate and channel count.
bool load_wav_file(const std::string & path, audio_fragment & out, error & err);
bool load_wav_memory(const void * data, size_t size, audio_fragment & out, error & err);

// 16-bit PCM; creates the parent directory when missing.
bool save_wav16(const std::string & path, const audio_fragment & audio, error & err);

} // namespace dialogue_tts
