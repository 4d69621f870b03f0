#include "audio-fragment.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>

#define MINIAUDIO_IMPLEMENTATION
#define MA_NO_ENCODING
#define MA_NO_DEVICE_IO
#define MA_NO_RESOURCE_MANAGER
#define MA_NO_NODE_GRAPH
#define MA_NO_ENGINE
#define MA_NO_GENERATION
#define MA_API static
#include "miniaudio/miniaudio.h"

namespace dialogue_tts {

namespace {

struct wav_header {
    char riff[4] = {'R', 'I', 'F', 'F'};
    uint32_t chunk_size = 0;
    char wave[4] = {'W', 'A', 'V', 'E'};
    char fmt[4] = {'f', 'm', 't', ' '};
    uint32_t fmt_chunk_size = 16;
    uint16_t audio_format = 1;
    uint16_t num_channels = 1;
    uint32_t sample_rate = 0;
    uint32_t byte_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits_per_sample = 16;
    char data[4] = {'d', 'a', 't', 'a'};
    uint32_t data_size = 0;
};

static int32_t bits_for_format(ma_format format) {
    switch (format) {
        case ma_format_u8:  return 8;
        case ma_format_s16: return 16;
        case ma_format_s24: return 24;
        case ma_format_s32: return 32;
        case ma_format_f32: return 32;
        default:            return 0;
    }
}

static bool decode_all(ma_decoder & decoder, audio_fragment & out, std::string & err) {
    ma_format format = ma_format_unknown;
    ma_uint32 channels = 0;
    ma_uint32 sample_rate = 0;
    ma_result result = ma_decoder_get_data_format(&decoder, &format, &channels, &sample_rate, nullptr, 0);
    if (result != MA_SUCCESS || channels == 0 || sample_rate == 0) {
        err = "ma_decoder_get_data_format failed";
        return false;
    }

    const ma_uint32 bytes_per_frame = ma_get_bytes_per_frame(format, channels);
    if (bytes_per_frame == 0) {
        err = "unsupported sample format";
        return false;
    }

    const ma_uint64 block_frames = 4096;
    std::vector<uint8_t> block((size_t) (block_frames * bytes_per_frame));
    std::vector<float> converted((size_t) (block_frames * channels));

    out.samples.clear();
    while (true) {
        ma_uint64 frames_read = 0;
        result = ma_decoder_read_pcm_frames(&decoder, block.data(), block_frames, &frames_read);
        if (frames_read > 0) {
            const ma_uint64 n_samples = frames_read * channels;
            ma_pcm_convert(converted.data(), ma_format_f32, block.data(), format, n_samples, ma_dither_mode_none);
            out.samples.insert(out.samples.end(), converted.begin(), converted.begin() + (size_t) n_samples);
        }
        if (result != MA_SUCCESS && result != MA_AT_END) {
            err = "ma_decoder_read_pcm_frames failed";
            return false;
        }
        if (result == MA_AT_END || frames_read < block_frames) {
            break;
        }
    }

    if (out.samples.empty()) {
        err = "audio contains no frames";
        return false;
    }

    out.format.sample_rate = (int32_t) sample_rate;
    out.format.channels = (int32_t) channels;
    out.format.bits_per_sample = bits_for_format(format);
    return true;
}

} // namespace

std::string audio_format_to_string(const audio_format & fmt) {
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%d Hz, %d ch, %d bit", fmt.sample_rate, fmt.channels, fmt.bits_per_sample);
    return buf;
}

size_t audio_fragment::n_frames() const {
    return format.channels > 0 ? samples.size() / (size_t) format.channels : 0;
}

double audio_fragment::duration_sec() const {
    return format.sample_rate > 0 ? (double) n_frames() / (double) format.sample_rate : 0.0;
}

size_t silence_frames(int32_t sample_rate, int32_t duration_ms) {
    if (sample_rate <= 0 || duration_ms <= 0) {
        return 0;
    }
    return (size_t) std::llround((double) sample_rate * (double) duration_ms / 1000.0);
}

audio_fragment make_silence(const audio_format & fmt, int32_t duration_ms) {
    audio_fragment out;
    out.format = fmt;
    out.samples.assign(silence_frames(fmt.sample_rate, duration_ms) * (size_t) std::max(1, fmt.channels), 0.0f);
    return out;
}

bool append_fragment(audio_fragment & dst, const audio_fragment & src, error & err) {
    if (dst.samples.empty()) {
        dst.format = src.format;
    } else if (dst.format != src.format) {
        err.set(ERROR_FORMAT_MISMATCH,
                "audio format mismatch: " + audio_format_to_string(dst.format) +
                " vs " + audio_format_to_string(src.format));
        return false;
    }
    dst.samples.insert(dst.samples.end(), src.samples.begin(), src.samples.end());
    return true;
}

bool load_wav_file(const std::string & path, audio_fragment & out, error & err) {
    ma_decoder_config config = ma_decoder_config_init(ma_format_unknown, 0, 0);
    ma_decoder decoder;
    if (ma_decoder_init_file(path.c_str(), &config, &decoder) != MA_SUCCESS) {
        err.set(ERROR_IO, "ma_decoder_init_file failed: " + path);
        return false;
    }

    std::string decode_err;
    const bool ok = decode_all(decoder, out, decode_err);
    ma_decoder_uninit(&decoder);
    if (!ok) {
        err.set(ERROR_IO, decode_err + ": " + path);
        return false;
    }
    return true;
}

bool load_wav_memory(const void * data, size_t size, audio_fragment & out, error & err) {
    if (data == nullptr || size == 0) {
        err.set(ERROR_IO, "audio buffer is empty");
        return false;
    }

    ma_decoder_config config = ma_decoder_config_init(ma_format_unknown, 0, 0);
    ma_decoder decoder;
    if (ma_decoder_init_memory(data, size, &config, &decoder) != MA_SUCCESS) {
        err.set(ERROR_IO, "ma_decoder_init_memory failed");
        return false;
    }

    std::string decode_err;
    const bool ok = decode_all(decoder, out, decode_err);
    ma_decoder_uninit(&decoder);
    if (!ok) {
        err.set(ERROR_IO, decode_err);
        return false;
    }
    return true;
}

bool save_wav16(const std::string & path, const audio_fragment & audio, error & err) {
    if (path.empty()) {
        err.set(ERROR_IO, "output wav path is empty");
        return false;
    }
    if (audio.format.sample_rate <= 0 || audio.format.channels <= 0) {
        err.set(ERROR_IO, "invalid audio format: " + audio_format_to_string(audio.format));
        return false;
    }

    const std::filesystem::path out_path(path);
    if (out_path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(out_path.parent_path(), ec);
        if (ec) {
            err.set(ERROR_IO, "failed to create directory " + out_path.parent_path().string() + ": " + ec.message());
            return false;
        }
    }

    std::ofstream file(path, std::ios::binary);
    if (!file) {
        err.set(ERROR_IO, "failed to open output wav file: " + path);
        return false;
    }

    wav_header header;
    header.num_channels = (uint16_t) audio.format.channels;
    header.sample_rate = (uint32_t) audio.format.sample_rate;
    header.block_align = (uint16_t) (header.num_channels * (header.bits_per_sample / 8));
    header.byte_rate = header.sample_rate * header.block_align;
    header.data_size = (uint32_t) (audio.samples.size() * (header.bits_per_sample / 8));
    header.chunk_size = 36 + header.data_size;

    file.write(reinterpret_cast<const char *>(&header), sizeof(header));

    for (float x : audio.samples) {
        const float v = std::clamp(x, -1.0f, 1.0f);
        const int16_t pcm = (int16_t) std::lrintf(v * 32767.0f);
        file.write(reinterpret_cast<const char *>(&pcm), sizeof(pcm));
    }

    if (!file.good()) {
        err.set(ERROR_IO, "failed while writing output wav file: " + path);
        return false;
    }

    return true;
}

} // namespace dialogue_tts
