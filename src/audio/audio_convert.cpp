#include "audio/audio_convert.hpp"
#include <algorithm>
#include <cmath>

namespace audio {

std::vector<int16_t> downmix_to_mono(const int16_t* interleaved, size_t frames, int channels) {
    if (!interleaved || frames == 0) return {};
    if (channels <= 1) {
        return std::vector<int16_t>(interleaved, interleaved + frames);
    }
    std::vector<int16_t> mono(frames);
    for (size_t i = 0; i < frames; ++i) {
        int sum = 0;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[i * channels + c];
        }
        mono[i] = static_cast<int16_t>(sum / channels);
    }
    return mono;
}

std::vector<int16_t> resample_linear(const int16_t* in, size_t in_samples, int in_hz, int out_hz) {
    if (!in || in_samples == 0) return {};
    if (in_hz == out_hz || in_hz <= 0 || out_hz <= 0) {
        return std::vector<int16_t>(in, in + in_samples);
    }
    const double ratio = static_cast<double>(out_hz) / static_cast<double>(in_hz);
    const size_t out_len = static_cast<size_t>(std::llround(in_samples * ratio));
    std::vector<int16_t> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double src_pos = i / ratio;
        size_t i0 = std::min(static_cast<size_t>(src_pos), in_samples - 1);
        size_t i1 = std::min(i0 + 1, in_samples - 1);
        double frac = src_pos - static_cast<double>(i0);
        double v = (1.0 - frac) * static_cast<double>(in[i0]) + frac * static_cast<double>(in[i1]);
        int vi = static_cast<int>(std::lrint(v));
        vi = std::clamp(vi, -32768, 32767);
        out[i] = static_cast<int16_t>(vi);
    }
    return out;
}

std::vector<int16_t> to_engine_format(const int16_t* interleaved, size_t frames,
                                      int channels, int in_hz, int out_hz) {
    std::vector<int16_t> mono = downmix_to_mono(interleaved, frames, channels);
    if (in_hz == out_hz) return mono;
    return resample_linear(mono.data(), mono.size(), in_hz, out_hz);
}

} // namespace audio
