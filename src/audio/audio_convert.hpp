#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace audio {

// Average interleaved channels into one. channels <= 1 returns a copy.
std::vector<int16_t> downmix_to_mono(const int16_t* interleaved, size_t frames, int channels);

// Linear interpolation resampler. Returns the input unchanged when rates match
// or either rate is invalid.
std::vector<int16_t> resample_linear(const int16_t* in, size_t in_samples, int in_hz, int out_hz);

// Downmix then resample: the format every engine call expects.
std::vector<int16_t> to_engine_format(const int16_t* interleaved, size_t frames,
                                      int channels, int in_hz, int out_hz);

} // namespace audio
