#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

/**
 * @brief Decoded WAV contents as interleaved PCM16
 */
struct WavData {
    std::vector<int16_t> samples;   ///< Interleaved (frames * channels)
    int sample_rate = 0;
    int channels = 0;
    int bits_per_sample = 0;        ///< Of the source file (16 or 32-bit float)

    size_t frames() const { return channels > 0 ? samples.size() / channels : 0; }
    double duration_seconds() const {
        return sample_rate > 0 ? static_cast<double>(frames()) / sample_rate : 0.0;
    }
};

// Reads PCM16 or float32 WAV. Returns false on I/O errors or unsupported formats.
bool read_wav(const std::string& path, WavData& out);

// Canonical 44-byte-header PCM16 WAV image in memory. Empty on invalid format.
std::string encode_wav(const int16_t* samples, size_t count, int sample_rate, int channels);

// Writes interleaved PCM16 as a canonical 44-byte-header WAV.
bool write_wav(const std::string& path, const std::vector<int16_t>& samples,
               int sample_rate, int channels);

} // namespace audio
