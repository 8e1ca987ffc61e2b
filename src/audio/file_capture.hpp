#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace audio {

// WAV-backed source that simulates a microphone by returning fixed-size mono blocks
class FileCapture {
public:
    bool start_from_wav(const std::string& path, int block_ms = 20);
    void stop();
    int sample_rate() const { return sample_rate_; }
    // Returns next block of mono int16 frames at the original file sample rate.
    // Empty when no more data.
    std::vector<int16_t> read_chunk();

    // Basic file info for reporting
    int channels() const { return channels_; }
    int bits_per_sample() const { return bits_per_sample_; }
    double duration_seconds() const { return duration_seconds_; }
    std::string source_path() const { return source_path_; }
    size_t frames_per_chunk() const { return frames_per_chunk_; }

private:
    std::string source_path_;
    std::vector<int16_t> mono_; // decoded mono PCM16
    size_t cursor_ = 0;
    size_t frames_per_chunk_ = 0;
    int sample_rate_ = 0;
    int channels_ = 0;
    int bits_per_sample_ = 0;
    double duration_seconds_ = 0.0;
};

} // namespace audio
