#include "audio/file_capture.hpp"
#include "audio/audio_convert.hpp"
#include "audio/wav_file.hpp"
#include <algorithm>

namespace audio {

bool FileCapture::start_from_wav(const std::string& path, int block_ms) {
    stop();
    source_path_.clear();
    channels_ = 0;
    bits_per_sample_ = 0;
    duration_seconds_ = 0.0;

    WavData wav;
    if (!read_wav(path, wav)) return false;

    // downmix to mono by averaging channels
    mono_ = downmix_to_mono(wav.samples.data(), wav.frames(), wav.channels);
    sample_rate_ = wav.sample_rate;
    channels_ = wav.channels;
    bits_per_sample_ = wav.bits_per_sample;
    duration_seconds_ = wav.duration_seconds();
    frames_per_chunk_ = std::max<size_t>(1, static_cast<size_t>(sample_rate_) * std::max(1, block_ms) / 1000);
    source_path_ = path;
    return true;
}

void FileCapture::stop() {
    mono_.clear();
    cursor_ = 0;
    sample_rate_ = 0;
}

std::vector<int16_t> FileCapture::read_chunk() {
    std::vector<int16_t> out;
    if (sample_rate_ <= 0 || cursor_ >= mono_.size()) return out;
    size_t remaining = mono_.size() - cursor_;
    size_t n = std::min(frames_per_chunk_, remaining);
    out.insert(out.end(), mono_.begin() + cursor_, mono_.begin() + cursor_ + n);
    cursor_ += n;
    return out;
}

} // namespace audio
