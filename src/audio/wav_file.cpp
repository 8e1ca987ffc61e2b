#include "audio/wav_file.hpp"
#include <fstream>
#include <cstring>
#include <algorithm>
#include <cmath>

namespace audio {

namespace {
struct WavHeader {
    char riff[4];
    uint32_t chunkSize;
    char wave[4];
    char fmt[4];
    uint32_t subchunk1Size;
    uint16_t audioFormat; // 1=PCM, 3=float
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};
static_assert(sizeof(WavHeader) == 36, "WAV header must be packed");
} // namespace

bool read_wav(const std::string& path, WavData& out) {
    out = WavData{};

    std::ifstream f(path, std::ios::binary);
    if (!f) return false;
    WavHeader hdr{};
    if (!f.read(reinterpret_cast<char*>(&hdr), sizeof(hdr))) return false;
    if (std::strncmp(hdr.riff, "RIFF", 4) != 0 || std::strncmp(hdr.wave, "WAVE", 4) != 0) return false;
    if (std::strncmp(hdr.fmt, "fmt ", 4) != 0 || hdr.numChannels == 0) return false;

    // Skip optional fmt extension bytes, then walk chunks until "data"
    uint32_t fmtExtra = hdr.subchunk1Size > 16 ? hdr.subchunk1Size - 16 : 0;
    if (fmtExtra) f.seekg(fmtExtra, std::ios::cur);

    char chunkId[4];
    uint32_t chunkSize = 0;
    bool found = false;
    while (f.read(chunkId, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunkSize), 4)) return false;
        if (std::strncmp(chunkId, "data", 4) == 0) {
            found = true;
            break;
        }
        f.seekg(chunkSize + (chunkSize & 1u), std::ios::cur);
    }
    if (!found) return false;

    const size_t bytesPerSample = hdr.bitsPerSample / 8;
    if (bytesPerSample == 0) return false;
    const size_t sampleCount = chunkSize / bytesPerSample;

    if (hdr.audioFormat == 1 && hdr.bitsPerSample == 16) {
        out.samples.resize(sampleCount);
        if (!f.read(reinterpret_cast<char*>(out.samples.data()), sampleCount * sizeof(int16_t))) return false;
    } else if (hdr.audioFormat == 3 && hdr.bitsPerSample == 32) {
        std::vector<float> buf(sampleCount);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(float))) return false;
        out.samples.resize(sampleCount);
        for (size_t i = 0; i < sampleCount; ++i) {
            float v = std::clamp(buf[i], -1.0f, 1.0f);
            out.samples[i] = static_cast<int16_t>(std::lrint(v * 32767.0f));
        }
    } else {
        return false; // unsupported
    }

    // Drop a trailing partial frame
    out.samples.resize(out.samples.size() - out.samples.size() % hdr.numChannels);
    out.sample_rate = static_cast<int>(hdr.sampleRate);
    out.channels = hdr.numChannels;
    out.bits_per_sample = hdr.bitsPerSample;
    return true;
}

std::string encode_wav(const int16_t* samples, size_t count, int sample_rate, int channels) {
    if (sample_rate <= 0 || channels <= 0) return {};
    if (!samples) count = 0;

    const uint32_t dataBytes = static_cast<uint32_t>(count * sizeof(int16_t));
    WavHeader hdr{};
    std::memcpy(hdr.riff, "RIFF", 4);
    hdr.chunkSize = 36 + dataBytes;
    std::memcpy(hdr.wave, "WAVE", 4);
    std::memcpy(hdr.fmt, "fmt ", 4);
    hdr.subchunk1Size = 16;
    hdr.audioFormat = 1;
    hdr.numChannels = static_cast<uint16_t>(channels);
    hdr.sampleRate = static_cast<uint32_t>(sample_rate);
    hdr.blockAlign = static_cast<uint16_t>(channels * sizeof(int16_t));
    hdr.byteRate = hdr.sampleRate * hdr.blockAlign;
    hdr.bitsPerSample = 16;

    std::string out;
    out.reserve(sizeof(hdr) + 8 + dataBytes);
    out.append(reinterpret_cast<const char*>(&hdr), sizeof(hdr));
    out.append("data", 4);
    out.append(reinterpret_cast<const char*>(&dataBytes), 4);
    if (dataBytes) out.append(reinterpret_cast<const char*>(samples), dataBytes);
    return out;
}

bool write_wav(const std::string& path, const std::vector<int16_t>& samples,
               int sample_rate, int channels) {
    const std::string bytes = encode_wav(samples.data(), samples.size(), sample_rate, channels);
    if (bytes.empty()) return false;
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) return false;
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(f);
}

} // namespace audio
