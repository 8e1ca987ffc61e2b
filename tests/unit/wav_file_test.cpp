#undef NDEBUG  // assert() must stay active in release builds
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>
#include "audio/file_capture.hpp"
#include "audio/wav_file.hpp"

namespace fs = std::filesystem;

int main() {
    const fs::path dir = fs::temp_directory_path() / "chunkscribe_wav_test";
    fs::create_directories(dir);

    // Stereo PCM16 written and read back
    {
        const std::string path = (dir / "stereo.wav").string();
        std::vector<int16_t> samples;
        for (int i = 0; i < 1000; ++i) {
            samples.push_back(static_cast<int16_t>(i));
            samples.push_back(static_cast<int16_t>(-i));
        }
        assert(audio::write_wav(path, samples, 22050, 2));
        assert(fs::file_size(path) == 44 + samples.size() * 2);

        audio::WavData wav;
        assert(audio::read_wav(path, wav));
        assert(wav.sample_rate == 22050);
        assert(wav.channels == 2);
        assert(wav.bits_per_sample == 16);
        assert(wav.frames() == 1000);
        assert(wav.samples == samples);
    }

    // FileCapture serves 20 ms mono blocks and downmixes stereo
    {
        const std::string path = (dir / "capture.wav").string();
        std::vector<int16_t> samples(16000 * 2);
        for (size_t i = 0; i < samples.size(); i += 2) { samples[i] = 1000; samples[i + 1] = 3000; }
        assert(audio::write_wav(path, samples, 16000, 2));

        audio::FileCapture cap;
        assert(cap.start_from_wav(path, 20));
        assert(cap.sample_rate() == 16000);
        assert(cap.channels() == 2);
        assert(cap.frames_per_chunk() == 320);
        size_t total = 0;
        for (auto block = cap.read_chunk(); !block.empty(); block = cap.read_chunk()) {
            assert(block.size() <= 320);
            assert(block[0] == 2000);
            total += block.size();
        }
        assert(total == 16000);
        assert(cap.read_chunk().empty());
    }

    // In-memory image matches the file written from the same samples
    {
        const std::string path = (dir / "image.wav").string();
        std::vector<int16_t> samples = {0, 1, -1, 32767, -32768};
        assert(audio::write_wav(path, samples, 16000, 1));
        const std::string image = audio::encode_wav(samples.data(), samples.size(), 16000, 1);
        assert(image.size() == 44 + samples.size() * 2);
        assert(image.compare(0, 4, "RIFF") == 0);
        assert(image.compare(8, 4, "WAVE") == 0);

        std::ifstream f(path, std::ios::binary);
        std::string on_disk((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        assert(on_disk == image);

        assert(audio::encode_wav(samples.data(), samples.size(), 0, 1).empty());
        assert(audio::encode_wav(samples.data(), samples.size(), 16000, 0).empty());
    }

    // Not a WAV file
    {
        const std::string path = (dir / "bogus.wav").string();
        std::ofstream(path) << "definitely not RIFF data, just text padding it out";
        audio::WavData wav;
        assert(!audio::read_wav(path, wav));
        assert(!audio::read_wav((dir / "missing.wav").string(), wav));
    }

    fs::remove_all(dir);
    return 0;
}
