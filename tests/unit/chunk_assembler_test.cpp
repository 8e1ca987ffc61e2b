#undef NDEBUG  // assert() must stay active in release builds
#include <cassert>
#include <cstdint>
#include <numeric>
#include <vector>
#include "audio/chunk_assembler.hpp"

// Feeds a ramp 0,1,2,... in blocks of `block` frames
static std::vector<audio::Window> feed_ramp(audio::ChunkAssembler& a, size_t total, size_t block, int16_t& next) {
    std::vector<audio::Window> out;
    size_t fed = 0;
    while (fed < total) {
        size_t n = std::min(block, total - fed);
        std::vector<int16_t> buf(n);
        for (auto& s : buf) s = next++;
        for (auto& w : a.push(buf.data(), n)) out.push_back(std::move(w));
        fed += n;
    }
    return out;
}

int main() {
    // Full windows have exactly W frames and start with the previous tail
    {
        const size_t W = 100, O = 10;
        audio::ChunkAssembler a(W, O, 5);
        int16_t next = 0;
        auto windows = feed_ramp(a, 300, 7, next);
        // 100 + 90 + 90 = 280 consumed by full windows
        assert(windows.size() == 3);
        for (size_t i = 0; i < windows.size(); ++i) {
            assert(windows[i].index == i);
            assert(windows[i].frames == W);
            assert(windows[i].samples.size() == W);
            assert(!windows[i].is_flush);
        }
        assert(windows[0].overlap_frames == 0);
        assert(windows[0].samples.front() == 0);
        for (size_t i = 1; i < windows.size(); ++i) {
            assert(windows[i].overlap_frames == O);
            for (size_t j = 0; j < O; ++j) {
                assert(windows[i].samples[j] == windows[i - 1].samples[W - O + j]);
            }
        }
        assert(a.pending_frames() == 20);

        auto flush = a.flush();
        assert(flush);
        assert(flush->is_flush);
        assert(flush->index == 3);
        assert(flush->overlap_frames == O);
        assert(flush->frames == O + 20);
        assert(flush->samples.back() == 299);
        assert(a.pending_frames() == 0);
        assert(a.frames_consumed() == 300);
    }

    // Leftover below the flush minimum is not emitted
    {
        audio::ChunkAssembler a(100, 10, 50);
        int16_t next = 0;
        auto windows = feed_ramp(a, 130, 13, next);
        assert(windows.size() == 1);
        assert(a.pending_frames() == 30);
        assert(!a.flush());
        assert(a.pending_frames() == 0);
    }

    // Nothing pending: no flush window
    {
        audio::ChunkAssembler a(100, 10, 0);
        int16_t next = 0;
        auto windows = feed_ramp(a, 100, 100, next);
        assert(windows.size() == 1);
        assert(!a.flush());
    }

    // Recording shorter than one window: only a flush window
    {
        audio::ChunkAssembler a(100, 10, 5);
        int16_t next = 0;
        auto windows = feed_ramp(a, 60, 20, next);
        assert(windows.empty());
        auto flush = a.flush();
        assert(flush);
        assert(flush->index == 0);
        assert(flush->overlap_frames == 0);
        assert(flush->frames == 60);
    }

    // One large block can complete several windows at once
    {
        audio::ChunkAssembler a(50, 25, 0);
        std::vector<int16_t> big(200);
        std::iota(big.begin(), big.end(), static_cast<int16_t>(0));
        auto windows = a.push(big.data(), big.size());
        // 50 + 25 * 6 = 200
        assert(windows.size() == 7);
        assert(windows[6].samples.back() == 199);
    }

    // Stereo: frames count interleaved pairs
    {
        audio::ChunkAssembler a(4, 1, 0, 2);
        audio::AudioBlock block;
        block.samples = {1, -1, 2, -2, 3, -3, 4, -4, 5, -5};
        block.frames = 5;
        auto windows = a.push(block);
        assert(windows.size() == 1);
        assert(windows[0].frames == 4);
        assert(windows[0].samples.size() == 8);
        auto flush = a.flush();
        assert(flush);
        assert(flush->frames == 2);
        assert(flush->samples[0] == 4 && flush->samples[1] == -4);
        assert(flush->samples[2] == 5 && flush->samples[3] == -5);
    }

    // Overlap is clamped below the window length
    {
        audio::ChunkAssembler a(10, 50, 0);
        assert(a.overlap_frames() == 9);
    }
    return 0;
}
