#include "audio/chunk_assembler.hpp"
#include <algorithm>

namespace audio {

ChunkAssembler::ChunkAssembler(size_t window_frames, size_t overlap_frames,
                               size_t min_flush_frames, int channels)
    : window_frames_(std::max<size_t>(1, window_frames))
    , overlap_frames_(std::min(overlap_frames, window_frames_ - 1))
    , min_flush_frames_(min_flush_frames)
    , channels_(static_cast<size_t>(std::max(1, channels))) {
    pending_.reserve(window_frames_ * channels_);
}

std::vector<Window> ChunkAssembler::push(const AudioBlock& block) {
    return push(block.samples.data(), std::min(block.frames, block.samples.size() / channels_));
}

std::vector<Window> ChunkAssembler::push(const int16_t* samples, size_t frames) {
    std::vector<Window> out;
    if (!samples || frames == 0) return out;
    pending_.insert(pending_.end(), samples, samples + frames * channels_);
    frames_consumed_ += frames;

    // The first window has no tail, so it takes window_frames new frames;
    // later windows take window_frames - overlap_frames.
    for (;;) {
        const size_t tail_frames = tail_.size() / channels_;
        const size_t needed = window_frames_ - tail_frames;
        if (pending_frames() < needed) break;
        out.push_back(cut_window(needed, false));
    }
    return out;
}

std::optional<Window> ChunkAssembler::flush() {
    const size_t leftover = pending_frames();
    if (leftover == 0 || leftover < min_flush_frames_) {
        pending_.clear();
        return std::nullopt;
    }
    return cut_window(leftover, true);
}

Window ChunkAssembler::cut_window(size_t new_frames, bool is_flush) {
    Window w;
    w.index = next_index_++;
    w.is_flush = is_flush;
    w.overlap_frames = tail_.size() / channels_;
    w.samples.reserve(tail_.size() + new_frames * channels_);
    w.samples.insert(w.samples.end(), tail_.begin(), tail_.end());
    w.samples.insert(w.samples.end(), pending_.begin(), pending_.begin() + new_frames * channels_);
    w.frames = w.samples.size() / channels_;

    pending_.erase(pending_.begin(), pending_.begin() + new_frames * channels_);

    // Slide: keep the trailing overlap of this window for the next one
    const size_t keep = std::min(overlap_frames_, w.frames) * channels_;
    tail_.assign(w.samples.end() - keep, w.samples.end());
    return w;
}

} // namespace audio
