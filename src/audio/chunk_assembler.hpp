#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "audio/block_queue.hpp"

namespace audio {

/**
 * @brief One unit of audio submitted to the transcription engine
 */
struct Window {
    size_t index = 0;               ///< Sequence number, 0-based
    std::vector<int16_t> samples;   ///< Interleaved samples, tail-prefixed
    size_t frames = 0;              ///< Frame count including the carried tail
    size_t overlap_frames = 0;      ///< Leading frames repeated from the previous window
    bool is_flush = false;          ///< Final, possibly shorter window emitted at stop
};

/**
 * @brief Slices a stream of blocks into fixed-length overlapping windows
 *
 * Every full window holds exactly window_frames frames. A non-initial window
 * starts with the last overlap_frames frames of the window before it.
 * Not thread-safe: owned by the chunk worker.
 */
class ChunkAssembler {
public:
    ChunkAssembler(size_t window_frames, size_t overlap_frames,
                   size_t min_flush_frames, int channels = 1);

    // Append a block and cut every window that became complete.
    std::vector<Window> push(const AudioBlock& block);
    std::vector<Window> push(const int16_t* samples, size_t frames);

    // Emit the leftover pending frames as the final window. Returns nothing
    // when fewer than min_flush_frames new frames are pending.
    std::optional<Window> flush();

    size_t window_frames() const { return window_frames_; }
    size_t overlap_frames() const { return overlap_frames_; }
    size_t pending_frames() const { return pending_.size() / channels_; }
    size_t windows_emitted() const { return next_index_; }
    size_t frames_consumed() const { return frames_consumed_; }

private:
    Window cut_window(size_t new_frames, bool is_flush);

    const size_t window_frames_;
    const size_t overlap_frames_;
    const size_t min_flush_frames_;
    const size_t channels_;

    std::vector<int16_t> pending_;  // new audio not yet part of any window
    std::vector<int16_t> tail_;     // last overlap_frames of the previous window
    size_t next_index_ = 0;
    size_t frames_consumed_ = 0;
};

} // namespace audio
