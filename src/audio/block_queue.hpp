#pragma once
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <atomic>
#include <optional>

namespace audio {

/**
 * @brief One block of interleaved PCM16 audio as delivered by the capture callback
 */
struct AudioBlock {
    std::vector<int16_t> samples;   ///< Interleaved samples (frames * channels)
    size_t frames = 0;              ///< Frame count
};

enum class PushResult {
    Enqueued,
    Dropped,    ///< Queue was full, block discarded
    Rejected    ///< Receiver is not accepting audio (no active recording)
};

// Bounded hand-off between the capture callback and the chunk worker.
// When full, the newest block is dropped and counted.
class BlockQueue {
public:
    explicit BlockQueue(size_t capacity = 512) : capacity_(capacity == 0 ? 1 : capacity) {}

    BlockQueue(const BlockQueue&) = delete;
    BlockQueue& operator=(const BlockQueue&) = delete;

    // Called by the audio source. Never waits on the consumer.
    PushResult push(AudioBlock&& block) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (queue_.size() >= capacity_) {
                dropped_count_++;
                return PushResult::Dropped;
            }
            queue_.push_back(std::move(block));
        }
        cv_pop_.notify_one();
        return PushResult::Enqueued;
    }

    // Called by the worker. Waits at most `timeout` for a block so the caller
    // can periodically look at its stop flag.
    std::optional<AudioBlock> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_pop_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        AudioBlock block = std::move(queue_.front());
        queue_.pop_front();
        return block;
    }

    std::optional<AudioBlock> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.empty()) return std::nullopt;
        AudioBlock block = std::move(queue_.front());
        queue_.pop_front();
        return block;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const { return size() == 0; }

    size_t capacity() const { return capacity_; }

    size_t dropped_count() const {
        return dropped_count_.load();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_pop_;   // Notifies pop() when data available
    std::deque<AudioBlock> queue_;
    const size_t capacity_;
    std::atomic<size_t> dropped_count_{0};
};

} // namespace audio
