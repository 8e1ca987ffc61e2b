// Copyright (c) 2025 Chunkscribe
// PipelineController - chunked transcription during capture with a
// full-file fallback at stop time.

#pragma once

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "asr/transcription_engine.hpp"
#include "audio/block_queue.hpp"
#include "core/config.hpp"

namespace core {

/**
 * @brief Lifecycle of one recording session
 */
enum class PipelineState {
    Idle,           ///< No session yet
    Recording,      ///< Accepting audio, worker transcribing full windows
    Stopping,       ///< Stop requested, worker has not noticed yet
    Draining,       ///< Worker consuming the rest of the queue and the final flush
    Finalized       ///< Decision made; session discarded on next start()
};

/**
 * @brief Conditions observed during a session
 *
 * All but MergeAmbiguous make the incremental transcript untrustworthy.
 */
enum class PipelineIssue {
    QueueOverflow,      ///< Blocks dropped at the queue
    EngineError,        ///< A window failed to transcribe
    MergeAmbiguous,     ///< No overlap found, chunks concatenated verbatim
    FinalizeTimeout,    ///< Worker did not finish in time
    ShortRecording      ///< Recording shorter than one window
};

const char* to_string(PipelineState state);
const char* to_string(PipelineIssue issue);
bool forces_fallback(PipelineIssue issue);

enum class TranscriptSource {
    Incremental,        ///< Merged chunk transcript can be delivered as is
    FallbackRequired    ///< Caller must transcribe the whole recording
};

/**
 * @brief Result of finalize(): the fast-path / fallback decision
 */
struct FinalizeResult {
    std::string transcript;             ///< Merged text; empty when fallback is required
    TranscriptSource source = TranscriptSource::FallbackRequired;
    std::vector<PipelineIssue> issues;

    size_t frames_recorded = 0;         ///< Capture-rate frames fed while recording
    size_t windows_transcribed = 0;     ///< Full windows plus flush window sent to the engine
    size_t flush_windows = 0;
    size_t dropped_blocks = 0;
    size_t engine_errors = 0;
    size_t ambiguous_merges = 0;
    std::string recording_path;         ///< Saved WAV, empty if kept in memory only

    bool requires_fallback() const { return source == TranscriptSource::FallbackRequired; }
    bool has_issue(PipelineIssue issue) const;
};

/**
 * @brief Final text for one recording
 */
struct RecordingTranscript {
    bool ok = false;            ///< false only when the full-file pass failed
    std::string text;
    bool used_fallback = false; ///< Text came from the full-file pass
    std::string error;
    FinalizeResult finalize;
};

/**
 * @brief Drives one chunked transcription session per recording
 *
 * Capture thread (must not block):
 *   - feed() copies the block into the session recording and pushes it to a
 *     bounded queue; a full queue drops the block
 *
 * Worker thread (one per session):
 *   - pops blocks with a short timeout, cuts overlapping windows,
 *     transcribes each one and merges the text into the session transcript
 *   - after stop(): drains the queue, transcribes the final flush window,
 *     signals completion
 *
 * Control thread:
 *   - start() / stop() / finalize() / finish()
 *   - finalize() waits for the worker at most finalize_timeout, then
 *     abandons it and ignores whatever it produces later
 *
 * The incremental transcript is delivered only if the worker saw the whole
 * stream without loss or errors; otherwise finish() re-transcribes the
 * complete recording once.
 */
class PipelineController {
public:
    using StateCallback = std::function<void(PipelineState)>;

    struct Config {
        int sample_rate = 16000;            ///< Capture rate of fed blocks
        int channels = 1;                   ///< Interleaved channels of fed blocks

        double window_duration_s = 12.0;
        double overlap_duration_s = 1.0;
        double min_flush_duration_s = 0.5;  ///< Shorter leftovers are not transcribed

        size_t queue_capacity = 512;        ///< Blocks
        std::chrono::milliseconds pop_timeout{100};
        size_t max_overlap_words = 30;

        asr::DecodeParams chunk_params = asr::DecodeParams::for_chunks();
        asr::DecodeParams full_params = asr::DecodeParams::for_full_file();

        std::chrono::milliseconds finalize_timeout{10000};
        std::string recordings_dir;         ///< Empty = keep the recording in memory only

        StateCallback on_state;             ///< Invoked on each transition (any thread)

        size_t window_frames() const { return frames_for(window_duration_s); }
        size_t overlap_frames() const { return frames_for(overlap_duration_s); }
        size_t min_flush_frames() const { return frames_for(min_flush_duration_s); }

    private:
        size_t frames_for(double seconds) const {
            if (seconds <= 0.0 || sample_rate <= 0) return 0;
            return static_cast<size_t>(std::llround(seconds * sample_rate));
        }
    };

    PipelineController(std::shared_ptr<asr::TranscriptionEngine> engine, Config config);
    ~PipelineController();

    PipelineController(const PipelineController&) = delete;
    PipelineController& operator=(const PipelineController&) = delete;

    /**
     * @brief Begin a new session (from Idle or Finalized)
     * @return false if a session is still active
     */
    bool start();

    /**
     * @brief Hand one capture block to the session; never waits on the worker
     * @param samples Interleaved PCM16 at config().sample_rate
     * @param frames Number of frames (samples / channels)
     */
    audio::PushResult feed(const int16_t* samples, size_t frames);
    audio::PushResult feed(const audio::AudioBlock& block);

    /**
     * @brief Stop accepting audio and let the worker drain; saves the recording
     */
    void stop();

    /**
     * @brief Wait (bounded) for the worker and decide fast path vs fallback
     *
     * Calls stop() first if still recording. Repeated calls return the same result.
     */
    FinalizeResult finalize();

    /**
     * @brief finalize() plus the full-file pass when it is required
     */
    RecordingTranscript finish();

    PipelineState state() const;
    const Config& config() const { return config_; }

    // Blocks dropped so far in the current session
    size_t dropped_blocks() const;

    // Blocks waiting for the worker in the current session
    size_t queued_blocks() const;

    /**
     * @brief Wait until fewer than `blocks` blocks are queued
     *
     * For sources that can be slowed down, such as file replay; a live
     * capture callback must never call this. Returns false on timeout or
     * when the session stops recording.
     */
    bool wait_for_queue_below(size_t blocks, std::chrono::milliseconds timeout);

private:
    class Session;

    void run_full_pass(RecordingTranscript& out);
    void notify(PipelineState state) const;

    std::shared_ptr<asr::TranscriptionEngine> engine_;
    Config config_;

    std::shared_ptr<Session> session_;
    std::thread worker_;
    std::future<void> drained_;
    bool finalized_ = false;
    FinalizeResult last_result_;
};

// Maps application settings onto the pipeline configuration
PipelineController::Config make_pipeline_config(const core::Config& app);

} // namespace core
