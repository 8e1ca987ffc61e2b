// Copyright (c) 2025 Chunkscribe
// PipelineController - session worker, finalize decision, full-file pass
//
// Capture thread:   feed() -> recording copy + BlockQueue::push (drops when full)
// Worker thread:    BlockQueue::pop(timeout) -> ChunkAssembler -> ChunkTranscriber
//                   -> TranscriptMerger -> session transcript (mutex)
// Control thread:   stop() sets the flag, finalize() waits on the drained future
//                   with a deadline, finish() runs the full-file pass if needed

#include "core/pipeline_controller.hpp"
#include "asr/chunk_transcriber.hpp"
#include "audio/audio_convert.hpp"
#include "audio/chunk_assembler.hpp"
#include "audio/wav_file.hpp"
#include "core/logging.hpp"
#include "core/recording_store.hpp"
#include "core/transcript_merger.hpp"

#include <algorithm>
#include <exception>
#include <mutex>

namespace core {

namespace {
// Trim whitespace and drop NUL bytes some engines leave in their output
std::string clean_text(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '\0') out.push_back(c);
    }
    size_t a = out.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = out.find_last_not_of(" \t\r\n");
    return out.substr(a, b - a + 1);
}
} // namespace

const char* to_string(PipelineState state) {
    switch (state) {
        case PipelineState::Idle:      return "Idle";
        case PipelineState::Recording: return "Recording";
        case PipelineState::Stopping:  return "Stopping";
        case PipelineState::Draining:  return "Draining";
        case PipelineState::Finalized: return "Finalized";
    }
    return "Unknown";
}

const char* to_string(PipelineIssue issue) {
    switch (issue) {
        case PipelineIssue::QueueOverflow:   return "QueueOverflow";
        case PipelineIssue::EngineError:     return "EngineError";
        case PipelineIssue::MergeAmbiguous:  return "MergeAmbiguous";
        case PipelineIssue::FinalizeTimeout: return "FinalizeTimeout";
        case PipelineIssue::ShortRecording:  return "ShortRecording";
    }
    return "Unknown";
}

bool forces_fallback(PipelineIssue issue) {
    return issue != PipelineIssue::MergeAmbiguous;
}

bool FinalizeResult::has_issue(PipelineIssue issue) const {
    return std::find(issues.begin(), issues.end(), issue) != issues.end();
}

// =============================================================================
// Session: everything that belongs to one recording. Shared between the
// controller and the worker so an abandoned worker never outlives its data.
// =============================================================================

class PipelineController::Session {
public:
    Session(const PipelineController::Config& cfg, std::shared_ptr<asr::TranscriptionEngine> engine)
        : config(cfg)
        , queue(cfg.queue_capacity)
        , assembler(cfg.window_frames(), cfg.overlap_frames(), cfg.min_flush_frames(), cfg.channels)
        , transcriber(std::move(engine), cfg.sample_rate, cfg.channels, cfg.chunk_params)
        , merger(cfg.max_overlap_words) {}

    const PipelineController::Config config;
    audio::BlockQueue queue;

    std::atomic<PipelineState> state{PipelineState::Recording};
    std::atomic<bool> stop_requested{false};
    std::atomic<bool> abandoned{false};
    std::promise<void> drained;

    // Producer side; guarded so no block can slip in after stop()
    std::mutex recording_mutex;
    std::vector<int16_t> recording;
    size_t frames_recorded = 0;
    std::string recording_path;

    // Written by the worker only, read by finalize() after the worker is done
    mutable std::mutex transcript_mutex;
    std::string transcript;
    size_t windows_transcribed = 0;
    size_t flush_windows = 0;
    size_t engine_errors = 0;
    size_t ambiguous_merges = 0;

    void run() {
        while (!abandoned.load()) {
            if (stop_requested.load()) {
                PipelineState expected = PipelineState::Stopping;
                if (state.compare_exchange_strong(expected, PipelineState::Draining) && config.on_state) {
                    config.on_state(PipelineState::Draining);
                }
                auto block = queue.try_pop();
                if (!block) break;  // drained
                process_block(*block);
                continue;
            }
            auto block = queue.pop(config.pop_timeout);
            if (block) process_block(*block);
        }

        if (!abandoned.load()) {
            if (auto window = assembler.flush()) {
                handle_window(*window);
            }
        }
        drained.set_value();
    }

private:
    // Worker-only state
    audio::ChunkAssembler assembler;
    asr::ChunkTranscriber transcriber;
    TranscriptMerger merger;

    void process_block(const audio::AudioBlock& block) {
        for (const auto& window : assembler.push(block)) {
            if (abandoned.load()) return;
            handle_window(window);
        }
    }

    void handle_window(const audio::Window& window) {
        asr::PartialResult partial = transcriber.transcribe(window);

        std::lock_guard<std::mutex> lock(transcript_mutex);
        windows_transcribed++;
        if (window.is_flush) flush_windows++;

        if (!partial.ok) {
            engine_errors++;
            log_warn("[pipeline] window " + std::to_string(partial.index) + " failed: " + partial.error);
            return;
        }

        const std::string text = clean_text(partial.text);
        MergeResult merged = merger.merge(transcript, text);
        if (merged.ambiguous) {
            ambiguous_merges++;
            log_debug("[pipeline] window " + std::to_string(partial.index) + ": no overlap found, concatenated");
        } else if (merged.overlap_words > 0) {
            log_debug("[pipeline] window " + std::to_string(partial.index) + ": removed "
                      + std::to_string(merged.overlap_words) + " overlapping words");
        }
        transcript = std::move(merged.text);
    }
};

// =============================================================================
// Public API Implementation
// =============================================================================

PipelineController::PipelineController(std::shared_ptr<asr::TranscriptionEngine> engine, Config config)
    : engine_(std::move(engine))
    , config_(std::move(config)) {
    if (config_.channels < 1) config_.channels = 1;
    if (config_.queue_capacity == 0) config_.queue_capacity = 1;
    if (config_.window_frames() == 0) {
        log_warn("[pipeline] window duration must be positive, using 12s");
        config_.window_duration_s = 12.0;
    }
    if (config_.overlap_frames() >= config_.window_frames()) {
        log_warn("[pipeline] overlap must be shorter than the window, disabling overlap");
        config_.overlap_duration_s = 0.0;
    }
}

PipelineController::~PipelineController() {
    if (session_ && !finalized_) {
        finalize();
    }
}

bool PipelineController::start() {
    const PipelineState current = state();
    if (current != PipelineState::Idle && current != PipelineState::Finalized) {
        log_warn(std::string("[pipeline] start ignored in state ") + to_string(current));
        return false;
    }
    if (!engine_) {
        log_error("[pipeline] no transcription engine configured");
        return false;
    }

    auto session = std::make_shared<Session>(config_, engine_);
    drained_ = session->drained.get_future();
    finalized_ = false;
    last_result_ = FinalizeResult{};
    std::atomic_store(&session_, session);

    // The worker holds its own reference; it may outlive this controller's interest
    worker_ = std::thread([session]() { session->run(); });

    log_info("[pipeline] recording started (window " + std::to_string(config_.window_duration_s)
             + "s, overlap " + std::to_string(config_.overlap_duration_s) + "s, queue "
             + std::to_string(config_.queue_capacity) + " blocks)");
    notify(PipelineState::Recording);
    return true;
}

audio::PushResult PipelineController::feed(const int16_t* samples, size_t frames) {
    std::shared_ptr<Session> session = std::atomic_load(&session_);
    if (!session || !samples || frames == 0) return audio::PushResult::Rejected;

    const size_t count = frames * static_cast<size_t>(config_.channels);
    std::lock_guard<std::mutex> lock(session->recording_mutex);
    if (session->state.load() != PipelineState::Recording) {
        return audio::PushResult::Rejected;
    }
    session->recording.insert(session->recording.end(), samples, samples + count);
    session->frames_recorded += frames;

    audio::AudioBlock block;
    block.samples.assign(samples, samples + count);
    block.frames = frames;
    return session->queue.push(std::move(block));
}

audio::PushResult PipelineController::feed(const audio::AudioBlock& block) {
    return feed(block.samples.data(),
                std::min(block.frames, block.samples.size() / static_cast<size_t>(config_.channels)));
}

void PipelineController::stop() {
    std::shared_ptr<Session> session = std::atomic_load(&session_);
    if (!session) return;
    {
        std::lock_guard<std::mutex> lock(session->recording_mutex);
        if (session->state.load() != PipelineState::Recording) return;
        session->state.store(PipelineState::Stopping);
    }
    notify(PipelineState::Stopping);
    session->stop_requested.store(true);

    log_info("[pipeline] recording stopped: " + std::to_string(session->frames_recorded) + " frames, "
             + std::to_string(session->queue.dropped_count()) + " dropped blocks");

    if (!config_.recordings_dir.empty() && !session->recording.empty()) {
        RecordingStore store(config_.recordings_dir);
        session->recording_path = store.save(session->recording, config_.sample_rate, config_.channels);
    }
}

FinalizeResult PipelineController::finalize() {
    if (finalized_) return last_result_;

    FinalizeResult result;
    std::shared_ptr<Session> session = session_;
    if (!session) {
        // Nothing was ever recorded
        result.issues.push_back(PipelineIssue::ShortRecording);
        return result;
    }

    if (session->state.load() == PipelineState::Recording) {
        stop();
    }

    const bool completed =
        drained_.valid() && drained_.wait_for(config_.finalize_timeout) == std::future_status::ready;
    if (completed) {
        if (worker_.joinable()) worker_.join();
    } else {
        // No cancellation of an engine call in flight: stop trusting it instead
        session->abandoned.store(true);
        if (worker_.joinable()) worker_.detach();
        log_warn("[pipeline] worker did not finish within "
                 + std::to_string(config_.finalize_timeout.count()) + " ms, abandoning it");
        result.issues.push_back(PipelineIssue::FinalizeTimeout);
    }
    session->state.store(PipelineState::Finalized);

    result.frames_recorded = session->frames_recorded;
    result.dropped_blocks = session->queue.dropped_count();
    result.recording_path = session->recording_path;
    {
        std::lock_guard<std::mutex> lock(session->transcript_mutex);
        result.windows_transcribed = session->windows_transcribed;
        result.flush_windows = session->flush_windows;
        result.engine_errors = session->engine_errors;
        result.ambiguous_merges = session->ambiguous_merges;
        if (completed) result.transcript = session->transcript;
    }

    if (result.frames_recorded < config_.window_frames()) {
        result.issues.push_back(PipelineIssue::ShortRecording);
    }
    if (result.dropped_blocks > 0) {
        result.issues.push_back(PipelineIssue::QueueOverflow);
    }
    if (result.engine_errors > 0) {
        result.issues.push_back(PipelineIssue::EngineError);
    }
    if (result.ambiguous_merges > 0) {
        result.issues.push_back(PipelineIssue::MergeAmbiguous);
    }

    const bool fallback = std::any_of(result.issues.begin(), result.issues.end(), forces_fallback);
    result.source = fallback ? TranscriptSource::FallbackRequired : TranscriptSource::Incremental;
    if (fallback) {
        result.transcript.clear();
    }

    std::string issues;
    for (auto issue : result.issues) {
        if (!issues.empty()) issues += ", ";
        issues += to_string(issue);
    }
    log_info("[pipeline] finalized: " + std::to_string(result.windows_transcribed) + " windows, "
             + (fallback ? "fallback required" : "incremental transcript accepted")
             + (issues.empty() ? "" : " (" + issues + ")"));

    finalized_ = true;
    last_result_ = result;
    notify(PipelineState::Finalized);
    return result;
}

RecordingTranscript PipelineController::finish() {
    RecordingTranscript out;
    out.finalize = finalize();
    if (!out.finalize.requires_fallback()) {
        out.ok = true;
        out.text = out.finalize.transcript;
        return out;
    }
    out.used_fallback = true;
    run_full_pass(out);
    return out;
}

void PipelineController::run_full_pass(RecordingTranscript& out) {
    std::shared_ptr<Session> session = session_;
    if (!session) {
        out.error = "no recording to transcribe";
        log_error("[pipeline] full-file pass failed: " + out.error);
        return;
    }

    std::vector<int16_t> samples;
    int sample_rate = config_.sample_rate;
    int channels = config_.channels;
    if (!out.finalize.recording_path.empty()) {
        audio::WavData wav;
        if (!audio::read_wav(out.finalize.recording_path, wav)) {
            out.error = "cannot read recording " + out.finalize.recording_path;
            log_error("[pipeline] full-file pass failed: " + out.error);
            return;
        }
        samples = std::move(wav.samples);
        sample_rate = wav.sample_rate;
        channels = wav.channels;
    } else {
        std::lock_guard<std::mutex> lock(session->recording_mutex);
        samples = session->recording;
    }

    if (samples.empty()) {
        out.error = "no audio data recorded";
        log_error("[pipeline] full-file pass failed: " + out.error);
        return;
    }

    const size_t frames = samples.size() / static_cast<size_t>(channels);
    std::vector<int16_t> pcm = audio::to_engine_format(samples.data(), frames, channels,
                                                       sample_rate, engine_->sample_rate());
    log_info("[pipeline] running full-file pass over " + std::to_string(frames) + " frames with "
             + engine_->name());

    asr::EngineResult r;
    try {
        r = engine_->transcribe(pcm.data(), pcm.size(), config_.full_params);
    } catch (const std::exception& e) {
        r = asr::EngineResult::failure(e.what());
    } catch (...) {
        r = asr::EngineResult::failure("unknown engine exception");
    }

    if (!r.ok) {
        out.error = r.error.empty() ? std::string("full-file transcription failed") : r.error;
        log_error("[pipeline] full-file pass failed: " + out.error);
        return;
    }
    out.ok = true;
    out.text = clean_text(r.text);
}

PipelineState PipelineController::state() const {
    std::shared_ptr<Session> session = std::atomic_load(&session_);
    return session ? session->state.load() : PipelineState::Idle;
}

size_t PipelineController::dropped_blocks() const {
    std::shared_ptr<Session> session = std::atomic_load(&session_);
    return session ? session->queue.dropped_count() : 0;
}

size_t PipelineController::queued_blocks() const {
    std::shared_ptr<Session> session = std::atomic_load(&session_);
    return session ? session->queue.size() : 0;
}

bool PipelineController::wait_for_queue_below(size_t blocks, std::chrono::milliseconds timeout) {
    std::shared_ptr<Session> session = std::atomic_load(&session_);
    if (!session) return false;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (session->queue.size() >= blocks) {
        if (session->state.load() != PipelineState::Recording) return false;
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

void PipelineController::notify(PipelineState state) const {
    if (config_.on_state) config_.on_state(state);
}

PipelineController::Config make_pipeline_config(const core::Config& app) {
    PipelineController::Config cfg;
    cfg.sample_rate = app.sample_rate;
    cfg.channels = 1;
    cfg.window_duration_s = app.window_duration_s;
    cfg.overlap_duration_s = app.overlap_duration_s;
    cfg.min_flush_duration_s = app.min_flush_duration_s;
    cfg.queue_capacity = static_cast<size_t>(std::max(1, app.queue_capacity));
    cfg.max_overlap_words = static_cast<size_t>(std::max(2, app.max_overlap_words));
    cfg.finalize_timeout = std::chrono::milliseconds(app.finalize_timeout_ms);
    cfg.recordings_dir = app.recordings_dir;

    cfg.chunk_params.language = app.language;
    cfg.chunk_params.n_threads = app.n_threads;
    cfg.chunk_params.beam_size = app.chunk_beam_size;

    cfg.full_params.language = app.language;
    cfg.full_params.n_threads = app.n_threads;
    cfg.full_params.beam_size = app.full_beam_size;
    cfg.full_params.best_of = std::max(1, app.full_beam_size);
    return cfg;
}

} // namespace core
