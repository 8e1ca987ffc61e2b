#include "asr/chunk_transcriber.hpp"
#include "audio/audio_convert.hpp"
#include "core/logging.hpp"

#include <chrono>
#include <exception>

namespace asr {

ChunkTranscriber::ChunkTranscriber(std::shared_ptr<TranscriptionEngine> engine,
                                   int input_sample_rate, int channels, DecodeParams params)
    : engine_(std::move(engine))
    , input_sample_rate_(input_sample_rate)
    , channels_(channels < 1 ? 1 : channels)
    , params_(std::move(params)) {}

std::vector<int16_t> ChunkTranscriber::prepare(const int16_t* interleaved, size_t frames) const {
    const int target = engine_ ? engine_->sample_rate() : input_sample_rate_;
    return audio::to_engine_format(interleaved, frames, channels_, input_sample_rate_, target);
}

PartialResult ChunkTranscriber::transcribe(const audio::Window& window) {
    PartialResult result;
    result.index = window.index;
    result.is_flush = window.is_flush;

    if (!engine_) {
        result.error = "no transcription engine";
        return result;
    }

    std::vector<int16_t> pcm = prepare(window.samples.data(), window.frames);

    auto t_start = std::chrono::steady_clock::now();
    EngineResult r;
    try {
        r = engine_->transcribe(pcm.data(), pcm.size(), params_);
    } catch (const std::exception& e) {
        r = EngineResult::failure(e.what());
    } catch (...) {
        r = EngineResult::failure("unknown engine exception");
    }
    auto t_end = std::chrono::steady_clock::now();
    result.elapsed_s = std::chrono::duration<double>(t_end - t_start).count();

    result.ok = r.ok;
    if (r.ok) {
        result.text = std::move(r.text);
    } else {
        result.error = r.error.empty() ? std::string("engine reported failure") : r.error;
    }

    core::log_debug("[chunk] window " + std::to_string(window.index)
                    + (window.is_flush ? " (flush)" : "")
                    + " frames=" + std::to_string(window.frames)
                    + " engine_samples=" + std::to_string(pcm.size())
                    + " t=" + std::to_string(result.elapsed_s) + "s"
                    + (result.ok ? "" : " error=" + result.error));
    return result;
}

} // namespace asr
