#pragma once
#include <memory>
#include <string>
#include <vector>

#include "asr/transcription_engine.hpp"
#include "audio/chunk_assembler.hpp"

namespace asr {

/**
 * @brief Text produced for one window
 */
struct PartialResult {
    size_t index = 0;       ///< Window sequence index
    bool ok = false;
    bool is_flush = false;
    std::string text;
    std::string error;      ///< Set when ok == false
    double elapsed_s = 0.0; ///< Engine wall time
};

// Runs one window through the engine: channel downmix, linear resample to the
// engine rate, engine call with the chunk decode parameters.
class ChunkTranscriber {
public:
    ChunkTranscriber(std::shared_ptr<TranscriptionEngine> engine,
                     int input_sample_rate, int channels,
                     DecodeParams params = DecodeParams::for_chunks());

    PartialResult transcribe(const audio::Window& window);

    // Interleaved capture-rate frames to mono engine-rate samples
    std::vector<int16_t> prepare(const int16_t* interleaved, size_t frames) const;

    const DecodeParams& params() const { return params_; }

private:
    std::shared_ptr<TranscriptionEngine> engine_;
    int input_sample_rate_;
    int channels_;
    DecodeParams params_;
};

} // namespace asr
