#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace asr {

/**
 * @brief Decoding parameters passed with every engine call
 *
 * The chunk worker uses cheap settings (greedy, best_of=1) since a full pass
 * may still run later; the full-file pass uses beam search.
 */
struct DecodeParams {
    std::string language = "en";    ///< Language code, empty = auto-detect
    int beam_size = 1;              ///< > 1 selects beam search
    int best_of = 1;                ///< Candidates for greedy sampling
    float temperature = 0.0f;
    int n_threads = 0;              ///< 0 = hardware concurrency
    bool no_context = true;         ///< Do not condition on previous text
    bool single_segment = false;

    static DecodeParams for_chunks() { return DecodeParams{}; }
    static DecodeParams for_full_file() {
        DecodeParams p;
        p.beam_size = 5;
        p.best_of = 5;
        p.no_context = false;
        return p;
    }
};

/**
 * @brief Outcome of one engine call
 */
struct EngineResult {
    bool ok = false;
    std::string text;
    std::string error;

    static EngineResult success(std::string t) { return EngineResult{true, std::move(t), {}}; }
    static EngineResult failure(std::string e) { return EngineResult{false, {}, std::move(e)}; }
};

/**
 * @brief Black-box speech-to-text capability
 *
 * Implementations receive mono PCM16 at sample_rate(). Calls may block for a
 * long time; they are never cancelled.
 */
class TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;

    virtual EngineResult transcribe(const int16_t* samples, size_t count, const DecodeParams& params) = 0;

    // Sample rate the engine expects its input at
    virtual int sample_rate() const = 0;

    virtual std::string name() const = 0;
};

} // namespace asr
