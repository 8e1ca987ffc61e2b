#pragma once
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "asr/transcription_engine.hpp"
#include "whisper.h"

namespace asr {

/**
 * @brief TranscriptionEngine over a local whisper.cpp model
 *
 * Owns one context and one persistent state. Calls are serialized, so a
 * chunk worker still running after finalize() and the full-file pass never
 * share the state concurrently.
 */
class WhisperEngine : public TranscriptionEngine {
public:
	struct Options {
		std::string model_dir = "models";
		bool use_gpu = false;
		int n_threads = 0;      // 0 = hardware concurrency, unless DecodeParams sets it
	};

	WhisperEngine();
	explicit WhisperEngine(Options options);
	~WhisperEngine() override;

	WhisperEngine(const WhisperEngine&) = delete;
	WhisperEngine& operator=(const WhisperEngine&) = delete;

	// Model name ("small.en", "base") resolved under model_dir, or a path to a
	// .gguf / .bin file. Returns false if the model cannot be loaded.
	bool load_model(const std::string& model_name);
	bool is_loaded() const;
	const std::string& model_path() const { return model_path_; }

	EngineResult transcribe(const int16_t* samples, size_t count, const DecodeParams& params) override;
	int sample_rate() const override;
	std::string name() const override;

	// First existing candidate for a model name, else <model_dir>/<name>.gguf
	static std::string resolve_model_path(const std::string& model_name, const std::string& model_dir);

private:
	Options options_;
	mutable std::mutex mutex_;
	whisper_context* ctx_ = nullptr;
	whisper_state* state_ = nullptr;
	std::string model_path_;
};

using ContextInit = std::function<whisper_context*(const whisper_context_params&)>;

// Runs `init` with the given params; if that fails with use_gpu set, warns and
// retries once on the CPU.
whisper_context* init_with_cpu_fallback(whisper_context_params cparams, const ContextInit& init);

// Drops segments that are only a non-speech marker such as [BLANK_AUDIO] or [ Silence ]
bool is_non_speech_segment(const std::string& segment);

} // namespace asr
