#include "asr/whisper_engine.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <filesystem>
#include <thread>
#include <vector>
#include <cstdio>

namespace {

// Filter whisper/ggml logs: keep errors/warnings always; info/debug only if verbose
void log_cb(ggml_log_level level, const char * text, void *) {
	switch (level) {
	case GGML_LOG_LEVEL_ERROR:
	case GGML_LOG_LEVEL_WARN:
		std::fputs(text, stderr);
		break;
	default:
		if (core::debug_enabled()) std::fputs(text, stderr);
		break;
	}
}

std::string trim(const std::string& x) {
	size_t a = x.find_first_not_of(" \t\r\n");
	if (a == std::string::npos) return {};
	size_t b = x.find_last_not_of(" \t\r\n");
	return x.substr(a, b - a + 1);
}

int resolve_threads(int requested) {
	if (requested > 0) return requested;
	return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
}

} // anonymous namespace

namespace asr {

bool is_non_speech_segment(const std::string& segment) {
	const std::string s = trim(segment);
	if (s.empty()) return true;
	// A single bracketed token: [BLANK_AUDIO], [ Silence ], [MUSIC] ...
	return s.size() > 2 && s.front() == '[' && s.back() == ']'
		&& s.find(']') == s.size() - 1;
}

whisper_context* init_with_cpu_fallback(whisper_context_params cparams, const ContextInit& init) {
	whisper_context* ctx = init(cparams);
	if (!ctx && cparams.use_gpu) {
		core::log_warn("[whisper] GPU acceleration failed, falling back to CPU");
		cparams.use_gpu = false;
		ctx = init(cparams);
	}
	return ctx;
}

WhisperEngine::WhisperEngine() = default;

WhisperEngine::WhisperEngine(Options options) : options_(std::move(options)) {}

WhisperEngine::~WhisperEngine() {
	std::lock_guard<std::mutex> lock(mutex_);
	if (state_) whisper_free_state(state_);
	if (ctx_) whisper_free(ctx_);
}

std::string WhisperEngine::resolve_model_path(const std::string& model_name, const std::string& model_dir) {
	auto exists = [](const std::string& p){ return std::filesystem::exists(std::filesystem::u8path(p)); };
	const bool has_ext = (model_name.find(".gguf") != std::string::npos) || (model_name.find(".bin") != std::string::npos);
	if (has_ext || (exists(model_name) && std::filesystem::is_regular_file(std::filesystem::u8path(model_name)))) {
		return model_name;
	}
	const std::string dir = model_dir.empty() ? std::string("models") : model_dir;
	// GGUF first, then legacy GGML BIN
	const std::string candidates[] = {
		dir + "/" + model_name + ".gguf",
		dir + "/ggml-" + model_name + "-q5_1.gguf",
		dir + "/ggml-" + model_name + ".gguf",
		dir + "/" + model_name + ".bin",
		dir + "/ggml-" + model_name + ".bin",
		dir + "/ggml-" + model_name + "-q5_1.bin",
	};
	for (const auto& c : candidates) {
		if (exists(c)) return c;
	}
	return candidates[0]; // may fail at load
}

bool WhisperEngine::load_model(const std::string& model_name) {
	std::lock_guard<std::mutex> lock(mutex_);
	if (ctx_) return true;

	const std::string path = resolve_model_path(model_name, options_.model_dir);
	// Set logging verbosity before creating context to suppress init spam when not verbose
	whisper_log_set(log_cb, nullptr);

	whisper_context_params cparams = whisper_context_default_params();
	cparams.use_gpu = options_.use_gpu;
	core::log_info("[whisper] init from: " + path);
	ctx_ = init_with_cpu_fallback(cparams, [&path](const whisper_context_params& p) {
		return whisper_init_from_file_with_params(path.c_str(), p);
	});
	if (!ctx_) {
		core::log_error("[whisper] init FAILED for path: " + path);
		return false;
	}
	// persistent state for faster repeated calls
	state_ = whisper_init_state(ctx_);
	if (!state_) {
		core::log_error("[whisper] state allocation failed");
		whisper_free(ctx_);
		ctx_ = nullptr;
		return false;
	}
	model_path_ = path;
	core::log_info("[whisper] init OK: " + path);
	core::log_debug(std::string("[whisper] system: ") + whisper_print_system_info());
	return true;
}

bool WhisperEngine::is_loaded() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return ctx_ != nullptr;
}

EngineResult WhisperEngine::transcribe(const int16_t* samples, size_t count, const DecodeParams& params) {
	if (!samples || count == 0) return EngineResult::success({});

	std::lock_guard<std::mutex> lock(mutex_);
	if (!ctx_ || !state_) return EngineResult::failure("whisper model not loaded");

	const bool beam = params.beam_size > 1;
	whisper_full_params wparams = whisper_full_default_params(beam ? WHISPER_SAMPLING_BEAM_SEARCH : WHISPER_SAMPLING_GREEDY);
	const bool verbose = core::debug_enabled();
	wparams.print_realtime   = false;
	wparams.print_progress   = false;
	wparams.print_timestamps = verbose;
	wparams.print_special    = false;
	wparams.translate        = false;
	wparams.language         = params.language.empty() ? "auto" : params.language.c_str();
	wparams.detect_language  = false;
	wparams.n_threads        = resolve_threads(params.n_threads > 0 ? params.n_threads : options_.n_threads);
	wparams.no_context       = params.no_context;
	wparams.single_segment   = params.single_segment;
	wparams.temperature      = params.temperature;
	wparams.token_timestamps = false;
	if (beam) {
		wparams.beam_search.beam_size = params.beam_size;
	} else {
		wparams.greedy.best_of = std::max(1, params.best_of);
	}

	// Convert int16 PCM to float [-1,1]
	std::vector<float> pcm_f32;
	pcm_f32.reserve(count);
	constexpr float scale = 1.0f / 32768.0f;
	for (size_t i = 0; i < count; ++i) {
		pcm_f32.push_back(static_cast<float>(samples[i]) * scale);
	}
	core::log_debug("[whisper] running on samples=" + std::to_string(pcm_f32.size())
		+ ", threads=" + std::to_string(wparams.n_threads)
		+ (beam ? ", beam=" + std::to_string(params.beam_size) : std::string(", greedy")));

	const int ret = whisper_full_with_state(ctx_, state_, wparams, pcm_f32.data(), static_cast<int>(pcm_f32.size()));
	if (ret != 0) {
		return EngineResult::failure("whisper_full failed, ret=" + std::to_string(ret));
	}

	std::string out;
	const int n = whisper_full_n_segments_from_state(state_);
	for (int i = 0; i < n; ++i) {
		const char* txt = whisper_full_get_segment_text_from_state(state_, i);
		if (!txt) continue;
		std::string s = trim(txt);
		if (is_non_speech_segment(s)) continue;
		if (!out.empty()) out += ' ';
		out += s;
	}
	return EngineResult::success(std::move(out));
}

int WhisperEngine::sample_rate() const {
	return WHISPER_SAMPLE_RATE;
}

std::string WhisperEngine::name() const {
	return model_path_.empty() ? std::string("whisper") : "whisper (" + model_path_ + ")";
}

} // namespace asr
