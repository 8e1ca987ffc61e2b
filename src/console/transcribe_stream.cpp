// Streaming console: replays a WAV through the synthetic microphone into a
// chunked transcription session, then prints the final transcript.
#include <iostream>
#include <memory>
#include <string>
#include <chrono>
#include <cstdlib>
#include <algorithm>
#if defined(CHUNKSCRIBE_HAS_WHISPER)
#include "asr/whisper_engine.hpp"
#endif
#if defined(CHUNKSCRIBE_HAS_HTTP)
#include "asr/http_transcription_engine.hpp"
#endif
#include "asr/transcription_engine.hpp"
#include "audio/audio_input_device.hpp"
#include "audio/audio_input_device_synthetic.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/pipeline_controller.hpp"
#include "core/recording_store.hpp"

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <audio.wav> [--env FILE] [--model NAME] [--fast] [--no-save] [-v]\n"
                 "       " << argv0 << " --list-devices\n"
                 "  --env FILE      settings file (default .env)\n"
                 "  --model NAME    whisper model name or path (default DEFAULT_MODEL_SIZE)\n"
                 "  --fast          replay the file as fast as the engine keeps up\n"
                 "  --no-save       keep the recording in memory instead of RECORDINGS_DIR\n"
                 "  --list-devices  print the available input devices and exit\n"
                 "  -v              debug logging\n";
}

int list_devices() {
    auto devices = audio::AudioInputFactory::enumerate_devices();
    if (devices.empty()) {
        std::cout << "No input devices found." << std::endl;
        return 0;
    }
    std::cout << "Input devices:" << std::endl;
    for (size_t i = 0; i < devices.size(); ++i) {
        const auto& d = devices[i];
        std::cout << i << ": " << d.name << (d.is_default ? " [default]" : "") << "\n"
                  << "  ID: " << d.id << "\n"
                  << "  Driver: " << d.driver << ", " << d.default_sample_rate << " Hz, "
                  << d.max_channels << " ch\n";
    }
    std::cout << "Use synthetic:<file.wav> to replay a recording." << std::endl;
    return 0;
}

// TRANSCRIPTION_MODEL picks the engine. Null (with a message printed) when it cannot be built.
std::shared_ptr<asr::TranscriptionEngine> make_engine(const core::Config& settings) {
    if (settings.transcription_model == "fireworks" || settings.transcription_model == "openai") {
#if defined(CHUNKSCRIBE_HAS_HTTP)
        const bool fireworks = settings.transcription_model == "fireworks";
        const std::string& key = fireworks ? settings.fireworks_api_key : settings.openai_api_key;
        if (key.empty()) {
            std::cerr << (fireworks ? "FIREWORKS_API_KEY" : "OPENAI_API_KEY")
                      << " is not set (required for TRANSCRIPTION_MODEL=" << settings.transcription_model << ")\n";
            return nullptr;
        }
        auto opts = fireworks ? asr::HttpTranscriptionEngine::fireworks(key)
                              : asr::HttpTranscriptionEngine::openai(key);
        opts.timeout_seconds = settings.remote_timeout_seconds;
        auto engine = std::make_shared<asr::HttpTranscriptionEngine>(opts);
        core::log_info("Using remote engine " + engine->name());
        return engine;
#else
        std::cerr << "This build has no remote engine (libcurl and nlohmann_json were not found)\n";
        return nullptr;
#endif
    }

#if defined(CHUNKSCRIBE_HAS_WHISPER)
    asr::WhisperEngine::Options opts;
    opts.model_dir = settings.model_dir;
    opts.use_gpu = settings.use_gpu;
    opts.n_threads = settings.n_threads;
    auto engine = std::make_shared<asr::WhisperEngine>(opts);
    if (!engine->load_model(settings.whisper_model)) {
        std::cerr << "Whisper model not found. Place a model under " << settings.model_dir << "/, e.g.:\n"
                  << "  " << settings.model_dir << "/" << settings.whisper_model << ".gguf (GGUF)\n"
                  << "  " << settings.model_dir << "/ggml-" << settings.whisper_model << ".bin (legacy GGML BIN)\n";
        return nullptr;
    }
    return engine;
#else
    std::cerr << "This build has no local engine (whisper.cpp was not found); set TRANSCRIPTION_MODEL=fireworks or openai\n";
    return nullptr;
#endif
}

} // namespace

int main(int argc, char** argv) {
    std::string wav_path;
    std::string env_path = ".env";
    std::string model_arg;
    bool realtime = true;
    bool save = true;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "--verbose") { setenv("CHUNKSCRIBE_DEBUG", "1", 1); continue; }
        if (a == "--env" && i + 1 < argc) { env_path = argv[++i]; continue; }
        if (a == "--model" && i + 1 < argc) { model_arg = argv[++i]; continue; }
        if (a == "--fast") { realtime = false; continue; }
        if (a == "--no-save") { save = false; continue; }
        if (a == "--list-devices") { return list_devices(); }
        if (a == "-h" || a == "--help") { print_usage(argv[0]); return 0; }
        if (!a.empty() && a[0] == '-') {
            std::cerr << "Unknown option: " << a << "\n";
            print_usage(argv[0]);
            return 2;
        }
        wav_path = a; // first non-flag arg is the input file
    }
    if (wav_path.empty()) {
        print_usage(argv[0]);
        return 2;
    }

    core::Config settings = core::load_config(env_path);
    if (!model_arg.empty()) settings.whisper_model = model_arg;

    if (save && settings.delete_recordings) {
        core::RecordingStore store(settings.recordings_dir);
        size_t removed = store.cleanup_older_than(settings.max_recording_age_days);
        if (removed > 0) {
            core::log_info("Removed " + std::to_string(removed) + " recordings older than "
                           + std::to_string(settings.max_recording_age_days) + " days");
        }
    }

    auto engine = make_engine(settings);
    if (!engine) {
        return 1;
    }

    // Synthetic microphone
    audio::AudioInputConfig dev_cfg;
    dev_cfg.device_id = "synthetic:" + wav_path;
    dev_cfg.synthetic_file_path = wav_path;
    dev_cfg.synthetic_realtime = realtime;
    auto device = audio::AudioInputFactory::create_device(dev_cfg.device_id);
    if (!device) {
        core::log_error("Cannot create device " + dev_cfg.device_id);
        return 1;
    }

    // Without real-time pacing the file thread waits for the worker instead
    // of overflowing the queue.
    std::unique_ptr<core::PipelineController> controller;
    size_t pace_below = 0;
    auto on_audio = [&controller, &pace_below, realtime](const int16_t* samples, size_t frames, int, int) {
        if (!controller) return;
        if (!realtime && !controller->wait_for_queue_below(pace_below, std::chrono::seconds(60))) {
            core::log_warn("[pipeline] worker is not keeping up, feeding anyway");
        }
        controller->feed(samples, frames);
    };
    auto on_error = [](const std::string& msg, bool fatal) {
        if (fatal) core::log_error("[device] " + msg);
        else core::log_warn("[device] " + msg);
    };
    if (!device->initialize(dev_cfg, on_audio, on_error)) {
        return 1;
    }

    const audio::AudioInputConfig actual = device->get_actual_config();
    const audio::AudioDeviceInfo info = device->get_device_info();
    core::log_info("Input: " + info.name + ", " + std::to_string(info.default_sample_rate) + " Hz, "
                   + std::to_string(actual.channels) + " ch");
    settings.sample_rate = actual.sample_rate;
    core::PipelineController::Config pipe_cfg = core::make_pipeline_config(settings);
    pipe_cfg.channels = actual.channels;
    if (!save) pipe_cfg.recordings_dir.clear();
    pipe_cfg.on_state = [](core::PipelineState s) {
        core::log_debug(std::string("[pipeline] state -> ") + core::to_string(s));
    };

    pace_below = std::max<size_t>(1, pipe_cfg.queue_capacity / 2);
    controller = std::make_unique<core::PipelineController>(engine, pipe_cfg);
    if (!controller->start()) {
        return 1;
    }

    auto t0 = std::chrono::steady_clock::now();
    std::cout << "Transcribing " << wav_path << (realtime ? " (real time)" : "") << "..." << std::endl;
    if (!device->start()) {
        core::log_error("Failed to start capture");
        controller->stop();
        controller->finalize();
        return 1;
    }
    auto* synthetic = dynamic_cast<audio::AudioInputDevice_Synthetic*>(device.get());
    if (synthetic) synthetic->wait_until_finished();
    device->stop();

    controller->stop();
    core::RecordingTranscript result = controller->finish();
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

    if (!result.ok) {
        std::cerr << "Transcription failed: " << result.error << "\n";
        return 1;
    }

    const core::FinalizeResult& fin = result.finalize;
    std::cout << "\n" << result.text << "\n\n";
    std::cout << "Source: " << (result.used_fallback ? "full-file pass" : "incremental chunks")
              << " | windows: " << fin.windows_transcribed
              << " | dropped blocks: " << fin.dropped_blocks
              << " | engine errors: " << fin.engine_errors
              << " | elapsed: " << elapsed << "s\n";
    if (!fin.recording_path.empty()) {
        std::cout << "Recording: " << fin.recording_path << "\n";
    }
    return 0;
}
