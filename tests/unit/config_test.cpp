#undef NDEBUG  // assert() must stay active in release builds
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include "core/config.hpp"
#include "core/pipeline_controller.hpp"

namespace fs = std::filesystem;

int main() {
    const fs::path dir = fs::temp_directory_path() / "chunkscribe_config_test";
    fs::create_directories(dir);
    const fs::path env = dir / "test.env";
    for (const char* key : {"TRANSCRIPTION_MODEL", "FIREWORKS_API_KEY", "OPENAI_API_KEY", "REMOTE_TIMEOUT_SECONDS"}) {
        unsetenv(key);
    }

    // Value cleaning and scalar parsing
    {
        assert(core::clean_env_value("  small.en   # default model") == "small.en");
        assert(core::clean_env_value("\"models/whisper\"") == "models/whisper");
        assert(core::clean_env_value("'en'") == "en");
        assert(core::parse_bool_value("TRUE", false));
        assert(core::parse_bool_value("yes", false));
        assert(core::parse_bool_value("1", false));
        assert(!core::parse_bool_value("off", true));
        assert(core::parse_bool_value("", true));
        assert(core::parse_int_value("K", "42", 0) == 42);
        assert(core::parse_int_value("K", "4x2", 7) == 7);
        assert(core::parse_int_value("K", "abc", 7) == 7);
        assert(core::parse_double_value("K", "1.5", 0.0) == 1.5);
        assert(core::parse_double_value("K", "1.5s", 2.0) == 2.0);
    }

    // Missing file: defaults
    {
        core::Config cfg = core::load_config((dir / "does_not_exist.env").string());
        assert(cfg.model_dir == "models");
        assert(cfg.whisper_model == "small.en");
        assert(cfg.sample_rate == 44100);
        assert(cfg.window_duration_s == 12.0);
        assert(cfg.overlap_duration_s == 1.0);
        assert(cfg.queue_capacity == 512);
        assert(cfg.max_overlap_words == 30);
        assert(cfg.finalize_timeout_ms == 10000);
        assert(cfg.delete_recordings);
        assert(cfg.max_recording_age_days == 7);
        assert(cfg.transcription_model == "local");
        assert(cfg.fireworks_api_key.empty());
        assert(cfg.openai_api_key.empty());
        assert(cfg.remote_timeout_seconds == 120);
    }

    // File values: comments, quotes, booleans, invalid integers
    {
        std::ofstream f(env);
        f << "# chunkscribe settings\n"
          << "\n"
          << "DEFAULT_MODEL_SIZE=\"base.en\"   # smaller model\n"
          << "LOCAL_MODEL_PATH='/opt/models'\n"
          << "USE_GPU=yes\n"
          << "DELETE_RECORDINGS=false\n"
          << "SAMPLE_RATE=48000\n"
          << "WHISPER_THREADS=four\n"
          << "CHUNK_WINDOW_SECONDS=8\n"
          << "CHUNK_OVERLAP_SECONDS=0.5\n"
          << "CHUNK_QUEUE_CAPACITY=64\n"
          << "export FINALIZE_TIMEOUT_MS=2500\n"
          << "not a setting line\n";
    }
    unsetenv("SAMPLE_RATE");
    {
        core::Config cfg = core::load_config(env.string());
        assert(cfg.whisper_model == "base.en");
        assert(cfg.model_dir == "/opt/models");
        assert(cfg.use_gpu);
        assert(!cfg.delete_recordings);
        assert(cfg.sample_rate == 48000);
        assert(cfg.n_threads == 0);
        assert(cfg.window_duration_s == 8.0);
        assert(cfg.overlap_duration_s == 0.5);
        assert(cfg.queue_capacity == 64);
        assert(cfg.finalize_timeout_ms == 2500);

        core::PipelineController::Config pc = core::make_pipeline_config(cfg);
        assert(pc.sample_rate == 48000);
        assert(pc.window_frames() == 8 * 48000);
        assert(pc.overlap_frames() == 24000);
        assert(pc.queue_capacity == 64);
        assert(pc.finalize_timeout.count() == 2500);
        assert(pc.chunk_params.beam_size == 1);
        assert(pc.full_params.beam_size == 5);
    }

    // The environment wins over the file
    {
        setenv("SAMPLE_RATE", "16000", 1);
        core::Config cfg = core::load_config(env.string());
        assert(cfg.sample_rate == 16000);
        unsetenv("SAMPLE_RATE");
    }

    // Remote engine selection and keys
    {
        std::ofstream f(env);
        f << "TRANSCRIPTION_MODEL=Fireworks   # remote\n"
          << "FIREWORKS_API_KEY=\"fw-123\"\n"
          << "REMOTE_TIMEOUT_SECONDS=30\n";
    }
    {
        core::Config cfg = core::load_config(env.string());
        assert(cfg.transcription_model == "fireworks");
        assert(cfg.fireworks_api_key == "fw-123");
        assert(cfg.openai_api_key.empty());
        assert(cfg.remote_timeout_seconds == 30);

        setenv("TRANSCRIPTION_MODEL", "openai", 1);
        setenv("OPENAI_API_KEY", "sk-abc", 1);
        cfg = core::load_config(env.string());
        assert(cfg.transcription_model == "openai");
        assert(cfg.openai_api_key == "sk-abc");

        setenv("TRANSCRIPTION_MODEL", "deepgram", 1);
        cfg = core::load_config(env.string());
        assert(cfg.transcription_model == "local");
        unsetenv("TRANSCRIPTION_MODEL");
        unsetenv("OPENAI_API_KEY");
    }

    // Unusable values are replaced by defaults
    {
        std::ofstream f(env);
        f << "SAMPLE_RATE=-5\n"
          << "CHUNK_WINDOW_SECONDS=4\n"
          << "CHUNK_OVERLAP_SECONDS=4\n"
          << "CHUNK_QUEUE_CAPACITY=0\n"
          << "REMOTE_TIMEOUT_SECONDS=0\n";
    }
    {
        core::Config cfg = core::load_config(env.string());
        assert(cfg.sample_rate == 44100);
        assert(cfg.window_duration_s == 4.0);
        assert(cfg.overlap_duration_s < cfg.window_duration_s);
        assert(cfg.queue_capacity == 512);
        assert(cfg.remote_timeout_seconds == 120);
    }

    fs::remove_all(dir);
    return 0;
}
