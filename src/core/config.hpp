#pragma once
#include <string>

namespace core {

/**
 * @brief Application settings, read from a .env file and the environment
 */
struct Config {
    // Engine
    std::string transcription_model = "local";  ///< TRANSCRIPTION_MODEL: local | fireworks | openai
    std::string fireworks_api_key;              ///< FIREWORKS_API_KEY
    std::string openai_api_key;                 ///< OPENAI_API_KEY
    int remote_timeout_seconds = 120;           ///< REMOTE_TIMEOUT_SECONDS

    // Local model
    std::string model_dir = "models";           ///< LOCAL_MODEL_PATH
    std::string whisper_model = "small.en";     ///< DEFAULT_MODEL_SIZE: name or explicit path
    std::string language = "en";                ///< TRANSCRIPTION_LANGUAGE
    int n_threads = 0;                          ///< WHISPER_THREADS (0 = auto)
    bool use_gpu = false;                       ///< USE_GPU

    // Capture and recordings
    int sample_rate = 44100;                    ///< SAMPLE_RATE
    std::string recordings_dir = "recordings";  ///< RECORDINGS_DIR
    bool delete_recordings = true;              ///< DELETE_RECORDINGS (age-based cleanup)
    int max_recording_age_days = 7;             ///< MAX_RECORDING_AGE_DAYS

    // Chunked pipeline
    double window_duration_s = 12.0;            ///< CHUNK_WINDOW_SECONDS
    double overlap_duration_s = 1.0;            ///< CHUNK_OVERLAP_SECONDS
    double min_flush_duration_s = 0.5;          ///< CHUNK_MIN_FLUSH_SECONDS
    int queue_capacity = 512;                   ///< CHUNK_QUEUE_CAPACITY (blocks)
    int max_overlap_words = 30;                 ///< MERGE_MAX_OVERLAP_WORDS
    int finalize_timeout_ms = 10000;            ///< FINALIZE_TIMEOUT_MS
    int chunk_beam_size = 1;                    ///< CHUNK_BEAM_SIZE
    int full_beam_size = 5;                     ///< FULL_BEAM_SIZE
};

// Loads defaults, then `env_path` (KEY=VALUE lines, missing file is fine),
// then the process environment, which wins over the file.
Config load_config(const std::string& env_path = ".env");

// Strips an inline '#' comment, surrounding whitespace and any quote characters.
std::string clean_env_value(const std::string& value);

bool parse_bool_value(const std::string& value, bool fallback);
int parse_int_value(const std::string& key, const std::string& value, int fallback);
double parse_double_value(const std::string& key, const std::string& value, double fallback);

}
