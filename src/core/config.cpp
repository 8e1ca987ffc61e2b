#include "core/config.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <map>
#include <stdexcept>

namespace core {

namespace {
std::string trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

std::map<std::string, std::string> read_env_file(const std::string& path) {
    std::map<std::string, std::string> values;
    std::ifstream f(path);
    if (!f) return values;
    std::string line;
    while (std::getline(f, line)) {
        std::string l = trim(line);
        if (l.empty() || l[0] == '#') continue;
        if (l.rfind("export ", 0) == 0) l = trim(l.substr(7));
        size_t eq = l.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(l.substr(0, eq));
        if (key.empty()) continue;
        values[key] = l.substr(eq + 1);
    }
    return values;
}
} // namespace

std::string clean_env_value(const std::string& value) {
    std::string v = value;
    size_t hash = v.find('#');
    if (hash != std::string::npos) v = v.substr(0, hash);
    v = trim(v);
    v.erase(std::remove_if(v.begin(), v.end(), [](char c) { return c == '"' || c == '\''; }), v.end());
    return v;
}

bool parse_bool_value(const std::string& value, bool fallback) {
    std::string v = clean_env_value(value);
    if (v.empty()) return fallback;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v == "true" || v == "yes" || v == "1";
}

int parse_int_value(const std::string& key, const std::string& value, int fallback) {
    std::string v = clean_env_value(value);
    if (v.empty()) return fallback;
    try {
        size_t used = 0;
        int parsed = std::stoi(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return parsed;
    } catch (const std::logic_error&) {
        log_warn("[config] invalid " + key + " value '" + v + "', using default of " + std::to_string(fallback));
        return fallback;
    }
}

double parse_double_value(const std::string& key, const std::string& value, double fallback) {
    std::string v = clean_env_value(value);
    if (v.empty()) return fallback;
    try {
        size_t used = 0;
        double parsed = std::stod(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return parsed;
    } catch (const std::logic_error&) {
        log_warn("[config] invalid " + key + " value '" + v + "', using default of " + std::to_string(fallback));
        return fallback;
    }
}

Config load_config(const std::string& env_path) {
    Config cfg;
    const auto file_values = read_env_file(env_path);

    // Environment wins over the file
    auto lookup = [&file_values](const std::string& key, std::string& out) {
        if (const char* env = std::getenv(key.c_str())) {
            out = env;
            return true;
        }
        auto it = file_values.find(key);
        if (it == file_values.end()) return false;
        out = it->second;
        return true;
    };
    auto set_string = [&](const char* key, std::string& field) {
        std::string raw;
        if (lookup(key, raw)) {
            std::string v = clean_env_value(raw);
            if (!v.empty()) field = v;
        }
    };
    auto set_int = [&](const char* key, int& field) {
        std::string raw;
        if (lookup(key, raw)) field = parse_int_value(key, raw, field);
    };
    auto set_double = [&](const char* key, double& field) {
        std::string raw;
        if (lookup(key, raw)) field = parse_double_value(key, raw, field);
    };
    auto set_bool = [&](const char* key, bool& field) {
        std::string raw;
        if (lookup(key, raw)) field = parse_bool_value(raw, field);
    };

    set_string("TRANSCRIPTION_MODEL", cfg.transcription_model);
    set_string("FIREWORKS_API_KEY", cfg.fireworks_api_key);
    set_string("OPENAI_API_KEY", cfg.openai_api_key);
    set_int("REMOTE_TIMEOUT_SECONDS", cfg.remote_timeout_seconds);

    set_string("LOCAL_MODEL_PATH", cfg.model_dir);
    set_string("DEFAULT_MODEL_SIZE", cfg.whisper_model);
    set_string("TRANSCRIPTION_LANGUAGE", cfg.language);
    set_int("WHISPER_THREADS", cfg.n_threads);
    set_bool("USE_GPU", cfg.use_gpu);

    set_int("SAMPLE_RATE", cfg.sample_rate);
    set_string("RECORDINGS_DIR", cfg.recordings_dir);
    set_bool("DELETE_RECORDINGS", cfg.delete_recordings);
    set_int("MAX_RECORDING_AGE_DAYS", cfg.max_recording_age_days);

    set_double("CHUNK_WINDOW_SECONDS", cfg.window_duration_s);
    set_double("CHUNK_OVERLAP_SECONDS", cfg.overlap_duration_s);
    set_double("CHUNK_MIN_FLUSH_SECONDS", cfg.min_flush_duration_s);
    set_int("CHUNK_QUEUE_CAPACITY", cfg.queue_capacity);
    set_int("MERGE_MAX_OVERLAP_WORDS", cfg.max_overlap_words);
    set_int("FINALIZE_TIMEOUT_MS", cfg.finalize_timeout_ms);
    set_int("CHUNK_BEAM_SIZE", cfg.chunk_beam_size);
    set_int("FULL_BEAM_SIZE", cfg.full_beam_size);

    // Sanity checks: keep defaults for values that cannot work
    const Config defaults;
    std::transform(cfg.transcription_model.begin(), cfg.transcription_model.end(), cfg.transcription_model.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (cfg.transcription_model != "local" && cfg.transcription_model != "fireworks"
        && cfg.transcription_model != "openai") {
        log_warn("[config] unknown TRANSCRIPTION_MODEL '" + cfg.transcription_model + "', using local");
        cfg.transcription_model = defaults.transcription_model;
    }
    if (cfg.remote_timeout_seconds <= 0) cfg.remote_timeout_seconds = defaults.remote_timeout_seconds;
    if (cfg.sample_rate <= 0) {
        log_warn("[config] SAMPLE_RATE must be positive, using " + std::to_string(defaults.sample_rate));
        cfg.sample_rate = defaults.sample_rate;
    }
    if (cfg.window_duration_s <= 0.0) {
        log_warn("[config] CHUNK_WINDOW_SECONDS must be positive, using default");
        cfg.window_duration_s = defaults.window_duration_s;
    }
    if (cfg.overlap_duration_s < 0.0 || cfg.overlap_duration_s >= cfg.window_duration_s) {
        log_warn("[config] CHUNK_OVERLAP_SECONDS must be in [0, window), using default");
        cfg.overlap_duration_s = std::min(defaults.overlap_duration_s, cfg.window_duration_s / 2.0);
    }
    if (cfg.queue_capacity <= 0) cfg.queue_capacity = defaults.queue_capacity;
    if (cfg.max_overlap_words < 2) cfg.max_overlap_words = defaults.max_overlap_words;
    if (cfg.finalize_timeout_ms <= 0) cfg.finalize_timeout_ms = defaults.finalize_timeout_ms;
    if (cfg.max_recording_age_days < 0) cfg.max_recording_age_days = defaults.max_recording_age_days;
    cfg.chunk_beam_size = std::max(1, cfg.chunk_beam_size);
    cfg.full_beam_size = std::max(1, cfg.full_beam_size);
    return cfg;
}

}
