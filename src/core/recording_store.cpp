#include "core/recording_store.hpp"
#include "audio/wav_file.hpp"
#include "core/logging.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <system_error>

namespace core {

namespace fs = std::filesystem;

RecordingStore::RecordingStore(std::string directory) : directory_(std::move(directory)) {}

std::string RecordingStore::next_recording_path() const {
    std::error_code ec;
    fs::create_directories(fs::u8path(directory_), ec);
    if (ec) {
        log_error("[recordings] cannot create " + directory_ + ": " + ec.message());
        return {};
    }

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#if defined(_WIN32)
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_buf);

    const std::string base = std::string("recording_") + stamp;
    fs::path candidate = fs::u8path(directory_) / (base + ".wav");
    for (int n = 1; fs::exists(candidate, ec); ++n) {
        candidate = fs::u8path(directory_) / (base + "_" + std::to_string(n) + ".wav");
    }
    return candidate.u8string();
}

std::string RecordingStore::save(const std::vector<int16_t>& samples, int sample_rate, int channels) const {
    std::string path = next_recording_path();
    if (path.empty()) return {};
    if (!audio::write_wav(path, samples, sample_rate, channels)) {
        log_error("[recordings] failed to write " + path);
        return {};
    }
    log_info("[recordings] saved " + path);
    return path;
}

size_t RecordingStore::cleanup_older_than(int max_age_days) const {
    std::error_code ec;
    const fs::path dir = fs::u8path(directory_);
    if (!fs::is_directory(dir, ec)) return 0;

    const auto max_age = std::chrono::hours(24) * max_age_days;
    const auto now = fs::file_time_type::clock::now();
    size_t count = 0;

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) { ec.clear(); continue; }
        const auto ext = it->path().extension().string();
        if (ext != ".wav" && ext != ".m4a") continue;

        auto mtime = fs::last_write_time(it->path(), ec);
        if (ec) { ec.clear(); continue; }
        if (now - mtime <= max_age) continue;

        if (fs::remove(it->path(), ec)) {
            ++count;
        } else {
            log_warn("[recordings] could not delete " + it->path().u8string() + ": " + ec.message());
            ec.clear();
        }
    }
    if (ec) {
        log_warn("[recordings] cleanup stopped early: " + ec.message());
    }
    if (count > 0) {
        log_info("[recordings] cleaned up " + std::to_string(count) + " old recording" + (count > 1 ? "s" : ""));
    }
    return count;
}

}
