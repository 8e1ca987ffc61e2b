#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace core {

/**
 * @brief Directory of saved recordings used by the full-file pass
 */
class RecordingStore {
public:
    explicit RecordingStore(std::string directory);

    const std::string& directory() const { return directory_; }

    // recording_YYYYMMDD_HHMMSS.wav, suffixed _1, _2, ... if the name is taken.
    // Creates the directory. Returns empty on filesystem errors.
    std::string next_recording_path() const;

    // Writes interleaved PCM16 to a fresh path; returns it, or empty on failure.
    std::string save(const std::vector<int16_t>& samples, int sample_rate, int channels) const;

    // Deletes .wav / .m4a files last modified more than max_age_days ago.
    // Returns the number of files removed.
    size_t cleanup_older_than(int max_age_days) const;

private:
    std::string directory_;
};

}
