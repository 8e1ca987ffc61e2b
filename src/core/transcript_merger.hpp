#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace core {

/**
 * @brief Outcome of appending one chunk's text to the running transcript
 */
struct MergeResult {
    std::string text;           ///< Merged transcript
    size_t overlap_words = 0;   ///< Words removed from the new chunk
    bool ambiguous = false;     ///< No shared run found, plain concatenation used
};

/**
 * @brief De-duplicates text repeated across consecutive overlapping windows
 *
 * Looks for the longest run (at least 2 words) where the end of the
 * transcript equals the start of the new chunk, comparing lowercase word
 * tokens within the last/first max_overlap_words words only. The matched
 * words are cut from the new chunk's original text. This also removes a
 * speaker's genuine repetition when it falls on a chunk boundary.
 */
class TranscriptMerger {
public:
    static constexpr size_t kDefaultMaxOverlapWords = 30;
    static constexpr size_t kMinOverlapWords = 2;

    explicit TranscriptMerger(size_t max_overlap_words = kDefaultMaxOverlapWords)
        : max_overlap_words_(max_overlap_words) {}

    MergeResult merge(const std::string& previous, const std::string& next) const;

    size_t max_overlap_words() const { return max_overlap_words_; }

private:
    size_t max_overlap_words_;
};

struct WordSpan {
    size_t begin;
    size_t end;     // one past the last byte
};

// Word boundaries in `text`: runs of ASCII alphanumerics, '_' or non-ASCII bytes
std::vector<WordSpan> find_words(const std::string& text);

// Lowercase word tokens of `text`
std::vector<std::string> tokenize_words(const std::string& text);

} // namespace core
