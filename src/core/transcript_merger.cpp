#include "core/transcript_merger.hpp"

#include <algorithm>
#include <cctype>

namespace core {

namespace {
bool is_word_byte(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

std::string lowercase(const std::string& s, const WordSpan& w) {
    std::string out = s.substr(w.begin, w.end - w.begin);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}
} // namespace

std::vector<WordSpan> find_words(const std::string& text) {
    std::vector<WordSpan> out;
    size_t i = 0;
    while (i < text.size()) {
        if (!is_word_byte(static_cast<unsigned char>(text[i]))) { ++i; continue; }
        size_t start = i;
        while (i < text.size() && is_word_byte(static_cast<unsigned char>(text[i]))) ++i;
        out.push_back({start, i});
    }
    return out;
}

std::vector<std::string> tokenize_words(const std::string& text) {
    std::vector<std::string> out;
    for (const auto& w : find_words(text)) {
        out.push_back(lowercase(text, w));
    }
    return out;
}

MergeResult TranscriptMerger::merge(const std::string& previous, const std::string& next) const {
    MergeResult r;
    if (previous.empty()) { r.text = next; return r; }
    if (next.empty()) { r.text = previous; return r; }

    const auto prev_tokens = tokenize_words(previous);
    const auto next_words = find_words(next);

    // Bounded windows: merge cost does not grow with the transcript
    const size_t suffix_len = std::min(prev_tokens.size(), max_overlap_words_);
    const size_t prefix_len = std::min(next_words.size(), max_overlap_words_);
    const size_t suffix_start = prev_tokens.size() - suffix_len;

    std::vector<std::string> prefix;
    prefix.reserve(prefix_len);
    for (size_t i = 0; i < prefix_len; ++i) {
        prefix.push_back(lowercase(next, next_words[i]));
    }

    for (size_t k = std::min(suffix_len, prefix_len); k >= kMinOverlapWords; --k) {
        bool match = true;
        for (size_t i = 0; i < k; ++i) {
            if (prev_tokens[suffix_start + suffix_len - k + i] != prefix[i]) { match = false; break; }
        }
        if (!match) continue;

        // Cut the first k words of the original-cased chunk
        size_t cut = next_words[k - 1].end;
        while (cut < next.size() && std::isspace(static_cast<unsigned char>(next[cut]))) ++cut;
        std::string remainder = next.substr(cut);

        r.overlap_words = k;
        r.text = remainder.empty() ? previous : previous + " " + remainder;
        return r;
    }

    r.ambiguous = true;
    r.text = previous + " " + next;
    return r;
}

} // namespace core
