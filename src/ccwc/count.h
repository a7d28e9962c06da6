#ifndef FILE_GUARD_CCWC_COUNT_H
#define FILE_GUARD_CCWC_COUNT_H

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string>
#include <ccwc/utf8.h>

namespace ccwc {

// The four counts reported for a source.
struct statistics {
    std::uint64_t bytes;
    std::uint64_t lines;
    std::uint64_t words;
    std::uint64_t chars;

    statistics()
    :   bytes(0),
        lines(0),
        words(0),
        chars(0)
    {}
};

// Returns true if C separates words. Only ASCII whitespace counts, which
// means this works on raw UTF-8 bytes: no multi-byte sequence contains one.
inline bool is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n'
        || c == '\v' || c == '\f' || c == '\r';
}

template<typename Iterator>
std::uint64_t count_bytes(Iterator begin, Iterator end) {
    return static_cast<std::uint64_t>(std::distance(begin, end));
}

// Counts '\n' bytes, so text after the last newline isn't a line.
template<typename Iterator>
std::uint64_t count_lines(Iterator begin, Iterator end) {
    return static_cast<std::uint64_t>(std::count(begin, end, '\n'));
}

// Counts runs of non-whitespace.
template<typename Iterator>
std::uint64_t count_words(Iterator begin, Iterator end) {
    std::uint64_t words = 0;
    bool in_word = false;
    for(Iterator i = begin; i != end; ++i) {
        const bool word_char = !is_whitespace(*i);
        if (!in_word && word_char) {
            ++ words;
            in_word = true;
        } else if (in_word && !word_char) {
            in_word = false;
        }
    }
    return words;
}

template<typename Iterator>
std::uint64_t count_chars(Iterator begin, Iterator end) {
    return utf8::count_code_points(begin, end);
}

inline std::uint64_t count_bytes(const std::string & text) {
    return text.size();
}

inline std::uint64_t count_lines(const std::string & text) {
    return count_lines(text.begin(), text.end());
}

inline std::uint64_t count_words(const std::string & text) {
    return count_words(text.begin(), text.end());
}

inline std::uint64_t count_chars(const std::string & text) {
    return count_chars(text.begin(), text.end());
}

// Each count is taken independently from the same bytes.
inline statistics compute_statistics(const std::string & content) {
    statistics stats;
    stats.bytes = count_bytes(content);
    stats.lines = count_lines(content);
    stats.words = count_words(content);
    stats.chars = count_chars(content);
    return stats;
}

}  // end namespace ccwc

#endif
