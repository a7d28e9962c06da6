#ifndef FILE_GUARD_CCWC_UTF8_H
#define FILE_GUARD_CCWC_UTF8_H

#include <cstdint>
#include <string>

namespace ccwc {
namespace utf8 {

inline bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

// Given a lead byte, returns how many bytes the sequence should have along
// with the allowed range of the second byte. Returns 0 if the byte can't
// start a sequence at all (continuation bytes, C0, C1, F5..FF).
inline int sequence_length(unsigned char lead,
                           unsigned char & second_min,
                           unsigned char & second_max) {
    second_min = 0x80;
    second_max = 0xBF;
    if (lead < 0x80) {
        return 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
        return 2;
    } else if (lead == 0xE0) {
        second_min = 0xA0;  // overlong
        return 3;
    } else if (lead == 0xED) {
        second_max = 0x9F;  // surrogates
        return 3;
    } else if (lead >= 0xE1 && lead <= 0xEF) {
        return 3;
    } else if (lead == 0xF0) {
        second_min = 0x90;  // overlong
        return 4;
    } else if (lead == 0xF4) {
        second_max = 0x8F;  // above U+10FFFF
        return 4;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        return 4;
    }
    return 0;
}

// Returns an iterator one past the code point starting at BEGIN. An
// ill-formed sequence stops at its maximal subpart, so every byte belongs to
// exactly one code point or replacement character.
template<typename Iterator>
Iterator next_code_point(Iterator begin, Iterator end) {
    Iterator i = begin;
    unsigned char second_min;
    unsigned char second_max;
    const int length = sequence_length(
        static_cast<unsigned char>(*i), second_min, second_max);
    ++ i;
    if (length <= 1) {
        return i;
    }
    for (int n = 1; n < length; ++ n) {
        if (i == end) {
            return i;
        }
        const auto b = static_cast<unsigned char>(*i);
        if (n == 1 ? (b < second_min || b > second_max)
                   : !is_continuation(b)) {
            return i;
        }
        ++ i;
    }
    return i;
}

// Counts Unicode scalar values. Malformed input counts one U+FFFD for each
// maximal subpart, so this never fails.
template<typename Iterator>
std::uint64_t count_code_points(Iterator begin, Iterator end) {
    std::uint64_t count = 0;
    for (Iterator i = begin; i != end; i = next_code_point(i, end)) {
        ++ count;
    }
    return count;
}

inline std::uint64_t count_code_points(const std::string & text) {
    return count_code_points(text.begin(), text.end());
}

}  // end namespace utf8
}  // end namespace ccwc

#endif
