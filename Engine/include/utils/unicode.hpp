#pragma once

#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>

namespace Cerebrum {

/**
 * @brief Length in bytes of the UTF-8 sequence starting with lead byte c.
 *
 * Invalid lead bytes count as a single byte so malformed input never stalls a scan.
 */
inline size_t utf8_sequence_length(uint8_t c) {
    if (c < 0x80) return 1;
    if ((c >> 5) == 0x6) return 2;
    if ((c >> 4) == 0xE) return 3;
    if ((c >> 3) == 0x1E) return 4;
    return 1;
}

/**
 * @brief Number of code points in a UTF-8 string.
 */
inline size_t utf8_length(std::string_view s) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); ) {
        i += utf8_sequence_length(static_cast<uint8_t>(s[i]));
        ++count;
    }
    return count;
}

/**
 * @brief Keep at most max_codepoints code points, never splitting a sequence.
 */
inline std::string utf8_truncate(std::string_view s, size_t max_codepoints) {
    size_t i = 0;
    size_t count = 0;
    while (i < s.size() && count < max_codepoints) {
        size_t len = utf8_sequence_length(static_cast<uint8_t>(s[i]));
        if (i + len > s.size()) break;
        i += len;
        ++count;
    }
    return std::string(s.substr(0, i));
}

/**
 * @brief Strip ASCII whitespace from both ends.
 */
inline std::string trim(std::string_view s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return std::string(s.substr(begin, end - begin));
}

inline std::string to_lower_ascii(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

} // namespace Cerebrum
