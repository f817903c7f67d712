#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace filetree::string_utils {

inline bool is_digit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

inline std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

// Number of code points in a UTF-8 string; continuation bytes are skipped.
inline std::size_t display_width(std::string_view text) {
    std::size_t width = 0;
    for (unsigned char ch : text) {
        if ((ch & 0xC0u) != 0x80u) {
            ++width;
        }
    }
    return width;
}

// Lower-cases UTF-8 text: ASCII, Latin-1, Latin Extended-A, Greek and
// Cyrillic capitals map to their single lower-case letter. Other code
// points and invalid bytes are copied unchanged.
std::string fold_case(std::string_view text);

bool wildcard_match(std::string_view pattern, std::string_view text);

} // namespace filetree::string_utils
