#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace spancheck {

/**
 * @brief Normalise a textual option for comparison
 *
 * Trims surrounding whitespace and lower-cases the remainder, so that
 * "Simply Supported", " simply supported" and "SIMPLY SUPPORTED" compare equal.
 */
inline std::string normalize_option(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    if (begin >= end) return std::string();

    std::string result(begin, end);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace spancheck
