/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * Snippet text arrives as UTF-8 from JSON request bodies. Length limits are
 * expressed in code points so that a 10,000 character limit means the same
 * thing for ASCII and non-ASCII submissions.
 *
 * @date 2025
 */

#include "evalbox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace evalbox {
namespace utils {

// ============================================================================
// MEASURING
// ============================================================================

// Count UTF-8 code points
std::size_t StringUtils::CountCodePoints(const std::string& str) {
    std::size_t count = 0;
    for (unsigned char c : str) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

// Whitespace-only check
bool StringUtils::IsBlank(const std::string& str) {
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c); });
}

// ============================================================================
// MANIPULATION
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

// ============================================================================
// FORMATTING
// ============================================================================

// 10000 -> "10,000"
std::string StringUtils::FormatThousands(std::uint64_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);

    std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == lead) {
            result += ',';
        }
        result += digits[i];
    }

    return result;
}

// Truncate on a code point boundary
std::string StringUtils::Truncate(const std::string& str,
                                  std::size_t max_length,
                                  const std::string& suffix) {
    if (str.length() <= max_length) {
        return str;
    }
    if (max_length <= suffix.length()) {
        return suffix.substr(0, max_length);
    }

    std::size_t cut = max_length - suffix.length();
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) {
        --cut;
    }

    return str.substr(0, cut) + suffix;
}

// One-line preview for logs
std::string StringUtils::Preview(const std::string& str, std::size_t max_length) {
    std::string flat;
    flat.reserve(std::min(str.size(), max_length + 8));

    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        flat += (uc < 0x20 || uc == 0x7F) ? ' ' : c;
        if (flat.size() > max_length + 8) {
            break;
        }
    }

    return Truncate(flat, max_length);
}

} // namespace utils
} // namespace evalbox
