/**
 * @file string_utils.hpp
 * @brief String helpers shared by the admission filter, engine and CLI
 *
 * Small, allocation-light utilities for measuring, trimming and formatting
 * snippet text and diagnostic messages. Script text is treated as UTF-8.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstdint>

namespace evalbox {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * if (StringUtils::IsBlank(code)) {
 *     return Reject("Code must not be empty");
 * }
 *
 * auto length = StringUtils::CountCodePoints(code);
 * spdlog::debug("Snippet preview: {}", StringUtils::Preview(code, 60));
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Measuring
     ***************************************************************************/

    /**
     * @brief Count Unicode code points in a UTF-8 string
     *
     * Continuation bytes (10xxxxxx) are not counted, so a malformed sequence
     * still yields a count no larger than the byte length.
     *
     * @param str UTF-8 text
     * @return Number of code points
     */
    static std::size_t CountCodePoints(const std::string& str);

    /**
     * @brief Check whether a string is empty or whitespace only
     * @param str Input string
     * @return true if nothing but whitespace
     */
    static bool IsBlank(const std::string& str);

    /***************************************************************************
     * Manipulation
     ***************************************************************************/

    /**
     * @brief Trim leading and trailing whitespace
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert to lowercase (ASCII)
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /***************************************************************************
     * Formatting
     ***************************************************************************/

    /**
     * @brief Format an integer with thousands separators
     *
     * **Example**: `FormatThousands(10000)` returns `"10,000"`
     *
     * @param value Number to format
     * @return Formatted number
     */
    static std::string FormatThousands(std::uint64_t value);

    /**
     * @brief Truncate string to a byte limit without splitting a UTF-8 sequence
     *
     * @param str Input string
     * @param max_length Maximum length in bytes (including suffix)
     * @param suffix Appended when truncation happens
     * @return Truncated string
     */
    static std::string Truncate(const std::string& str,
                                std::size_t max_length,
                                const std::string& suffix = "...");

    /**
     * @brief Single-line preview of a snippet for log output
     *
     * Control characters (including newlines) are replaced by spaces and the
     * result is truncated to `max_length` bytes.
     *
     * @param str Input text
     * @param max_length Maximum preview length
     * @return Printable one-line preview
     */
    static std::string Preview(const std::string& str, std::size_t max_length = 80);
};

} // namespace utils
} // namespace evalbox
