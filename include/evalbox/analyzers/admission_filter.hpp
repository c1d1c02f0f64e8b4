/**
 * @file admission_filter.hpp
 * @brief Pre-execution validation of submitted snippets
 *
 * The admission filter is the first stage of every evaluation. It checks the
 * shape and size of the submitted code, verifies that it is lexically sound
 * and runs a fail-closed identifier scan against a blocklist of host
 * capabilities. Nothing is executed at this stage.
 *
 * The blocklist is a pre-filter only. The structural boundary is the
 * allow-listed global scope of the sandbox; a blocklist hit is reported with
 * the same message an unresolved reference produces at run time.
 *
 * @date 2025
 */

#pragma once

#include "evalbox/core/types.hpp"
#include "evalbox/parsers/script_lexer.hpp"

#include <set>
#include <string>
#include <optional>
#include <vector>

namespace evalbox {
namespace analyzers {

/**
 * @struct AdmissionVerdict
 * @brief Outcome of admitting one snippet
 */
struct AdmissionVerdict {
    bool admitted{false};                          ///< Snippet may be executed
    std::optional<core::ErrorDetail> rejection;    ///< Set when not admitted
    std::size_t code_points{0};                    ///< Measured length
    std::size_t identifier_count{0};               ///< Identifiers scanned
};

/**
 * @class AdmissionFilter
 * @brief Size, shape, lexical and blocklist checks
 *
 * **Checks (in order)**:
 * 1. Code present and a string (JSON overload only)
 * 2. Not blank
 * 3. At most `max_code_length` code points
 * 4. No NUL bytes
 * 5. Lexically well formed (literals, comments, bracket nesting)
 * 6. No identifier from the blocklist outside property position
 *
 * Checks 1-5 produce `AdmissionRejected`, check 6 produces
 * `CapabilityViolation`.
 *
 * **Thread Safety**: Admit() is const and safe to call concurrently.
 *
 * **Usage Example**:
 * @code
 * AdmissionFilter filter;
 * auto verdict = filter.Admit(request.code);
 * if (!verdict.admitted) {
 *     spdlog::warn("Rejected: {}", verdict.rejection->message);
 * }
 * @endcode
 */
class AdmissionFilter {
public:
    /**
     * @struct Config
     * @brief Admission limits
     */
    struct Config {
        std::size_t max_code_length{10000};        ///< Maximum length in code points
        bool enable_identifier_scan{true};         ///< Run the blocklist scan
        std::set<std::string> blocked_identifiers; ///< Empty means DefaultBlockedIdentifiers()
    };

    explicit AdmissionFilter(const Config& config);
    AdmissionFilter();

    /**
     * @brief Admit a snippet given as text
     * @param code Snippet source
     * @return Verdict
     */
    AdmissionVerdict Admit(const std::string& code) const;

    /**
     * @brief Admit the `code` member of a request body
     *
     * Rejects missing and non-string values before running the text checks.
     *
     * @param code JSON value of the `code` member (null when missing)
     * @param present Whether the member was present at all
     */
    AdmissionVerdict Admit(const core::Json& code, bool present) const;

    /**
     * @brief Built-in blocklist of host globals, dynamic code, module
     *        syntax, timers, network and host internals
     */
    static const std::set<std::string>& DefaultBlockedIdentifiers();

    const Config& GetConfig() const { return config_; }

private:
    AdmissionVerdict Reject(const std::string& message) const;
    std::optional<std::string> FindBlockedIdentifier(
        const std::vector<parsers::Token>& tokens) const;

    Config config_;
    std::set<std::string> blocked_;
};

} // namespace analyzers
} // namespace evalbox
