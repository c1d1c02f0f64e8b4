/**
 * @file admission_filter.cpp
 * @brief Implementation of snippet admission checks
 *
 * **Identifier scan**:
 * The snippet is tokenized by ScriptLexer, so the contents of string,
 * template and regex literals and of comments never match. An identifier is
 * skipped when it is used as a property name:
 * ```
 * response.module        // after '.'
 * response?.process      // after '?.'
 * { window: 1, self: 2 } // object key: preceded by '{' or ',' and followed by ':'
 * ```
 * Everything else, including shorthand properties (`{ process }`) and
 * declarations (`let fetch`), is treated as a reference and checked.
 *
 * @date 2025
 */

#include "evalbox/analyzers/admission_filter.hpp"
#include "evalbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace evalbox {
namespace analyzers {

using core::ErrorCategory;
using core::ErrorDetail;
using utils::StringUtils;

// ============================================================================
// CONSTRUCTOR
// ============================================================================

AdmissionFilter::AdmissionFilter()
    : AdmissionFilter(Config{}) {
}

AdmissionFilter::AdmissionFilter(const Config& config)
    : config_(config)
    , blocked_(config.blocked_identifiers.empty() ? DefaultBlockedIdentifiers()
                                                  : config.blocked_identifiers) {
    spdlog::debug("Admission filter initialized (max {} code points, {} blocked identifiers)",
                  config_.max_code_length, blocked_.size());
}

const std::set<std::string>& AdmissionFilter::DefaultBlockedIdentifiers() {
    static const std::set<std::string> blocked = {
        // Host globals
        "globalThis", "global", "window", "self", "document", "process",
        "navigator", "location",
        // Dynamic code
        "eval", "Function",
        // Module syntax
        "import", "export", "require", "module", "exports",
        // Timers
        "setTimeout", "setInterval", "setImmediate", "clearTimeout",
        "clearInterval", "clearImmediate", "queueMicrotask",
        // Network
        "fetch", "XMLHttpRequest", "WebSocket", "EventSource",
        // Host internals
        "Buffer", "__dirname", "__filename"
    };
    return blocked;
}

// ============================================================================
// ADMISSION
// ============================================================================

AdmissionVerdict AdmissionFilter::Admit(const core::Json& code, bool present) const {
    if (!present) {
        return Reject("Missing required field: code");
    }
    if (!code.is_string()) {
        return Reject("Code must be a string");
    }
    return Admit(code.get<std::string>());
}

AdmissionVerdict AdmissionFilter::Admit(const std::string& code) const {
    if (StringUtils::IsBlank(code)) {
        return Reject("Code must not be empty");
    }

    std::size_t length = StringUtils::CountCodePoints(code);
    if (length > config_.max_code_length) {
        spdlog::warn("Snippet rejected: {} code points exceeds limit of {}",
                     length, config_.max_code_length);
        auto verdict = Reject("Code too long. Maximum " +
                              StringUtils::FormatThousands(config_.max_code_length) +
                              " characters allowed.");
        verdict.code_points = length;
        return verdict;
    }

    if (code.find('\0') != std::string::npos) {
        return Reject("Code contains invalid characters");
    }

    parsers::ScriptLexer lexer(code);
    auto lexed = lexer.Tokenize();
    if (lexed.error) {
        spdlog::debug("Lexical error at line {}: {}", lexed.error->line, lexed.error->message);
        auto verdict = Reject("Syntax error: " + lexed.error->message +
                              " (line " + std::to_string(lexed.error->line) + ")");
        verdict.code_points = length;
        return verdict;
    }

    AdmissionVerdict verdict;
    verdict.code_points = length;

    if (config_.enable_identifier_scan) {
        for (const auto& token : lexed.tokens) {
            if (token.type == parsers::TokenType::IDENTIFIER) {
                ++verdict.identifier_count;
            }
        }

        if (auto name = FindBlockedIdentifier(lexed.tokens)) {
            spdlog::warn("Snippet references blocked identifier '{}'", *name);
            verdict.rejection = ErrorDetail{ErrorCategory::CAPABILITY_VIOLATION,
                                            "'" + *name + "' is not defined"};
            return verdict;
        }
    }

    verdict.admitted = true;
    spdlog::debug("Snippet admitted ({} code points, {} identifiers)",
                  verdict.code_points, verdict.identifier_count);
    return verdict;
}

// ============================================================================
// HELPERS
// ============================================================================

AdmissionVerdict AdmissionFilter::Reject(const std::string& message) const {
    AdmissionVerdict verdict;
    verdict.rejection = ErrorDetail{ErrorCategory::ADMISSION_REJECTED, message};
    spdlog::debug("Snippet rejected: {}", message);
    return verdict;
}

std::optional<std::string> AdmissionFilter::FindBlockedIdentifier(
    const std::vector<parsers::Token>& tokens) const {

    auto is_punct = [&tokens](std::size_t index, const char* text) {
        return index < tokens.size() &&
               tokens[index].type == parsers::TokenType::PUNCTUATOR &&
               tokens[index].text == text;
    };

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (token.type != parsers::TokenType::IDENTIFIER || blocked_.count(token.text) == 0) {
            continue;
        }

        if (i > 0 && (is_punct(i - 1, ".") || is_punct(i - 1, "?."))) {
            continue;
        }

        if (i > 0 && is_punct(i + 1, ":") && (is_punct(i - 1, "{") || is_punct(i - 1, ","))) {
            continue;
        }

        return token.text;
    }

    return std::nullopt;
}

} // namespace analyzers
} // namespace evalbox
