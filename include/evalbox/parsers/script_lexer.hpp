/**
 * @file script_lexer.hpp
 * @brief Lightweight JavaScript tokenizer used for pre-execution checks
 *
 * Splits a snippet into identifiers, literals and punctuators without building
 * a syntax tree. String, template and regular-expression literals as well as
 * comments are recognised so that their contents are never mistaken for code,
 * while template `${}` substitutions are tokenized as code. Bracket nesting is
 * tracked to detect malformed input.
 *
 * The lexer is deliberately conservative: any input it cannot make sense of is
 * reported as an error so that callers can fail closed.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace evalbox {
namespace parsers {

/**
 * @enum TokenType
 * @brief Coarse token classification
 */
enum class TokenType {
    IDENTIFIER,   ///< Identifier or reserved word, unicode escapes decoded
    NUMBER,       ///< Numeric literal
    STRING,       ///< Quoted string literal
    TEMPLATE,     ///< Template literal text chunk
    REGEX,        ///< Regular-expression literal
    PUNCTUATOR    ///< Operator or bracket
};

/**
 * @struct Token
 * @brief One lexical token
 */
struct Token {
    TokenType type{TokenType::PUNCTUATOR};  ///< Classification
    std::string text;                       ///< Identifier name or punctuator text
    std::size_t offset{0};                  ///< Byte offset in source
    std::size_t line{1};                    ///< 1-based line number
};

/**
 * @struct LexError
 * @brief First lexical error found
 */
struct LexError {
    std::string message;     ///< Description (e.g. "Unterminated string literal")
    std::size_t offset{0};   ///< Byte offset
    std::size_t line{1};     ///< 1-based line number
};

/**
 * @struct LexResult
 * @brief Token stream or error
 */
struct LexResult {
    std::vector<Token> tokens;       ///< Tokens up to the error (if any)
    std::optional<LexError> error;   ///< Set when the input is malformed
};

/**
 * @class ScriptLexer
 * @brief Single-pass tokenizer
 *
 * **Checks performed**:
 * - Unterminated string, template, regex literal or block comment
 * - Closing bracket without a matching opener, or of the wrong kind
 * - Brackets still open at end of input
 * - Malformed `\u` escapes inside identifiers
 * - A `/` whose meaning (regex or division) depends on parser context the
 *   lexer does not track, e.g. after `}` or after `of`
 * - Unicode whitespace outside literals, and HTML-like comments
 *
 * **Usage Example**:
 * @code
 * ScriptLexer lexer(code);
 * auto result = lexer.Tokenize();
 * if (result.error) {
 *     spdlog::warn("Line {}: {}", result.error->line, result.error->message);
 * }
 * for (const auto& token : result.tokens) {
 *     if (token.type == TokenType::IDENTIFIER) { ... }
 * }
 * @endcode
 */
class ScriptLexer {
public:
    /**
     * @brief Construct lexer over source text
     * @param source Snippet text (UTF-8)
     */
    explicit ScriptLexer(std::string source);

    /**
     * @brief Tokenize the whole input
     * @return Token stream, with `error` set on the first problem
     */
    LexResult Tokenize();

private:
    enum class Bracket { PAREN, SQUARE, CURLY, SUBSTITUTION, CONTROL_PAREN };
    enum class SlashMeaning { REGEX, DIVISION, AMBIGUOUS };

    bool AtEnd() const { return pos_ >= source_.size(); }
    char Peek(std::size_t ahead = 0) const;
    void Advance(std::size_t count = 1);

    SlashMeaning ClassifySlash() const;
    bool FollowsControlKeyword() const;
    std::size_t UnicodeSpaceLength(std::size_t at) const;
    bool AtLineSeparator() const;
    void Push(TokenType type, std::string text, std::size_t offset, std::size_t line);
    void Fail(const std::string& message, std::size_t offset, std::size_t line);

    bool SkipWhitespaceAndComments();
    bool LexIdentifier();
    bool LexNumber();
    bool LexString(char quote);
    bool LexTemplate();
    bool LexRegex();
    bool LexPunctuator();
    bool DecodeUnicodeEscape(std::string& out);

    std::string source_;
    std::size_t pos_{0};
    std::size_t line_{1};
    std::vector<Bracket> brackets_;
    LexResult result_;
    std::size_t control_close_{static_cast<std::size_t>(-1)};  ///< Index of last `)` ending an if/for/while/with head
};

/**
 * @brief Check whether an identifier is a reserved word after which a `/`
 *        starts a regular expression (e.g. `return /x/`)
 */
bool IsExpressionKeyword(const std::string& word);

/**
 * @brief Check whether an identifier is a keyword only in some contexts
 *        (`of`, `await`), so that a following `/` cannot be classified
 */
bool IsContextualKeyword(const std::string& word);

} // namespace parsers
} // namespace evalbox
