/**
 * @file script_lexer.cpp
 * @brief Implementation of the pre-execution JavaScript tokenizer
 *
 * **Regular expressions vs. division**:
 * A `/` starts a regex literal only where an expression may begin: at the
 * start of input, after a punctuator other than `)`, `]`, `}`, `++`, `--`,
 * after the `)` closing an `if`, `for`, `while` or `with` head, after the
 * opening of a template substitution, or after an expression keyword such as
 * `return` or `typeof`.
 *
 * Where the answer depends on grammar the lexer does not track, the `/` is
 * reported as an error instead of guessed: after `}` (block or object
 * literal), after `++`/`--` (postfix, or prefix following a line break) and
 * after `of`/`await` (keyword or plain identifier). A wrong guess would let
 * the contents of a regex be read as code or the reverse, and quotes or
 * brackets inside them would then hide real brackets from the balance check.
 *
 * **Line terminators and whitespace**:
 * `//` comments end at CR, LF, U+2028 and U+2029. Unicode space separators
 * are whitespace and never part of an identifier. HTML-like comments
 * (`<!--`, and `-->` at line start) are rejected.
 *
 * **Templates**:
 * ```
 * `text ${ expr } more`
 *  ^^^^^^        ^^^^^^    TEMPLATE tokens
 *         ^^^^             tokenized as code, tracked as SUBSTITUTION bracket
 * ```
 *
 * @date 2025
 */

#include "evalbox/parsers/script_lexer.hpp"

#include <cctype>
#include <set>
#include <utility>

namespace evalbox {
namespace parsers {

namespace {

bool IsIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool IsIdentPart(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool IsNonAscii(char c) {
    return static_cast<unsigned char>(c) >= 0x80;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void AppendUtf8(std::string& out, unsigned long cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

const char* OpenerText(int kind) {
    switch (kind) {
        case 0: return "(";
        case 1: return "[";
        case 2: return "{";
        case 3: return "${";
        default: return "(";
    }
}

} // namespace

bool IsExpressionKeyword(const std::string& word) {
    static const std::set<std::string> keywords = {
        "return", "typeof", "instanceof", "in", "new", "delete",
        "void", "throw", "case", "do", "else", "yield", "extends"
    };
    return keywords.count(word) > 0;
}

bool IsContextualKeyword(const std::string& word) {
    return word == "of" || word == "await";
}

// Constructor
ScriptLexer::ScriptLexer(std::string source)
    : source_(std::move(source)) {
}

// ============================================================================
// MAIN LOOP
// ============================================================================

LexResult ScriptLexer::Tokenize() {
    pos_ = 0;
    line_ = 1;
    brackets_.clear();
    result_ = LexResult{};
    control_close_ = static_cast<std::size_t>(-1);

    while (!result_.error) {
        if (!SkipWhitespaceAndComments() || AtEnd()) {
            break;
        }

        char c = Peek();
        bool ok = false;

        if (IsIdentStart(c) || c == '\\' || IsNonAscii(c)) {
            ok = LexIdentifier();
        } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                   (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
            ok = LexNumber();
        } else if (c == '"' || c == '\'') {
            ok = LexString(c);
        } else if (c == '`') {
            Advance();
            ok = LexTemplate();
        } else if (c == '/') {
            switch (ClassifySlash()) {
                case SlashMeaning::REGEX:
                    ok = LexRegex();
                    break;
                case SlashMeaning::DIVISION:
                    ok = LexPunctuator();
                    break;
                case SlashMeaning::AMBIGUOUS:
                    Fail("Ambiguous '/' after '" + result_.tokens.back().text + "'", pos_, line_);
                    break;
            }
        } else {
            ok = LexPunctuator();
        }

        if (!ok) {
            break;
        }
    }

    if (!result_.error && !brackets_.empty()) {
        Fail(std::string("Unclosed '") + OpenerText(static_cast<int>(brackets_.back())) + "'",
             pos_, line_);
    }

    return result_;
}

// ============================================================================
// CURSOR HELPERS
// ============================================================================

char ScriptLexer::Peek(std::size_t ahead) const {
    std::size_t index = pos_ + ahead;
    return index < source_.size() ? source_[index] : '\0';
}

void ScriptLexer::Advance(std::size_t count) {
    for (std::size_t i = 0; i < count && !AtEnd(); ++i) {
        if (source_[pos_] == '\n') {
            ++line_;
        }
        ++pos_;
    }
}

void ScriptLexer::Push(TokenType type, std::string text, std::size_t offset, std::size_t line) {
    result_.tokens.push_back(Token{type, std::move(text), offset, line});
}

void ScriptLexer::Fail(const std::string& message, std::size_t offset, std::size_t line) {
    if (!result_.error) {
        result_.error = LexError{message, offset, line};
    }
}

ScriptLexer::SlashMeaning ScriptLexer::ClassifySlash() const {
    if (result_.tokens.empty()) {
        return SlashMeaning::REGEX;
    }

    const Token& last = result_.tokens.back();
    switch (last.type) {
        case TokenType::IDENTIFIER:
            if (IsContextualKeyword(last.text)) {
                return SlashMeaning::AMBIGUOUS;
            }
            return IsExpressionKeyword(last.text) ? SlashMeaning::REGEX : SlashMeaning::DIVISION;
        case TokenType::TEMPLATE:
            return last.text == "${" ? SlashMeaning::REGEX : SlashMeaning::DIVISION;
        case TokenType::PUNCTUATOR:
            if (last.text == "}" || last.text == "++" || last.text == "--") {
                return SlashMeaning::AMBIGUOUS;
            }
            if (last.text == ")") {
                return control_close_ == result_.tokens.size() - 1 ? SlashMeaning::REGEX
                                                                   : SlashMeaning::DIVISION;
            }
            return last.text == "]" ? SlashMeaning::DIVISION : SlashMeaning::REGEX;
        default:
            return SlashMeaning::DIVISION;
    }
}

// `if (`, `for (`, `for await (`, `while (`, `with (`
bool ScriptLexer::FollowsControlKeyword() const {
    const auto& tokens = result_.tokens;
    if (tokens.empty() || tokens.back().type != TokenType::IDENTIFIER) {
        return false;
    }

    const std::string& word = tokens.back().text;
    if (word == "if" || word == "for" || word == "while" || word == "with") {
        return true;
    }
    return word == "await" && tokens.size() >= 2 &&
           tokens[tokens.size() - 2].type == TokenType::IDENTIFIER &&
           tokens[tokens.size() - 2].text == "for";
}

// U+2028 LINE SEPARATOR or U+2029 PARAGRAPH SEPARATOR
bool ScriptLexer::AtLineSeparator() const {
    return static_cast<unsigned char>(Peek()) == 0xE2 &&
           static_cast<unsigned char>(Peek(1)) == 0x80 &&
           (static_cast<unsigned char>(Peek(2)) == 0xA8 ||
            static_cast<unsigned char>(Peek(2)) == 0xA9);
}

// Byte length of a Unicode space separator (or U+2028/U+2029/U+FEFF) at `at`, else 0
std::size_t ScriptLexer::UnicodeSpaceLength(std::size_t at) const {
    auto byte = [&](std::size_t i) {
        return at + i < source_.size() ? static_cast<unsigned char>(source_[at + i]) : 0u;
    };

    unsigned b0 = byte(0);
    unsigned b1 = byte(1);
    unsigned b2 = byte(2);

    if (b0 == 0xC2 && b1 == 0xA0) return 2;                          // U+00A0
    if (b0 == 0xE1 && b1 == 0x9A && b2 == 0x80) return 3;            // U+1680
    if (b0 == 0xE2 && b1 == 0x80 &&
        ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 || b2 == 0xA9 || b2 == 0xAF)) {
        return 3;                                                    // U+2000-200A, U+2028/9, U+202F
    }
    if (b0 == 0xE2 && b1 == 0x81 && b2 == 0x9F) return 3;            // U+205F
    if (b0 == 0xE3 && b1 == 0x80 && b2 == 0x80) return 3;            // U+3000
    if (b0 == 0xEF && b1 == 0xBB && b2 == 0xBF) return 3;            // U+FEFF
    return 0;
}

// ============================================================================
// TRIVIA
// ============================================================================

bool ScriptLexer::SkipWhitespaceAndComments() {
    while (!AtEnd()) {
        char c = Peek();

        if (std::isspace(static_cast<unsigned char>(c))) {
            Advance();
            continue;
        }

        if (std::size_t space = UnicodeSpaceLength(pos_)) {
            Advance(space);
            continue;
        }

        if (c == '/' && Peek(1) == '/') {
            while (!AtEnd() && Peek() != '\n' && Peek() != '\r' && !AtLineSeparator()) {
                Advance();
            }
            continue;
        }

        if (c == '/' && Peek(1) == '*') {
            std::size_t start = pos_;
            std::size_t start_line = line_;
            Advance(2);
            while (!AtEnd() && !(Peek() == '*' && Peek(1) == '/')) {
                Advance();
            }
            if (AtEnd()) {
                Fail("Unterminated comment", start, start_line);
                return false;
            }
            Advance(2);
            continue;
        }

        break;
    }
    return true;
}

// ============================================================================
// TOKENS
// ============================================================================

bool ScriptLexer::LexIdentifier() {
    std::size_t start = pos_;
    std::size_t start_line = line_;
    std::string name;

    while (!AtEnd()) {
        char c = Peek();
        if (IsIdentPart(c) || (IsNonAscii(c) && UnicodeSpaceLength(pos_) == 0)) {
            name += c;
            Advance();
        } else if (c == '\\') {
            if (!DecodeUnicodeEscape(name)) {
                return false;
            }
        } else {
            break;
        }
    }

    Push(TokenType::IDENTIFIER, std::move(name), start, start_line);
    return true;
}

// \uXXXX or \u{X...} inside an identifier
bool ScriptLexer::DecodeUnicodeEscape(std::string& out) {
    std::size_t start = pos_;
    if (Peek(1) != 'u') {
        Fail("Invalid escape sequence in identifier", start, line_);
        return false;
    }
    Advance(2);

    unsigned long cp = 0;
    if (Peek() == '{') {
        Advance();
        int digits = 0;
        while (!AtEnd() && Peek() != '}') {
            int v = HexValue(Peek());
            if (v < 0 || ++digits > 6) {
                Fail("Invalid escape sequence in identifier", start, line_);
                return false;
            }
            cp = cp * 16 + static_cast<unsigned long>(v);
            Advance();
        }
        if (AtEnd() || digits == 0 || cp > 0x10FFFF) {
            Fail("Invalid escape sequence in identifier", start, line_);
            return false;
        }
        Advance();
    } else {
        for (int i = 0; i < 4; ++i) {
            int v = HexValue(Peek());
            if (v < 0) {
                Fail("Invalid escape sequence in identifier", start, line_);
                return false;
            }
            cp = cp * 16 + static_cast<unsigned long>(v);
            Advance();
        }
    }

    AppendUtf8(out, cp);
    return true;
}

bool ScriptLexer::LexNumber() {
    std::size_t start = pos_;
    std::size_t start_line = line_;
    bool hex = Peek() == '0' && (Peek(1) == 'x' || Peek(1) == 'X');
    std::string text;

    while (!AtEnd()) {
        char c = Peek();
        char prev = text.empty() ? '\0' : text.back();
        if (IsIdentPart(c) || c == '.') {
            text += c;
            Advance();
        } else if ((c == '+' || c == '-') && (prev == 'e' || prev == 'E') && !hex) {
            text += c;
            Advance();
        } else {
            break;
        }
    }

    Push(TokenType::NUMBER, std::move(text), start, start_line);
    return true;
}

bool ScriptLexer::LexString(char quote) {
    std::size_t start = pos_;
    std::size_t start_line = line_;
    Advance();

    while (true) {
        if (AtEnd()) {
            Fail("Unterminated string literal", start, start_line);
            return false;
        }

        char c = Peek();
        if (c == '\\') {
            Advance(2);
        } else if (c == quote) {
            Advance();
            break;
        } else if (c == '\n' || c == '\r') {
            Fail("Unterminated string literal", start, start_line);
            return false;
        } else {
            Advance();
        }
    }

    Push(TokenType::STRING, std::string(1, quote), start, start_line);
    return true;
}

// Called just after an opening backtick or a closing substitution brace
bool ScriptLexer::LexTemplate() {
    std::size_t start = pos_;
    std::size_t start_line = line_;

    while (true) {
        if (AtEnd()) {
            Fail("Unterminated template literal", start, start_line);
            return false;
        }

        char c = Peek();
        if (c == '\\') {
            Advance(2);
        } else if (c == '`') {
            Advance();
            Push(TokenType::TEMPLATE, "`", start, start_line);
            return true;
        } else if (c == '$' && Peek(1) == '{') {
            Advance(2);
            Push(TokenType::TEMPLATE, "${", start, start_line);
            brackets_.push_back(Bracket::SUBSTITUTION);
            return true;
        } else {
            Advance();
        }
    }
}

bool ScriptLexer::LexRegex() {
    std::size_t start = pos_;
    std::size_t start_line = line_;
    bool in_class = false;
    Advance();

    while (true) {
        if (AtEnd() || Peek() == '\n' || Peek() == '\r') {
            Fail("Unterminated regular expression literal", start, start_line);
            return false;
        }

        char c = Peek();
        if (c == '\\') {
            if (Peek(1) == '\n' || Peek(1) == '\r' || Peek(1) == '\0') {
                Fail("Unterminated regular expression literal", start, start_line);
                return false;
            }
            Advance(2);
        } else if (c == '[') {
            in_class = true;
            Advance();
        } else if (c == ']') {
            in_class = false;
            Advance();
        } else if (c == '/' && !in_class) {
            Advance();
            break;
        } else {
            Advance();
        }
    }

    while (!AtEnd() && IsIdentPart(Peek())) {
        Advance();
    }

    Push(TokenType::REGEX, "/", start, start_line);
    return true;
}

bool ScriptLexer::LexPunctuator() {
    std::size_t start = pos_;
    std::size_t start_line = line_;
    char c = Peek();

    switch (c) {
        case '(':
            brackets_.push_back(FollowsControlKeyword() ? Bracket::CONTROL_PAREN : Bracket::PAREN);
            break;
        case '[':
            brackets_.push_back(Bracket::SQUARE);
            break;
        case '{':
            brackets_.push_back(Bracket::CURLY);
            break;
        case ')':
        case ']':
        case '}': {
            Bracket expected = c == ')' ? Bracket::PAREN
                             : c == ']' ? Bracket::SQUARE
                             : Bracket::CURLY;
            if (brackets_.empty()) {
                Fail(std::string("Unbalanced '") + c + "'", start, start_line);
                return false;
            }
            Bracket top = brackets_.back();
            if (c == '}' && top == Bracket::SUBSTITUTION) {
                brackets_.pop_back();
                Advance();
                return LexTemplate();
            }
            bool control = top == Bracket::CONTROL_PAREN;
            if ((control ? Bracket::PAREN : top) != expected) {
                Fail(std::string("Unbalanced '") + c + "'", start, start_line);
                return false;
            }
            brackets_.pop_back();
            if (control) {
                control_close_ = result_.tokens.size();
            }
            break;
        }
        case '<':
            if (Peek(1) == '!' && Peek(2) == '-' && Peek(3) == '-') {
                Fail("HTML-like comments are not allowed", start, start_line);
                return false;
            }
            break;
        case '.':
            if (Peek(1) == '.' && Peek(2) == '.') {
                Advance(3);
                Push(TokenType::PUNCTUATOR, "...", start, start_line);
                return true;
            }
            break;
        case '?':
            if (Peek(1) == '.' && !std::isdigit(static_cast<unsigned char>(Peek(2)))) {
                Advance(2);
                Push(TokenType::PUNCTUATOR, "?.", start, start_line);
                return true;
            }
            break;
        case '+':
        case '-':
            if (c == '-' && Peek(1) == '-' && Peek(2) == '>' &&
                (result_.tokens.empty() || result_.tokens.back().line < start_line)) {
                Fail("HTML-like comments are not allowed", start, start_line);
                return false;
            }
            if (Peek(1) == c) {
                Advance(2);
                Push(TokenType::PUNCTUATOR, std::string(2, c), start, start_line);
                return true;
            }
            break;
        case '\0':
            Fail("Code contains invalid characters", start, start_line);
            return false;
        default:
            break;
    }

    Advance();
    Push(TokenType::PUNCTUATOR, std::string(1, c), start, start_line);
    return true;
}

} // namespace parsers
} // namespace evalbox
