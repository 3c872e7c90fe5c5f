//! # Script Lexer Implementation
//!
//! Single forward scan. The previous significant token decides whether `/`
//! or `<` would start an expression.

#include "script/script_lexer.hpp"

#include <algorithm>
#include <array>
#include <optional>

namespace polyfmt::script {

namespace {

// Longest operators first; the scan takes the first prefix match.
constexpr std::array<std::string_view, 47> PUNCTUATORS = {
    ">>>=", "===", "!==", "**=", "<<=", ">>=", ">>>", "...", "&&=", "||=", "??=", "=>",
    "==",   "!=",  "<=",  ">=",  "&&",  "||",  "??",  "++",  "--",  "+=",  "-=",
    "*=",   "/=",  "%=",  "&=",  "|=",  "^=",  "<<",  ">>",  "**",  "{",   "}",   "(",
    ")",    "[",   "]",   ";",   ",",   "<",   ">",   "+",   "-",   "*",   "%",   "=",
};

// Single characters not covered above.
constexpr std::string_view SINGLE_PUNCTUATORS = "&|^!~?:./@";

constexpr std::array<std::string_view, 26> NON_ENDING_KEYWORDS = {
    "case",   "catch",   "class",  "const",  "default",    "delete", "do",     "else",   "enum",
    "export", "extends", "finally", "for",   "function",   "if",     "import", "in",     "instanceof",
    "new",    "switch",  "throw",  "try",    "typeof",     "var",    "void",   "while",
};

constexpr std::array<std::string_view, 5> EXPRESSION_KEYWORDS = {
    "return", "await", "yield", "of", "with",
};

auto is_ident_start(unsigned char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' || c >= 0x80;
}

auto is_ident_char(unsigned char c) -> bool {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

class ScriptLexer {
public:
    ScriptLexer(std::string_view source, ScriptDialect dialect)
        : source_(source), dialect_(dialect) {}

    auto run() -> Result<std::vector<ScriptToken>, ScriptError>;

private:
    std::string_view source_;
    ScriptDialect dialect_;
    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t pending_newlines_ = 0;
    bool pending_space_ = false;
    std::vector<ScriptToken> tokens_;

    [[nodiscard]] auto peek(size_t offset = 0) const -> char {
        return pos_ + offset < source_.size() ? source_[pos_ + offset] : '\0';
    }

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= source_.size();
    }

    [[nodiscard]] auto error(std::string message) const -> ScriptError {
        return ScriptError{std::move(message), line_};
    }

    [[nodiscard]] auto previous_significant() const -> const ScriptToken*;
    [[nodiscard]] auto expression_may_start() const -> bool;

    void push(ScriptTokenKind kind, std::string text, uint32_t line);
    void skip_whitespace();
    auto scan_line_comment() -> void;
    auto scan_block_comment() -> std::optional<ScriptError>;
    auto scan_string(char quote) -> std::optional<ScriptError>;
    auto scan_number() -> std::optional<ScriptError>;
    void scan_identifier();
    auto scan_punct() -> std::optional<ScriptError>;
};

auto ScriptLexer::previous_significant() const -> const ScriptToken* {
    for (auto it = tokens_.rbegin(); it != tokens_.rend(); ++it) {
        if (!it->is_comment() && it->kind != ScriptTokenKind::Shebang) {
            return &*it;
        }
    }
    return nullptr;
}

auto ScriptLexer::expression_may_start() const -> bool {
    const ScriptToken* last = previous_significant();
    if (!last) {
        return true;
    }
    const auto& prev = *last;
    switch (prev.kind) {
    case ScriptTokenKind::Number:
    case ScriptTokenKind::String:
        return false;
    case ScriptTokenKind::Identifier:
        return is_expression_prefix_keyword(prev.text);
    case ScriptTokenKind::Punct:
        return prev.text != ")" && prev.text != "]" && prev.text != "++" && prev.text != "--";
    default:
        return true;
    }
}

void ScriptLexer::push(ScriptTokenKind kind, std::string text, uint32_t line) {
    ScriptToken token{kind, std::move(text), pending_newlines_, pending_space_, line};
    pending_newlines_ = 0;
    pending_space_ = false;
    tokens_.push_back(std::move(token));
}

void ScriptLexer::skip_whitespace() {
    while (!at_end()) {
        char c = peek();
        if (c == '\n') {
            ++line_;
            ++pending_newlines_;
            pending_space_ = true;
            ++pos_;
        } else if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
            pending_space_ = true;
            ++pos_;
        } else {
            break;
        }
    }
}

void ScriptLexer::scan_line_comment() {
    size_t start = pos_;
    while (!at_end() && peek() != '\n') {
        ++pos_;
    }
    std::string_view text = source_.substr(start, pos_ - start);
    while (!text.empty() && (text.back() == '\r' || text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    push(ScriptTokenKind::LineComment, std::string(text), line_);
}

auto ScriptLexer::scan_block_comment() -> std::optional<ScriptError> {
    uint32_t start_line = line_;
    pos_ += 2;
    std::string text = "/*";
    while (true) {
        if (at_end()) {
            return ScriptError{"unterminated block comment", start_line};
        }
        if (peek() == '*' && peek(1) == '/') {
            pos_ += 2;
            text += "*/";
            break;
        }
        char c = peek();
        ++pos_;
        if (c == '\r' && peek() == '\n') {
            continue;
        }
        if (c == '\n') {
            ++line_;
        }
        text.push_back(c);
    }
    push(ScriptTokenKind::BlockComment, std::move(text), start_line);
    return std::nullopt;
}

auto ScriptLexer::scan_string(char quote) -> std::optional<ScriptError> {
    size_t start = pos_;
    ++pos_;
    while (true) {
        if (at_end() || peek() == '\n') {
            return error("unterminated string literal");
        }
        char c = peek();
        if (c == '\\') {
            // Escaped line continuations keep the literal on one logical line.
            if (peek(1) == '\n') {
                ++line_;
            }
            pos_ += 2;
            continue;
        }
        ++pos_;
        if (c == quote) {
            break;
        }
    }
    push(ScriptTokenKind::String, std::string(source_.substr(start, pos_ - start)), line_);
    return std::nullopt;
}

auto ScriptLexer::scan_number() -> std::optional<ScriptError> {
    size_t start = pos_;
    if (peek() == '0' && (peek(1) == 'x' || peek(1) == 'X' || peek(1) == 'b' || peek(1) == 'B' ||
                          peek(1) == 'o' || peek(1) == 'O')) {
        pos_ += 2;
        while (!at_end() && (is_ident_char(static_cast<unsigned char>(peek())))) {
            ++pos_;
        }
    } else {
        while (is_digit(peek()) || peek() == '_') {
            ++pos_;
        }
        if (peek() == '.') {
            ++pos_;
            while (is_digit(peek()) || peek() == '_') {
                ++pos_;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') {
                ++pos_;
            }
            if (!is_digit(peek())) {
                return error("malformed exponent");
            }
            while (is_digit(peek()) || peek() == '_') {
                ++pos_;
            }
        }
        if (peek() == 'n') {
            ++pos_;
        }
    }
    if (!at_end() && is_ident_start(static_cast<unsigned char>(peek()))) {
        return error("identifier directly after numeric literal");
    }
    push(ScriptTokenKind::Number, std::string(source_.substr(start, pos_ - start)), line_);
    return std::nullopt;
}

void ScriptLexer::scan_identifier() {
    size_t start = pos_;
    ++pos_;
    while (!at_end() && is_ident_char(static_cast<unsigned char>(peek()))) {
        ++pos_;
    }
    push(ScriptTokenKind::Identifier, std::string(source_.substr(start, pos_ - start)), line_);
}

auto ScriptLexer::scan_punct() -> std::optional<ScriptError> {
    std::string_view rest = source_.substr(pos_);

    if (rest[0] == '/' && expression_may_start()) {
        return error("regular expression literals are not supported");
    }
    if (rest[0] == '<' && allows_jsx(dialect_) && expression_may_start()) {
        return error("JSX elements are not supported");
    }

    for (auto punct : PUNCTUATORS) {
        if (rest.substr(0, punct.size()) == punct) {
            pos_ += punct.size();
            push(ScriptTokenKind::Punct, std::string(punct), line_);
            return std::nullopt;
        }
    }

    // `a?.5:b` is a conditional, not optional chaining
    if (rest[0] == '?' && rest.size() > 1 && rest[1] == '.' &&
        !(rest.size() > 2 && is_digit(rest[2]))) {
        pos_ += 2;
        push(ScriptTokenKind::Punct, "?.", line_);
        return std::nullopt;
    }

    if (SINGLE_PUNCTUATORS.find(rest[0]) != std::string_view::npos) {
        ++pos_;
        push(ScriptTokenKind::Punct, std::string(1, rest[0]), line_);
        return std::nullopt;
    }

    return error(std::string("unexpected character '") + rest[0] + "'");
}

auto ScriptLexer::run() -> Result<std::vector<ScriptToken>, ScriptError> {
    if (source_.substr(0, 3) == "\xEF\xBB\xBF") {
        return error("byte order mark is not supported");
    }

    if (source_.substr(0, 2) == "#!") {
        size_t end = source_.find('\n');
        if (end == std::string_view::npos) {
            end = source_.size();
        }
        std::string_view text = source_.substr(0, end);
        while (!text.empty() && text.back() == '\r') {
            text.remove_suffix(1);
        }
        pos_ = end;
        push(ScriptTokenKind::Shebang, std::string(text), 1);
    }

    while (true) {
        skip_whitespace();
        if (at_end()) {
            break;
        }

        char c = peek();
        std::optional<ScriptError> failure;

        switch (c) {
        case '"':
        case '\'':
            failure = scan_string(c);
            break;
        case '`':
            return error("template literals are not supported");
        case '#':
            if (is_ident_start(static_cast<unsigned char>(peek(1)))) {
                scan_identifier();
            } else {
                return error("unexpected character '#'");
            }
            break;
        case '\\':
            return error("unicode escapes in identifiers are not supported");
        case '/':
            if (peek(1) == '/') {
                scan_line_comment();
            } else if (peek(1) == '*') {
                failure = scan_block_comment();
            } else {
                failure = scan_punct();
            }
            break;
        case '.':
            if (is_digit(peek(1))) {
                failure = scan_number();
            } else {
                failure = scan_punct();
            }
            break;
        default:
            if (is_digit(c)) {
                failure = scan_number();
            } else if (is_ident_start(static_cast<unsigned char>(c))) {
                scan_identifier();
            } else {
                failure = scan_punct();
            }
            break;
        }

        if (failure) {
            return *failure;
        }
    }

    return std::move(tokens_);
}

} // namespace

auto is_non_ending_keyword(std::string_view word) -> bool {
    return std::find(NON_ENDING_KEYWORDS.begin(), NON_ENDING_KEYWORDS.end(), word) !=
           NON_ENDING_KEYWORDS.end();
}

auto is_expression_prefix_keyword(std::string_view word) -> bool {
    return is_non_ending_keyword(word) ||
           std::find(EXPRESSION_KEYWORDS.begin(), EXPRESSION_KEYWORDS.end(), word) !=
               EXPRESSION_KEYWORDS.end();
}

auto tokenize_script(std::string_view source, ScriptDialect dialect)
    -> Result<std::vector<ScriptToken>, ScriptError> {
    ScriptLexer lexer(source, dialect);
    return lexer.run();
}

} // namespace polyfmt::script
