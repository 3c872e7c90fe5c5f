//! # JSON Parser
//!
//! Zero-copy JSON lexer and recursive descent parser.
//!
//! The lexer is also the front end of the JSON formatting backend, which
//! reprints the token stream instead of the parsed tree so that key order and
//! the exact lexeme of every number and string survive formatting.
//!
//! ## Token Types
//!
//! | Token | Description | Example |
//! |-------|-------------|---------|
//! | `LBrace` / `RBrace` | Object delimiters | `{` `}` |
//! | `LBracket` / `RBracket` | Array delimiters | `[` `]` |
//! | `Colon` / `Comma` | Separators | `:` `,` |
//! | `String` | Quoted string | `"hello"` |
//! | `IntNumber` / `FloatNumber` | Numbers | `42`, `1e10` |
//! | `True` / `False` / `Null` | Keywords | `true` |
//! | `LineComment` / `BlockComment` | Only with `allow_comments` | `// x` |
//!
//! ## Dialects
//!
//! `JsonDialect::Strict` is RFC 8259. `JsonDialect::Jsonc` additionally
//! accepts `//` and `/* */` comments and trailing commas, as found in
//! `tsconfig.json` and editor settings files.

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>
#include <vector>

namespace polyfmt::json {

enum class JsonDialect : uint8_t { Strict, Jsonc };

// ============================================================================
// Token Types
// ============================================================================

enum class JsonTokenKind : uint8_t {
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Colon,
    Comma,

    String,
    IntNumber,
    FloatNumber,
    True,
    False,
    Null,

    LineComment,
    BlockComment,

    Eof,
    Error
};

/// A token with its source text and position.
struct JsonToken {
    JsonTokenKind kind;

    /// The original text of this token (view into source).
    std::string_view lexeme;

    size_t line;
    size_t column;
    size_t offset;

    /// For `String` tokens: the unescaped string content.
    std::string string_value;

    /// For `IntNumber`/`FloatNumber` tokens: the parsed number.
    JsonNumber number_value;
};

// ============================================================================
// Lexer
// ============================================================================

/// Converts JSON text into tokens.
///
/// Call `next_token()` until `Eof` or `Error` is returned.
class JsonLexer {
public:
    explicit JsonLexer(std::string_view input, JsonDialect dialect = JsonDialect::Strict);

    auto next_token() -> JsonToken;

    [[nodiscard]] auto has_errors() const -> bool { return has_errors_; }
    [[nodiscard]] auto errors() const -> const std::vector<JsonError>& { return errors_; }

private:
    std::string_view input_;
    JsonDialect dialect_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    bool has_errors_ = false;
    std::vector<JsonError> errors_;

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    auto advance() -> char;
    void skip_whitespace();

    auto make_token(JsonTokenKind kind, size_t start_pos, size_t start_line,
                    size_t start_col) -> JsonToken;

    auto scan_string() -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_keyword() -> JsonToken;
    auto scan_comment() -> JsonToken;

    void add_error(const std::string& msg);
    void add_error(const std::string& msg, size_t line, size_t col);
};

/// Tokenizes the whole input, comments included, ending with `Eof`.
///
/// Returns the first lexer error instead if the input does not tokenize.
[[nodiscard]] auto tokenize_json(std::string_view input, JsonDialect dialect)
    -> Result<std::vector<JsonToken>, JsonError>;

// ============================================================================
// Parser
// ============================================================================

/// Recursive descent JSON parser with a nesting limit.
class JsonParser {
public:
    explicit JsonParser(std::string_view input, JsonDialect dialect = JsonDialect::Strict);

    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    JsonLexer lexer_;
    JsonDialect dialect_;
    JsonToken current_;
    static constexpr size_t MAX_DEPTH = 1000;
    size_t depth_ = 0;

    /// Advances to the next non-comment token.
    void advance();

    [[nodiscard]] auto check(JsonTokenKind kind) const -> bool;
    auto match(JsonTokenKind kind) -> bool;
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Parses a JSON document.
///
/// # Example
///
/// ```cpp
/// auto result = parse_json(R"({"indent_width": 2})");
/// if (is_ok(result)) {
///     auto width = unwrap(result).get("indent_width")->try_as_i64();
/// }
/// ```
[[nodiscard]] auto parse_json(std::string_view input, JsonDialect dialect = JsonDialect::Strict)
    -> Result<JsonValue, JsonError>;

} // namespace polyfmt::json
