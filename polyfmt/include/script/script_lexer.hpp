//! # Script Lexer
//!
//! Tokenizer for the JavaScript family (JavaScript, TypeScript, JSX, TSX)
//! feeding the in-process script formatter.
//!
//! The lexer keeps exactly what the reprinter needs: the token text, how many
//! newlines preceded it and whether whitespace preceded it. Constructs the
//! reprinter cannot reproduce safely are rejected here:
//!
//! | Construct | Reason |
//! |-----------|--------|
//! | Template literals | Embedded expressions and raw text |
//! | Regular expression literals | Ambiguous with division without a parser |
//! | JSX elements (`.jsx`/`.tsx`) | Text content is not token-shaped |
//! | Unterminated strings and comments | Input is not valid source |

#ifndef POLYFMT_SCRIPT_SCRIPT_LEXER_HPP
#define POLYFMT_SCRIPT_SCRIPT_LEXER_HPP

#include "common.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace polyfmt::script {

enum class ScriptDialect : uint8_t { JavaScript, TypeScript, Jsx, Tsx };

[[nodiscard]] constexpr auto allows_jsx(ScriptDialect dialect) -> bool {
    return dialect == ScriptDialect::Jsx || dialect == ScriptDialect::Tsx;
}

enum class ScriptTokenKind : uint8_t {
    Identifier, ///< Identifiers and keywords, `#private` names included
    Number,
    String, ///< Text includes the quotes
    Punct,
    LineComment,  ///< Text excludes the newline
    BlockComment, ///< Text includes the delimiters
    Shebang,
};

struct ScriptToken {
    ScriptTokenKind kind;
    std::string text;
    uint32_t newlines_before = 0; ///< Line breaks between the previous token and this one
    bool space_before = false;    ///< Any whitespace directly before this token
    uint32_t line = 1;

    [[nodiscard]] auto is_comment() const -> bool {
        return kind == ScriptTokenKind::LineComment || kind == ScriptTokenKind::BlockComment;
    }

    [[nodiscard]] auto is(std::string_view punct) const -> bool {
        return kind == ScriptTokenKind::Punct && text == punct;
    }
};

struct ScriptError {
    std::string message;
    uint32_t line = 0;

    [[nodiscard]] auto to_string() const -> std::string {
        return "line " + std::to_string(line) + ": " + message;
    }
};

/// Tokenizes a whole source file.
[[nodiscard]] auto tokenize_script(std::string_view source, ScriptDialect dialect)
    -> Result<std::vector<ScriptToken>, ScriptError>;

/// Reserved words that cannot end a statement (`if`, `const`, `new`, ...).
[[nodiscard]] auto is_non_ending_keyword(std::string_view word) -> bool;

/// Words after which an expression starts: any non-ending keyword plus
/// `return`, `typeof`, `await`, `yield` and friends.
[[nodiscard]] auto is_expression_prefix_keyword(std::string_view word) -> bool;

} // namespace polyfmt::script

#endif // POLYFMT_SCRIPT_SCRIPT_LEXER_HPP
