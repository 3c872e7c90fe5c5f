//! # Script Formatter
//!
//! In-process reprinter for the JavaScript family. It works on the token
//! stream without building a syntax tree, tracking just enough structure to
//! find statement boundaries and brace kinds:
//!
//! | Frame | Opened by | Layout |
//! |-------|-----------|--------|
//! | Block | `{` of a statement, function or class body | One statement per line, indented |
//! | Object | Any other `{` | Inline, or one entry per line when the source breaks after `{` |
//! | Paren / Bracket | `(` / `[` | Inline |
//!
//! Statement ends follow automatic semicolon insertion: an explicit `;`, or a
//! line break after a token that can end a statement when the next token
//! cannot continue the expression. Input the token model cannot place safely
//! is reported as a `ScriptError` and the caller keeps the original text. That
//! covers literals with no operator between them, binary operators with no
//! left operand and `.` or `?.` without a property name.
//!
//! ## Methods
//!
//! | Method | Description |
//! |--------|-------------|
//! | `format()` | Reprint a whole file |
//! | `write_token()` | Emit text with indentation or a separating space |
//! | `end_statement()` | Close the current statement, applying the semicolon policy |

#ifndef POLYFMT_SCRIPT_SCRIPT_FORMATTER_HPP
#define POLYFMT_SCRIPT_SCRIPT_FORMATTER_HPP

#include "config/format_config.hpp"
#include "script/script_lexer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace polyfmt::script {

/// Engine options, filled from the translated native configuration.
struct ScriptOptions {
    bool use_tabs = true;
    uint32_t indent_width = 4;
    config::LineEnding line_ending = config::LineEnding::Lf;
    config::QuoteStyle quote_style = config::QuoteStyle::Double;
    config::TrailingComma trailing_comma = config::TrailingComma::All;
    config::Semicolons semicolons = config::Semicolons::Always;
    bool bracket_spacing = true;
};

/// Rewrites a string literal to the preferred quote when its body does not
/// contain that quote. Other literals are returned as written.
[[nodiscard]] auto convert_quotes(std::string_view literal, config::QuoteStyle style)
    -> std::string;

class ScriptFormatter {
public:
    explicit ScriptFormatter(ScriptOptions options);

    /// Formats `source`; the result ends with exactly one line ending.
    auto format(std::string_view source, ScriptDialect dialect) -> Result<std::string, ScriptError>;

private:
    static constexpr size_t NONE = static_cast<size_t>(-1);

    enum class FrameKind : uint8_t { Root, Block, Object, Paren, Bracket };

    enum class Role : uint8_t {
        Operand,
        Keyword,
        Binary,
        Prefix,
        Postfix,
        Glued, ///< `*` of `function*` and `yield*`
        Open,
        Close,
        Comma,
        Semicolon,
        Dot,
        Colon,
        CaseColon,
        Angle, ///< `<` and `>` keep their source spacing
    };

    struct Statement {
        bool fresh = true;
        std::string lead; ///< First token past modifiers such as `export`
        size_t lead_index = NONE;
        bool is_case = false;
    };

    struct Frame {
        FrameKind kind = FrameKind::Root;
        size_t open = NONE;
        bool multiline = false;
        bool terminal = false;
        bool class_body = false;
        bool header = false;
        bool params = false;
        bool do_tail = false;
        bool body_pending = false; ///< Parameter list closed, body `{` may follow
        bool body_terminal = false;
        bool semicolon_members = false;
        bool type_literal = false; ///< Object in a type position, members end with `;`
        bool entry_fresh = true;
        bool entry_rest = false;
        int ternaries = 0;
        Statement stmt;
    };

    struct TokenInfo {
        Role role = Role::Operand;
        bool header_close = false;
        bool params_close = false;
        bool do_tail_close = false;
        bool block_close = false;
        bool object_close = false;
        bool terminal_close = false;
    };

    ScriptOptions options_;

    std::vector<ScriptToken> tokens_;
    std::vector<TokenInfo> info_;
    std::vector<Frame> frames_;
    std::vector<size_t> history_; ///< Indices of printed significant tokens
    std::string out_;
    size_t prev_ = NONE;
    bool at_line_start_ = true;
    bool pending_newline_ = false;
    bool just_opened_ = false;
    bool space_after_comment_ = false;
    std::optional<ScriptError> failure_;

    void reset();
    void fail(size_t index, std::string message);

    // Output
    void write_token(std::string_view text, bool space, bool closing = false);
    void flush_newline(const ScriptToken& next);
    void emit_newline(bool blank);
    [[nodiscard]] auto indent_level(bool closing) const -> size_t;
    [[nodiscard]] auto indent_str(size_t level) const -> std::string;

    // Token classification
    [[nodiscard]] auto next_significant(size_t index) const -> size_t;
    [[nodiscard]] auto newline_between(size_t from, size_t to) const -> bool;
    [[nodiscard]] auto after_dot(size_t index) const -> bool;
    [[nodiscard]] auto can_end(size_t index) const -> bool;
    [[nodiscard]] auto ends_operand(size_t index) const -> bool;
    [[nodiscard]] auto continues_expression(const ScriptToken& token) const -> bool;
    [[nodiscard]] auto needs_space(size_t index, Role role) const -> bool;
    [[nodiscard]] auto is_statement_level(const Frame& frame) const -> bool;
    [[nodiscard]] auto is_compound(const Statement& stmt) const -> bool;
    [[nodiscard]] auto callee_position() const -> size_t;
    [[nodiscard]] auto opens_params(const Frame& frame) const -> bool;

    // Structure
    void note_statement_token(Frame& frame, size_t index, size_t next);
    void track(size_t index, size_t next);
    void open_brace(size_t index, size_t next, bool was_fresh);
    void close_brace(size_t index, size_t next);
    void open_paren(size_t index, size_t next);
    void close_paren(size_t index, size_t next);
    void write_operator(size_t index, size_t next);
    void handle_semicolon(size_t index, size_t next);
    void handle_comma(size_t index, size_t next);
    void handle_colon(size_t index, size_t next);
    void end_statement(bool insert_semicolon);
    void after_token(size_t index, size_t next);

    void process_comment(size_t index);
    void process_token(size_t index);
};

} // namespace polyfmt::script

#endif // POLYFMT_SCRIPT_SCRIPT_FORMATTER_HPP
