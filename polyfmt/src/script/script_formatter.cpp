//! # Script Formatter Implementation
//!
//! One pass over the token stream. Each significant token is written, the
//! frame it lives in is updated, and then `after_token` decides with one token
//! of lookahead whether the current statement ends there.
//!
//! | Method | Description |
//! |--------|-------------|
//! | `process_token()` | Classify, write and track one token |
//! | `after_token()` | Statement boundaries and trailing commas |
//! | `indent_str()` | Indentation for a level |

#include "script/script_formatter.hpp"

#include <algorithm>
#include <array>

namespace polyfmt::script {

namespace {

constexpr std::array<std::string_view, 6> HEADER_KEYWORDS = {
    "if", "for", "while", "switch", "catch", "with",
};

// Keywords separated from a following `(` or `[`.
constexpr std::array<std::string_view, 21> SPACED_KEYWORDS = {
    "if",   "for",  "while",  "switch", "catch", "with", "return",
    "typeof", "void", "delete", "in", "instanceof", "function", "case",
    "throw", "await", "yield", "else", "do", "new", "extends",
};

constexpr std::array<std::string_view, 13> COMPOUND_LEADS = {
    "if",       "for",   "while",     "do",        "try",    "switch", "function",
    "class",    "interface", "namespace", "module", "else",   "{",
};

constexpr std::array<std::string_view, 9> MODIFIERS = {
    "export", "declare", "abstract", "static", "public", "private", "protected", "readonly",
    "override",
};

constexpr std::array<std::string_view, 8> NON_CONTINUING_PUNCT = {
    "{", "}", "++", "--", "!", "~", "...", "@",
};

// Words that may follow a string or number literal on the same line.
constexpr std::array<std::string_view, 7> LITERAL_FOLLOWERS = {
    "in", "instanceof", "as", "satisfies", "extends", "assert", "with",
};

// Binary operators that may open a type or a generator without a left operand.
constexpr std::array<std::string_view, 3> LEADING_OPERATORS = {
    "|", "&", "*",
};

template <size_t N>
auto contains(const std::array<std::string_view, N>& words, std::string_view word) -> bool {
    return std::find(words.begin(), words.end(), word) != words.end();
}

auto is_literal(const ScriptToken& token) -> bool {
    return token.kind == ScriptTokenKind::Number || token.kind == ScriptTokenKind::String;
}

auto is_reserved_word(std::string_view word) -> bool {
    return is_non_ending_keyword(word) || word == "let" || word == "return" || word == "with";
}

auto names_member(const ScriptToken* token) -> bool {
    return token && (token->kind == ScriptTokenKind::Identifier ||
                     token->kind == ScriptTokenKind::String || token->is("[") ||
                     token->is("*"));
}

} // namespace

auto convert_quotes(std::string_view literal, config::QuoteStyle style) -> std::string {
    const char target = style == config::QuoteStyle::Double ? '"' : '\'';
    if (literal.size() < 2 || literal.front() == target) {
        return std::string(literal);
    }
    const char source = literal.front();
    if (source != '"' && source != '\'') {
        return std::string(literal);
    }

    std::string_view body = literal.substr(1, literal.size() - 2);
    if (body.find(target) != std::string_view::npos) {
        return std::string(literal);
    }

    std::string result;
    result.reserve(literal.size());
    result.push_back(target);
    for (size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '\\' && i + 1 < body.size()) {
            // The old quote no longer needs its escape
            if (body[i + 1] != source) {
                result.push_back('\\');
            }
            result.push_back(body[i + 1]);
            ++i;
            continue;
        }
        result.push_back(body[i]);
    }
    result.push_back(target);
    return result;
}

ScriptFormatter::ScriptFormatter(ScriptOptions options) : options_(options) {}

auto ScriptFormatter::format(std::string_view source, ScriptDialect dialect)
    -> Result<std::string, ScriptError> {
    reset();

    auto lexed = tokenize_script(source, dialect);
    if (is_err(lexed)) {
        return unwrap_err(lexed);
    }
    tokens_ = std::move(unwrap(lexed));
    info_.assign(tokens_.size(), TokenInfo{});
    frames_.push_back(Frame{});

    for (size_t i = 0; i < tokens_.size() && !failure_; ++i) {
        const auto& tok = tokens_[i];
        if (tok.is_comment()) {
            process_comment(i);
        } else if (tok.kind == ScriptTokenKind::Shebang) {
            write_token(tok.text, false);
            pending_newline_ = true;
        } else {
            process_token(i);
        }
    }

    if (failure_) {
        return *failure_;
    }
    if (frames_.size() != 1) {
        return ScriptError{"unbalanced brackets at end of file",
                           tokens_.empty() ? 0 : tokens_.back().line};
    }

    while (!out_.empty() && (out_.back() == '\n' || out_.back() == ' ' || out_.back() == '\t')) {
        out_.pop_back();
    }
    if (out_.empty()) {
        return std::string();
    }
    out_.push_back('\n');

    if (options_.line_ending == config::LineEnding::Crlf) {
        std::string converted;
        converted.reserve(out_.size() + out_.size() / 16);
        for (char c : out_) {
            if (c == '\n') {
                converted += "\r\n";
            } else {
                converted.push_back(c);
            }
        }
        return converted;
    }
    return std::move(out_);
}

void ScriptFormatter::reset() {
    tokens_.clear();
    info_.clear();
    frames_.clear();
    history_.clear();
    out_.clear();
    prev_ = NONE;
    at_line_start_ = true;
    pending_newline_ = false;
    just_opened_ = false;
    space_after_comment_ = false;
    failure_.reset();
}

void ScriptFormatter::fail(size_t index, std::string message) {
    if (!failure_) {
        failure_ = ScriptError{std::move(message), tokens_[index].line};
    }
}

// ============================================================================
// Output
// ============================================================================

void ScriptFormatter::write_token(std::string_view text, bool space, bool closing) {
    if (at_line_start_) {
        out_ += indent_str(indent_level(closing));
        at_line_start_ = false;
    } else if (space && !out_.empty()) {
        out_.push_back(' ');
    }
    out_ += text;
    just_opened_ = false;
    space_after_comment_ = false;
}

void ScriptFormatter::flush_newline(const ScriptToken& next) {
    if (!pending_newline_) {
        return;
    }
    pending_newline_ = false;
    if (at_line_start_ || out_.empty()) {
        return;
    }
    emit_newline(next.newlines_before >= 2 && !just_opened_ && !next.is("}"));
}

void ScriptFormatter::emit_newline(bool blank) {
    while (!out_.empty() && (out_.back() == ' ' || out_.back() == '\t')) {
        out_.pop_back();
    }
    out_.push_back('\n');
    if (blank) {
        out_.push_back('\n');
    }
    at_line_start_ = true;
}

auto ScriptFormatter::indent_level(bool closing) const -> size_t {
    size_t level = 0;
    for (size_t f = 1; f < frames_.size(); ++f) {
        const auto& frame = frames_[f];
        if (frame.kind == FrameKind::Block || (frame.kind == FrameKind::Object && frame.multiline)) {
            ++level;
        }
    }
    if (closing) {
        return level;
    }

    const Frame& top = frames_.back();
    bool continuation = true;
    switch (top.kind) {
    case FrameKind::Root:
    case FrameKind::Block:
        continuation = !top.stmt.fresh;
        break;
    case FrameKind::Object:
        continuation = !top.multiline || !top.entry_fresh;
        break;
    default:
        break;
    }
    return level + (continuation ? 1 : 0);
}

auto ScriptFormatter::indent_str(size_t level) const -> std::string {
    if (options_.use_tabs) {
        return std::string(level, '\t');
    }
    return std::string(level * options_.indent_width, ' ');
}

// ============================================================================
// Token Classification
// ============================================================================

auto ScriptFormatter::next_significant(size_t index) const -> size_t {
    for (size_t j = index + 1; j < tokens_.size(); ++j) {
        if (!tokens_[j].is_comment() && tokens_[j].kind != ScriptTokenKind::Shebang) {
            return j;
        }
    }
    return NONE;
}

auto ScriptFormatter::newline_between(size_t from, size_t to) const -> bool {
    size_t end = to == NONE ? tokens_.size() - 1 : to;
    for (size_t k = from + 1; k <= end && k < tokens_.size(); ++k) {
        if (tokens_[k].newlines_before > 0) {
            return true;
        }
    }
    return false;
}

auto ScriptFormatter::after_dot(size_t index) const -> bool {
    for (size_t j = index; j-- > 0;) {
        const auto& tok = tokens_[j];
        if (tok.is_comment() || tok.kind == ScriptTokenKind::Shebang) {
            continue;
        }
        return tok.is(".") || tok.is("?.");
    }
    return false;
}

auto ScriptFormatter::can_end(size_t index) const -> bool {
    const auto& tok = tokens_[index];
    const auto& info = info_[index];
    switch (tok.kind) {
    case ScriptTokenKind::Identifier:
        return info.role != Role::Keyword;
    case ScriptTokenKind::Number:
    case ScriptTokenKind::String:
        return true;
    case ScriptTokenKind::Punct:
        if (tok.text == ")") {
            return !(info.header_close || info.params_close);
        }
        if (tok.text == "]") {
            return true;
        }
        if (tok.text == "}") {
            return !info.terminal_close;
        }
        return info.role == Role::Postfix && tok.text != "?";
    default:
        return false;
    }
}

auto ScriptFormatter::ends_operand(size_t index) const -> bool {
    const auto& tok = tokens_[index];
    if (tok.kind == ScriptTokenKind::Identifier && !after_dot(index) &&
        is_expression_prefix_keyword(tok.text)) {
        return false;
    }
    Role role = info_[index].role;
    return role == Role::Operand || role == Role::Close || role == Role::Postfix;
}

auto ScriptFormatter::continues_expression(const ScriptToken& token) const -> bool {
    if (token.kind == ScriptTokenKind::Identifier) {
        return token.text == "in" || token.text == "instanceof";
    }
    if (token.kind != ScriptTokenKind::Punct) {
        return false;
    }
    return !contains(NON_CONTINUING_PUNCT, token.text);
}

auto ScriptFormatter::needs_space(size_t index, Role role) const -> bool {
    if (prev_ == NONE) {
        return false;
    }
    if (space_after_comment_) {
        return true;
    }
    const auto& tok = tokens_[index];
    const auto& prev = tokens_[prev_];
    const Role pr = info_[prev_].role;

    // `a - -b` and `a + ++b` must not fuse
    if (prev.kind == ScriptTokenKind::Punct && tok.kind == ScriptTokenKind::Punct) {
        char a = prev.text.back();
        char b = tok.text.front();
        if ((a == '+' || a == '-') && a == b) {
            return true;
        }
    }

    switch (role) {
    case Role::Close:
    case Role::Comma:
    case Role::Semicolon:
    case Role::Dot:
    case Role::Postfix:
    case Role::Colon:
    case Role::CaseColon:
    case Role::Glued:
        return false;
    default:
        break;
    }

    if (pr == Role::Open) {
        return prev.is("{") && options_.bracket_spacing;
    }
    if (pr == Role::Prefix || pr == Role::Dot) {
        return false;
    }
    if (pr == Role::Glued) {
        return true;
    }
    if (pr == Role::Angle || role == Role::Angle) {
        return tok.space_before;
    }

    if (tok.is("(") || tok.is("[")) {
        bool keyword = prev.kind == ScriptTokenKind::Identifier && !after_dot(prev_);
        if (keyword && (contains(SPACED_KEYWORDS, prev.text) || (tok.is("[") && prev.text == "of"))) {
            return true;
        }
        if (pr == Role::Keyword) {
            return false;
        }
        return !(pr == Role::Operand || pr == Role::Close || pr == Role::Postfix);
    }
    return true;
}

auto ScriptFormatter::is_statement_level(const Frame& frame) const -> bool {
    return frame.kind == FrameKind::Root || frame.kind == FrameKind::Block;
}

auto ScriptFormatter::is_compound(const Statement& stmt) const -> bool {
    return contains(COMPOUND_LEADS, stmt.lead);
}

/// History position of the token naming a call, skipping a type argument list.
auto ScriptFormatter::callee_position() const -> size_t {
    if (history_.empty()) {
        return NONE;
    }
    size_t pos = history_.size() - 1;
    const auto& last = tokens_[history_[pos]];
    if (last.is(">") || last.is(">>")) {
        int depth = 0;
        while (true) {
            const auto& tok = tokens_[history_[pos]];
            if (tok.is(">")) {
                ++depth;
            } else if (tok.is(">>")) {
                depth += 2;
            } else if (tok.is("<")) {
                --depth;
            }
            if (depth <= 0) {
                break;
            }
            if (pos == 0) {
                return NONE;
            }
            --pos;
        }
        if (pos == 0) {
            return NONE;
        }
        --pos;
    }
    return pos;
}

auto ScriptFormatter::opens_params(const Frame& frame) const -> bool {
    size_t pos = callee_position();
    if (pos == NONE) {
        return false;
    }
    const size_t callee_index = history_[pos];
    const auto& callee = tokens_[callee_index];
    if (callee.kind != ScriptTokenKind::Identifier && callee.kind != ScriptTokenKind::String) {
        return false;
    }
    if (callee.text == "function") {
        return !after_dot(callee_index);
    }

    auto at = [&](size_t p) -> const ScriptToken& { return tokens_[history_[p]]; };
    if (pos >= 1 && at(pos - 1).text == "function") {
        return true;
    }
    if (pos >= 2 && at(pos - 1).is("*") && at(pos - 2).text == "function") {
        return true;
    }

    if (frame.kind == FrameKind::Block && frame.class_body) {
        return callee_index == frame.stmt.lead_index;
    }

    if (frame.kind == FrameKind::Object) {
        size_t p = pos;
        while (p > 0) {
            const auto& tok = at(p - 1);
            bool modifier = tok.is("*") || (tok.kind == ScriptTokenKind::Identifier &&
                                            (tok.text == "get" || tok.text == "set" ||
                                             tok.text == "async" || tok.text == "static"));
            if (!modifier) {
                break;
            }
            --p;
        }
        if (p == 0) {
            return false;
        }
        size_t before = history_[p - 1];
        return before == frame.open || tokens_[before].is(",");
    }
    return false;
}

// ============================================================================
// Structure
// ============================================================================

void ScriptFormatter::note_statement_token(Frame& frame, size_t index, size_t next) {
    Statement& stmt = frame.stmt;
    stmt.fresh = false;
    if (!stmt.lead.empty()) {
        return;
    }

    const auto& tok = tokens_[index];
    const ScriptToken* nt = next != NONE ? &tokens_[next] : nullptr;

    bool modifier = false;
    if (tok.kind == ScriptTokenKind::Identifier) {
        if (contains(MODIFIERS, tok.text)) {
            modifier = names_member(nt) || (nt && nt->is("{"));
        } else if (tok.text == "async") {
            modifier = nt && (nt->kind == ScriptTokenKind::Identifier || nt->is("*"));
        } else if (tok.text == "get" || tok.text == "set") {
            modifier = frame.class_body && names_member(nt) && !nt->is("*");
        } else if (tok.text == "default") {
            modifier = nt && !nt->is(":");
        }
    } else if (tok.is("*")) {
        modifier = frame.class_body;
    }
    if (modifier) {
        return;
    }

    stmt.lead = tok.text;
    stmt.lead_index = index;
    if (tok.kind == ScriptTokenKind::Identifier) {
        stmt.is_case = tok.text == "case" || (tok.text == "default" && nt && nt->is(":"));
        bool declares_name = nt && (nt->kind == ScriptTokenKind::Identifier ||
                                    nt->kind == ScriptTokenKind::String);
        if ((tok.text == "module" || tok.text == "namespace" || tok.text == "interface") &&
            !declares_name) {
            // `module.exports = ...` and friends
            stmt.lead = "<expression>";
        }
    }
}

void ScriptFormatter::track(size_t index, size_t next) {
    Frame& frame = frames_.back();
    if (is_statement_level(frame)) {
        note_statement_token(frame, index, next);
    } else if (frame.kind == FrameKind::Object) {
        if (frame.entry_fresh && tokens_[index].is("...")) {
            frame.entry_rest = true;
        }
        frame.entry_fresh = false;
    }
}

void ScriptFormatter::open_brace(size_t index, size_t next, bool was_fresh) {
    Frame& top = frames_.back();
    const bool statement_level = is_statement_level(top);
    const ScriptToken* pt = prev_ != NONE ? &tokens_[prev_] : nullptr;
    const ScriptToken* nt = next != NONE ? &tokens_[next] : nullptr;
    const std::string& lead = top.stmt.lead;
    const bool keyword_before = pt && info_[prev_].role == Role::Keyword;

    Frame frame;
    frame.kind = FrameKind::Object;
    frame.open = index;

    if (statement_level && was_fresh) {
        frame.kind = FrameKind::Block;
        frame.terminal = true;
    } else if (top.body_pending) {
        frame.kind = FrameKind::Block;
        frame.terminal = top.body_terminal;
    } else if (statement_level && (lead == "class" || lead == "interface")) {
        frame.kind = FrameKind::Block;
        frame.terminal = true;
        frame.class_body = true;
    } else if (statement_level && (lead == "namespace" || lead == "module")) {
        frame.kind = FrameKind::Block;
        frame.terminal = true;
    } else if (pt && pt->is(")") && info_[prev_].header_close) {
        frame.kind = FrameKind::Block;
        frame.terminal = statement_level;
    } else if (pt && pt->is("=>")) {
        frame.kind = FrameKind::Block;
    } else if (keyword_before && (pt->text == "else" || pt->text == "try" ||
                                  pt->text == "finally" || pt->text == "do" ||
                                  pt->text == "catch")) {
        frame.kind = FrameKind::Block;
        frame.terminal = statement_level;
    } else if (statement_level && lead == "enum") {
        frame.terminal = true;
    }

    const bool empty = next == index + 1 && nt && nt->is("}");
    if (frame.kind == FrameKind::Object) {
        frame.multiline = !empty && newline_between(index, next);
        const bool annotation = pt && info_[prev_].role == Role::Colon;
        frame.type_literal = (annotation && (top.kind != FrameKind::Object || top.type_literal)) ||
                             (statement_level && lead == "type");
    }

    info_[index].role = Role::Open;
    write_token("{", needs_space(index, Role::Open));
    track(index, next);
    frames_.back().body_pending = false;

    const bool breaks = !empty && (frame.kind == FrameKind::Block || frame.multiline);
    frames_.push_back(frame);
    if (breaks) {
        pending_newline_ = true;
        just_opened_ = true;
    }
}

void ScriptFormatter::close_brace(size_t index, size_t next) {
    const FrameKind kind = frames_.back().kind;
    if (kind != FrameKind::Block && kind != FrameKind::Object) {
        fail(index, "unbalanced '}'");
        return;
    }
    const Frame closed = frames_.back();
    frames_.pop_back();

    auto& info = info_[index];
    info.role = Role::Close;
    info.block_close = closed.kind == FrameKind::Block;
    info.object_close = closed.kind == FrameKind::Object;
    info.terminal_close = closed.terminal;

    const bool empty = closed.open + 1 == index;
    if (empty) {
        write_token("}", false, true);
    } else if (closed.kind == FrameKind::Block || closed.multiline) {
        pending_newline_ = true;
        flush_newline(tokens_[index]);
        write_token("}", false, true);
    } else {
        write_token("}", options_.bracket_spacing || space_after_comment_, true);
    }
    track(index, next);
}

void ScriptFormatter::open_paren(size_t index, size_t next) {
    const auto& tok = tokens_[index];
    Frame& top = frames_.back();
    const ScriptToken* pt = prev_ != NONE ? &tokens_[prev_] : nullptr;

    Frame frame;
    frame.kind = tok.is("(") ? FrameKind::Paren : FrameKind::Bracket;
    frame.open = index;

    if (frame.kind == FrameKind::Paren) {
        if (pt && pt->kind == ScriptTokenKind::Identifier && !after_dot(prev_)) {
            if (contains(HEADER_KEYWORDS, pt->text)) {
                if (pt->text == "while" && is_statement_level(top) && top.stmt.lead == "do") {
                    frame.do_tail = true;
                } else {
                    frame.header = true;
                }
            } else if (pt->text == "await" && history_.size() >= 2 &&
                       tokens_[history_[history_.size() - 2]].text == "for") {
                frame.header = true;
            }
        }
        if (!frame.header && !frame.do_tail) {
            frame.params = opens_params(top);
        }
    }

    info_[index].role = Role::Open;
    write_token(tok.text, needs_space(index, Role::Open));
    track(index, next);
    frames_.push_back(frame);
}

void ScriptFormatter::close_paren(size_t index, size_t next) {
    const auto& tok = tokens_[index];
    const FrameKind expected = tok.is(")") ? FrameKind::Paren : FrameKind::Bracket;
    if (frames_.back().kind != expected) {
        fail(index, "unbalanced '" + tok.text + "'");
        return;
    }
    const Frame closed = frames_.back();
    frames_.pop_back();

    auto& info = info_[index];
    info.role = Role::Close;
    info.header_close = closed.header;
    info.params_close = closed.params;
    info.do_tail_close = closed.do_tail;

    write_token(tok.text, false);
    track(index, next);

    if (closed.params) {
        Frame& top = frames_.back();
        top.body_pending = true;
        top.body_terminal =
            is_statement_level(top) && (is_compound(top.stmt) || top.class_body);
    }
}

void ScriptFormatter::write_operator(size_t index, size_t next) {
    const auto& tok = tokens_[index];
    const std::string& text = tok.text;
    const ScriptToken* pt = prev_ != NONE ? &tokens_[prev_] : nullptr;
    const ScriptToken* nt = next != NONE ? &tokens_[next] : nullptr;
    Frame& top = frames_.back();
    const bool fresh = is_statement_level(top) && top.stmt.fresh;

    Role role = Role::Binary;
    if (text == "++" || text == "--" || text == "!") {
        bool postfix = pt && !fresh && ends_operand(prev_) && !newline_between(prev_, index);
        role = postfix ? Role::Postfix : Role::Prefix;
    } else if (text == "~" || text == "...") {
        role = Role::Prefix;
    } else if (text == "@") {
        if (is_statement_level(top)) {
            fail(index, "decorators are not supported");
            return;
        }
        role = Role::Prefix;
    } else if (text == "+" || text == "-") {
        role = (!pt || fresh || !ends_operand(prev_)) ? Role::Prefix : Role::Binary;
    } else if (text == "*") {
        if (pt && pt->kind == ScriptTokenKind::Identifier && !after_dot(prev_) &&
            (pt->text == "function" || pt->text == "yield")) {
            role = Role::Glued;
        } else if (fresh || (top.kind == FrameKind::Object && top.entry_fresh) ||
                   (top.class_body && top.stmt.lead.empty())) {
            role = Role::Prefix;
        }
    } else if (text == "?") {
        if (nt && (nt->is(":") || nt->is(")") || nt->is(",") || nt->is("=") || nt->is(";"))) {
            role = Role::Postfix;
        } else {
            ++top.ternaries;
        }
    } else if (text == "." || text == "?.") {
        // `a?. 1` would print as the conditional `a?.1`
        const bool call = text == "?." && nt && (nt->is("(") || nt->is("["));
        if (!nt || (nt->kind != ScriptTokenKind::Identifier && !call)) {
            fail(index, "'" + text + "' is not followed by a property name");
            return;
        }
        role = Role::Dot;
    } else if (text == "<" || text == ">" || text == ">>" || text == ">>>") {
        role = Role::Angle;
    } else if (text == "=") {
        top.body_pending = false;
    }

    if (role == Role::Binary && !contains(LEADING_OPERATORS, text)) {
        const bool has_left = pt && (ends_operand(prev_) || info_[prev_].role == Role::Angle ||
                                     (text == "=" && pt->text == "export"));
        if (!has_left) {
            fail(index, "operator '" + text + "' has no left operand");
            return;
        }
    }

    info_[index].role = role;
    write_token(text, needs_space(index, role));
    track(index, next);
}

void ScriptFormatter::handle_semicolon(size_t index, size_t next) {
    Frame& top = frames_.back();
    const ScriptToken* nt = next != NONE ? &tokens_[next] : nullptr;
    info_[index].role = Role::Semicolon;
    top.body_pending = false;

    switch (top.kind) {
    case FrameKind::Paren:
        write_token(";", false);
        return;
    case FrameKind::Bracket:
        fail(index, "unexpected ';' inside brackets");
        return;
    case FrameKind::Object:
        top.semicolon_members = true;
        top.entry_fresh = true;
        top.entry_rest = false;
        top.ternaries = 0;
        write_token(";", false);
        if (top.multiline) {
            pending_newline_ = true;
        }
        return;
    default:
        break;
    }

    const bool drop = options_.semicolons == config::Semicolons::AsNeeded && prev_ != NONE &&
                      can_end(prev_) && !(nt && (continues_expression(*nt) || nt->is("{")));
    if (!drop) {
        write_token(";", false);
    }
    end_statement(false);
}

void ScriptFormatter::handle_comma(size_t index, size_t next) {
    Frame& top = frames_.back();
    const ScriptToken* nt = next != NONE ? &tokens_[next] : nullptr;
    info_[index].role = Role::Comma;
    top.body_pending = false;

    if (top.kind == FrameKind::Object) {
        top.entry_fresh = true;
        top.entry_rest = false;
        top.ternaries = 0;
        if (top.multiline) {
            bool trailing = nt && nt->is("}");
            if (!(trailing && options_.trailing_comma == config::TrailingComma::None)) {
                write_token(",", false);
            }
            pending_newline_ = true;
            return;
        }
        write_token(",", false);
        return;
    }

    write_token(",", false);
    track(index, next);
}

void ScriptFormatter::handle_colon(size_t index, size_t next) {
    Frame& top = frames_.back();
    if (top.ternaries > 0) {
        --top.ternaries;
        info_[index].role = Role::Binary;
        write_token(":", true);
    } else if (is_statement_level(top) && top.stmt.is_case) {
        info_[index].role = Role::CaseColon;
        write_token(":", false);
    } else {
        info_[index].role = Role::Colon;
        write_token(":", false);
    }
    track(index, next);
}

void ScriptFormatter::end_statement(bool insert_semicolon) {
    if (insert_semicolon && options_.semicolons == config::Semicolons::Always) {
        write_token(";", false);
    }
    Frame& top = frames_.back();
    top.stmt = Statement{};
    top.ternaries = 0;
    top.body_pending = false;
    pending_newline_ = true;
}

void ScriptFormatter::after_token(size_t index, size_t next) {
    if (failure_) {
        return;
    }
    const auto& tok = tokens_[index];
    const auto& info = info_[index];
    const ScriptToken* nt = next != NONE ? &tokens_[next] : nullptr;
    Frame& top = frames_.back();

    if (info.role == Role::Open || info.role == Role::Comma || info.role == Role::Semicolon) {
        return;
    }

    if (top.kind == FrameKind::Object) {
        if (!nt) {
            return;
        }
        const bool always = options_.semicolons == config::Semicolons::Always;
        if (nt->is("}")) {
            if (!top.multiline) {
                return;
            }
            if (top.type_literal) {
                if (always) {
                    write_token(";", false);
                }
            } else if (options_.trailing_comma == config::TrailingComma::All &&
                       !top.semicolon_members && !top.entry_rest) {
                write_token(",", false);
            }
            return;
        }
        if (newline_between(index, next) && can_end(index) && !nt->is(",") && !nt->is(";") &&
            !continues_expression(*nt)) {
            if (!top.type_literal) {
                fail(next, "line break inside braces that do not hold an object literal");
                return;
            }
            // Members of a type literal may be separated by line breaks alone
            if (always) {
                write_token(";", false);
            }
            top.semicolon_members = true;
            top.entry_fresh = true;
            top.ternaries = 0;
            pending_newline_ = true;
        }
        return;
    }

    if (!is_statement_level(top)) {
        return;
    }

    if (info.role == Role::CaseColon) {
        end_statement(false);
        return;
    }

    if (!nt || nt->is("}")) {
        if (info.terminal_close) {
            end_statement(false);
        } else if (can_end(index)) {
            end_statement(true);
        } else {
            fail(index, "statement ends unexpectedly");
        }
        return;
    }

    if (info.terminal_close) {
        const bool continues =
            nt->kind == ScriptTokenKind::Identifier &&
            (nt->text == "else" || nt->text == "catch" || nt->text == "finally" ||
             (nt->text == "while" && top.stmt.lead == "do"));
        if (!continues) {
            end_statement(false);
        }
        return;
    }

    if (!newline_between(index, next)) {
        return;
    }
    if (!can_end(index)) {
        if (info.role == Role::Angle && !tok.is("<") && !continues_expression(*nt)) {
            fail(index, "ambiguous line break after '>'");
        }
        return;
    }
    if (continues_expression(*nt)) {
        return;
    }
    if (nt->is("{")) {
        if (top.stmt.lead != "class" && top.stmt.lead != "interface") {
            fail(next, "ambiguous '{' after line break");
        }
        return;
    }
    end_statement(true);
}

// ============================================================================
// Driver
// ============================================================================

void ScriptFormatter::process_comment(size_t index) {
    const auto& tok = tokens_[index];
    const bool own_line = tok.newlines_before > 0 || at_line_start_ || out_.empty();

    if (own_line) {
        if (!at_line_start_ && !out_.empty()) {
            emit_newline(tok.newlines_before >= 2 && !just_opened_);
        }
        pending_newline_ = false;
        write_token(tok.text, false);
    } else {
        const bool space = !(out_.back() == '(' || out_.back() == '[');
        write_token(tok.text, space);
    }

    if (tok.kind == ScriptTokenKind::LineComment) {
        pending_newline_ = true;
    } else {
        space_after_comment_ = true;
        if (own_line && index + 1 < tokens_.size() && tokens_[index + 1].newlines_before > 0) {
            pending_newline_ = true;
        }
    }
}

void ScriptFormatter::process_token(size_t index) {
    const auto& tok = tokens_[index];
    const size_t next = next_significant(index);
    const ScriptToken* pt = prev_ != NONE ? &tokens_[prev_] : nullptr;

    flush_newline(tok);

    if (tok.kind == ScriptTokenKind::Punct) {
        if (tok.text == "{") {
            open_brace(index, next, frames_.back().stmt.fresh);
        } else if (tok.text == "}") {
            close_brace(index, next);
        } else if (tok.text == "(" || tok.text == "[") {
            open_paren(index, next);
        } else if (tok.text == ")" || tok.text == "]") {
            close_paren(index, next);
        } else if (tok.text == ";") {
            handle_semicolon(index, next);
        } else if (tok.text == ",") {
            handle_comma(index, next);
        } else if (tok.text == ":") {
            handle_colon(index, next);
        } else {
            write_operator(index, next);
        }
    } else {
        if (pt && is_literal(*pt) && !newline_between(prev_, index) &&
            (is_literal(tok) || !contains(LITERAL_FOLLOWERS, tok.text))) {
            fail(index, "missing operator between '" + pt->text + "' and '" + tok.text + "'");
            return;
        }
        Role role = Role::Operand;
        std::string text = tok.text;
        if (tok.kind == ScriptTokenKind::Identifier) {
            bool member = pt && (pt->is(".") || pt->is("?.") ||
                                 (pt->kind == ScriptTokenKind::Identifier && pt->text == "as"));
            // `void` as a type
            bool type_word = tok.text == "void" && pt &&
                             (pt->is(":") || pt->is("=>") || pt->is("|") || pt->is("&") ||
                              pt->is("<") || pt->is(","));
            if (!member && !type_word && is_non_ending_keyword(tok.text)) {
                role = Role::Keyword;
            }
            const ScriptToken* nt = next != NONE ? &tokens_[next] : nullptr;
            const bool declaration = tok.text == "let" || tok.text == "const" || tok.text == "var";
            if (!member && declaration && nt && nt->kind == ScriptTokenKind::Identifier &&
                is_reserved_word(nt->text) && !(tok.text == "const" && nt->text == "enum")) {
                fail(next, "'" + nt->text + "' cannot be declared");
                return;
            }
        } else if (tok.kind == ScriptTokenKind::String) {
            text = convert_quotes(tok.text, options_.quote_style);
        }
        info_[index].role = role;
        write_token(text, needs_space(index, role));
        track(index, next);
    }

    if (failure_) {
        return;
    }
    history_.push_back(index);
    prev_ = index;
    after_token(index, next);
}

} // namespace polyfmt::script
