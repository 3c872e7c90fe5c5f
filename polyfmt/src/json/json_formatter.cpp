#include "json/json_formatter.hpp"

#include <algorithm>

namespace polyfmt::json {

namespace {

auto is_open(JsonTokenKind kind) -> bool {
    return kind == JsonTokenKind::LBrace || kind == JsonTokenKind::LBracket;
}

auto is_close(JsonTokenKind kind) -> bool {
    return kind == JsonTokenKind::RBrace || kind == JsonTokenKind::RBracket;
}

auto is_comment(JsonTokenKind kind) -> bool {
    return kind == JsonTokenKind::LineComment || kind == JsonTokenKind::BlockComment;
}

// Block comments keep their inner line breaks, normalized to `\n`.
auto comment_text(std::string_view lexeme) -> std::string {
    std::string text;
    text.reserve(lexeme.size());
    for (size_t i = 0; i < lexeme.size(); ++i) {
        if (lexeme[i] == '\r' && i + 1 < lexeme.size() && lexeme[i + 1] == '\n') {
            continue;
        }
        text.push_back(lexeme[i]);
    }
    return text;
}

auto end_line(const JsonToken& token) -> size_t {
    return token.line + static_cast<size_t>(std::count(token.lexeme.begin(), token.lexeme.end(), '\n'));
}

} // namespace

JsonFormatter::JsonFormatter(JsonFormatOptions options) : options_(options) {}

void JsonFormatter::emit(std::string_view text) {
    if (at_line_start_) {
        out_ += indent_str();
        at_line_start_ = false;
    } else if (space_next_) {
        out_.push_back(' ');
    }
    space_next_ = false;
    out_ += text;
}

void JsonFormatter::emit_newline() {
    out_.push_back('\n');
    at_line_start_ = true;
}

void JsonFormatter::flush_newline() {
    if (pending_newline_ && !at_line_start_ && !out_.empty()) {
        emit_newline();
    }
    pending_newline_ = false;
}

void JsonFormatter::push_indent() {
    ++indent_level_;
}

void JsonFormatter::pop_indent() {
    if (indent_level_ > 0)
        --indent_level_;
}

auto JsonFormatter::indent_str() const -> std::string {
    if (options_.use_tabs) {
        return std::string(indent_level_, '\t');
    }
    return std::string(indent_level_ * options_.indent_width, ' ');
}

auto JsonFormatter::format(std::string_view input, JsonDialect dialect)
    -> Result<std::string, JsonError> {
    out_.clear();
    indent_level_ = 0;
    at_line_start_ = true;
    pending_newline_ = false;
    space_next_ = false;

    JsonParser parser(input, dialect);
    auto parsed = parser.parse();
    if (is_err(parsed)) {
        return unwrap_err(parsed);
    }

    auto lexed = tokenize_json(input, dialect);
    if (is_err(lexed)) {
        return unwrap_err(lexed);
    }
    const auto& tokens = unwrap(lexed);

    size_t prev_end_line = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& tok = tokens[i];
        if (tok.kind == JsonTokenKind::Eof) {
            break;
        }

        if (is_comment(tok.kind)) {
            // A block comment right before a value on its line moves with it.
            const JsonToken* next = i + 1 < tokens.size() ? &tokens[i + 1] : nullptr;
            const bool leading = tok.kind == JsonTokenKind::BlockComment && pending_newline_ &&
                                 next && next->line == end_line(tok) &&
                                 next->kind != JsonTokenKind::Eof && !is_comment(next->kind) &&
                                 !is_close(next->kind) && next->kind != JsonTokenKind::Comma;
            if (leading) {
                flush_newline();
                emit(comment_text(tok.lexeme));
                space_next_ = true;
                prev_end_line = end_line(tok);
                continue;
            }

            const bool trailing = !out_.empty() && tok.line == prev_end_line;
            if (trailing) {
                if (!at_line_start_) {
                    out_.push_back(' ');
                }
                out_ += comment_text(tok.lexeme);
                at_line_start_ = false;
                space_next_ = true;
            } else {
                pending_newline_ = true;
                flush_newline();
                emit(comment_text(tok.lexeme));
            }
            if (tok.kind == JsonTokenKind::LineComment || !trailing) {
                pending_newline_ = true;
                space_next_ = false;
            }
            prev_end_line = end_line(tok);
            continue;
        }

        if (is_open(tok.kind)) {
            flush_newline();
            const bool empty = i + 1 < tokens.size() && is_close(tokens[i + 1].kind);
            if (empty) {
                emit(tok.kind == JsonTokenKind::LBrace ? "{}" : "[]");
                prev_end_line = tokens[i + 1].line;
                ++i;
                continue;
            }
            emit(tok.lexeme);
            push_indent();
            pending_newline_ = true;
        } else if (is_close(tok.kind)) {
            pop_indent();
            pending_newline_ = true;
            flush_newline();
            emit(tok.lexeme);
        } else if (tok.kind == JsonTokenKind::Comma) {
            flush_newline();
            space_next_ = false;
            emit(",");
            pending_newline_ = true;
        } else if (tok.kind == JsonTokenKind::Colon) {
            flush_newline();
            space_next_ = false;
            emit(":");
            space_next_ = true;
        } else {
            flush_newline();
            emit(tok.lexeme);
        }
        prev_end_line = end_line(tok);
    }

    while (!out_.empty() && (out_.back() == '\n' || out_.back() == ' ' || out_.back() == '\t')) {
        out_.pop_back();
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

} // namespace polyfmt::json
