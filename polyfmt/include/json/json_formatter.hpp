//! # JSON Formatter
//!
//! Reprints JSON and JSONC documents: one member or element per line, `": "`
//! after keys, empty containers collapsed to `{}` and `[]`. Numbers and
//! strings are copied as written, and comments stay where they were relative
//! to the surrounding tokens. A block comment written before a value on the
//! same line stays on that value's line.
//!
//! The input is validated with `JsonParser` first; invalid documents are
//! returned as a `JsonError` and never partially printed.

#pragma once

#include "common.hpp"
#include "config/format_config.hpp"
#include "json/json_error.hpp"
#include "json/json_parser.hpp"

#include <string>
#include <string_view>

namespace polyfmt::json {

struct JsonFormatOptions {
    bool use_tabs = true;
    uint32_t indent_width = 4;
    config::LineEnding line_ending = config::LineEnding::Lf;
};

class JsonFormatter {
public:
    explicit JsonFormatter(JsonFormatOptions options);

    auto format(std::string_view input, JsonDialect dialect) -> Result<std::string, JsonError>;

private:
    JsonFormatOptions options_;
    std::string out_;
    size_t indent_level_ = 0;
    bool at_line_start_ = true;
    bool pending_newline_ = false;
    bool space_next_ = false;

    void emit(std::string_view text);
    void emit_newline();
    void flush_newline();
    void push_indent();
    void pop_indent();
    [[nodiscard]] auto indent_str() const -> std::string;
};

} // namespace polyfmt::json
