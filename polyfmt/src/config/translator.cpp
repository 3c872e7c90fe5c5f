#include "config/translator.hpp"

namespace polyfmt::config {

auto translate(const FormatConfig& config, const registry::CapabilityEntry& entry)
    -> NativeConfig {
    const OptionSet& supported = entry.supported;

    NativeConfig native;
    native.backend = entry.backend;
    if (supported.contains(FormatOption::IndentStyle)) {
        native.indent_style = config.indent_style;
    }
    if (supported.contains(FormatOption::IndentWidth)) {
        native.indent_width = config.indent_width;
    }
    if (supported.contains(FormatOption::LineWidth)) {
        native.line_width = config.line_width;
    }
    if (supported.contains(FormatOption::LineEnding)) {
        native.line_ending = config.line_ending;
    }
    if (supported.contains(FormatOption::QuoteStyle)) {
        native.quote_style = config.quote_style;
    }
    if (supported.contains(FormatOption::TrailingComma)) {
        native.trailing_comma = config.trailing_comma;
    }
    if (supported.contains(FormatOption::Semicolons)) {
        native.semicolons = config.semicolons;
    }
    if (supported.contains(FormatOption::BracketSpacing)) {
        native.bracket_spacing = config.bracket_spacing;
    }
    if (supported.contains(FormatOption::BraceStyle)) {
        native.brace_style = config.brace_style;
    }
    return native;
}

auto NativeConfig::populated() const -> OptionSet {
    OptionSet set;
    auto add = [&set](bool present, FormatOption option) {
        if (present) {
            set = set | OptionSet{option};
        }
    };
    add(indent_style.has_value(), FormatOption::IndentStyle);
    add(indent_width.has_value(), FormatOption::IndentWidth);
    add(line_width.has_value(), FormatOption::LineWidth);
    add(line_ending.has_value(), FormatOption::LineEnding);
    add(quote_style.has_value(), FormatOption::QuoteStyle);
    add(trailing_comma.has_value(), FormatOption::TrailingComma);
    add(semicolons.has_value(), FormatOption::Semicolons);
    add(bracket_spacing.has_value(), FormatOption::BracketSpacing);
    add(brace_style.has_value(), FormatOption::BraceStyle);
    return set;
}

auto NativeConfig::foreign_indent() const -> unsigned {
    if (!indent_style || *indent_style == IndentStyle::Tabs) {
        return 0;
    }
    return indent_width.value_or(0);
}

auto NativeConfig::sandbox_style() const -> std::string {
    std::string style = "{BasedOnStyle: LLVM";
    if (indent_style) {
        style += *indent_style == IndentStyle::Tabs ? ", UseTab: Always" : ", UseTab: Never";
    }
    if (indent_width) {
        std::string width = std::to_string(*indent_width);
        style += ", IndentWidth: " + width + ", TabWidth: " + width;
    }
    if (line_width) {
        style += ", ColumnLimit: " + std::to_string(*line_width);
    }
    if (brace_style) {
        style += *brace_style == BraceStyle::SameLine ? ", BreakBeforeBraces: Attach"
                                                      : ", BreakBeforeBraces: Allman";
    }
    if (bracket_spacing) {
        // clang-format pads `{ 1, 2 }` only when the C++11 braced-list style is off.
        style += *bracket_spacing ? ", Cpp11BracedListStyle: false"
                                  : ", Cpp11BracedListStyle: true";
    }
    if (line_ending) {
        style += *line_ending == LineEnding::Lf ? ", LineEnding: LF" : ", LineEnding: CRLF";
    }
    style += "}";
    return style;
}

} // namespace polyfmt::config
