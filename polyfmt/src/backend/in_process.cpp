#include "backend/in_process.hpp"

#include "log/log.hpp"

namespace polyfmt::backend {

// ============================================================================
// Script Backend
// ============================================================================

auto ScriptBackend::options_from(const config::NativeConfig& native) -> script::ScriptOptions {
    const auto defaults = config::FormatConfig::defaults();
    script::ScriptOptions options;
    options.use_tabs =
        native.indent_style.value_or(defaults.indent_style) == config::IndentStyle::Tabs;
    options.indent_width = native.indent_width.value_or(defaults.indent_width);
    options.line_ending = native.line_ending.value_or(defaults.line_ending);
    options.quote_style = native.quote_style.value_or(defaults.quote_style);
    options.trailing_comma = native.trailing_comma.value_or(defaults.trailing_comma);
    options.semicolons = native.semicolons.value_or(defaults.semicolons);
    options.bracket_spacing = native.bracket_spacing.value_or(defaults.bracket_spacing);
    return options;
}

auto ScriptBackend::dialect_for(registry::FileType type) -> script::ScriptDialect {
    switch (type) {
    case registry::FileType::TypeScript:
        return script::ScriptDialect::TypeScript;
    case registry::FileType::Jsx:
        return script::ScriptDialect::Jsx;
    case registry::FileType::Tsx:
        return script::ScriptDialect::Tsx;
    default:
        return script::ScriptDialect::JavaScript;
    }
}

auto ScriptBackend::format(const FormatRequest& request) -> FormatResult<std::string> {
    script::ScriptFormatter formatter(options_from(request.native));
    auto result = formatter.format(request.text, dialect_for(request.entry.file_type));
    if (is_err(result)) {
        const auto& error = unwrap_err(result);
        POLYFMT_LOG_DEBUG("script", request.path << ": " << error.to_string());
        return FormatError::make(ErrorKind::ParseFailure, error.to_string());
    }
    return std::move(unwrap(result));
}

// ============================================================================
// JSON Backend
// ============================================================================

auto JsonBackend::options_from(const config::NativeConfig& native) -> json::JsonFormatOptions {
    const auto defaults = config::FormatConfig::defaults();
    json::JsonFormatOptions options;
    options.use_tabs =
        native.indent_style.value_or(defaults.indent_style) == config::IndentStyle::Tabs;
    options.indent_width = native.indent_width.value_or(defaults.indent_width);
    options.line_ending = native.line_ending.value_or(defaults.line_ending);
    return options;
}

auto JsonBackend::format(const FormatRequest& request) -> FormatResult<std::string> {
    const auto dialect = request.entry.file_type == registry::FileType::Jsonc
                             ? json::JsonDialect::Jsonc
                             : json::JsonDialect::Strict;
    json::JsonFormatter formatter(options_from(request.native));
    auto result = formatter.format(request.text, dialect);
    if (is_err(result)) {
        const auto& error = unwrap_err(result);
        POLYFMT_LOG_DEBUG("json", request.path << ": " << error.to_string());
        return FormatError::make(ErrorKind::ParseFailure, error.to_string());
    }
    return std::move(unwrap(result));
}

} // namespace polyfmt::backend
