//! # Configuration Loading
//!
//! Reads `polyfmt.json` with the project JSON parser and maps it onto
//! `FormatConfig`.

#include "config/format_config.hpp"

#include "json/json_parser.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace polyfmt::config {

namespace fs = std::filesystem;

auto option_key(FormatOption option) -> std::string_view {
    switch (option) {
    case FormatOption::IndentStyle:
        return "indent_style";
    case FormatOption::IndentWidth:
        return "indent_width";
    case FormatOption::LineWidth:
        return "line_width";
    case FormatOption::LineEnding:
        return "line_ending";
    case FormatOption::QuoteStyle:
        return "quote_style";
    case FormatOption::TrailingComma:
        return "trailing_comma";
    case FormatOption::Semicolons:
        return "semicolons";
    case FormatOption::BracketSpacing:
        return "bracket_spacing";
    case FormatOption::BraceStyle:
        return "brace_style";
    }
    return "";
}

namespace {

auto invalid_value(std::string_view key, std::string_view expected) -> std::string {
    return "invalid value for '" + std::string(key) + "': expected " + std::string(expected);
}

/// Matches a string value against two accepted spellings.
template <typename Enum>
auto read_choice(const json::JsonValue& value, std::string_view key, std::string_view first,
                 Enum first_value, std::string_view second, Enum second_value, Enum& out)
    -> std::optional<std::string> {
    if (value.is_string()) {
        if (value.as_string() == first) {
            out = first_value;
            return std::nullopt;
        }
        if (value.as_string() == second) {
            out = second_value;
            return std::nullopt;
        }
    }
    return invalid_value(key, "\"" + std::string(first) + "\" or \"" + std::string(second) + "\"");
}

auto read_width(const json::JsonValue& value, std::string_view key, uint32_t max, uint32_t& out)
    -> std::optional<std::string> {
    auto number = value.try_as_i64();
    if (!number || *number < 1 || *number > static_cast<int64_t>(max)) {
        return invalid_value(key, "an integer between 1 and " + std::to_string(max));
    }
    out = static_cast<uint32_t>(*number);
    return std::nullopt;
}

auto apply_key(const std::string& key, const json::JsonValue& value, FormatConfig& config)
    -> std::optional<std::string> {
    if (key == "indent_style") {
        return read_choice(value, key, "tabs", IndentStyle::Tabs, "spaces", IndentStyle::Spaces,
                           config.indent_style);
    }
    if (key == "indent_width") {
        return read_width(value, key, 16, config.indent_width);
    }
    if (key == "line_width") {
        return read_width(value, key, 1000, config.line_width);
    }
    if (key == "line_ending") {
        return read_choice(value, key, "lf", LineEnding::Lf, "crlf", LineEnding::Crlf,
                           config.line_ending);
    }
    if (key == "quote_style") {
        return read_choice(value, key, "double", QuoteStyle::Double, "single", QuoteStyle::Single,
                           config.quote_style);
    }
    if (key == "trailing_comma") {
        return read_choice(value, key, "all", TrailingComma::All, "none", TrailingComma::None,
                           config.trailing_comma);
    }
    if (key == "semicolons") {
        return read_choice(value, key, "always", Semicolons::Always, "as_needed",
                           Semicolons::AsNeeded, config.semicolons);
    }
    if (key == "bracket_spacing") {
        if (!value.is_bool()) {
            return invalid_value(key, "true or false");
        }
        config.bracket_spacing = value.as_bool();
        return std::nullopt;
    }
    if (key == "brace_style") {
        return read_choice(value, key, "same_line", BraceStyle::SameLine, "next_line",
                           BraceStyle::NextLine, config.brace_style);
    }

    POLYFMT_LOG_WARN("config", "Ignoring unknown configuration key '" << key << "'");
    return std::nullopt;
}

} // namespace

auto parse_format_config(std::string_view json_text) -> Result<FormatConfig, std::string> {
    auto parsed = json::parse_json(json_text, json::JsonDialect::Jsonc);
    if (is_err(parsed)) {
        return "malformed configuration: " + unwrap_err(parsed).to_string();
    }

    const json::JsonValue& root = unwrap(parsed);
    if (!root.is_object()) {
        return "configuration must be a JSON object, found " + std::string(root.type_name());
    }

    FormatConfig config = FormatConfig::defaults();
    for (const auto& [key, value] : root.as_object()) {
        if (auto error = apply_key(key, value, config)) {
            return *error;
        }
    }
    return config;
}

auto load_format_config(const std::string& path) -> Result<FormatConfig, std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return "cannot open configuration file " + path;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_format_config(buffer.str());
    if (is_err(result)) {
        return path + ": " + unwrap_err(result);
    }
    POLYFMT_LOG_DEBUG("config", "Loaded configuration from " << path);
    return result;
}

auto resolve_format_config(const std::string& explicit_path) -> Result<FormatConfig, std::string> {
    if (!explicit_path.empty()) {
        return load_format_config(explicit_path);
    }
    std::error_code ec;
    if (fs::is_regular_file(CONFIG_FILE_NAME, ec)) {
        return load_format_config(CONFIG_FILE_NAME);
    }
    return FormatConfig::defaults();
}

} // namespace polyfmt::config
