//! # Unified Format Configuration
//!
//! One `FormatConfig` value describes the desired style for every language.
//! It is built once at startup from defaults plus an optional `polyfmt.json`,
//! then shared read-only by all batch workers.
//!
//! ## Configuration File
//!
//! ```json
//! {
//!     "indent_style": "spaces",
//!     "indent_width": 2,
//!     "line_width": 100,
//!     "line_ending": "lf",
//!     "quote_style": "single",
//!     "trailing_comma": "none",
//!     "semicolons": "as_needed",
//!     "bracket_spacing": true,
//!     "brace_style": "same_line"
//! }
//! ```
//!
//! Every key is optional. Unknown keys are reported as warnings; a known key
//! with an invalid value fails the load.

#ifndef POLYFMT_CONFIG_FORMAT_CONFIG_HPP
#define POLYFMT_CONFIG_FORMAT_CONFIG_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace polyfmt::config {

// ============================================================================
// Style Enumerations
// ============================================================================

enum class IndentStyle : uint8_t { Tabs, Spaces };
enum class LineEnding : uint8_t { Lf, Crlf };
enum class QuoteStyle : uint8_t { Double, Single };
enum class TrailingComma : uint8_t { All, None };
enum class Semicolons : uint8_t { Always, AsNeeded };
enum class BraceStyle : uint8_t { SameLine, NextLine };

// ============================================================================
// FormatConfig
// ============================================================================

/// The unified, backend-independent style description.
struct FormatConfig {
    IndentStyle indent_style = IndentStyle::Tabs;
    uint32_t indent_width = 4;
    uint32_t line_width = 80;
    LineEnding line_ending = LineEnding::Lf;
    QuoteStyle quote_style = QuoteStyle::Double;
    TrailingComma trailing_comma = TrailingComma::All;
    Semicolons semicolons = Semicolons::Always;
    bool bracket_spacing = true;
    BraceStyle brace_style = BraceStyle::SameLine;

    [[nodiscard]] static auto defaults() -> FormatConfig {
        return FormatConfig{};
    }

    [[nodiscard]] auto operator==(const FormatConfig& other) const -> bool = default;
};

// ============================================================================
// Options
// ============================================================================

/// Names one field of `FormatConfig`.
enum class FormatOption : uint8_t {
    IndentStyle,
    IndentWidth,
    LineWidth,
    LineEnding,
    QuoteStyle,
    TrailingComma,
    Semicolons,
    BracketSpacing,
    BraceStyle,
};

inline constexpr size_t FORMAT_OPTION_COUNT = 9;

/// Configuration key of an option, as used in `polyfmt.json`.
[[nodiscard]] auto option_key(FormatOption option) -> std::string_view;

/// A bit set over `FormatOption`, usable in constant expressions so that the
/// capability table can be `constexpr` data.
class OptionSet {
public:
    constexpr OptionSet() = default;

    constexpr OptionSet(std::initializer_list<FormatOption> options) {
        for (FormatOption option : options) {
            bits_ |= bit(option);
        }
    }

    [[nodiscard]] constexpr auto contains(FormatOption option) const -> bool {
        return (bits_ & bit(option)) != 0;
    }

    [[nodiscard]] constexpr auto empty() const -> bool {
        return bits_ == 0;
    }

    [[nodiscard]] constexpr auto size() const -> size_t {
        size_t count = 0;
        for (uint16_t bits = bits_; bits != 0; bits &= static_cast<uint16_t>(bits - 1)) {
            ++count;
        }
        return count;
    }

    [[nodiscard]] constexpr auto operator|(OptionSet other) const -> OptionSet {
        OptionSet result;
        result.bits_ = static_cast<uint16_t>(bits_ | other.bits_);
        return result;
    }

    [[nodiscard]] constexpr auto operator&(OptionSet other) const -> OptionSet {
        OptionSet result;
        result.bits_ = static_cast<uint16_t>(bits_ & other.bits_);
        return result;
    }

    [[nodiscard]] constexpr auto operator==(const OptionSet& other) const -> bool = default;

private:
    uint16_t bits_ = 0;

    static constexpr auto bit(FormatOption option) -> uint16_t {
        return static_cast<uint16_t>(1u << static_cast<unsigned>(option));
    }
};

// ============================================================================
// Loading
// ============================================================================

/// Default configuration file name, looked up in the working directory.
inline constexpr const char* CONFIG_FILE_NAME = "polyfmt.json";

/// Applies the keys of a JSON document on top of `FormatConfig::defaults()`.
///
/// Returns a message naming the offending key on an invalid value.
[[nodiscard]] auto parse_format_config(std::string_view json_text)
    -> Result<FormatConfig, std::string>;

/// Reads and parses a configuration file.
[[nodiscard]] auto load_format_config(const std::string& path) -> Result<FormatConfig, std::string>;

/// Loads `explicit_path` if given, else `polyfmt.json` from the working
/// directory if it exists, else the defaults.
[[nodiscard]] auto resolve_format_config(const std::string& explicit_path)
    -> Result<FormatConfig, std::string>;

} // namespace polyfmt::config

#endif // POLYFMT_CONFIG_FORMAT_CONFIG_HPP
