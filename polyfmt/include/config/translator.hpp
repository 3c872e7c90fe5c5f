//! # Config Translator
//!
//! Reconciles the unified `FormatConfig` with what one backend understands.
//! `translate` copies an option into the backend's `NativeConfig` only when the
//! capability entry lists it as supported; everything else is dropped, so a
//! fixed-style backend such as gofmt receives an empty configuration.
//!
//! ## Native Renderings
//!
//! | Backend kind | Rendering |
//! |--------------|-----------|
//! | Foreign | `foreign_indent()`: 0 for tabs, the width for spaces |
//! | Sandbox | `sandbox_style()`: inline `{BasedOnStyle: LLVM, ...}` |
//! | In-process | slots read through `value_or` by the engine options |
//!
//! Pure and deterministic; safe to call from any number of workers at once.

#ifndef POLYFMT_CONFIG_TRANSLATOR_HPP
#define POLYFMT_CONFIG_TRANSLATOR_HPP

#include "config/format_config.hpp"
#include "registry/capability.hpp"

#include <optional>
#include <string>

namespace polyfmt::config {

/// Backend-native configuration: one optional slot per `FormatOption`,
/// populated only for options the backend supports.
struct NativeConfig {
    registry::BackendId backend = registry::BackendId::Script;

    std::optional<IndentStyle> indent_style;
    std::optional<uint32_t> indent_width;
    std::optional<uint32_t> line_width;
    std::optional<LineEnding> line_ending;
    std::optional<QuoteStyle> quote_style;
    std::optional<TrailingComma> trailing_comma;
    std::optional<Semicolons> semicolons;
    std::optional<bool> bracket_spacing;
    std::optional<BraceStyle> brace_style;

    /// The set of populated slots.
    [[nodiscard]] auto populated() const -> OptionSet;

    /// Indent argument of the foreign C ABI.
    [[nodiscard]] auto foreign_indent() const -> unsigned;

    /// clang-format style string for the sandboxed module.
    [[nodiscard]] auto sandbox_style() const -> std::string;

    [[nodiscard]] auto operator==(const NativeConfig& other) const -> bool = default;
};

[[nodiscard]] auto translate(const FormatConfig& config, const registry::CapabilityEntry& entry)
    -> NativeConfig;

} // namespace polyfmt::config

#endif // POLYFMT_CONFIG_TRANSLATOR_HPP
