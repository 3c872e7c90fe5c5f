//! # Configuration Unit Tests
//!
//! Loading `polyfmt.json` and translating the unified configuration into each
//! backend's native options.

#include "config/format_config.hpp"
#include "config/translator.hpp"
#include "registry/capability.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace polyfmt;
using namespace polyfmt::config;
using polyfmt::registry::CapabilityRegistry;
using polyfmt::registry::FileType;
using polyfmt::test::ScopedLogCapture;
using polyfmt::test::TempDir;

// ============================================================================
// Loading
// ============================================================================

class FormatConfigTest : public ::testing::Test {};

TEST_F(FormatConfigTest, Defaults) {
    FormatConfig config = FormatConfig::defaults();
    EXPECT_EQ(config.indent_style, IndentStyle::Tabs);
    EXPECT_EQ(config.indent_width, 4u);
    EXPECT_EQ(config.line_width, 80u);
    EXPECT_EQ(config.line_ending, LineEnding::Lf);
    EXPECT_EQ(config.quote_style, QuoteStyle::Double);
    EXPECT_EQ(config.trailing_comma, TrailingComma::All);
    EXPECT_EQ(config.semicolons, Semicolons::Always);
    EXPECT_TRUE(config.bracket_spacing);
    EXPECT_EQ(config.brace_style, BraceStyle::SameLine);
}

TEST_F(FormatConfigTest, EmptyObjectIsDefaults) {
    auto result = parse_format_config("{}");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result), FormatConfig::defaults());
}

TEST_F(FormatConfigTest, EveryKey) {
    auto result = parse_format_config(R"({
        "indent_style": "spaces",
        "indent_width": 2,
        "line_width": 100,
        "line_ending": "crlf",
        "quote_style": "single",
        "trailing_comma": "none",
        "semicolons": "as_needed",
        "bracket_spacing": false,
        "brace_style": "next_line"
    })");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);

    const FormatConfig& config = unwrap(result);
    EXPECT_EQ(config.indent_style, IndentStyle::Spaces);
    EXPECT_EQ(config.indent_width, 2u);
    EXPECT_EQ(config.line_width, 100u);
    EXPECT_EQ(config.line_ending, LineEnding::Crlf);
    EXPECT_EQ(config.quote_style, QuoteStyle::Single);
    EXPECT_EQ(config.trailing_comma, TrailingComma::None);
    EXPECT_EQ(config.semicolons, Semicolons::AsNeeded);
    EXPECT_FALSE(config.bracket_spacing);
    EXPECT_EQ(config.brace_style, BraceStyle::NextLine);
}

TEST_F(FormatConfigTest, CommentsAreAccepted) {
    auto result = parse_format_config("{\n  // two spaces\n  \"indent_width\": 2,\n}");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).indent_width, 2u);
}

TEST_F(FormatConfigTest, InvalidValueNamesTheKey) {
    auto bad_choice = parse_format_config(R"({"quote_style": "backtick"})");
    ASSERT_TRUE(is_err(bad_choice));
    EXPECT_NE(unwrap_err(bad_choice).find("quote_style"), std::string::npos);

    auto bad_width = parse_format_config(R"({"indent_width": 0})");
    ASSERT_TRUE(is_err(bad_width));
    EXPECT_NE(unwrap_err(bad_width).find("indent_width"), std::string::npos);

    auto bad_type = parse_format_config(R"({"bracket_spacing": "yes"})");
    ASSERT_TRUE(is_err(bad_type));
    EXPECT_NE(unwrap_err(bad_type).find("bracket_spacing"), std::string::npos);
}

TEST_F(FormatConfigTest, MalformedDocument) {
    EXPECT_TRUE(is_err(parse_format_config("{\"indent_width\": ")));
    EXPECT_TRUE(is_err(parse_format_config("[1, 2]")));
}

TEST_F(FormatConfigTest, UnknownKeyWarns) {
    ScopedLogCapture capture;
    auto result = parse_format_config(R"({"tab_size": 8, "indent_width": 3})");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).indent_width, 3u);
    EXPECT_EQ(capture.sink().count(log::LogLevel::Warn, "config", "tab_size"), 1u);
}

TEST_F(FormatConfigTest, LoadFromFile) {
    TempDir dir("polyfmt_config");
    auto path = dir.write("polyfmt.json", R"({"line_width": 120})");

    auto result = load_format_config(path.string());
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    EXPECT_EQ(unwrap(result).line_width, 120u);
}

TEST_F(FormatConfigTest, LoadErrorsNameTheFile) {
    TempDir dir("polyfmt_config");
    auto path = dir.write("broken.json", R"({"line_ending": "cr"})");

    auto result = load_format_config(path.string());
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("broken.json"), std::string::npos);

    auto missing = load_format_config((dir.path() / "absent.json").string());
    EXPECT_TRUE(is_err(missing));
}

TEST_F(FormatConfigTest, ExplicitPathWins) {
    TempDir dir("polyfmt_config");
    auto path = dir.write("custom.json", R"({"indent_style": "spaces"})");

    auto result = resolve_format_config(path.string());
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).indent_style, IndentStyle::Spaces);
}

// ============================================================================
// Translation
// ============================================================================

class TranslatorTest : public ::testing::Test {
protected:
    auto entry_for(FileType type) const -> registry::CapabilityEntry {
        return *CapabilityRegistry::global().lookup(type);
    }

    FormatConfig config = FormatConfig::defaults();
};

TEST_F(TranslatorTest, OnlySupportedOptionsArePopulated) {
    for (const registry::CapabilityEntry& entry : CapabilityRegistry::global().entries()) {
        NativeConfig native = translate(config, entry);
        EXPECT_EQ(native.populated(), entry.supported);
        EXPECT_EQ(native.backend, entry.backend);
    }
}

TEST_F(TranslatorTest, FixedStyleBackendGetsNothing) {
    NativeConfig native = translate(config, entry_for(FileType::Go));
    EXPECT_TRUE(native.populated().empty());
    EXPECT_EQ(native.foreign_indent(), 0u);
}

TEST_F(TranslatorTest, ForeignIndent) {
    auto shell = entry_for(FileType::Shell);
    EXPECT_EQ(translate(config, shell).foreign_indent(), 0u);

    config.indent_style = IndentStyle::Spaces;
    config.indent_width = 2;
    EXPECT_EQ(translate(config, shell).foreign_indent(), 2u);
}

TEST_F(TranslatorTest, SandboxStyle) {
    config.indent_style = IndentStyle::Spaces;
    config.indent_width = 2;
    config.line_width = 100;
    config.brace_style = BraceStyle::NextLine;

    std::string style = translate(config, entry_for(FileType::Cpp)).sandbox_style();
    EXPECT_EQ(style.front(), '{');
    EXPECT_EQ(style.back(), '}');
    EXPECT_NE(style.find("BasedOnStyle: LLVM"), std::string::npos);
    EXPECT_NE(style.find("UseTab: Never"), std::string::npos);
    EXPECT_NE(style.find("IndentWidth: 2"), std::string::npos);
    EXPECT_NE(style.find("ColumnLimit: 100"), std::string::npos);
    EXPECT_NE(style.find("BreakBeforeBraces: Allman"), std::string::npos);
    EXPECT_NE(style.find("LineEnding: LF"), std::string::npos);
}

TEST_F(TranslatorTest, ScriptDropsLineWidth) {
    config.line_width = 40;
    NativeConfig native = translate(config, entry_for(FileType::TypeScript));
    EXPECT_FALSE(native.line_width.has_value());
    ASSERT_TRUE(native.quote_style.has_value());
    EXPECT_EQ(*native.quote_style, QuoteStyle::Double);
}

TEST_F(TranslatorTest, TranslationIsDeterministic) {
    auto entry = entry_for(FileType::Java);
    EXPECT_EQ(translate(config, entry), translate(config, entry));
    EXPECT_EQ(translate(config, entry).sandbox_style(), translate(config, entry).sandbox_style());
}
