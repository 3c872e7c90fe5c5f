//! # JSON Parser and Formatter Tests
//!
//! - Parser: primitives, strings, containers, dialects, errors
//! - Formatter: layout, lexeme preservation, comments, fallback on errors

#include "common.hpp"

#include "json/json_formatter.hpp"
#include "json/json_parser.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace polyfmt;
using namespace polyfmt::json;

// ============================================================================
// Parser
// ============================================================================

TEST(JsonParserTest, ParsePrimitives) {
    auto null_result = parse_json("null");
    ASSERT_TRUE(is_ok(null_result));
    EXPECT_TRUE(unwrap(null_result).is_null());

    auto bool_result = parse_json("true");
    ASSERT_TRUE(is_ok(bool_result));
    EXPECT_TRUE(unwrap(bool_result).as_bool());

    auto int_result = parse_json("-42");
    ASSERT_TRUE(is_ok(int_result));
    EXPECT_EQ(unwrap(int_result).try_as_i64(), -42);

    auto float_result = parse_json("1.5e3");
    ASSERT_TRUE(is_ok(float_result));
    EXPECT_FALSE(unwrap(float_result).as_number().is_integer());
    EXPECT_DOUBLE_EQ(unwrap(float_result).as_number().as_f64(), 1500.0);
}

TEST(JsonParserTest, ParseStringEscapes) {
    auto result = parse_json(R"("a\"b\\c\n\u0041")");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_string(), "a\"b\\c\nA");
}

TEST(JsonParserTest, ParseNestedObject) {
    auto result = parse_json(R"({"indent_width": 2, "tags": ["a", "b"], "nested": {"x": null}})");
    ASSERT_TRUE(is_ok(result));
    const auto& value = unwrap(result);
    ASSERT_TRUE(value.is_object());
    EXPECT_EQ(value.get("indent_width")->try_as_i64(), 2);
    EXPECT_EQ(value.get("tags")->as_array().size(), 2u);
    EXPECT_TRUE(value.get("nested")->get("x")->is_null());
    EXPECT_EQ(value.get("missing"), nullptr);
}

TEST(JsonParserTest, StrictRejectsCommentsAndTrailingCommas) {
    EXPECT_TRUE(is_err(parse_json("// note\n{}")));
    EXPECT_TRUE(is_err(parse_json("[1, 2,]")));
    EXPECT_TRUE(is_err(parse_json(R"({"a": 1,})")));
}

TEST(JsonParserTest, JsoncAcceptsCommentsAndTrailingCommas) {
    auto result = parse_json("{\n  // compiler options\n  \"strict\": true, /* on */\n}",
                             JsonDialect::Jsonc);
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).get("strict")->as_bool());

    EXPECT_TRUE(is_ok(parse_json("[1, 2,]", JsonDialect::Jsonc)));
}

TEST(JsonParserTest, ErrorsCarryLocation) {
    auto result = parse_json("{\n  \"a\": tru\n}");
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.line, 2u);
    EXPECT_GT(error.column, 0u);
    EXPECT_NE(error.to_string().find("line 2"), std::string::npos);
}

TEST(JsonParserTest, RejectsMalformedInput) {
    EXPECT_TRUE(is_err(parse_json(R"("unterminated)")));
    EXPECT_TRUE(is_err(parse_json(R"({"a" 1})")));
    EXPECT_TRUE(is_err(parse_json("[1 2]")));
    EXPECT_TRUE(is_err(parse_json("{} []")));
    EXPECT_TRUE(is_err(parse_json("")));
}

TEST(JsonParserTest, DepthLimit) {
    std::string deep(1200, '[');
    deep += std::string(1200, ']');
    EXPECT_TRUE(is_err(parse_json(deep)));
}

TEST(JsonLexerTest, TokenizeKeepsComments) {
    auto result = tokenize_json("[1, // one\n 2]", JsonDialect::Jsonc);
    ASSERT_TRUE(is_ok(result));
    const auto& tokens = unwrap(result);
    ASSERT_GE(tokens.size(), 6u);
    EXPECT_EQ(tokens[3].kind, JsonTokenKind::LineComment);
    EXPECT_EQ(tokens[3].lexeme, "// one");
    EXPECT_EQ(tokens.back().kind, JsonTokenKind::Eof);
}

// ============================================================================
// Formatter
// ============================================================================

class JsonFormatterTest : public ::testing::Test {
protected:
    static auto spaces(uint32_t width) -> JsonFormatOptions {
        JsonFormatOptions options;
        options.use_tabs = false;
        options.indent_width = width;
        return options;
    }

    static auto format(std::string_view input, JsonFormatOptions options = spaces(2),
                       JsonDialect dialect = JsonDialect::Strict) -> std::string {
        JsonFormatter formatter(options);
        auto result = formatter.format(input, dialect);
        EXPECT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
        return is_ok(result) ? unwrap(result) : std::string();
    }
};

TEST_F(JsonFormatterTest, ExpandsObjectsAndArrays) {
    EXPECT_EQ(format(R"({"a":1,"b":[true,null]})"),
              "{\n  \"a\": 1,\n  \"b\": [\n    true,\n    null\n  ]\n}\n");
}

TEST_F(JsonFormatterTest, CollapsesEmptyContainers) {
    EXPECT_EQ(format(R"({ "a" : { }, "b" : [ ] })"), "{\n  \"a\": {},\n  \"b\": []\n}\n");
}

TEST_F(JsonFormatterTest, PreservesKeyOrderAndLexemes) {
    EXPECT_EQ(format(R"({"z":1.50,"a":"\u00e9","m":1E+3})"),
              "{\n  \"z\": 1.50,\n  \"a\": \"\\u00e9\",\n  \"m\": 1E+3\n}\n");
}

TEST_F(JsonFormatterTest, TabsByDefault) {
    EXPECT_EQ(format("[1]", JsonFormatOptions{}), "[\n\t1\n]\n");
}

TEST_F(JsonFormatterTest, CrlfLineEndings) {
    auto options = spaces(4);
    options.line_ending = polyfmt::config::LineEnding::Crlf;
    EXPECT_EQ(format(R"({"a":1})", options), "{\r\n    \"a\": 1\r\n}\r\n");
}

TEST_F(JsonFormatterTest, JsoncKeepsComments) {
    const char* input = "{\n// leading\n\"a\": 1, // trailing\n/* block */\n\"b\": 2,\n}";
    EXPECT_EQ(format(input, spaces(2), JsonDialect::Jsonc),
              "{\n  // leading\n  \"a\": 1, // trailing\n  /* block */\n  \"b\": 2,\n}\n");
}

TEST_F(JsonFormatterTest, BlockCommentStaysWithFollowingValue) {
    auto once = format("[1,2,/* two */3]", spaces(2), JsonDialect::Jsonc);
    EXPECT_EQ(once, "[\n  1,\n  2,\n  /* two */ 3\n]\n");
    EXPECT_EQ(format(once, spaces(2), JsonDialect::Jsonc), once);
}

TEST_F(JsonFormatterTest, NoSpaceBeforeCommaOrColonAfterComment) {
    auto once = format("[1 /* x */, 2]", spaces(2), JsonDialect::Jsonc);
    EXPECT_EQ(once, "[\n  1 /* x */,\n  2\n]\n");
    EXPECT_EQ(format(once, spaces(2), JsonDialect::Jsonc), once);

    EXPECT_EQ(format(R"({"a" /* k */: 1})", spaces(2), JsonDialect::Jsonc),
              "{\n  \"a\" /* k */: 1\n}\n");
}

TEST_F(JsonFormatterTest, IsIdempotent) {
    const char* input = R"({"compilerOptions":{"target":"es2020","lib":["dom","es2020"]},"files":[]})";
    auto once = format(input);
    EXPECT_EQ(format(once), once);
}

TEST_F(JsonFormatterTest, InvalidInputIsAnError) {
    JsonFormatter formatter(spaces(2));
    EXPECT_TRUE(is_err(formatter.format("{\"a\": }", JsonDialect::Strict)));
    EXPECT_TRUE(is_err(formatter.format("{\"a\": 1} // c", JsonDialect::Strict)));
}
