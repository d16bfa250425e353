#include <fluffy/markup/attribute_parser.h>
#include <gtest/gtest.h>
#include <string>

using fluffy::markup::parse_attributes;

// ============================================================================
// Basic pairs
// ============================================================================

TEST(AttributeParser, EmptyTextYieldsEmptyMap) {
    EXPECT_TRUE(parse_attributes("").empty());
}

TEST(AttributeParser, DoubleQuotedValue) {
    auto attrs = parse_attributes(R"(language="cpp")");
    ASSERT_EQ(attrs.size(), 1u);
    EXPECT_EQ(attrs.at("language"), "cpp");
}

TEST(AttributeParser, SingleQuotedValue) {
    auto attrs = parse_attributes("title='Hello world'");
    ASSERT_EQ(attrs.size(), 1u);
    EXPECT_EQ(attrs.at("title"), "Hello world");
}

TEST(AttributeParser, MultiplePairs) {
    auto attrs = parse_attributes(R"(id="a1" type='code' lang="py")");
    ASSERT_EQ(attrs.size(), 3u);
    EXPECT_EQ(attrs.at("id"), "a1");
    EXPECT_EQ(attrs.at("type"), "code");
    EXPECT_EQ(attrs.at("lang"), "py");
}

TEST(AttributeParser, WhitespaceAroundEquals) {
    auto attrs = parse_attributes("name  =   \"x\"\tother\t=\t'y'");
    EXPECT_EQ(attrs.at("name"), "x");
    EXPECT_EQ(attrs.at("other"), "y");
}

TEST(AttributeParser, EmptyValue) {
    auto attrs = parse_attributes(R"(flag="")");
    ASSERT_EQ(attrs.count("flag"), 1u);
    EXPECT_EQ(attrs.at("flag"), "");
}

TEST(AttributeParser, UnderscoreAndDigitsInName) {
    auto attrs = parse_attributes(R"(data_id2="7")");
    EXPECT_EQ(attrs.at("data_id2"), "7");
}

// ============================================================================
// Quoting rules
// ============================================================================

TEST(AttributeParser, OtherQuoteKindInsideValueIsLiteral) {
    auto attrs = parse_attributes(R"(a="it's" b='say "hi"')");
    EXPECT_EQ(attrs.at("a"), "it's");
    EXPECT_EQ(attrs.at("b"), "say \"hi\"");
}

TEST(AttributeParser, JsonValueInSingleQuotes) {
    auto attrs = parse_attributes(R"(data='{"k": "<v>"}')");
    EXPECT_EQ(attrs.at("data"), R"({"k": "<v>"})");
}

TEST(AttributeParser, UnterminatedValueIsIgnored) {
    auto attrs = parse_attributes(R"(a="open)");
    EXPECT_TRUE(attrs.empty());
}

TEST(AttributeParser, ValueMayNotSpanLines) {
    auto attrs = parse_attributes("a=\"line1\nline2\" b=\"ok\"");
    EXPECT_EQ(attrs.count("a"), 0u);
    EXPECT_EQ(attrs.at("b"), "ok");
}

// ============================================================================
// Tolerated junk
// ============================================================================

TEST(AttributeParser, BareWordsAreSkipped) {
    auto attrs = parse_attributes(R"(disabled checked value="1")");
    ASSERT_EQ(attrs.size(), 1u);
    EXPECT_EQ(attrs.at("value"), "1");
}

TEST(AttributeParser, UnquotedValueIsSkipped) {
    auto attrs = parse_attributes(R"(width=10 height="20")");
    EXPECT_EQ(attrs.count("width"), 0u);
    EXPECT_EQ(attrs.at("height"), "20");
}

TEST(AttributeParser, HyphenatedNameKeepsTrailingWord) {
    // '-' is not a name character, so only the part after it forms a pair.
    auto attrs = parse_attributes(R"(data-role="main")");
    ASSERT_EQ(attrs.size(), 1u);
    EXPECT_EQ(attrs.at("role"), "main");
}

TEST(AttributeParser, NonAsciiLettersInName) {
    auto attrs = parse_attributes("na\xC3\xAFve=\"x\" \xC3\xA9t\xC3\xA9='y'");
    ASSERT_EQ(attrs.size(), 2u);
    EXPECT_EQ(attrs.at("na\xC3\xAFve"), "x");
    EXPECT_EQ(attrs.at("\xC3\xA9t\xC3\xA9"), "y");
}

TEST(AttributeParser, DuplicateNameLastWins) {
    auto attrs = parse_attributes(R"(x="1" x='2' x="3")");
    ASSERT_EQ(attrs.size(), 1u);
    EXPECT_EQ(attrs.at("x"), "3");
}
