#include <fluffy/markup/quote_tracker.h>
#include <gtest/gtest.h>
#include <string_view>

using fluffy::markup::QuoteTracker;

static void feed(QuoteTracker& tracker, std::string_view text) {
    for (char c : text) tracker.update(c);
}

TEST(QuoteTracker, StartsAtMarkupLevel) {
    QuoteTracker t;
    EXPECT_EQ(t.json_depth(), 0);
    EXPECT_FALSE(t.in_quotes());
    EXPECT_EQ(t.quote_char(), '\0');
    EXPECT_TRUE(t.at_markup_level());
}

TEST(QuoteTracker, BracesChangeDepth) {
    QuoteTracker t;
    feed(t, "{{");
    EXPECT_EQ(t.json_depth(), 2);
    feed(t, "}");
    EXPECT_EQ(t.json_depth(), 1);
    feed(t, "}");
    EXPECT_EQ(t.json_depth(), 0);
}

TEST(QuoteTracker, UnmatchedCloseBraceFloorsAtZero) {
    QuoteTracker t;
    feed(t, "}}}");
    EXPECT_EQ(t.json_depth(), 0);
    feed(t, "{");
    EXPECT_EQ(t.json_depth(), 1);
}

TEST(QuoteTracker, QuotesIgnoredAtDepthZero) {
    QuoteTracker t;
    feed(t, "\"it's\"");
    EXPECT_FALSE(t.in_quotes());
    EXPECT_TRUE(t.at_markup_level());
}

TEST(QuoteTracker, QuoteInsideBracesOpensString) {
    QuoteTracker t;
    feed(t, "{\"");
    EXPECT_TRUE(t.in_quotes());
    EXPECT_EQ(t.quote_char(), '"');
    EXPECT_EQ(t.json_depth(), 1);
}

TEST(QuoteTracker, OnlyMatchingQuoteCloses) {
    QuoteTracker t;
    feed(t, "{\"it's");
    EXPECT_TRUE(t.in_quotes());
    EXPECT_EQ(t.quote_char(), '"');
    feed(t, "\"");
    EXPECT_FALSE(t.in_quotes());
    EXPECT_EQ(t.quote_char(), '\0');
}

TEST(QuoteTracker, SingleQuotedString) {
    QuoteTracker t;
    feed(t, "{'say \"x\"");
    EXPECT_TRUE(t.in_quotes());
    EXPECT_EQ(t.quote_char(), '\'');
    feed(t, "'");
    EXPECT_FALSE(t.in_quotes());
}

TEST(QuoteTracker, BracesInsideQuotesDoNotCount) {
    QuoteTracker t;
    feed(t, "{\"}}{{\"");
    EXPECT_EQ(t.json_depth(), 1);
    feed(t, "}");
    EXPECT_EQ(t.json_depth(), 0);
}

TEST(QuoteTracker, NotAtMarkupLevelInsideJson) {
    QuoteTracker t;
    feed(t, "{\"x\": ");
    EXPECT_FALSE(t.at_markup_level());
    feed(t, "1}");
    EXPECT_TRUE(t.at_markup_level());
}

TEST(QuoteTracker, ResetClearsState) {
    QuoteTracker t;
    feed(t, "{{'abc");
    t.reset();
    EXPECT_EQ(t.json_depth(), 0);
    EXPECT_FALSE(t.in_quotes());
    EXPECT_EQ(t.quote_char(), '\0');
}
