#pragma once

namespace fluffy::markup {

// Tracks brace depth and quoting inside JSON-shaped content so that '<', '>'
// and quotes appearing there are not read as markup.
//
// Quotes only count while depth > 0; a string is closed by the same quote
// character that opened it. Braces only count outside quotes, and an
// unmatched '}' leaves the depth at 0.
class QuoteTracker {
public:
    void update(char c);
    void reset();

    int json_depth() const { return json_depth_; }
    bool in_quotes() const { return in_quotes_; }
    // '\0' when not inside a quoted string.
    char quote_char() const { return quote_char_; }

    // True when the tracker sits outside any JSON value, i.e. markup
    // delimiters take effect.
    bool at_markup_level() const { return json_depth_ == 0 && !in_quotes_; }

private:
    int json_depth_ = 0;
    bool in_quotes_ = false;
    char quote_char_ = '\0';
};

} // namespace fluffy::markup
