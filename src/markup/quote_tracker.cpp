#include <fluffy/markup/quote_tracker.h>

namespace fluffy::markup {

void QuoteTracker::update(char c) {
    if ((c == '"' || c == '\'') && json_depth_ > 0) {
        if (!in_quotes_) {
            in_quotes_ = true;
            quote_char_ = c;
        } else if (c == quote_char_) {
            in_quotes_ = false;
            quote_char_ = '\0';
        }
    }

    if (in_quotes_) return;

    if (c == '{') {
        ++json_depth_;
    } else if (c == '}' && json_depth_ > 0) {
        --json_depth_;
    }
}

void QuoteTracker::reset() {
    json_depth_ = 0;
    in_quotes_ = false;
    quote_char_ = '\0';
}

} // namespace fluffy::markup
