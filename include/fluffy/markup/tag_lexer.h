#pragma once
#include <fluffy/core/error.h>
#include <fluffy/markup/quote_tracker.h>
#include <string>
#include <string_view>

namespace fluffy::markup {

using core::Attributes;

struct TagToken {
    enum Kind { Open, Close, SelfClosing };
    Kind kind = Open;
    std::string name;
    Attributes attributes;
};

// Classifies a complete, whitespace-stripped tag token (`<...>`).
//   "</name>"          -> Close
//   "<name attrs/>"    -> SelfClosing
//   "<name attrs>"     -> Open
// The name is the first whitespace-delimited word; the rest is handed to
// parse_attributes().
TagToken classify_tag_token(std::string_view raw);

enum class LexerMode {
    Outside,     // producing untagged content
    InTagToken,  // accumulating a raw tag token
    InBody,      // appending to the innermost open tag
};

const char* lexer_mode_name(LexerMode mode);

struct LexerEvent {
    enum Type {
        TagBegin,     // '<' at markup level; pending untagged content must be flushed
        TagChar,      // character absorbed into the current tag token
        TagComplete,  // `token` holds the finished, stripped tag token
        Content,      // `ch` is body or untagged content, depending on mode()
    };
    Type type = Content;
    char ch = '\0';
    std::string token;
};

// Character-at-a-time scanner. The lexer only knows whether a tag body is
// open through resume(); the owner calls it after every TagComplete once the
// token has been applied to the tag stack.
class TagLexer {
public:
    LexerEvent consume(char c);

    void resume(bool inside_body);
    void reset();

    LexerMode mode() const;
    const QuoteTracker& tracker() const { return tracker_; }
    const std::string& pending_token() const { return token_; }

private:
    QuoteTracker tracker_;
    std::string token_;
    bool in_token_ = false;
    bool inside_body_ = false;
};

} // namespace fluffy::markup
