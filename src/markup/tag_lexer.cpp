#include <fluffy/markup/tag_lexer.h>
#include <fluffy/markup/attribute_parser.h>
#include <cctype>
#include <utility>

namespace fluffy::markup {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Strips `head` leading and `tail` trailing characters, clamped to the input.
std::string_view inner(std::string_view s, std::size_t head, std::size_t tail) {
    if (s.size() <= head + tail) return {};
    return s.substr(head, s.size() - head - tail);
}

void split_name_and_attributes(std::string_view body, TagToken& token) {
    body = trim(body);
    std::size_t i = 0;
    while (i < body.size() && !is_space(body[i])) ++i;
    token.name = std::string(body.substr(0, i));
    token.attributes = parse_attributes(trim(body.substr(i)));
}

} // namespace

TagToken classify_tag_token(std::string_view raw) {
    TagToken token;
    if (starts_with(raw, "</")) {
        token.kind = TagToken::Close;
        token.name = std::string(trim(inner(raw, 2, 1)));
    } else if (ends_with(raw, "/>")) {
        token.kind = TagToken::SelfClosing;
        split_name_and_attributes(inner(raw, 1, 2), token);
    } else {
        token.kind = TagToken::Open;
        split_name_and_attributes(inner(raw, 1, 1), token);
    }
    return token;
}

const char* lexer_mode_name(LexerMode mode) {
    switch (mode) {
        case LexerMode::Outside:    return "outside";
        case LexerMode::InTagToken: return "in-tag-token";
        case LexerMode::InBody:     return "in-body";
    }
    return "unknown";
}

LexerEvent TagLexer::consume(char c) {
    tracker_.update(c);

    LexerEvent event;
    event.ch = c;

    // A markup-level '<' always starts a new token, even inside a tag body or
    // over a token that never saw its '>'.
    if (c == '<' && tracker_.at_markup_level()) {
        in_token_ = true;
        token_.assign(1, c);
        event.type = LexerEvent::TagBegin;
        return event;
    }

    if (in_token_) {
        token_.push_back(c);
        if (c == '>' && tracker_.at_markup_level()) {
            in_token_ = false;
            event.type = LexerEvent::TagComplete;
            event.token = std::string(trim(token_));
            token_.clear();
            return event;
        }
        event.type = LexerEvent::TagChar;
        return event;
    }

    event.type = LexerEvent::Content;
    return event;
}

void TagLexer::resume(bool inside_body) {
    inside_body_ = inside_body;
}

void TagLexer::reset() {
    tracker_.reset();
    token_.clear();
    in_token_ = false;
    inside_body_ = false;
}

LexerMode TagLexer::mode() const {
    if (in_token_) return LexerMode::InTagToken;
    return inside_body_ ? LexerMode::InBody : LexerMode::Outside;
}

} // namespace fluffy::markup
