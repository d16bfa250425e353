#include <fluffy/markup/attribute_parser.h>
#include <cctype>
#include <string>

namespace fluffy::markup {

namespace {

// Bytes of multi-byte UTF-8 sequences count as name characters, so
// non-ASCII letters stay part of the name.
bool is_name_char(char c) {
    auto byte = static_cast<unsigned char>(c);
    return byte >= 0x80 || std::isalnum(byte) != 0 || c == '_';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_quote(char c) {
    return c == '"' || c == '\'';
}

// Tries to read one pair starting exactly at `pos`. On success stores the
// pair and returns the position just past the closing quote.
std::size_t match_pair(std::string_view text, std::size_t pos, Attributes& out) {
    std::size_t i = pos;
    while (i < text.size() && is_name_char(text[i])) ++i;
    if (i == pos) return std::string_view::npos;
    std::string_view name = text.substr(pos, i - pos);

    while (i < text.size() && is_space(text[i])) ++i;
    if (i >= text.size() || text[i] != '=') return std::string_view::npos;
    ++i;
    while (i < text.size() && is_space(text[i])) ++i;
    if (i >= text.size() || !is_quote(text[i])) return std::string_view::npos;

    char quote = text[i++];
    std::size_t value_start = i;
    while (i < text.size() && text[i] != quote) {
        if (text[i] == '\n') return std::string_view::npos;
        ++i;
    }
    if (i >= text.size()) return std::string_view::npos;

    out[std::string(name)] = std::string(text.substr(value_start, i - value_start));
    return i + 1;
}

} // namespace

Attributes parse_attributes(std::string_view text) {
    Attributes attributes;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t next = match_pair(text, pos, attributes);
        pos = (next == std::string_view::npos) ? pos + 1 : next;
    }
    return attributes;
}

} // namespace fluffy::markup
