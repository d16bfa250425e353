#include <fluffy/core/error.h>

#include <sstream>
#include <utility>

namespace fluffy::core {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidRegistration:  return "InvalidRegistration";
        case ErrorKind::UnregisteredTag:      return "UnregisteredTag";
        case ErrorKind::NestedTagViolation:   return "NestedTagViolation";
        case ErrorKind::UnexpectedClosingTag: return "UnexpectedClosingTag";
        case ErrorKind::MismatchedClosingTag: return "MismatchedClosingTag";
        case ErrorKind::HandlerFailure:       return "HandlerFailure";
    }
    return "Unknown";
}

const char* callback_kind_name(CallbackKind kind) {
    switch (kind) {
        case CallbackKind::None:                   return "none";
        case CallbackKind::Handler:                return "handler";
        case CallbackKind::StreamingCallback:      return "streaming_callback";
        case CallbackKind::OnTagStart:             return "on_tag_start";
        case CallbackKind::OnTagComplete:          return "on_tag_complete";
        case CallbackKind::UntaggedContentHandler: return "untagged_content_handler";
    }
    return "unknown";
}

std::string make_preview(std::string_view content, std::size_t limit) {
    if (content.size() <= limit) {
        return std::string(content);
    }
    std::string preview(content.substr(0, limit));
    preview += "...";
    return preview;
}

std::string TagError::format() const {
    std::ostringstream oss;
    oss << error_kind_name(kind) << ": " << message;
    if (!tag_name.empty()) {
        oss << " [tag=" << tag_name << "]";
    }
    if (kind == ErrorKind::MismatchedClosingTag) {
        oss << " [expected=" << expected << " received=" << received << "]";
    }
    if (callback != CallbackKind::None) {
        oss << " [callback=" << callback_kind_name(callback) << "]";
    }
    if (!cause.empty()) {
        oss << " [cause=" << cause << "]";
    }
    if (!attributes.empty()) {
        oss << " [attributes:";
        for (const auto& [name, value] : attributes) {
            oss << " " << name << "=\"" << value << "\"";
        }
        oss << "]";
    }
    return oss.str();
}

TagProcessorError::TagProcessorError(TagError error)
    : std::runtime_error(error.message), error_(std::move(error)) {}

} // namespace fluffy::core
