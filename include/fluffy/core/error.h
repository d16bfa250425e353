#pragma once
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fluffy::core {

using Attributes = std::map<std::string, std::string>;

enum class ErrorKind {
    InvalidRegistration,
    UnregisteredTag,
    NestedTagViolation,
    UnexpectedClosingTag,
    MismatchedClosingTag,
    HandlerFailure,
};

const char* error_kind_name(ErrorKind kind);

// Which user callback raised a HandlerFailure.
enum class CallbackKind {
    None,
    Handler,
    StreamingCallback,
    OnTagStart,
    OnTagComplete,
    UntaggedContentHandler,
};

const char* callback_kind_name(CallbackKind kind);

// Uniform error value handed to the error boundary. Only the fields that
// apply to `kind` are populated.
struct TagError {
    ErrorKind kind = ErrorKind::HandlerFailure;
    std::string message;
    std::string tag_name;
    Attributes attributes;

    // MismatchedClosingTag
    std::string expected;
    std::string received;

    // HandlerFailure
    CallbackKind callback = CallbackKind::None;
    std::string cause;
    std::string content_preview;
    std::optional<char> character;

    std::string format() const;
};

// Cuts `content` to `limit` characters, appending "..." when it was longer.
std::string make_preview(std::string_view content, std::size_t limit);

// Thrown for construction-time misuse (bad registration, bad threshold).
// Scanning-time errors never surface as exceptions.
class TagProcessorError : public std::runtime_error {
public:
    explicit TagProcessorError(TagError error);

    const TagError& error() const noexcept { return error_; }
    ErrorKind kind() const noexcept { return error_.kind; }

private:
    TagError error_;
};

} // namespace fluffy::core
