#pragma once
#include <fluffy/core/diagnostics.h>
#include <fluffy/core/error.h>
#include <fluffy/processor/tag_registry.h>
#include <functional>
#include <string>
#include <string_view>

namespace fluffy::processor {

using UntaggedContentHandler = std::function<void(const std::string& content)>;
using ErrorHandler = std::function<void(const core::TagError& error)>;

// Runs every user callback and owns the error boundary.
//
// A callback that throws is converted into a HandlerFailure carrying the tag
// name, attributes and a content preview; the original exception never leaves
// the dispatcher. Every error then goes through report(): with an error
// handler installed it receives the error, otherwise the error is recorded as
// an Error diagnostic and scanning carries on.
class Dispatcher {
public:
    explicit Dispatcher(core::DiagnosticEmitter& diagnostics);

    void set_error_handler(ErrorHandler handler);

    void set_untagged_content_handler(UntaggedContentHandler handler);
    bool has_untagged_content_handler() const { return static_cast<bool>(untagged_handler_); }

    void tag_started(const TagConfig& config, const std::string& name,
                     const Attributes& attributes);
    void stream_char(const TagConfig& config, const std::string& name,
                     const Attributes& attributes, char c);
    // Runs the handler, then on_tag_complete; a failing handler does not
    // prevent on_tag_complete.
    void tag_completed(const TagConfig& config, const std::string& name,
                       const Attributes& attributes, const std::string& content);

    // Trims `content` and delivers it; nothing is delivered when the trimmed
    // text is empty or no handler is set.
    void untagged_content(std::string_view content);

    void report(core::TagError error);
    size_t error_count() const { return error_count_; }

private:
    core::DiagnosticEmitter& diagnostics_;
    ErrorHandler error_handler_;
    UntaggedContentHandler untagged_handler_;
    size_t error_count_ = 0;

    void report_failure(core::CallbackKind callback, const std::string& name,
                        const Attributes& attributes, std::string cause,
                        std::string_view content);
};

} // namespace fluffy::processor
