#include <fluffy/processor/dispatcher.h>
#include <fluffy/core/config.h>
#include <cctype>
#include <exception>
#include <utility>

namespace fluffy::processor {

namespace {

// Runs `fn`; on failure stores the exception text in `cause`.
template <typename Fn>
bool run_guarded(Fn&& fn, std::string& cause) {
    try {
        fn();
        return true;
    } catch (const std::exception& e) {
        cause = e.what();
    } catch (...) {
        cause = "non-standard exception";
    }
    return false;
}

std::string_view trim(std::string_view s) {
    auto space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && space(s.front())) s.remove_prefix(1);
    while (!s.empty() && space(s.back())) s.remove_suffix(1);
    return s;
}

const char* failure_message(core::CallbackKind callback) {
    switch (callback) {
        case core::CallbackKind::Handler:                return "Error in tag handler";
        case core::CallbackKind::StreamingCallback:      return "Error in streaming callback";
        case core::CallbackKind::OnTagStart:             return "Error in on_tag_start callback";
        case core::CallbackKind::OnTagComplete:          return "Error in on_tag_complete callback";
        case core::CallbackKind::UntaggedContentHandler: return "Error in untagged content handler";
        case core::CallbackKind::None:                   break;
    }
    return "Error in callback";
}

} // namespace

Dispatcher::Dispatcher(core::DiagnosticEmitter& diagnostics)
    : diagnostics_(diagnostics) {}

void Dispatcher::set_error_handler(ErrorHandler handler) {
    error_handler_ = std::move(handler);
}

void Dispatcher::set_untagged_content_handler(UntaggedContentHandler handler) {
    untagged_handler_ = std::move(handler);
}

void Dispatcher::tag_started(const TagConfig& config, const std::string& name,
                             const Attributes& attributes) {
    if (!config.on_tag_start) return;
    std::string cause;
    if (!run_guarded([&] { config.on_tag_start(name, attributes); }, cause)) {
        report_failure(core::CallbackKind::OnTagStart, name, attributes, std::move(cause), {});
    }
}

void Dispatcher::stream_char(const TagConfig& config, const std::string& name,
                             const Attributes& attributes, char c) {
    if (!config.streaming_callback) return;
    std::string cause;
    if (!run_guarded([&] { config.streaming_callback(c, attributes); }, cause)) {
        core::TagError error;
        error.kind = core::ErrorKind::HandlerFailure;
        error.message = failure_message(core::CallbackKind::StreamingCallback);
        error.tag_name = name;
        error.attributes = attributes;
        error.callback = core::CallbackKind::StreamingCallback;
        error.cause = std::move(cause);
        error.character = c;
        report(std::move(error));
    }
}

void Dispatcher::tag_completed(const TagConfig& config, const std::string& name,
                               const Attributes& attributes, const std::string& content) {
    std::string cause;
    if (!run_guarded([&] { config.handler(attributes, content); }, cause)) {
        report_failure(core::CallbackKind::Handler, name, attributes, std::move(cause), content);
    }

    if (!config.on_tag_complete) return;
    cause.clear();
    if (!run_guarded([&] { config.on_tag_complete(name, attributes, content); }, cause)) {
        report_failure(core::CallbackKind::OnTagComplete, name, attributes, std::move(cause), content);
    }
}

void Dispatcher::untagged_content(std::string_view content) {
    std::string_view trimmed = trim(content);
    if (trimmed.empty() || !untagged_handler_) return;

    std::string text(trimmed);
    std::string cause;
    if (!run_guarded([&] { untagged_handler_(text); }, cause)) {
        report_failure(core::CallbackKind::UntaggedContentHandler, {}, {}, std::move(cause), text);
        return;
    }
    if (diagnostics_.enabled(core::Severity::Debug)) {
        diagnostics_.emit(core::Severity::Debug, "dispatch", "untagged",
                          "Processed untagged content (" + std::to_string(text.size()) + " chars)");
    }
}

void Dispatcher::report_failure(core::CallbackKind callback, const std::string& name,
                                const Attributes& attributes, std::string cause,
                                std::string_view content) {
    core::TagError error;
    error.kind = core::ErrorKind::HandlerFailure;
    error.message = failure_message(callback);
    error.tag_name = name;
    error.attributes = attributes;
    error.callback = callback;
    error.cause = std::move(cause);
    error.content_preview = core::make_preview(content, core::config::kContentPreviewLimit);
    report(std::move(error));
}

void Dispatcher::report(core::TagError error) {
    ++error_count_;
    if (error_handler_) {
        error_handler_(error);
        return;
    }
    const char* module = error.kind == core::ErrorKind::HandlerFailure ? "dispatch" : "stack";
    diagnostics_.emit(core::Severity::Error, module, core::error_kind_name(error.kind),
                      error.format());
}

} // namespace fluffy::processor
