#pragma once
#include <fluffy/core/config.h>
#include <fluffy/core/diagnostics.h>
#include <fluffy/markup/tag_lexer.h>
#include <fluffy/processor/dispatcher.h>
#include <fluffy/processor/tag_registry.h>
#include <fluffy/processor/tag_stack.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fluffy::processor {

struct ProcessorOptions {
    // Records Debug-level lifecycle events and echoes every event to std::clog.
    bool debug = false;
    ErrorHandler error_handler;
    bool auto_process_untagged = true;
    size_t auto_process_threshold = core::config::kDefaultAutoProcessThreshold;
    // Drop whitespace-only tokens that arrive between segments: outside any
    // tag token, body or JSON value, with the untagged buffer empty.
    // Elsewhere they are always fed.
    bool ignore_blank_tokens = true;
};

// Streaming processor for XML-like tags embedded in free text.
//
// Text is consumed one character at a time, so any split of the input into
// tokens yields the same tag callbacks. Only where untagged content is cut at
// the threshold can a dropped blank token shift the cut; turn
// ignore_blank_tokens off to make that exact too. Registered tags route their body to the
// tag's handler when they close; text outside any tag goes to the untagged
// content handler, delivered whenever the buffer grows past the threshold, at
// the next tag, or on flush().
//
// One instance serves one stream on one thread. Callbacks run inline and must
// not feed or reset the processor that invoked them.
class TagProcessor {
public:
    TagProcessor();
    explicit TagProcessor(ProcessorOptions options);

    TagProcessor(const TagProcessor&) = delete;
    TagProcessor& operator=(const TagProcessor&) = delete;

    // Throws core::TagProcessorError for an empty name or handler.
    TagProcessor& register_handler(const std::string& tag_name, TagHandler handler,
                                   HandlerOptions options = {});
    TagProcessor& set_untagged_content_handler(UntaggedContentHandler handler);
    TagProcessor& set_error_handler(ErrorHandler handler);
    // Throws core::TagProcessorError when `threshold` is 0.
    TagProcessor& set_auto_process_threshold(size_t threshold);
    size_t auto_process_threshold() const { return threshold_; }

    // Empty tokens are ignored. Whitespace-only tokens are ignored between
    // segments unless ignore_blank_tokens is off.
    TagProcessor& process_token(std::string_view token);
    TagProcessor& process_tokens(const std::vector<std::string>& tokens);
    TagProcessor& process_string(std::string_view content);

    // Drops all scanning state; registrations and handlers are kept.
    TagProcessor& reset();
    // Delivers buffered untagged content and warns about tags still open.
    // Open tags stay open and their handlers are not called.
    TagProcessor& flush();

    size_t stack_depth() const { return stack_.depth(); }
    bool is_inside_tag(const std::string& tag_name) const { return stack_.contains(tag_name); }
    std::vector<PendingTagInfo> pending_tag_info() const { return stack_.pending(); }

    markup::LexerMode mode() const { return lexer_.mode(); }
    const markup::QuoteTracker& tracker() const { return lexer_.tracker(); }
    const std::string& untagged_buffer() const { return untagged_; }
    const TagStack& stack() const { return stack_; }
    const TagRegistry& registry() const { return registry_; }

    core::DiagnosticEmitter& diagnostics() { return diagnostics_; }
    const core::DiagnosticEmitter& diagnostics() const { return diagnostics_; }

private:
    core::DiagnosticEmitter diagnostics_;
    TagRegistry registry_;
    Dispatcher dispatcher_;
    TagStack stack_;
    markup::TagLexer lexer_;
    std::string untagged_;
    bool auto_process_untagged_ = true;
    bool ignore_blank_tokens_ = true;
    size_t threshold_ = core::config::kDefaultAutoProcessThreshold;
    std::uint64_t stream_id_ = 1;

    bool between_segments() const;
    void process_char(char c);
    void apply_tag(const std::string& raw);
    void flush_untagged();
    void debug(const std::string& stage, const std::string& message);
};

} // namespace fluffy::processor
