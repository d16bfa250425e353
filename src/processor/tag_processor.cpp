#include <fluffy/processor/tag_processor.h>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace fluffy::processor {

namespace {

bool is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
        [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

void reject_threshold(size_t threshold) {
    if (threshold >= 1) return;
    core::TagError error;
    error.kind = core::ErrorKind::InvalidRegistration;
    error.message = "Threshold must be a positive integer";
    throw core::TagProcessorError(std::move(error));
}

} // namespace

TagProcessor::TagProcessor() : TagProcessor(ProcessorOptions{}) {}

TagProcessor::TagProcessor(ProcessorOptions options)
    : dispatcher_(diagnostics_),
      stack_(registry_, dispatcher_, diagnostics_),
      auto_process_untagged_(options.auto_process_untagged),
      ignore_blank_tokens_(options.ignore_blank_tokens),
      threshold_(options.auto_process_threshold) {
    reject_threshold(threshold_);

    diagnostics_.set_history_limit(core::config::kDiagnosticHistoryLimit);
    diagnostics_.set_correlation_id(stream_id_);
    if (options.debug) {
        diagnostics_.set_min_severity(core::Severity::Debug);
        diagnostics_.add_observer(core::stream_observer(std::clog));
    } else {
        diagnostics_.set_min_severity(core::Severity::Warning);
    }

    dispatcher_.set_error_handler(std::move(options.error_handler));
}

// ============================================================================
// Configuration
// ============================================================================

TagProcessor& TagProcessor::register_handler(const std::string& tag_name, TagHandler handler,
                                             HandlerOptions options) {
    registry_.add(tag_name, std::move(handler), std::move(options));
    debug("register", "Registered handler for tag: " + tag_name);
    return *this;
}

TagProcessor& TagProcessor::set_untagged_content_handler(UntaggedContentHandler handler) {
    dispatcher_.set_untagged_content_handler(std::move(handler));
    debug("register", "Set untagged content handler");
    return *this;
}

TagProcessor& TagProcessor::set_error_handler(ErrorHandler handler) {
    dispatcher_.set_error_handler(std::move(handler));
    return *this;
}

TagProcessor& TagProcessor::set_auto_process_threshold(size_t threshold) {
    reject_threshold(threshold);
    threshold_ = threshold;
    return *this;
}

// ============================================================================
// Feeding
// ============================================================================

TagProcessor& TagProcessor::process_token(std::string_view token) {
    if (token.empty() || (ignore_blank_tokens_ && between_segments() && is_blank(token))) {
        return *this;
    }
    for (char c : token) {
        process_char(c);
    }
    return *this;
}

TagProcessor& TagProcessor::process_tokens(const std::vector<std::string>& tokens) {
    for (const auto& token : tokens) {
        process_token(token);
    }
    return *this;
}

TagProcessor& TagProcessor::process_string(std::string_view content) {
    return process_token(content);
}

bool TagProcessor::between_segments() const {
    return lexer_.mode() == markup::LexerMode::Outside && untagged_.empty() &&
           lexer_.tracker().at_markup_level();
}

void TagProcessor::process_char(char c) {
    auto event = lexer_.consume(c);
    switch (event.type) {
        case markup::LexerEvent::TagBegin:
            flush_untagged();
            break;
        case markup::LexerEvent::TagChar:
            break;
        case markup::LexerEvent::TagComplete:
            apply_tag(event.token);
            lexer_.resume(!stack_.empty());
            break;
        case markup::LexerEvent::Content:
            if (lexer_.mode() == markup::LexerMode::InBody) {
                stack_.append(c);
            } else {
                untagged_.push_back(c);
            }
            break;
    }

    if (auto_process_untagged_ && untagged_.size() > threshold_) {
        flush_untagged();
    }
}

void TagProcessor::apply_tag(const std::string& raw) {
    auto token = markup::classify_tag_token(raw);
    switch (token.kind) {
        case markup::TagToken::Close:
            stack_.close(token.name);
            break;
        case markup::TagToken::SelfClosing:
            stack_.self_close(token.name, token.attributes);
            break;
        case markup::TagToken::Open:
            stack_.open(token.name, std::move(token.attributes));
            break;
    }
}

void TagProcessor::flush_untagged() {
    if (untagged_.empty()) return;
    std::string content;
    content.swap(untagged_);
    dispatcher_.untagged_content(content);
}

// ============================================================================
// Lifecycle
// ============================================================================

TagProcessor& TagProcessor::reset() {
    stack_.clear();
    lexer_.reset();
    untagged_.clear();
    diagnostics_.set_correlation_id(++stream_id_);
    debug("reset", "Processor reset");
    return *this;
}

TagProcessor& TagProcessor::flush() {
    flush_untagged();

    if (!stack_.empty()) {
        std::string names;
        for (const auto& name : stack_.open_names()) {
            if (!names.empty()) names += ", ";
            names += name;
        }
        diagnostics_.emit(core::Severity::Warning, "processor", "flush",
                          "Unclosed tags remain in stack: " + names);
    }
    return *this;
}

void TagProcessor::debug(const std::string& stage, const std::string& message) {
    if (diagnostics_.enabled(core::Severity::Debug)) {
        diagnostics_.emit(core::Severity::Debug, "processor", stage, message);
    }
}

} // namespace fluffy::processor
