#include <fluffy/processor/tag_stack.h>
#include <algorithm>
#include <utility>

namespace fluffy::processor {

TagStack::TagStack(const TagRegistry& registry, Dispatcher& dispatcher,
                   core::DiagnosticEmitter& diagnostics)
    : registry_(registry), dispatcher_(dispatcher), diagnostics_(diagnostics) {}

std::shared_ptr<const TagConfig> TagStack::resolve(const std::string& name) const {
    auto config = registry_.find(name);
    if (!config) {
        diagnostics_.emit(core::Severity::Warning, "stack", core::error_kind_name(core::ErrorKind::UnregisteredTag),
                          "Unregistered tag type: " + name);
    }
    return config;
}

void TagStack::debug(const std::string& stage, const std::string& message) const {
    if (diagnostics_.enabled(core::Severity::Debug)) {
        diagnostics_.emit(core::Severity::Debug, "stack", stage, message);
    }
}

// ============================================================================
// Tag tokens
// ============================================================================

void TagStack::open(const std::string& name, Attributes attributes) {
    auto config = resolve(name);
    if (!config) return;

    if (!config->allows_nested_of_same_type && contains(name)) {
        core::TagError error;
        error.kind = core::ErrorKind::NestedTagViolation;
        error.message = "Tag \"" + name + "\" cannot be nested within itself";
        error.tag_name = name;
        error.attributes = std::move(attributes);
        dispatcher_.report(std::move(error));
        return;
    }

    TagContext context;
    context.name = name;
    context.attributes = std::move(attributes);
    if (!contexts_.empty()) {
        context.parent_index = contexts_.size() - 1;
    }
    context.start_time = std::chrono::system_clock::now();
    context.config = std::move(config);

    // A failing on_tag_start is reported; the tag still opens.
    dispatcher_.tag_started(*context.config, context.name, context.attributes);
    contexts_.push_back(std::move(context));
    debug("open", "Started tag: " + name);
}

void TagStack::self_close(const std::string& name, const Attributes& attributes) {
    auto config = resolve(name);
    if (!config) return;

    debug("self-close", "Processing self-closing tag: " + name);
    dispatcher_.tag_started(*config, name, attributes);
    dispatcher_.tag_completed(*config, name, attributes, std::string());
}

void TagStack::close(const std::string& name) {
    if (contexts_.empty()) {
        core::TagError error;
        error.kind = core::ErrorKind::UnexpectedClosingTag;
        error.message = "Found closing tag \"" + name + "\" but no opening tags in stack";
        error.tag_name = name;
        dispatcher_.report(std::move(error));
        return;
    }

    if (contexts_.back().name != name) {
        core::TagError error;
        error.kind = core::ErrorKind::MismatchedClosingTag;
        error.message = "Mismatched closing tag: expected \"" + contexts_.back().name +
                        "\", got \"" + name + "\"";
        error.tag_name = name;
        error.expected = contexts_.back().name;
        error.received = name;
        dispatcher_.report(std::move(error));
        return;
    }

    TagContext context = std::move(contexts_.back());
    contexts_.pop_back();
    debug("close", "Completed tag: " + name);
    dispatcher_.tag_completed(*context.config, context.name, context.attributes, context.content);
}

// ============================================================================
// Content
// ============================================================================

void TagStack::append(char c) {
    if (contexts_.empty()) return;
    TagContext& context = contexts_.back();
    context.content.push_back(c);
    dispatcher_.stream_char(*context.config, context.name, context.attributes, c);
}

// ============================================================================
// Introspection
// ============================================================================

bool TagStack::contains(const std::string& name) const {
    return std::any_of(contexts_.begin(), contexts_.end(),
        [&](const TagContext& context) { return context.name == name; });
}

const TagContext* TagStack::top() const {
    if (contexts_.empty()) return nullptr;
    return &contexts_.back();
}

const TagContext* TagStack::parent_of(const TagContext& context) const {
    if (!context.parent_index || *context.parent_index >= contexts_.size()) return nullptr;
    return &contexts_[*context.parent_index];
}

std::vector<PendingTagInfo> TagStack::pending() const {
    std::vector<PendingTagInfo> result;
    result.reserve(contexts_.size());
    for (const auto& context : contexts_) {
        result.push_back({context.name, context.attributes, context.start_time, context.content.size()});
    }
    return result;
}

std::vector<std::string> TagStack::open_names() const {
    std::vector<std::string> result;
    result.reserve(contexts_.size());
    for (const auto& context : contexts_) {
        result.push_back(context.name);
    }
    return result;
}

void TagStack::clear() {
    contexts_.clear();
}

} // namespace fluffy::processor
