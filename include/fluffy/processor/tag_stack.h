#pragma once
#include <fluffy/core/diagnostics.h>
#include <fluffy/processor/dispatcher.h>
#include <fluffy/processor/tag_registry.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fluffy::processor {

// Bookkeeping for one open tag.
struct TagContext {
    std::string name;
    Attributes attributes;
    std::string content;
    // Index of the enclosing context in the same stack; empty for the outermost.
    std::optional<size_t> parent_index;
    std::chrono::system_clock::time_point start_time;
    // Resolved when the tag opened, never looked up again.
    std::shared_ptr<const TagConfig> config;
};

struct PendingTagInfo {
    std::string name;
    Attributes attributes;
    std::chrono::system_clock::time_point start_time;
    size_t content_length = 0;
};

// Owns the open tags, innermost last, and applies tag tokens to them.
//
// Structural problems (same-type nesting, stray or mismatched closing tags)
// are reported through the dispatcher and leave the stack untouched.
// Unregistered tags only produce a warning diagnostic.
//
// Content of a nested tag belongs to that tag alone: the enclosing tag
// receives neither the child's markup nor its body.
class TagStack {
public:
    TagStack(const TagRegistry& registry, Dispatcher& dispatcher,
             core::DiagnosticEmitter& diagnostics);

    void open(const std::string& name, Attributes attributes);
    void self_close(const std::string& name, const Attributes& attributes);
    void close(const std::string& name);

    // Appends to the innermost context and fires its streaming callback.
    // No-op on an empty stack.
    void append(char c);

    bool empty() const { return contexts_.empty(); }
    size_t depth() const { return contexts_.size(); }
    bool contains(const std::string& name) const;

    const TagContext* top() const;
    const TagContext* parent_of(const TagContext& context) const;
    const TagContext& at(size_t index) const { return contexts_.at(index); }

    std::vector<PendingTagInfo> pending() const;
    std::vector<std::string> open_names() const;

    void clear();

private:
    const TagRegistry& registry_;
    Dispatcher& dispatcher_;
    core::DiagnosticEmitter& diagnostics_;
    std::vector<TagContext> contexts_;

    std::shared_ptr<const TagConfig> resolve(const std::string& name) const;
    void debug(const std::string& stage, const std::string& message) const;
};

} // namespace fluffy::processor
