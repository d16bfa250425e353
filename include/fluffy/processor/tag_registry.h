#pragma once
#include <fluffy/core/error.h>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace fluffy::processor {

using core::Attributes;

using TagHandler = std::function<void(const Attributes& attributes, const std::string& content)>;
using StreamingCallback = std::function<void(char c, const Attributes& attributes)>;
using TagStartCallback = std::function<void(const std::string& name, const Attributes& attributes)>;
using TagCompleteCallback = std::function<void(const std::string& name, const Attributes& attributes,
                                               const std::string& content)>;

struct HandlerOptions {
    // Stored for callers; nested tags are recognized regardless.
    bool allow_nested = true;
    bool allows_nested_of_same_type = false;
    // Stored for callers; the streaming callback fires whenever it is set.
    bool stream_content = true;
    StreamingCallback streaming_callback;
    TagStartCallback on_tag_start;
    TagCompleteCallback on_tag_complete;
};

// Immutable once registered. Open tags hold a shared reference, so a later
// re-registration only affects tags opened afterwards.
struct TagConfig {
    TagHandler handler;
    bool stream_content = true;
    bool process_nested = true;
    StreamingCallback streaming_callback;
    bool allows_nested_of_same_type = false;
    TagStartCallback on_tag_start;
    TagCompleteCallback on_tag_complete;
};

class TagRegistry {
public:
    // Throws core::TagProcessorError (InvalidRegistration) for an empty name
    // or an empty handler. Overwrites any previous registration.
    void add(const std::string& name, TagHandler handler, HandlerOptions options = {});

    std::shared_ptr<const TagConfig> find(const std::string& name) const;
    bool has(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const;
    bool empty() const;

private:
    std::unordered_map<std::string, std::shared_ptr<const TagConfig>> configs_;
};

} // namespace fluffy::processor
