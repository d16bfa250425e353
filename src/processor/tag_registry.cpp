#include <fluffy/processor/tag_registry.h>
#include <algorithm>
#include <utility>

namespace fluffy::processor {

namespace {

[[noreturn]] void reject(const std::string& name, const std::string& message) {
    core::TagError error;
    error.kind = core::ErrorKind::InvalidRegistration;
    error.message = message;
    error.tag_name = name;
    throw core::TagProcessorError(std::move(error));
}

} // namespace

void TagRegistry::add(const std::string& name, TagHandler handler, HandlerOptions options) {
    if (name.empty()) {
        reject(name, "Tag name must be a non-empty string");
    }
    if (!handler) {
        reject(name, "Handler must be callable");
    }

    auto config = std::make_shared<TagConfig>();
    config->handler = std::move(handler);
    config->stream_content = options.stream_content;
    config->process_nested = options.allow_nested;
    config->streaming_callback = std::move(options.streaming_callback);
    config->allows_nested_of_same_type = options.allows_nested_of_same_type;
    config->on_tag_start = std::move(options.on_tag_start);
    config->on_tag_complete = std::move(options.on_tag_complete);

    configs_[name] = std::move(config);
}

std::shared_ptr<const TagConfig> TagRegistry::find(const std::string& name) const {
    auto it = configs_.find(name);
    if (it != configs_.end()) {
        return it->second;
    }
    return nullptr;
}

bool TagRegistry::has(const std::string& name) const {
    return configs_.find(name) != configs_.end();
}

std::vector<std::string> TagRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(configs_.size());
    for (const auto& [name, config] : configs_) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

size_t TagRegistry::size() const {
    return configs_.size();
}

bool TagRegistry::empty() const {
    return configs_.empty();
}

} // namespace fluffy::processor
