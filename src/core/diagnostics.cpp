#include <fluffy/core/diagnostics.h>

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <ostream>
#include <sstream>
#include <utility>

namespace fluffy::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug:   return "debug";
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (stream:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver stream_observer(std::ostream& out) {
    return [&out](const DiagnosticEvent& event) {
        out << "[fluffy] " << format_diagnostic(event) << "\n";
    };
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (!enabled(severity)) return;

    DiagnosticEvent event{std::chrono::steady_clock::now(), severity, module, stage,
                          message, correlation_id_};
    events_.push_back(event);
    for (const auto& observer : observers_) {
        observer(event);
    }
    trim_history();
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    correlation_id_ = id;
}

std::uint64_t DiagnosticEmitter::correlation_id() const {
    return correlation_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::set_history_limit(std::size_t limit) {
    history_limit_ = limit;
    trim_history();
}

std::size_t DiagnosticEmitter::history_limit() const {
    return history_limit_;
}

// Drops the oldest events beyond the limit.
void DiagnosticEmitter::trim_history() {
    if (history_limit_ == 0 || events_.size() <= history_limit_) return;
    auto excess = static_cast<std::ptrdiff_t>(events_.size() - history_limit_);
    events_.erase(events_.begin(), events_.begin() + excess);
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

template <typename Pred>
std::vector<DiagnosticEvent> DiagnosticEmitter::select(Pred pred) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result), pred);
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    return select([&module](const DiagnosticEvent& e) { return e.module == module; });
}

} // namespace fluffy::core
