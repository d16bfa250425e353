#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace fluffy::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Observer that writes one formatted line per event to `out`.
// The stream must outlive every emitter the observer is attached to.
DiagnosticObserver stream_observer(std::ostream& out);

// Collects structured events and forwards them to observers.
// Events below the minimum severity are dropped before observers see them.
// With a history limit set, only the most recent events are retained.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;
    bool enabled(Severity severity) const { return severity >= min_severity_; }

    // 0 keeps every event.
    void set_history_limit(std::size_t limit);
    std::size_t history_limit() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    std::size_t size() const { return events_.size(); }

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
    std::size_t history_limit_ = 0;

    void trim_history();
    template <typename Pred>
    std::vector<DiagnosticEvent> select(Pred pred) const;
};

} // namespace fluffy::core
