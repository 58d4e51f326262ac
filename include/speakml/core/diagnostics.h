#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace speakml::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::string source;                 // input name, e.g. a file path or "<stdin>"
    std::optional<std::size_t> offset;  // byte offset into the source
};

// Formats as "[severity] module/stage source@offset: message".
// Empty parts are left out.
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects diagnostics from the parser and the normalizer. Events below the
// minimum severity are dropped before observers see them.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              std::optional<std::size_t> offset = std::nullopt);

    // Source name stamped on every subsequent event.
    void set_source(const std::string& source);
    const std::string& source() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;
    bool has_errors() const;

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::string source_;
    Severity min_severity_ = Severity::Info;
};

} // namespace speakml::core
