/**
 * @file Diagnostic.hpp
 * @brief Structured warnings emitted while importing icon collections.
 */

#pragma once
#include <functional>
#include <string>

namespace iconforge::domain {

/**
 * @enum Severity
 * @brief How serious a reported problem is.
 */
enum class Severity {
    Info,
    Warning,
    Error
};

/**
 * @struct Diagnostic
 * @brief One reported event: a rejected icon, an unreadable directory, a skipped file.
 */
struct Diagnostic {
    Severity severity = Severity::Warning;
    std::string subject; ///< Icon name, file or directory the event is about.
    std::string reason;  ///< Human-readable cause.
};

/**
 * @brief Receiver for diagnostics. Called from worker threads only through a synchronized wrapper.
 */
using DiagnosticSink = std::function<void(const Diagnostic&)>;

inline const char* ToString(Severity severity) {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
    }
    return "unknown";
}

} // namespace iconforge::domain
