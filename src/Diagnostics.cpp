/**
 * @file Diagnostics.cpp
 * @brief Diagnostic formatting and stock sinks
 */

#include "plaincfg/Diagnostics.hpp"

#include <ostream>
#include <sstream>

namespace plaincfg {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug: return "DEBUG";
        case Severity::Info: return "INFO";
        case Severity::Warning: return "WARN";
        case Severity::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::string format_diagnostic(const Diagnostic& d) {
    std::ostringstream oss;
    oss << "[" << severity_name(d.severity) << "] ";
    if (!d.source.empty()) {
        oss << d.source;
        if (d.line_number) oss << ":" << d.line_number;
        oss << ": ";
    } else if (d.line_number) {
        oss << "line " << d.line_number << ": ";
    }
    oss << d.message;
    return oss.str();
}

DiagnosticSink console_sink(std::ostream& os, Severity min_severity) {
    return [&os, min_severity](const Diagnostic& d) {
        if (static_cast<int>(d.severity) < static_cast<int>(min_severity)) return;
        os << format_diagnostic(d) << "\n";
    };
}

DiagnosticSink collecting_sink(std::vector<Diagnostic>& out) {
    return [&out](const Diagnostic& d) { out.push_back(d); };
}

void report(const DiagnosticSink& sink, Diagnostic d) {
    if (sink) sink(d);
}

} // namespace plaincfg
