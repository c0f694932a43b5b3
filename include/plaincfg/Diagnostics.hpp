/**
 * @file Diagnostics.hpp
 * @brief Injected reporting of recoverable problems
 *
 * Reads and writes never print on their own. Callers pass a
 * DiagnosticSink in ReadOptions / WriteOptions; an empty sink discards.
 */

#ifndef PLAINCFG_DIAGNOSTICS_HPP
#define PLAINCFG_DIAGNOSTICS_HPP

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace plaincfg {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error
};

/**
 * @brief One reported condition
 */
struct Diagnostic {
    Severity severity = Severity::Info;
    std::string message;

    /// File path or other source name, may be empty
    std::string source;

    /// 1-based line number, 0 when not tied to a line
    std::size_t line_number = 0;

    /// Offending line as read (terminator stripped), may be empty
    std::string raw_line;
};

using DiagnosticSink = std::function<void(const Diagnostic&)>;

/**
 * @brief Short tag for a severity: "DEBUG", "INFO", "WARN", "ERROR"
 */
const char* severity_name(Severity severity);

/**
 * @brief Format as `[WARN] source:line: message`
 */
std::string format_diagnostic(const Diagnostic& d);

/**
 * @brief Sink writing formatted diagnostics at or above `min_severity` to `os`
 *
 * The stream must outlive the sink.
 */
DiagnosticSink console_sink(std::ostream& os, Severity min_severity = Severity::Warning);

/**
 * @brief Sink appending every diagnostic to `out`
 *
 * The vector must outlive the sink.
 */
DiagnosticSink collecting_sink(std::vector<Diagnostic>& out);

/**
 * @brief Deliver `d` to `sink` if one is set
 */
void report(const DiagnosticSink& sink, Diagnostic d);

} // namespace plaincfg

#endif // PLAINCFG_DIAGNOSTICS_HPP
