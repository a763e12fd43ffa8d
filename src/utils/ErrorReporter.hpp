#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logger setup, startup
    Configuration,  // TOML parsing, invalid thresholds or weights
    Persistence,    // Registry snapshot read/write
    Input,          // Unreadable or malformed documents passed on the command line
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // Degraded, falls back to defaults
    Error,   // The current operation failed
    Fatal    // The process should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Paths, library messages
    std::string timestamp;

    bool isFatal() const { return severity == ErrorSeverity::Fatal; }
};

/**
 * @brief Process-wide queue of problems meant for the user.
 *
 * Library code reports here instead of printing; the command-line front end drains the
 * queue before exiting. Every report is also written to the default plog instance. At
 * most kMaxQueued reports are kept, oldest dropped first.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Persistence, "Failed to save registry",
 *                              "Path: teams.json | Error: permission denied");
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << ErrorReporter::Format(report) << '\n';
 */
class ErrorReporter
{
public:
    static constexpr std::size_t kMaxQueued = 100;

    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /// Drain the queue, oldest first
    static std::vector<ErrorReport> GetPendingErrors();

    /// Most recent report still queued; a default report when the queue is empty
    static ErrorReport GetLastError();

    static void ClearErrors();

    /// "[Severity] Category: message (details)"
    static std::string Format(const ErrorReport& report);

    static std::string CategoryToString(ErrorCategory category);

    static std::string SeverityToString(ErrorSeverity severity);

    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
};

} // namespace utils
