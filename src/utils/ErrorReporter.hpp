#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logging, lock file, startup
    Configuration,  // config.toml
    Network,        // HTTP transport failures
    Permission,     // Storage grants, installer consent
    Install,        // Platform installer failures
    Storage,        // State file read/write
    Upload,         // Batch upload failures
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // Degraded, the command continues
    Error,   // The command failed
    Fatal    // The process exits
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Printed on stderr before exit
    std::string technical_details; // Log only, and appended in parentheses on stderr
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Process-wide queue of problems the user should hear about
 *
 * Host layers report here instead of printing. Every report is logged through
 * plog immediately; the CLI drains the queue to stderr once the command ends.
 * The queue keeps the newest MAX_QUEUE_SIZE reports.
 */
class ErrorReporter
{
public:
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

    // Returns the queued reports oldest first and empties the queue
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
