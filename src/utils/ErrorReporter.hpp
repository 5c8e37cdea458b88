#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logger setup, registry construction
    Configuration,  // TOML parsing, out-of-range values
    Decode,         // malformed codec input (hex, binary, base64, gzip)
    Operation,      // unknown operation, compressor failure
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // input rejected or a default was substituted
    Error,   // the requested operation produced no result
    Fatal    // the process should exit
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // shown on stderr
    std::string technical_details; // log file only
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe sink for failures raised by the CLI and configuration layer
 *
 * Every report is logged through plog and kept in a bounded queue so the caller can
 * print user-facing messages once the operation is done.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Decode, "Input is not valid hex",
 *                              "odd number of digits (7)");
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << report.user_message << '\n';
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                            const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                              const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Drain the queue
     * @return Reports in the order they were raised
     */
    static std::vector<ErrorReport> GetPendingErrors();

    /**
     * @brief Most recent queued report, or a default-constructed one when the queue is empty
     */
    static ErrorReport GetLastError();

    static void ClearErrors();

    static std::string CategoryToString(ErrorCategory category);
    static std::string GetTimestamp();

private:
    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
};

} // namespace utils
