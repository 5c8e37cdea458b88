#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath; // empty for a console-only logger
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Records the defaults every RegisterLogger call falls back to.
    static bool Initialize(plog::Severity default_level, bool append_logs);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    // Creates the parent directory of filepath. Failure is reported, not fatal.
    static void PrepareLogDirectory(const std::string& filepath);

    // Clamps a configured 0-6 level onto plog::Severity
    static plog::Severity SeverityFromLevel(long long level);

private:
    LogManager() = default;

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
