#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(plog::Severity default_level, bool append_logs)
{
    if (s_initialized)
        return true;

    s_default_level = default_level;
    s_append_logs = append_logs;
    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    const plog::Severity level = config.level_override.value_or(s_default_level);

    // plog loggers live for the whole process; a second registration only updates the level
    if (auto existing = plog::get<InstanceId>())
    {
        existing->setMaxSeverity(level);
        PLOG_DEBUG << "Logger '" << config.name << "' already registered, level set to " << plog::severityToString(level);
        return true;
    }

    try
    {
        if (config.filepath.empty())
        {
            plog::init<InstanceId>(level);
        }
        else
        {
            PrepareLogDirectory(config.filepath);

            const bool append = config.append_override.value_or(s_append_logs);
            if (!append)
            {
                std::ofstream(config.filepath, std::ios::trunc).close();
            }

            auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
            plog::init<InstanceId>(level, file_appender.get());
            s_appenders.push_back(std::move(file_appender));
        }

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

// Appenders stay owned until exit because the registered plog loggers keep pointers to them.
void LogManager::Shutdown()
{
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    s_initialized = false;
}

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const std::filesystem::path parent = std::filesystem::path(filepath).parent_path();
    if (parent.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

plog::Severity LogManager::SeverityFromLevel(long long level)
{
    if (level < 0)
        return plog::none;
    if (level > 6)
        return plog::verbose;
    return static_cast<plog::Severity>(level);
}

} // namespace utils
