#include "Application.hpp"
#include "config/AppSettings.hpp"
#include "config/ConfigManager.hpp"
#include "ops/OperationRegistry.hpp"
#include "unicode/Graphemes.hpp"
#include "utils/Diagnostics.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <iomanip>
#include <iostream>
#include <sstream>

#ifndef STRINGITY_VERSION_STRING
#define STRINGITY_VERSION_STRING "0.0.0-dev"
#endif

Application::Application(std::vector<std::string> args, std::istream& in, std::ostream& out, std::ostream& err)
    : args_(std::move(args))
    , in_(in)
    , out_(out)
    , err_(err)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        reportPendingErrors();
        printUsage(err_);
        return static_cast<int>(ExitCode::UsageError);
    }

    if (help_requested_)
    {
        printUsage(out_);
        return static_cast<int>(ExitCode::Success);
    }
    if (version_requested_)
    {
        out_ << "stringity " << STRINGITY_VERSION_STRING << '\n';
        return static_cast<int>(ExitCode::Success);
    }

    const bool config_loaded = initializeConfig();
    if (initializeLogging() && !config_loaded)
        PLOG_WARNING << "Using default settings: " << config_->lastError();
    applyDiagnostics();
    setupRegistry();

    const int code = list_requested_ ? listOperations() : runOperation();
    reportPendingErrors();
    return code;
}

bool Application::parseCommandLineArgs()
{
    std::vector<std::string> positional;
    for (size_t i = 0; i < args_.size(); ++i)
    {
        const std::string& arg = args_[i];
        if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= args_.size())
            {
                utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration,
                                                  "--config requires a file path");
                return false;
            }
            config_path_ = args_[++i];
        }
        else if (arg == "--nfc")
            normalize_nfc_ = true;
        else if (arg == "--list" || arg == "-l")
            list_requested_ = true;
        else if (arg == "--help" || arg == "-h")
            help_requested_ = true;
        else if (arg == "--version")
            version_requested_ = true;
        else if (arg == "--")
        {
            positional.insert(positional.end(), args_.begin() + static_cast<std::ptrdiff_t>(i + 1), args_.end());
            break;
        }
        else
            positional.push_back(arg);
    }

    if (help_requested_ || version_requested_ || list_requested_)
        return true;

    if (positional.empty() || positional.size() > 2)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Operation,
                                          positional.empty() ? "No operation given" : "Too many arguments");
        return false;
    }

    operation_ = positional[0];
    if (positional.size() == 2)
        text_ = positional[1];
    return true;
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<config::ConfigManager>(config_path_);
    settings_ = std::make_unique<config::AppSettings>();
    if (!settings_->registerWith(*config_))
        return false;
    return config_->load();
}

bool Application::initializeLogging()
{
    const auto& logging = settings_->logging;
    if (!utils::LogManager::Initialize(utils::LogManager::SeverityFromLevel(logging.level), logging.append))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    const bool ok = utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                           .filepath = logging.file,
                                                           .append_override = std::nullopt,
                                                           .level_override = std::nullopt,
                                                           .max_file_size = 10 * 1024 * 1024,
                                                           .backup_count = 3,
                                                           .add_console_appender = logging.console });
    if (ok)
    {
        PLOG_INFO << "stringity " << STRINGITY_VERSION_STRING << " started, config: " << config_path_
                  << (config_->fileFound() ? "" : " (not found, defaults)");
    }
    return ok;
}

void Application::applyDiagnostics()
{
    utils::Diagnostics::SetVerbose(settings_->diagnostics.verbose);
    utils::Diagnostics::SetMaxPreview(settings_->diagnostics.max_preview);
}

void Application::setupRegistry()
{
    ops::RegistryOptions options;
    options.compression.level = settings_->compression.level;
    options.shuffle_seed = settings_->transform.shuffle_seed;
    registry_ = std::make_unique<ops::OperationRegistry>(options);
}

int Application::listOperations()
{
    for (const auto& def : registry_->operations())
    {
        out_ << std::left << std::setw(28) << def.name << std::setw(11)
             << ops::OperationRegistry::CategoryToString(def.category) << def.summary << '\n';
    }
    return static_cast<int>(ExitCode::Success);
}

int Application::runOperation()
{
    if (!registry_->findOperation(operation_))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Operation,
                                          "Unknown operation '" + operation_ + "'. Run 'stringity --list' to see all operations.");
        return static_cast<int>(ExitCode::UsageError);
    }

    std::string input = text_ ? *text_ : readInput();
    if (normalize_nfc_)
        input = unicode::normalizeNfc(input);

    if (utils::Diagnostics::IsVerbose())
        PLOG_DEBUG << operation_ << " <- " << utils::Diagnostics::Preview(input);

    auto result = registry_->run(operation_, input);
    if (!result || !*result)
    {
        const auto kind = result ? result->error_kind : codec::CodecError::None;
        const auto category = codec::isMalformedInput(kind) ? utils::ErrorCategory::Decode
                                                            : utils::ErrorCategory::Operation;
        utils::ErrorReporter::ReportError(category,
                                          operation_ + " failed: " +
                                              (result ? result->error.value_or(codec::errorName(kind)) : "no result"),
                                          codec::errorName(kind));
        return static_cast<int>(ExitCode::OperationFailed);
    }

    out_ << result->value << '\n';
    return static_cast<int>(ExitCode::Success);
}

std::string Application::readInput()
{
    std::ostringstream buffer;
    buffer << in_.rdbuf();
    std::string input = buffer.str();

    // A single trailing newline comes from the shell, not from the text.
    if (!input.empty() && input.back() == '\n')
    {
        input.pop_back();
        if (!input.empty() && input.back() == '\r')
            input.pop_back();
    }
    return input;
}

void Application::printUsage(std::ostream& os) const
{
    os << "usage: stringity [--config <file>] [--nfc] <operation> [text]\n"
          "       stringity --list | --help | --version\n"
          "Reads stdin when text is omitted.\n";
}

void Application::reportPendingErrors()
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        if (report.severity == utils::ErrorSeverity::Info)
            continue;
        err_ << "stringity: " << report.user_message << '\n';
    }
}

void Application::cleanup()
{
    registry_.reset();
    utils::LogManager::Shutdown();
}
