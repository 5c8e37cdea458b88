#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace config
{
class ConfigManager;
struct AppSettings;
} // namespace config

namespace ops
{
class OperationRegistry;
}

// Exit codes of the command-line front end
enum class ExitCode : int
{
    Success = 0,
    OperationFailed = 1, // malformed input or compressor failure
    UsageError = 2       // unknown operation or bad arguments
};

class Application
{
public:
    // args excludes the program name
    Application(std::vector<std::string> args, std::istream& in, std::ostream& out, std::ostream& err);
    ~Application();

    int run();

private:
    bool parseCommandLineArgs();
    bool initializeConfig(); // false leaves the defaults in effect
    bool initializeLogging();
    void applyDiagnostics();
    void setupRegistry();

    int listOperations();
    int runOperation();
    std::string readInput();
    void printUsage(std::ostream& os) const;
    void reportPendingErrors();
    void cleanup();

    std::vector<std::string> args_;
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;

    std::string config_path_ = "stringity.toml";
    std::string operation_;
    std::optional<std::string> text_;
    bool normalize_nfc_ = false;
    bool list_requested_ = false;
    bool help_requested_ = false;
    bool version_requested_ = false;

    std::unique_ptr<config::ConfigManager> config_;
    std::unique_ptr<config::AppSettings> settings_;
    std::unique_ptr<ops::OperationRegistry> registry_;
};
