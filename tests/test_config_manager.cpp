#include <catch2/catch_test_macros.hpp>
#include "config/AppSettings.hpp"
#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace
{

std::filesystem::path writeConfig(const std::string& name, const std::string& contents)
{
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream(path, std::ios::trunc) << contents;
    return path;
}

} // namespace

TEST_CASE("ConfigManager - missing file keeps defaults", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    config::ConfigManager manager((std::filesystem::temp_directory_path() / "stringity_no_such_file.toml").string());
    config::AppSettings settings;
    REQUIRE(settings.registerWith(manager));
    REQUIRE(manager.load());
    REQUIRE_FALSE(manager.fileFound());

    REQUIRE(settings.logging.level == 3);
    REQUIRE(settings.compression.level == 6);
    REQUIRE_FALSE(settings.transform.shuffle_seed.has_value());
    REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
}

TEST_CASE("ConfigManager - reads every section", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    const auto path = writeConfig("stringity_test_full.toml", R"(
[logging]
level = 5
file = ""
append = false
console = true

[diagnostics]
verbose = true
max_preview = 40

[compression]
level = 9

[transform]
shuffle_seed = 99
)");

    config::ConfigManager manager(path.string());
    config::AppSettings settings;
    REQUIRE(settings.registerWith(manager));
    REQUIRE(manager.load());
    REQUIRE(manager.fileFound());

    REQUIRE(settings.logging.level == 5);
    REQUIRE(settings.logging.file.empty());
    REQUIRE_FALSE(settings.logging.append);
    REQUIRE(settings.logging.console);
    REQUIRE(settings.diagnostics.verbose);
    REQUIRE(settings.diagnostics.max_preview == 40);
    REQUIRE(settings.compression.level == 9);
    REQUIRE(settings.transform.shuffle_seed == 99u);

    std::filesystem::remove(path);
}

TEST_CASE("ConfigManager - out-of-range values are clamped and reported", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    const auto path = writeConfig("stringity_test_range.toml", "[compression]\nlevel = 42\n[logging]\nlevel = -1\n");

    config::ConfigManager manager(path.string());
    config::AppSettings settings;
    REQUIRE(settings.registerWith(manager));
    REQUIRE(manager.load());

    REQUIRE(settings.compression.level == 10);
    REQUIRE(settings.logging.level == 0);

    const auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 2);
    for (const auto& report : reports)
        REQUIRE(report.category == utils::ErrorCategory::Configuration);

    std::filesystem::remove(path);
}

TEST_CASE("ConfigManager - parse errors are reported and defaults kept", "[config]")
{
    utils::ErrorReporter::ClearErrors();

    const auto path = writeConfig("stringity_test_broken.toml", "[compression\nlevel = 3\n");

    config::ConfigManager manager(path.string());
    config::AppSettings settings;
    REQUIRE(settings.registerWith(manager));
    REQUIRE_FALSE(manager.load());
    REQUIRE(std::string(manager.lastError()).find("parse error") != std::string::npos);
    REQUIRE(settings.compression.level == 6);

    REQUIRE(utils::ErrorReporter::HasPendingErrors());
    const auto last = utils::ErrorReporter::GetLastError();
    REQUIRE(last.category == utils::ErrorCategory::Configuration);
    REQUIRE(last.severity == utils::ErrorSeverity::Warning);
    utils::ErrorReporter::ClearErrors();

    std::filesystem::remove(path);
}

TEST_CASE("ConfigManager - duplicate key ownership is refused", "[config]")
{
    config::ConfigManager manager("unused.toml");
    REQUIRE(manager.registerTable("compression", { [](const toml::table&) {} }, { "level" }));
    REQUIRE_FALSE(manager.registerTable("compression", { [](const toml::table&) {} }, { "level" }));
    REQUIRE(manager.registerTable("compression", { [](const toml::table&) {} }, { "other" }));
}
