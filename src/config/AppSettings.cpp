#include "AppSettings.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <algorithm>
#include <limits>

namespace config
{

namespace
{

template <typename T>
T clampSetting(const char* key, long long value, long long lo, long long hi)
{
    if (value < lo || value > hi)
    {
        const long long clamped = std::clamp(value, lo, hi);
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            std::string("Setting '") + key + "' out of range, using " +
                                                std::to_string(clamped),
                                            "value " + std::to_string(value) + " outside [" + std::to_string(lo) +
                                                ", " + std::to_string(hi) + "]");
        value = clamped;
    }
    return static_cast<T>(value);
}

} // namespace

bool AppSettings::registerWith(ConfigManager& manager)
{
    bool ok = true;

    ok &= manager.registerTable("logging", { [this](const toml::table& t)
    {
        if (auto v = t["level"].value<int64_t>())
            logging.level = clampSetting<int>("logging.level", *v, 0, 6);
        if (auto v = t["file"].value<std::string>())
            logging.file = *v;
        if (auto v = t["append"].value<bool>())
            logging.append = *v;
        if (auto v = t["console"].value<bool>())
            logging.console = *v;
    } }, { "level", "file", "append", "console" });

    ok &= manager.registerTable("diagnostics", { [this](const toml::table& t)
    {
        if (auto v = t["verbose"].value<bool>())
            diagnostics.verbose = *v;
        if (auto v = t["max_preview"].value<int64_t>())
            diagnostics.max_preview = clampSetting<std::size_t>("diagnostics.max_preview", *v, 0, 1 << 20);
    } }, { "verbose", "max_preview" });

    ok &= manager.registerTable("compression", { [this](const toml::table& t)
    {
        if (auto v = t["level"].value<int64_t>())
            compression.level = clampSetting<int>("compression.level", *v, 0, 10);
    } }, { "level" });

    ok &= manager.registerTable("transform", { [this](const toml::table& t)
    {
        if (auto v = t["shuffle_seed"].value<int64_t>())
            transform.shuffle_seed = clampSetting<std::uint32_t>(
                "transform.shuffle_seed", *v, 0, std::numeric_limits<std::uint32_t>::max());
    } }, { "shuffle_seed" });

    return ok;
}

} // namespace config
