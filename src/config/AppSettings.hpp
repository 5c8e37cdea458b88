#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace config
{

class ConfigManager;

// Settings read from the [logging], [diagnostics], [compression] and [transform] tables.
struct AppSettings
{
    struct Logging
    {
        int level = 3; // plog::warning
        std::string file = "logs/stringity.log";
        bool append = true;
        bool console = false;
    };

    struct DiagnosticsSection
    {
        bool verbose = false;
        std::size_t max_preview = 160;
    };

    struct Compression
    {
        int level = 6;
    };

    struct Transform
    {
        std::optional<std::uint32_t> shuffle_seed;
    };

    Logging logging;
    DiagnosticsSection diagnostics;
    Compression compression;
    Transform transform;

    // Registers one load callback per table. Out-of-range values are reported as
    // configuration warnings and replaced by the nearest valid value.
    bool registerWith(ConfigManager& manager);
};

} // namespace config
