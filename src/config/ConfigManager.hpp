#pragma once

#include <string>
#include <functional>
#include <vector>

#include <toml++/toml.h>

namespace config
{

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Reads one TOML file and hands each registered table path to its owner.
// Absent tables are delivered as empty tables so owners can fall back to defaults.
class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "stringity.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // false on a parse error; registered owners keep their defaults in that case
    bool load();

    const std::string& path() const { return config_path_; }
    bool fileFound() const { return file_found_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;
    bool file_found_ = false;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
};

} // namespace config
