#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace utils
{

// Process-wide switches for how much of an operation's input ends up in the logs.
class Diagnostics
{
public:
    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Escaped, length-limited copy of text that is safe to put on one log line
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static void sanitize(std::string& text);
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace utils
