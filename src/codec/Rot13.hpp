#pragma once

#include <string>
#include <string_view>

namespace codec
{

/// Caesar shift of 13 over [a-zA-Z]; every other byte passes through. Self-inverse.
[[nodiscard]] std::string rot13(std::string_view text);

} // namespace codec
