#pragma once

#include <string>
#include <string_view>

namespace codec
{

/// Lowercase hex SHA-256 digest (64 characters) of the UTF-8 bytes of text
[[nodiscard]] std::string sha256(std::string_view text);

} // namespace codec
