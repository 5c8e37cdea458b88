#pragma once

#include <string>
#include <string_view>

namespace transform
{

/// JSON string-body escaping. Quote, backslash and \b \f \n \r \t get short escapes;
/// every other code point below U+0020 or above U+007F becomes \uXXXX (astral code
/// points as a surrogate pair).
[[nodiscard]] std::string toJsonEscaped(std::string_view text);

/// Replaces & " ' < > with their XML entities
[[nodiscard]] std::string toXmlEscaped(std::string_view text);

} // namespace transform
