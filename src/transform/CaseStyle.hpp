#pragma once

#include <string>
#include <string_view>

namespace transform
{

// Identifier-style renderings. Input that is empty or only whitespace is returned as-is.
// Word boundaries are ASCII whitespace, '_' and '-', plus lower-to-upper transitions for
// snake/kebab.

[[nodiscard]] std::string toSnakeCase(std::string_view text);  // "helloWorld" -> "hello_world"
[[nodiscard]] std::string toKebabCase(std::string_view text);  // "helloWorld" -> "hello-world"
[[nodiscard]] std::string toCamelCase(std::string_view text);  // "hello world" -> "helloWorld"
[[nodiscard]] std::string toPascalCase(std::string_view text); // "hello world" -> "HelloWorld"
[[nodiscard]] std::string toTitleCase(std::string_view text);  // "hello_world" -> "Hello World"

/// Upper-case letters become lower-case and vice versa
[[nodiscard]] std::string swapCase(std::string_view text);

/// Alternates case per code point: even positions lower, odd positions upper
[[nodiscard]] std::string toSarcasm(std::string_view text);

/// Full-string simple case mappings
[[nodiscard]] std::string toLower(std::string_view text);
[[nodiscard]] std::string toUpper(std::string_view text);

[[nodiscard]] bool isBlank(std::string_view text);

} // namespace transform
