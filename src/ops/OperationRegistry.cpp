#include "OperationRegistry.hpp"

#include "codec/BinaryCodec.hpp"
#include "codec/ByteEncodings.hpp"
#include "codec/HexCodec.hpp"
#include "codec/MorseCodec.hpp"
#include "codec/Rot13.hpp"
#include "codec/Sha256.hpp"
#include "metrics/CharacterCounts.hpp"
#include "metrics/FrequencyAnalysis.hpp"
#include "metrics/Segmentation.hpp"
#include "metrics/TextStatistics.hpp"
#include "transform/CaseStyle.hpp"
#include "transform/CharacterFilters.hpp"
#include "transform/Escaping.hpp"
#include "transform/Rearrange.hpp"

#include <plog/Log.h>

namespace ops
{

namespace
{

using codec::TextResult;

// Adapters from the library's function shapes to OperationHandler

template <typename Fn>
OperationHandler text(Fn fn)
{
    return [fn](const std::string& input) { return TextResult::success(fn(input)); };
}

template <typename Fn>
OperationHandler count(Fn fn)
{
    return [fn](const std::string& input) { return TextResult::success(std::to_string(fn(input))); };
}

template <typename Fn>
OperationHandler decode(Fn fn)
{
    return [fn](const std::string& input) { return fn(input); };
}

std::uint32_t seedFrom(const RegistryOptions& options)
{
    if (options.shuffle_seed)
        return *options.shuffle_seed;
    std::random_device device;
    return device();
}

} // namespace

OperationRegistry::OperationRegistry(RegistryOptions options)
    : options_(std::move(options))
    , rng_(seedFrom(options_))
{
    initializeCodecOperations();
    initializeMetricOperations();
    initializeTransformOperations();
    PLOG_DEBUG << "Operation registry initialized with " << definitions_.size() << " operations";
}

void OperationRegistry::registerOperation(std::string name, OperationCategory category, std::string summary,
                                          OperationHandler handler)
{
    auto [it, inserted] = index_.emplace(name, definitions_.size());
    if (!inserted)
    {
        PLOG_ERROR << "Operation '" << name << "' registered twice; keeping the first definition";
        return;
    }
    definitions_.push_back({ std::move(name), category, std::move(summary), std::move(handler) });
}

void OperationRegistry::initializeCodecOperations()
{
    constexpr auto C = OperationCategory::Codec;

    registerOperation("to-hex", C, "UTF-8 bytes as uppercase hex", text(codec::toHex));
    registerOperation("from-hex", C, "hex digits back to UTF-8 text", decode(codec::fromHex));
    registerOperation("to-binary", C, "code points as space-separated 8-bit literals", text(codec::toBinary));
    registerOperation("from-binary", C, "8-bit literals back to ASCII text", decode(codec::fromBinary));
    registerOperation("to-morse", C, "A-Z/0-9 as Morse tokens", text(codec::toMorse));
    registerOperation("from-morse", C, "Morse tokens back to A-Z/0-9", text(codec::fromMorse));
    registerOperation("rot13", C, "ROT13 (self-inverse)", text(codec::rot13));

    const codec::CompressionOptions compression = options_.compression;
    registerOperation("compress", C, "UTF-16LE + gzip + base64",
                      [compression](const std::string& input) { return codec::compress(input, compression); });
    registerOperation("decompress", C, "inverse of compress", decode(codec::decompress));

    registerOperation("to-ascii", C, "re-encode through ASCII", text(codec::toAscii));
    registerOperation("to-utf8", C, "re-encode through UTF-8", text(codec::toUtf8));
    registerOperation("to-utf16", C, "re-encode through UTF-16BE", text(codec::toUtf16));
    registerOperation("to-unicode", C, "re-encode through UTF-16LE", text(codec::toUnicode));
    registerOperation("to-utf32", C, "re-encode through UTF-32LE", text(codec::toUtf32));
    registerOperation("sha256", C, "SHA-256 of the UTF-8 bytes", text(codec::sha256));
}

void OperationRegistry::initializeMetricOperations()
{
    constexpr auto M = OperationCategory::Metrics;

    registerOperation("length", M, "UTF-8 byte count", count(metrics::codeUnitLength));
    registerOperation("code-points", M, "code point count", count(metrics::codePointLength));
    registerOperation("logical-length", M, "grapheme cluster count", count(metrics::logicalLength));
    registerOperation("count-characters", M, "code point count", count(metrics::countCharacters));
    registerOperation("count-words", M, "whitespace-delimited words", count(metrics::countWords));
    registerOperation("count-sentences", M, "segments between . ! ?", count(metrics::countSentences));
    registerOperation("count-paragraphs", M, "blocks separated by blank lines", count(metrics::countParagraphs));
    registerOperation("count-vowels", M, "aeiouAEIOU", count(metrics::countVowels));
    registerOperation("count-consonants", M, "letters that are not vowels", count(metrics::countConsonants));
    registerOperation("count-digits", M, "decimal digits", count(metrics::countDigits));
    registerOperation("count-uppercase", M, "upper-case letters", count(metrics::countUppercase));
    registerOperation("count-lowercase", M, "lower-case letters", count(metrics::countLowercase));
    registerOperation("count-whitespace", M, "whitespace code points", count(metrics::countWhitespace));
    registerOperation("count-punctuation", M, "punctuation code points", count(metrics::countPunctuation));
    registerOperation("most-frequent-character", M, "most common letter or digit",
                      text(metrics::mostFrequentCharacter));
    registerOperation("least-frequent-character", M, "least common letter or digit",
                      text(metrics::leastFrequentCharacter));
    registerOperation("most-frequent-word", M, "most common word", text(metrics::mostFrequentWord));
    registerOperation("least-frequent-word", M, "least common word", text(metrics::leastFrequentWord));
    registerOperation("stats", M, "every metric at once",
                      text([](const std::string& input) { return metrics::formatStatistics(metrics::analyze(input)); }));
}

void OperationRegistry::initializeTransformOperations()
{
    constexpr auto T = OperationCategory::Transform;

    registerOperation("snake-case", T, "snake_case", text(transform::toSnakeCase));
    registerOperation("kebab-case", T, "kebab-case", text(transform::toKebabCase));
    registerOperation("camel-case", T, "camelCase", text(transform::toCamelCase));
    registerOperation("pascal-case", T, "PascalCase", text(transform::toPascalCase));
    registerOperation("title-case", T, "Title Case", text(transform::toTitleCase));
    registerOperation("swap-case", T, "swap upper and lower case", text(transform::swapCase));
    registerOperation("sarcasm", T, "aLtErNaTiNg case", text(transform::toSarcasm));
    registerOperation("remove-non-alphanumeric", T, "keep [a-zA-Z0-9]", text(transform::removeNonAlphanumeric));
    registerOperation("remove-non-ascii", T, "keep ASCII", text(transform::removeNonAscii));
    registerOperation("remove-digits", T, "drop decimal digits", text(transform::removeDigits));
    registerOperation("remove-letters", T, "drop [a-zA-Z]", text(transform::removeLetters));
    registerOperation("remove-special-characters", T, "keep [a-zA-Z0-9] and whitespace",
                      text(transform::removeSpecialCharacters));
    registerOperation("json-escape", T, "escape for a JSON string", text(transform::toJsonEscaped));
    registerOperation("xml-escape", T, "escape XML special characters", text(transform::toXmlEscaped));
    registerOperation("reverse", T, "reverse by grapheme cluster", text(transform::reverse));
    registerOperation("shuffle", T, "shuffle grapheme clusters",
                      [this](const std::string& input) { return TextResult::success(transform::shuffle(input, rng_)); });
}

const OperationDefinition* OperationRegistry::findOperation(const std::string& name) const
{
    auto it = index_.find(name);
    return it != index_.end() ? &definitions_[it->second] : nullptr;
}

std::optional<codec::TextResult> OperationRegistry::run(const std::string& name, const std::string& input) const
{
    const OperationDefinition* def = findOperation(name);
    if (!def)
    {
        PLOG_WARNING << "Unknown operation requested: " << name;
        return std::nullopt;
    }
    return def->handler(input);
}

const char* OperationRegistry::CategoryToString(OperationCategory category)
{
    switch (category)
    {
    case OperationCategory::Codec:
        return "codec";
    case OperationCategory::Metrics:
        return "metrics";
    case OperationCategory::Transform:
        return "transform";
    default:
        return "unknown";
    }
}

} // namespace ops
