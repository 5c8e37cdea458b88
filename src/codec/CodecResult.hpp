#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace codec
{

enum class CodecError
{
    None,
    OddLength,        // hex payload with an odd number of digits
    InvalidDigit,     // non-hex character in a hex payload
    InvalidToken,     // binary token that is not exactly 8 bits of 0/1
    InvalidBase64,    // bad alphabet, padding or length
    CorruptStream,    // gzip framing, DEFLATE data, CRC or size mismatch
    InvalidEncoding,  // byte stream not valid under the named encoding
    CompressorFailure // compressor could not be initialized or run
};

[[nodiscard]] constexpr bool isMalformedInput(CodecError error)
{
    return error != CodecError::None && error != CodecError::CompressorFailure;
}

[[nodiscard]] const char* errorName(CodecError error);

// Outcome of a codec stage. A failed result never carries partial output.
template <typename T>
struct CodecResult
{
    T value{};
    bool succeeded = true;
    CodecError error_kind = CodecError::None;
    std::optional<std::string> error;

    explicit operator bool() const { return succeeded; }

    [[nodiscard]] bool isMalformedInput() const { return codec::isMalformedInput(error_kind); }

    static CodecResult success(T v)
    {
        CodecResult res;
        res.value = std::move(v);
        return res;
    }

    static CodecResult failure(CodecError kind, std::string message)
    {
        CodecResult res;
        res.succeeded = false;
        res.error_kind = kind;
        res.error = std::move(message);
        return res;
    }

    // Re-wrap the failure of another stage
    template <typename U>
    static CodecResult failure(const CodecResult<U>& other)
    {
        return failure(other.error_kind, other.error.value_or(errorName(other.error_kind)));
    }
};

using Bytes = std::vector<std::uint8_t>;
using TextResult = CodecResult<std::string>;
using BytesResult = CodecResult<Bytes>;

} // namespace codec
