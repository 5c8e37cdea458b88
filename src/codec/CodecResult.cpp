#include "CodecResult.hpp"

namespace codec
{

const char* errorName(CodecError error)
{
    switch (error)
    {
    case CodecError::None:
        return "none";
    case CodecError::OddLength:
        return "odd length";
    case CodecError::InvalidDigit:
        return "invalid digit";
    case CodecError::InvalidToken:
        return "invalid token";
    case CodecError::InvalidBase64:
        return "invalid base64";
    case CodecError::CorruptStream:
        return "corrupt stream";
    case CodecError::InvalidEncoding:
        return "invalid encoding";
    case CodecError::CompressorFailure:
        return "compressor failure";
    default:
        return "unknown";
    }
}

} // namespace codec
