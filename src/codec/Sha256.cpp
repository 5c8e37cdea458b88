#include "Sha256.hpp"

#include <picosha2.h>

#include <vector>

namespace codec
{

std::string sha256(std::string_view text)
{
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(text.begin(), text.end(), hash.begin(), hash.end());
    return picosha2::bytes_to_hex_string(hash.begin(), hash.end());
}

} // namespace codec
