#include <drift/encodings/base64.h>

namespace drift {

size_t
get_base64_encoded_length(size_t raw_length)
{
    return (raw_length + 2) / 3 * 4;
}

string
base64_encode(
    uint8_t const* src,
    size_t src_size,
    base64_character_set const& character_set)
{
    string dst;
    dst.reserve(get_base64_encoded_length(src_size));
    uint8_t const* src_end = src + src_size;
    while (src != src_end)
    {
        int n = *src;
        ++src;
        dst.push_back(character_set.digits[(n >> 2) & 63]);
        n <<= 8;
        if (src != src_end)
            n |= *src;
        dst.push_back(character_set.digits[(n >> 4) & 63]);
        if (src == src_end)
        {
            if (character_set.padding)
                dst.append(2, character_set.padding);
            break;
        }
        ++src;
        n <<= 8;
        if (src != src_end)
            n |= *src;
        dst.push_back(character_set.digits[(n >> 6) & 63]);
        if (src == src_end)
        {
            if (character_set.padding)
                dst.push_back(character_set.padding);
            break;
        }
        ++src;
        dst.push_back(character_set.digits[n & 63]);
    }
    return dst;
}

string
base64_encode(string const& source, base64_character_set const& character_set)
{
    return base64_encode(
        reinterpret_cast<uint8_t const*>(source.data()),
        source.length(),
        character_set);
}

} // namespace drift
