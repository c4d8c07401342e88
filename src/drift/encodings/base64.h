#ifndef DRIFT_ENCODINGS_BASE64_H
#define DRIFT_ENCODINGS_BASE64_H

#include <cstddef>
#include <cstdint>

#include <drift/core/type_definitions.h>

// This file provides functions for converting raw binary data to a base64
// ASCII encoding. The characters used to represent the 64 values are
// specified as a function parameter. Two obvious choices are provided here: the
// MIME character set (which is what Kubernetes uses for Secret data) and a
// modified MIME set that is URL-friendly.

namespace drift {

// Given the length of a raw binary sequence, this gives the maximum length of
// the corresponding base64 encoding.
// The actual length of the encoded sequence may be shorter by one or two
// characters (if the character set has no padding).
size_t
get_base64_encoded_length(size_t raw_length);

struct base64_character_set
{
    // the 64 digits used to represent the 6-bit values
    char const* digits;
    // the character used to pad the sequence to a multiple of 4 characters
    // Set this to 0 for no padding.
    char padding;
};

inline base64_character_set
get_mime_base64_character_set()
{
    base64_character_set set;
    set.digits
        = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    set.padding = '=';
    return set;
}

inline base64_character_set
get_url_friendly_base64_character_set()
{
    base64_character_set set;
    set.digits
        = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    set.padding = 0;
    return set;
}

// Encode the given source data in base64 using the provided character set.
string
base64_encode(
    uint8_t const* src,
    size_t src_size,
    base64_character_set const& character_set);

// Same as above, but the source data is also specified as a string.
string
base64_encode(string const& source, base64_character_set const& character_set);

} // namespace drift

#endif
