#include <drift/encodings/base64.h>

#include <drift/utilities/testing.h>

using namespace drift;

// This tests the base64 encoding interface on a single string.
static void
test_base64_encoding(
    string const& original,
    string const& correct_encoding,
    base64_character_set const& character_set)
{
    INFO("Testing base64 encoding.");

    CAPTURE(original);
    CAPTURE(correct_encoding);

    // Check the encoded form.
    auto encoded = base64_encode(original, character_set);
    REQUIRE(encoded == correct_encoding);

    // Check that the encoded length calculation is within bounds.
    {
        auto calculated = get_base64_encoded_length(original.length());
        auto actual = encoded.length();
        REQUIRE(calculated <= actual + 2);
        REQUIRE(actual <= calculated);
        if (character_set.padding)
            REQUIRE(actual == calculated);
    }
}

TEST_CASE("MIME base64 encoding", "[encodings][base64]")
{
    test_base64_encoding("", "", get_mime_base64_character_set());
    test_base64_encoding("x", "eA==", get_mime_base64_character_set());
    test_base64_encoding("admin", "YWRtaW4=", get_mime_base64_character_set());
    test_base64_encoding(
        "secret123", "c2VjcmV0MTIz", get_mime_base64_character_set());
    test_base64_encoding(
        "hello world", "aGVsbG8gd29ybGQ=", get_mime_base64_character_set());
    test_base64_encoding("ab?>", "YWI/Pg==", get_mime_base64_character_set());

    test_base64_encoding(
        "Proin sollicitudin cursus bibendum",
        "UHJvaW4gc29sbGljaXR1ZGluIGN1cnN1cyBiaWJlbmR1bQ==",
        get_mime_base64_character_set());

    test_base64_encoding(
        "Quisque dictum orci in urna cursus maximus",
        "UXVpc3F1ZSBkaWN0dW0gb3JjaSBpbiB1cm5hIGN1cnN1cyBtYXhpbXVz",
        get_mime_base64_character_set());
}

TEST_CASE("URL-friendly base64 encoding", "[encodings][base64]")
{
    test_base64_encoding("", "", get_url_friendly_base64_character_set());
    test_base64_encoding("x", "eA", get_url_friendly_base64_character_set());
    test_base64_encoding(
        "hello world",
        "aGVsbG8gd29ybGQ",
        get_url_friendly_base64_character_set());
    test_base64_encoding(
        "ab?>", "YWI_Pg", get_url_friendly_base64_character_set());
}

TEST_CASE("binary base64 encoding", "[encodings][base64]")
{
    uint8_t const bytes[] = {0x00, 0xff, 0x10, 0x80};
    REQUIRE(
        base64_encode(bytes, sizeof(bytes), get_mime_base64_character_set())
        == "AP8QgA==");
    REQUIRE(
        base64_encode(
            bytes, sizeof(bytes), get_url_friendly_base64_character_set())
        == "AP8QgA");

    // Strings holding arbitrary bytes are encoded the same way.
    REQUIRE(
        base64_encode(
            string(reinterpret_cast<char const*>(bytes), sizeof(bytes)),
            get_mime_base64_character_set())
        == "AP8QgA==");
}
