/**
 * @file text_field_test.cpp
 * @brief Unit tests for NUL-padded text field decoding
 */

#include <catch2/catch_test_macros.hpp>

#include <kretz/encoding/text_field.hpp>

#include <string>
#include <string_view>
#include <vector>

using namespace kretz::encoding;

namespace {

auto bytes_of(std::string_view text) -> std::vector<uint8_t> {
    return {text.begin(), text.end()};
}

auto padded(std::string_view text, std::size_t width) -> std::vector<uint8_t> {
    auto out = bytes_of(text);
    out.resize(width, 0);
    return out;
}

}  // namespace

TEST_CASE("trailing NUL padding is removed", "[encoding][text_field]") {
    CHECK(decode_text_field(padded("Jane Smith", 64)) == "Jane Smith");
    CHECK(decode_text_field(padded("", 16)).empty());
    CHECK(decode_text_field(bytes_of("full")) == "full");
}

TEST_CASE("interior whitespace and NULs are preserved", "[encoding][text_field]") {
    CHECK(decode_text_field(padded("  GE  Voluson ", 32)) == "  GE  Voluson ");

    std::vector<uint8_t> field{'a', 0, 'b', 0, 0};
    CHECK(decode_text_field(field) == std::string("a\0b", 3));
}

TEST_CASE("valid UTF-8 passes through unchanged", "[encoding][text_field]") {
    // "Müller" and a CJK character
    const std::string text = "M\xC3\xBCller \xE4\xB8\xAD";
    CHECK(decode_text_field(padded(text, 32)) == text);
}

TEST_CASE("invalid UTF-8 is replaced with U+FFFD", "[encoding][text_field]") {
    const std::string fffd{kReplacementCharacter};

    SECTION("lone continuation byte") {
        std::vector<uint8_t> field{'A', 0x80, 'B'};
        CHECK(decode_utf8_lossy(field) == "A" + fffd + "B");
    }

    SECTION("invalid lead bytes") {
        std::vector<uint8_t> field{0xC0, 0xFF};
        CHECK(decode_utf8_lossy(field) == fffd + fffd);
    }

    SECTION("truncated multi-byte sequence is one replacement") {
        std::vector<uint8_t> field{0xE4, 0xB8, 'x'};
        CHECK(decode_utf8_lossy(field) == fffd + "x");
    }

    SECTION("encoded surrogate is rejected per byte") {
        std::vector<uint8_t> field{0xED, 0xA0, 0x80};
        CHECK(decode_utf8_lossy(field) == fffd + fffd + fffd);
    }

    SECTION("truncated sequence at end of field") {
        std::vector<uint8_t> field{'o', 'k', 0xF0, 0x9F, 0x98};
        CHECK(decode_utf8_lossy(field) == "ok" + fffd);
    }
}

TEST_CASE("trim_trailing_nuls returns a prefix view", "[encoding][text_field]") {
    std::vector<uint8_t> field{'x', 'y', 0, 0};
    auto trimmed = trim_trailing_nuls(field);
    CHECK(trimmed.size() == 2);
    CHECK(trimmed.data() == field.data());
}
