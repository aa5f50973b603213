/**
 * @file text_field.cpp
 * @brief Implementation of NUL-padded text field decoding
 */

#include "kretz/encoding/text_field.hpp"

namespace kretz::encoding {

namespace {

[[nodiscard]] constexpr auto is_continuation(uint8_t byte) noexcept -> bool {
    return (byte & 0xC0) == 0x80;
}

/**
 * @brief Length of the well-formed sequence starting at data[pos].
 *
 * Returns 0 when the sequence is ill-formed; @p consumed then holds the
 * length of the maximal ill-formed subpart (at least 1).
 */
[[nodiscard]] auto well_formed_length(std::span<const uint8_t> data, size_t pos,
                                      size_t& consumed) noexcept -> size_t {
    const uint8_t lead = data[pos];
    consumed = 1;

    if (lead < 0x80) {
        return 1;
    }

    size_t length = 0;
    uint8_t second_min = 0x80;
    uint8_t second_max = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead == 0xE0) {
        length = 3;
        second_min = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        length = 3;
    } else if (lead == 0xED) {
        length = 3;
        second_max = 0x9F;  // excludes UTF-16 surrogates
    } else if (lead == 0xF0) {
        length = 4;
        second_min = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        length = 4;
    } else if (lead == 0xF4) {
        length = 4;
        second_max = 0x8F;  // caps at U+10FFFF
    } else {
        return 0;
    }

    for (size_t i = 1; i < length; ++i) {
        if (pos + i >= data.size()) {
            return 0;
        }
        const uint8_t byte = data[pos + i];
        const bool valid = (i == 1) ? (byte >= second_min && byte <= second_max)
                                    : is_continuation(byte);
        if (!valid) {
            return 0;
        }
        consumed = i + 1;
    }
    return length;
}

}  // namespace

auto trim_trailing_nuls(std::span<const uint8_t> field) noexcept
    -> std::span<const uint8_t> {
    size_t end = field.size();
    while (end > 0 && field[end - 1] == 0x00) {
        --end;
    }
    return field.first(end);
}

auto decode_utf8_lossy(std::span<const uint8_t> bytes) -> std::string {
    std::string result;
    result.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t consumed = 0;
        const size_t length = well_formed_length(bytes, pos, consumed);
        if (length == 0) {
            result.append(kReplacementCharacter);
            pos += consumed;
            continue;
        }
        result.append(reinterpret_cast<const char*>(bytes.data() + pos), length);
        pos += length;
    }

    return result;
}

auto decode_text_field(std::span<const uint8_t> field) -> std::string {
    return decode_utf8_lossy(trim_trailing_nuls(field));
}

}  // namespace kretz::encoding
