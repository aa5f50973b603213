/**
 * @file text_field.hpp
 * @brief Decoding of fixed-capacity, NUL-padded text fields
 *
 * Header strings such as the patient name occupy a fixed slot and are padded
 * with NUL bytes. Their content is nominally UTF-8 but is not guaranteed to
 * be valid, so decoding never fails.
 */

#ifndef KRETZ_ENCODING_TEXT_FIELD_HPP
#define KRETZ_ENCODING_TEXT_FIELD_HPP

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace kretz::encoding {

/// UTF-8 encoding of U+FFFD REPLACEMENT CHARACTER
inline constexpr std::string_view kReplacementCharacter = "\xEF\xBF\xBD";

/**
 * @brief Removes trailing NUL bytes from a fixed-size field.
 * @param field Raw field bytes
 * @return The field without its NUL padding (interior NULs are kept)
 */
[[nodiscard]] auto trim_trailing_nuls(std::span<const uint8_t> field) noexcept
    -> std::span<const uint8_t>;

/**
 * @brief Decodes bytes as UTF-8, replacing invalid sequences.
 *
 * Each maximal ill-formed subsequence is replaced by one U+FFFD, which
 * matches the substitution practice recommended by the Unicode standard.
 *
 * @param bytes Input bytes
 * @return Valid UTF-8 string
 */
[[nodiscard]] auto decode_utf8_lossy(std::span<const uint8_t> bytes) -> std::string;

/**
 * @brief Decodes a NUL-padded text field.
 *
 * Equivalent to decode_utf8_lossy(trim_trailing_nuls(field)).
 */
[[nodiscard]] auto decode_text_field(std::span<const uint8_t> field) -> std::string;

}  // namespace kretz::encoding

#endif  // KRETZ_ENCODING_TEXT_FIELD_HPP
