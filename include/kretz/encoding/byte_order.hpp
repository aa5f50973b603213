/**
 * @file byte_order.hpp
 * @brief Little-endian read helpers and host byte order conversion
 *
 * Every multi-byte value in a Kretz file is stored least significant byte
 * first. These helpers decode such values independently of the host byte
 * order and convert whole sample buffers to host order.
 */

#ifndef KRETZ_ENCODING_BYTE_ORDER_HPP
#define KRETZ_ENCODING_BYTE_ORDER_HPP

#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>

namespace kretz::encoding {

/**
 * @brief Byte ordering of multi-byte values.
 */
enum class byte_order {
    little_endian,  ///< Least significant byte first (file encoding)
    big_endian      ///< Most significant byte first
};

/**
 * @brief Byte order of the machine running the reader.
 */
[[nodiscard]] constexpr byte_order host_byte_order() noexcept {
    return std::endian::native == std::endian::little ? byte_order::little_endian
                                                      : byte_order::big_endian;
}

/// @name Little Endian Read Functions
/// @{

/**
 * @brief Reads a 16-bit value from little-endian bytes.
 * @param data Pointer to at least 2 bytes
 * @return The value in native byte order
 */
[[nodiscard]] constexpr uint16_t read_le16(const uint8_t* data) noexcept {
    return static_cast<uint16_t>(static_cast<uint16_t>(data[0]) |
                                 (static_cast<uint16_t>(data[1]) << 8));
}

/**
 * @brief Reads a 32-bit value from little-endian bytes.
 * @param data Pointer to at least 4 bytes
 * @return The value in native byte order
 */
[[nodiscard]] constexpr uint32_t read_le32(const uint8_t* data) noexcept {
    return static_cast<uint32_t>(data[0]) |
           (static_cast<uint32_t>(data[1]) << 8) |
           (static_cast<uint32_t>(data[2]) << 16) |
           (static_cast<uint32_t>(data[3]) << 24);
}

/**
 * @brief Reads a 64-bit value from little-endian bytes.
 * @param data Pointer to at least 8 bytes
 * @return The value in native byte order
 */
[[nodiscard]] constexpr uint64_t read_le64(const uint8_t* data) noexcept {
    return static_cast<uint64_t>(data[0]) |
           (static_cast<uint64_t>(data[1]) << 8) |
           (static_cast<uint64_t>(data[2]) << 16) |
           (static_cast<uint64_t>(data[3]) << 24) |
           (static_cast<uint64_t>(data[4]) << 32) |
           (static_cast<uint64_t>(data[5]) << 40) |
           (static_cast<uint64_t>(data[6]) << 48) |
           (static_cast<uint64_t>(data[7]) << 56);
}

/**
 * @brief Reads an IEEE-754 single precision value from little-endian bytes.
 * @param data Pointer to at least 4 bytes
 */
[[nodiscard]] constexpr float read_le_f32(const uint8_t* data) noexcept {
    return std::bit_cast<float>(read_le32(data));
}

/**
 * @brief Reads an IEEE-754 double precision value from little-endian bytes.
 * @param data Pointer to at least 8 bytes
 */
[[nodiscard]] constexpr double read_le_f64(const uint8_t* data) noexcept {
    return std::bit_cast<double>(read_le64(data));
}

/// @}

/**
 * @brief Converts a buffer of little-endian samples to host byte order.
 * @param buffer Samples laid out back to back
 * @param element_size Width of one sample in bytes (1, 2, 4 or 8)
 *
 * No-op on little-endian hosts and for single byte samples. A trailing
 * partial sample is left untouched.
 */
inline void little_endian_to_host(std::span<uint8_t> buffer,
                                  std::size_t element_size) noexcept {
    if constexpr (std::endian::native == std::endian::little) {
        (void)buffer;
        (void)element_size;
    } else {
        if (element_size <= 1) {
            return;
        }
        const std::size_t whole = buffer.size() - buffer.size() % element_size;
        for (std::size_t i = 0; i < whole; i += element_size) {
            std::reverse(buffer.begin() + static_cast<std::ptrdiff_t>(i),
                         buffer.begin() + static_cast<std::ptrdiff_t>(i + element_size));
        }
    }
}

}  // namespace kretz::encoding

#endif  // KRETZ_ENCODING_BYTE_ORDER_HPP
