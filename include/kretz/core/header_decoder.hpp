/**
 * @file header_decoder.hpp
 * @brief Decoding of the fixed 256-byte Kretz header region
 *
 * Header layout (all multi-byte values little-endian):
 *
 * | Offset | Size | Field                         |
 * |--------|------|-------------------------------|
 * | 0      | 9    | "KRETZFILE" signature         |
 * | 9      | 3    | version                       |
 * | 12     | 1    | separator (space), ignored    |
 * | 13     | 3    | reserved                      |
 * | 16     | 4    | frame_count (u32)             |
 * | 20     | 12   | dimensions (3 x u32)          |
 * | 32     | 12   | spacing (3 x f32, mm)         |
 * | 44     | 1    | coordinate_system tag         |
 * | 45     | 1    | data_type tag                 |
 * | 46     | 1    | compressed flag               |
 * | 48     | 64   | patient_name                  |
 * | 112    | 16   | study_date                    |
 * | 128    | 16   | study_time                    |
 * | 144    | 32   | acquisition_mode              |
 * | 176    | 32   | system_name                   |
 * | 208    | 32   | probe_name                    |
 * | 240    | 12   | origin (3 x f32)              |
 * | 252    | 4    | unused                        |
 *
 * The voxel payload always starts at offset 256.
 */

#pragma once

#include "kretz_metadata.hpp"

#include <kretz/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace kretz::core {

/// File signature at offset 0
inline constexpr std::string_view kMagic = "KRETZFILE";

/// Size of the fixed header region; the payload starts right after it
inline constexpr std::size_t kHeaderSize = 256;

/**
 * @brief Describes one fixed-offset header field
 *
 * The decoder receives exactly @c size bytes starting at @c offset.
 */
struct header_field {
    std::string_view name;
    std::size_t offset;
    std::size_t size;
    void (*decode)(std::span<const uint8_t> bytes, kretz_metadata& out);
};

/**
 * @brief The field descriptors of the header, in offset order
 */
[[nodiscard]] auto header_layout() noexcept -> std::span<const header_field>;

/**
 * @brief Checks the "KRETZFILE" signature at the start of @p data
 * @return error invalid_signature naming the expected and actual bytes
 */
[[nodiscard]] auto check_signature(std::span<const uint8_t> data) -> VoidResult;

/**
 * @brief Decodes the header region
 *
 * @param data File bytes starting at offset 0; at least kHeaderSize bytes
 *             are needed, anything past the header is ignored
 * @return Fully populated metadata (volume_data_missing unset), or
 *         invalid_signature / truncated_header
 *
 * Unknown tag codes and malformed text never cause an error.
 */
[[nodiscard]] auto decode_header(std::span<const uint8_t> data)
    -> Result<kretz_metadata>;

}  // namespace kretz::core
