/**
 * @file volume_decoder.hpp
 * @brief Decoding of the voxel payload that follows the header
 */

#pragma once

#include "kretz_metadata.hpp"
#include "reader_options.hpp"
#include "voxel_volume.hpp"

#include <kretz/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

namespace kretz::core {

/**
 * @brief Outcome of decoding a voxel payload
 */
struct volume_decode_result {
    voxel_volume volume;

    /// True when the payload did not yield exactly the expected sample count
    /// and @c volume was replaced by zeros
    bool data_missing{false};

    /// Samples actually recovered from the payload (before any zero fill)
    std::size_t decoded_samples{0};
};

/**
 * @brief Number of voxels the metadata declares
 *
 * @return x * y * z, or volume_too_large if the product overflows, exceeds
 *         options.max_voxel_count, or needs more than options.max_volume_bytes
 *         of storage_type(data_type) samples
 */
[[nodiscard]] auto expected_voxel_count(const kretz_metadata& metadata,
                                        const reader_options& options)
    -> Result<std::size_t>;

/**
 * @brief Decodes the bytes after the header into a voxel volume
 *
 * The sample type is storage_type(metadata.data_type); unknown data_type
 * codes fall back to 8-bit unsigned samples.
 *
 * Uncompressed payloads are read as consecutive little-endian samples;
 * trailing bytes beyond the expected count are ignored. Compressed payloads
 * are run-length decoded; runs are expanded whole, so a stream whose last
 * run overshoots x * y * z is a size mismatch.
 *
 * If the payload yields a sample count other than x * y * z the volume is
 * zero-filled and data_missing is set, unless options.strict_payload is
 * set, in which case payload_size_mismatch is returned.
 *
 * @param payload File bytes starting at offset 256 (may be empty)
 * @param metadata Decoded header
 * @param options Reader options
 */
[[nodiscard]] auto decode_volume(std::span<const uint8_t> payload,
                                 const kretz_metadata& metadata,
                                 const reader_options& options = {})
    -> Result<volume_decode_result>;

}  // namespace kretz::core
