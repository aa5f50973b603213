/**
 * @file volume_decoder.cpp
 * @brief Implementation of voxel payload decoding
 */

#include "kretz/core/volume_decoder.hpp"

#include <kretz/encoding/compression/rle_codec.hpp>

#include <limits>
#include <string>
#include <vector>

namespace kretz::core {

namespace {

using encoding::compression::rle_codec;

[[nodiscard]] auto describe(const vec3<uint32_t>& d) -> std::string {
    return "(" + std::to_string(d.x) + ", " + std::to_string(d.y) + ", " +
           std::to_string(d.z) + ")";
}

}  // namespace

auto expected_voxel_count(const kretz_metadata& metadata, const reader_options& options)
    -> Result<std::size_t> {
    const auto& d = metadata.dimensions;
    const auto xy = static_cast<uint64_t>(d.x) * d.y;

    // x * y fits in 64 bits; guard the multiplication by z
    const bool overflow =
        d.z != 0 && xy > std::numeric_limits<uint64_t>::max() / d.z;
    const uint64_t count = overflow ? 0 : xy * d.z;

    if (overflow || count > options.max_voxel_count ||
        count > std::numeric_limits<std::size_t>::max() / 8) {
        return kretz_error<std::size_t>(
            error_codes::volume_too_large,
            "Declared volume " + describe(d) + " exceeds the voxel limit of " +
                std::to_string(options.max_voxel_count));
    }

    // count <= SIZE_MAX / 8 here, so the byte size cannot overflow
    const uint64_t width = encoding::element_size(encoding::storage_type(metadata.data_type));
    if (count * width > options.max_volume_bytes) {
        return kretz_error<std::size_t>(
            error_codes::volume_too_large,
            "Declared volume " + describe(d) + " of " + metadata.data_type.label() +
                " samples exceeds the size limit of " +
                std::to_string(options.max_volume_bytes) + " bytes");
    }
    return Result<std::size_t>::ok(static_cast<std::size_t>(count));
}

auto decode_volume(std::span<const uint8_t> payload, const kretz_metadata& metadata,
                   const reader_options& options) -> Result<volume_decode_result> {
    auto count_result = expected_voxel_count(metadata, options);
    if (count_result.is_err()) {
        return Result<volume_decode_result>::err(count_result.error());
    }
    const std::size_t expected = count_result.value();

    const auto type = encoding::storage_type(metadata.data_type);
    const auto width = encoding::element_size(type);

    std::vector<uint8_t> samples;
    std::size_t decoded = 0;

    if (metadata.compressed) {
        // A final run overshooting the volume counts as a size mismatch
        rle_codec codec{width};
        auto rle = codec.decode(payload, expected);
        decoded = rle.sample_count;
        samples = std::move(rle.data);
    } else {
        decoded = payload.size() / width;
        if (decoded > expected) {
            decoded = expected;
        }
        samples.assign(payload.begin(),
                       payload.begin() + static_cast<std::ptrdiff_t>(decoded * width));
    }

    if (decoded != expected) {
        if (options.strict_payload) {
            return kretz_error<volume_decode_result>(
                error_codes::payload_size_mismatch,
                "Volume data size mismatch: expected " + std::to_string(expected) +
                    " samples, decoded " + std::to_string(decoded),
                metadata.compressed ? "compressed payload" : "uncompressed payload");
        }
        return Result<volume_decode_result>::ok(volume_decode_result{
            voxel_volume::zeros(metadata.dimensions, type), true, decoded});
    }

    auto volume = voxel_volume::from_little_endian(metadata.dimensions, type,
                                                   std::move(samples));
    if (volume.is_err()) {
        return Result<volume_decode_result>::err(volume.error());
    }
    return Result<volume_decode_result>::ok(
        volume_decode_result{std::move(volume.value()), false, decoded});
}

}  // namespace kretz::core
