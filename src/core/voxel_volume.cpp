/**
 * @file voxel_volume.cpp
 * @brief Implementation of the voxel grid
 */

#include "kretz/core/voxel_volume.hpp"

#include <kretz/encoding/byte_order.hpp>

#include <algorithm>

namespace kretz::core {

namespace {

template <typename T>
[[nodiscard]] auto load_sample(const uint8_t* data) noexcept -> double {
    T value{};
    std::memcpy(&value, data, sizeof(T));
    return static_cast<double>(value);
}

}  // namespace

voxel_volume::voxel_volume(vec3<uint32_t> shape, encoding::voxel_type type,
                           std::vector<uint8_t> data)
    : shape_(shape), type_(type), data_(std::move(data)) {}

auto voxel_volume::zeros(vec3<uint32_t> shape, encoding::voxel_type type)
    -> voxel_volume {
    const auto count = static_cast<std::size_t>(shape.x) * shape.y * shape.z;
    return voxel_volume{shape, type,
                        std::vector<uint8_t>(count * encoding::element_size(type), 0)};
}

auto voxel_volume::from_little_endian(vec3<uint32_t> shape, encoding::voxel_type type,
                                      std::vector<uint8_t> bytes)
    -> Result<voxel_volume> {
    const auto count = static_cast<std::size_t>(shape.x) * shape.y * shape.z;
    const auto expected = count * encoding::element_size(type);
    if (bytes.size() != expected) {
        return kretz_error<voxel_volume>(
            error_codes::payload_size_mismatch,
            "Volume data size mismatch: expected " + std::to_string(expected) +
                " bytes, got " + std::to_string(bytes.size()));
    }

    encoding::little_endian_to_host(bytes, encoding::element_size(type));
    return Result<voxel_volume>::ok(voxel_volume{shape, type, std::move(bytes)});
}

auto voxel_volume::value_at(uint32_t x, uint32_t y, uint32_t z) const -> double {
    check_bounds(x, y, z);
    const uint8_t* sample = data_.data() + index_of(x, y, z) * element_size();

    switch (type_) {
        case encoding::voxel_type::uint8:
            return load_sample<uint8_t>(sample);
        case encoding::voxel_type::uint16:
            return load_sample<uint16_t>(sample);
        case encoding::voxel_type::uint32:
            return load_sample<uint32_t>(sample);
        case encoding::voxel_type::int8:
            return load_sample<int8_t>(sample);
        case encoding::voxel_type::int16:
            return load_sample<int16_t>(sample);
        case encoding::voxel_type::int32:
            return load_sample<int32_t>(sample);
        case encoding::voxel_type::float32:
            return load_sample<float>(sample);
        case encoding::voxel_type::float64:
            return load_sample<double>(sample);
    }
    return 0.0;
}

auto voxel_volume::is_zero_filled() const noexcept -> bool {
    return std::all_of(data_.begin(), data_.end(), [](uint8_t b) { return b == 0; });
}

void voxel_volume::check_bounds(uint32_t x, uint32_t y, uint32_t z) const {
    if (!contains(x, y, z)) {
        throw std::out_of_range(
            "voxel_volume: position (" + std::to_string(x) + ", " + std::to_string(y) +
            ", " + std::to_string(z) + ") outside of shape (" +
            std::to_string(shape_.x) + ", " + std::to_string(shape_.y) + ", " +
            std::to_string(shape_.z) + ")");
    }
}

}  // namespace kretz::core
