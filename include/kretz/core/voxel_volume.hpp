/**
 * @file voxel_volume.hpp
 * @brief Three-dimensional voxel grid decoded from a Kretz file
 */

#pragma once

#include "kretz_metadata.hpp"

#include <kretz/core/result.hpp>
#include <kretz/encoding/voxel_type.hpp>

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace kretz::core {

/**
 * @brief A dense (x, y, z) grid of samples of one voxel_type
 *
 * Samples are kept in host byte order in C order over (x, y, z): the
 * sample at (ix, iy, iz) is element ((ix * y) + iy) * z + iz, so z varies
 * fastest in memory.
 *
 * voxel_volume is a value type. Copies own their buffer; modifying a copy
 * never affects the original.
 *
 * @example
 * @code
 * auto file = kretz_file::open("scan.vol");
 * if (file.is_ok()) {
 *     auto volume = file.value().volume();
 *     if (volume.is_ok()) {
 *         double v = volume.value().value_at(1, 2, 3);
 *     }
 * }
 * @endcode
 */
class voxel_volume {
public:
    voxel_volume() = default;

    /**
     * @brief Creates a volume whose samples are all zero
     */
    [[nodiscard]] static auto zeros(vec3<uint32_t> shape, encoding::voxel_type type)
        -> voxel_volume;

    /**
     * @brief Creates a volume from little-endian sample bytes
     * @param shape Grid dimensions
     * @param type Sample type
     * @param bytes Exactly x * y * z * element_size(type) bytes
     * @return The volume, or payload_size_mismatch if the byte count is wrong
     */
    [[nodiscard]] static auto from_little_endian(vec3<uint32_t> shape,
                                                 encoding::voxel_type type,
                                                 std::vector<uint8_t> bytes)
        -> Result<voxel_volume>;

    [[nodiscard]] auto shape() const noexcept -> vec3<uint32_t> { return shape_; }
    [[nodiscard]] auto type() const noexcept -> encoding::voxel_type { return type_; }

    [[nodiscard]] auto element_size() const noexcept -> std::size_t {
        return encoding::element_size(type_);
    }

    /// Number of samples
    [[nodiscard]] auto size() const noexcept -> std::size_t {
        return data_.size() / element_size();
    }

    [[nodiscard]] auto byte_size() const noexcept -> std::size_t { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /**
     * @brief Flat index of (x, y, z); does not check bounds
     */
    [[nodiscard]] auto index_of(uint32_t x, uint32_t y, uint32_t z) const noexcept
        -> std::size_t {
        return (static_cast<std::size_t>(x) * shape_.y + y) * shape_.z + z;
    }

    [[nodiscard]] auto contains(uint32_t x, uint32_t y, uint32_t z) const noexcept -> bool {
        return x < shape_.x && y < shape_.y && z < shape_.z;
    }

    /**
     * @brief Sample at (x, y, z) converted to double
     * @throws std::out_of_range if the position is outside the grid
     */
    [[nodiscard]] auto value_at(uint32_t x, uint32_t y, uint32_t z) const -> double;

    /**
     * @brief Sample at (x, y, z) as its native type
     * @tparam T Must match type()
     * @throws std::invalid_argument if T does not match the sample type
     * @throws std::out_of_range if the position is outside the grid
     */
    template <encoding::voxel_sample T>
    [[nodiscard]] auto at(uint32_t x, uint32_t y, uint32_t z) const -> T {
        if (encoding::voxel_type_v<T> != type_) {
            throw std::invalid_argument(
                "voxel_volume::at: requested " +
                std::string(encoding::to_string(encoding::voxel_type_v<T>)) +
                ", volume holds " + std::string(encoding::to_string(type_)));
        }
        check_bounds(x, y, z);
        T value{};
        std::memcpy(&value, data_.data() + index_of(x, y, z) * sizeof(T), sizeof(T));
        return value;
    }

    /**
     * @brief Copies all samples into a flat vector
     * @tparam T Must match type()
     * @return The samples in C order, or type_mismatch
     */
    template <encoding::voxel_sample T>
    [[nodiscard]] auto as() const -> Result<std::vector<T>> {
        if (encoding::voxel_type_v<T> != type_) {
            return kretz_error<std::vector<T>>(
                error_codes::type_mismatch,
                "Requested " + std::string(encoding::to_string(encoding::voxel_type_v<T>)) +
                    " samples from a " + std::string(encoding::to_string(type_)) +
                    " volume");
        }
        std::vector<T> samples(size());
        if (!data_.empty()) {
            std::memcpy(samples.data(), data_.data(), data_.size());
        }
        return Result<std::vector<T>>::ok(std::move(samples));
    }

    /**
     * @brief Copy of the raw sample bytes (host byte order)
     */
    [[nodiscard]] auto bytes() const -> std::vector<uint8_t> { return data_; }

    /**
     * @brief True if every byte of the buffer is zero
     */
    [[nodiscard]] auto is_zero_filled() const noexcept -> bool;

private:
    voxel_volume(vec3<uint32_t> shape, encoding::voxel_type type,
                 std::vector<uint8_t> data);

    void check_bounds(uint32_t x, uint32_t y, uint32_t z) const;

    vec3<uint32_t> shape_;
    encoding::voxel_type type_{encoding::voxel_type::uint8};
    std::vector<uint8_t> data_;
};

}  // namespace kretz::core
