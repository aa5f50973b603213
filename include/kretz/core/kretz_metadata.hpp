/**
 * @file kretz_metadata.hpp
 * @brief Decoded metadata of a Kretz volume file
 *
 * kretz_metadata holds every field of the 256-byte header region plus the
 * recovery flag set by the volume decoder. It is a plain value type: copies
 * are fully independent.
 */

#pragma once

#include <kretz/encoding/voxel_type.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kretz::core {

/**
 * @brief Three components along the x, y and z axes
 */
template <typename T>
struct vec3 {
    T x{};
    T y{};
    T z{};

    friend constexpr bool operator==(const vec3&, const vec3&) noexcept = default;
};

/**
 * @brief Patient and study identification
 */
struct patient_info {
    std::string patient_name;
    std::string study_date;
    std::string study_time;

    friend bool operator==(const patient_info&, const patient_info&) = default;
};

/**
 * @brief Scanner and probe identification
 */
struct system_info {
    std::string system_name;
    std::string probe_name;

    friend bool operator==(const system_info&, const system_info&) = default;
};

/**
 * @brief All metadata decoded from a Kretz file
 */
struct kretz_metadata {
    /// Format version (3 characters, e.g. "1.0")
    std::string version;

    uint32_t frame_count{0};

    /// Voxel counts along x, y and z
    vec3<uint32_t> dimensions;

    /// Voxel spacing in millimetres
    vec3<float> spacing;

    encoding::coordinate_system_tag coordinate_system;
    encoding::data_type_tag data_type;
    bool compressed{false};

    std::string patient_name;
    std::string study_date;
    std::string study_time;
    std::string acquisition_mode;
    std::string system_name;
    std::string probe_name;

    vec3<float> origin;

    /// Set to true only when the voxel payload could not be fully decoded
    std::optional<bool> volume_data_missing;

    /**
     * @brief Number of voxels declared by the dimensions (x * y * z)
     *
     * Computed in 64 bits; the product of three 32-bit values can still
     * wrap, so callers that allocate must check for overflow separately.
     */
    [[nodiscard]] auto voxel_count() const noexcept -> uint64_t {
        return static_cast<uint64_t>(dimensions.x) * dimensions.y * dimensions.z;
    }

    [[nodiscard]] auto patient() const -> patient_info {
        return {patient_name, study_date, study_time};
    }

    [[nodiscard]] auto system() const -> system_info {
        return {system_name, probe_name};
    }
};

/**
 * @brief Value of one metadata entry
 */
using metadata_value =
    std::variant<std::string, uint32_t, bool, vec3<uint32_t>, vec3<float>>;

/**
 * @brief A named metadata value
 */
struct metadata_entry {
    std::string name;
    metadata_value value;
};

/**
 * @brief Projects metadata into an ordered list of named entries
 *
 * Entries follow the header layout order: version, frame_count, dimensions,
 * spacing, coordinate_system, data_type, compressed, patient_name,
 * study_date, study_time, acquisition_mode, system_name, probe_name, origin
 * and, when set, volume_data_missing. Tags are reported by label.
 */
[[nodiscard]] auto to_entries(const kretz_metadata& metadata)
    -> std::vector<metadata_entry>;

/**
 * @brief Renders a metadata value as text
 *
 * Triples are rendered as "(x, y, z)", booleans as "true"/"false".
 */
[[nodiscard]] auto to_string(const metadata_value& value) -> std::string;

}  // namespace kretz::core
