/**
 * @file voxel_type.hpp
 * @brief Coordinate system and voxel data type tags of the Kretz header
 *
 * Both tags are stored as a single byte. Known codes map to the enumerations
 * below; any other code is preserved as-is and reported with an
 * "unknown_<code>" label instead of failing the parse.
 */

#ifndef KRETZ_ENCODING_VOXEL_TYPE_HPP
#define KRETZ_ENCODING_VOXEL_TYPE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace kretz::encoding {

/**
 * @brief Spatial geometry convention of the volume.
 */
enum class coordinate_system : uint8_t {
    cartesian = 0,
    toroidal = 1,     ///< Native geometry of mechanically swept 3D probes
    spherical = 2,
    cylindrical = 3
};

/**
 * @brief Numeric representation of a single voxel sample.
 */
enum class voxel_type : uint8_t {
    uint8 = 0,
    uint16 = 1,
    uint32 = 2,
    int8 = 3,
    int16 = 4,
    int32 = 5,
    float32 = 6,
    float64 = 7
};

/**
 * @brief Returns the label of a coordinate system ("cartesian", ...).
 */
[[nodiscard]] auto to_string(coordinate_system cs) noexcept -> std::string_view;

/**
 * @brief Returns the label of a voxel type ("uint8", "float32", ...).
 */
[[nodiscard]] auto to_string(voxel_type type) noexcept -> std::string_view;

/**
 * @brief Width of one sample of the given type in bytes.
 */
[[nodiscard]] constexpr auto element_size(voxel_type type) noexcept -> std::size_t {
    switch (type) {
        case voxel_type::uint8:
        case voxel_type::int8:
            return 1;
        case voxel_type::uint16:
        case voxel_type::int16:
            return 2;
        case voxel_type::uint32:
        case voxel_type::int32:
        case voxel_type::float32:
            return 4;
        case voxel_type::float64:
            return 8;
    }
    return 1;
}

[[nodiscard]] constexpr auto is_signed(voxel_type type) noexcept -> bool {
    return type == voxel_type::int8 || type == voxel_type::int16 ||
           type == voxel_type::int32 || type == voxel_type::float32 ||
           type == voxel_type::float64;
}

[[nodiscard]] constexpr auto is_floating_point(voxel_type type) noexcept -> bool {
    return type == voxel_type::float32 || type == voxel_type::float64;
}

/**
 * @brief Highest code with a named value, per tag enumeration.
 */
template <typename Enum>
struct tag_traits;

template <>
struct tag_traits<coordinate_system> {
    static constexpr uint8_t max_code = 3;
};

template <>
struct tag_traits<voxel_type> {
    static constexpr uint8_t max_code = 7;
};

/**
 * @brief A one-byte enumerated header tag that tolerates unknown codes.
 *
 * The raw code is always kept, so an unrecognized value can still be
 * reported exactly.
 *
 * @example
 * @code
 * coordinate_system_tag tag{uint8_t{1}};
 * tag.label();        // "toroidal"
 * coordinate_system_tag odd{uint8_t{42}};
 * odd.is_known();     // false
 * odd.label();        // "unknown_42"
 * @endcode
 */
template <typename Enum>
class enumerated_tag {
public:
    constexpr enumerated_tag() noexcept = default;

    constexpr explicit enumerated_tag(uint8_t code) noexcept : code_(code) {}

    constexpr explicit enumerated_tag(Enum value) noexcept
        : code_(static_cast<uint8_t>(value)) {}

    /// Raw byte as stored in the header
    [[nodiscard]] constexpr auto code() const noexcept -> uint8_t { return code_; }

    [[nodiscard]] constexpr auto is_known() const noexcept -> bool {
        return code_ <= tag_traits<Enum>::max_code;
    }

    /// The named value, or nullopt for an unrecognized code
    [[nodiscard]] constexpr auto value() const noexcept -> std::optional<Enum> {
        if (!is_known()) {
            return std::nullopt;
        }
        return static_cast<Enum>(code_);
    }

    /// Named label, or "unknown_<code>"
    [[nodiscard]] auto label() const -> std::string {
        if (const auto v = value()) {
            return std::string(to_string(*v));
        }
        return "unknown_" + std::to_string(code_);
    }

    friend constexpr bool operator==(const enumerated_tag&,
                                     const enumerated_tag&) noexcept = default;

private:
    uint8_t code_{0};
};

using coordinate_system_tag = enumerated_tag<coordinate_system>;
using data_type_tag = enumerated_tag<voxel_type>;

/**
 * @brief Type used to store samples for a data type tag.
 *
 * Unknown data types are read as uint8.
 */
[[nodiscard]] constexpr auto storage_type(data_type_tag tag) noexcept -> voxel_type {
    return tag.value().value_or(voxel_type::uint8);
}

/**
 * @brief Maps a C++ sample type to its voxel_type.
 */
template <typename T>
struct voxel_type_of;

template <> struct voxel_type_of<uint8_t>  { static constexpr auto value = voxel_type::uint8; };
template <> struct voxel_type_of<uint16_t> { static constexpr auto value = voxel_type::uint16; };
template <> struct voxel_type_of<uint32_t> { static constexpr auto value = voxel_type::uint32; };
template <> struct voxel_type_of<int8_t>   { static constexpr auto value = voxel_type::int8; };
template <> struct voxel_type_of<int16_t>  { static constexpr auto value = voxel_type::int16; };
template <> struct voxel_type_of<int32_t>  { static constexpr auto value = voxel_type::int32; };
template <> struct voxel_type_of<float>    { static constexpr auto value = voxel_type::float32; };
template <> struct voxel_type_of<double>   { static constexpr auto value = voxel_type::float64; };

template <typename T>
inline constexpr voxel_type voxel_type_v = voxel_type_of<T>::value;

/**
 * @brief Sample types a volume can be viewed as.
 */
template <typename T>
concept voxel_sample = requires { voxel_type_of<T>::value; };

}  // namespace kretz::encoding

#endif  // KRETZ_ENCODING_VOXEL_TYPE_HPP
