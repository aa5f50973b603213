#include "kretz/encoding/voxel_type.hpp"

namespace kretz::encoding {

auto to_string(coordinate_system cs) noexcept -> std::string_view {
    switch (cs) {
        case coordinate_system::cartesian:
            return "cartesian";
        case coordinate_system::toroidal:
            return "toroidal";
        case coordinate_system::spherical:
            return "spherical";
        case coordinate_system::cylindrical:
            return "cylindrical";
    }
    return "unknown";
}

auto to_string(voxel_type type) noexcept -> std::string_view {
    switch (type) {
        case voxel_type::uint8:
            return "uint8";
        case voxel_type::uint16:
            return "uint16";
        case voxel_type::uint32:
            return "uint32";
        case voxel_type::int8:
            return "int8";
        case voxel_type::int16:
            return "int16";
        case voxel_type::int32:
            return "int32";
        case voxel_type::float32:
            return "float32";
        case voxel_type::float64:
            return "float64";
    }
    return "unknown";
}

}  // namespace kretz::encoding
