/**
 * @file kretz_metadata.cpp
 * @brief Implementation of metadata projection helpers
 */

#include "kretz/core/kretz_metadata.hpp"

#include <kretz/compat/format.hpp>

#include <type_traits>

namespace kretz::core {

auto to_entries(const kretz_metadata& metadata) -> std::vector<metadata_entry> {
    std::vector<metadata_entry> entries;
    entries.reserve(15);

    entries.push_back({"version", metadata.version});
    entries.push_back({"frame_count", metadata.frame_count});
    entries.push_back({"dimensions", metadata.dimensions});
    entries.push_back({"spacing", metadata.spacing});
    entries.push_back({"coordinate_system", metadata.coordinate_system.label()});
    entries.push_back({"data_type", metadata.data_type.label()});
    entries.push_back({"compressed", metadata.compressed});
    entries.push_back({"patient_name", metadata.patient_name});
    entries.push_back({"study_date", metadata.study_date});
    entries.push_back({"study_time", metadata.study_time});
    entries.push_back({"acquisition_mode", metadata.acquisition_mode});
    entries.push_back({"system_name", metadata.system_name});
    entries.push_back({"probe_name", metadata.probe_name});
    entries.push_back({"origin", metadata.origin});

    if (metadata.volume_data_missing.has_value()) {
        entries.push_back({"volume_data_missing", *metadata.volume_data_missing});
    }

    return entries;
}

auto to_string(const metadata_value& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, bool>) {
                return v ? "true" : "false";
            } else if constexpr (std::is_same_v<T, uint32_t>) {
                return std::to_string(v);
            } else {
                return kretz::compat::format("({}, {}, {})", v.x, v.y, v.z);
            }
        },
        value);
}

}  // namespace kretz::core
