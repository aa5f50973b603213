/**
 * @file reader_options.hpp
 * @brief Configuration of the Kretz file reader
 */

#pragma once

#include <cstdint>

namespace kretz::core {

/**
 * @struct reader_options
 * @brief Options controlling how a Kretz file is decoded
 *
 * With the defaults, payload size mismatches are recovered with a
 * zero-filled volume and the volume_data_missing metadata flag.
 */
struct reader_options {
    /// Upper bound on x * y * z; larger declared volumes are rejected
    uint64_t max_voxel_count{uint64_t{1} << 31};

    /// Upper bound on the decoded volume in bytes (x * y * z * sample width)
    uint64_t max_volume_bytes{uint64_t{1} << 32};

    /// Decode the voxel payload; when false only metadata is read
    bool decode_volume{true};

    /// Return payload_size_mismatch instead of recovering a short payload
    bool strict_payload{false};

    /// Log recovered anomalies (unknown tags, missing volume data)
    bool log_anomalies{true};
};

}  // namespace kretz::core
