/**
 * @file kretz_file.hpp
 * @brief Loader for Kretz (KRETZFILE) 3D ultrasound volume files
 *
 * A Kretz file consists of:
 * - a fixed 256-byte header region starting with the "KRETZFILE" signature
 * - the voxel payload from offset 256, raw or run-length encoded
 *
 * @see header_decoder.hpp for the header layout
 */

#pragma once

#include "kretz_metadata.hpp"
#include "reader_options.hpp"
#include "voxel_volume.hpp"

#include <kretz/core/result.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace kretz::core {

/**
 * @brief A decoded Kretz volume file
 *
 * open() performs the whole decode eagerly: on success both the metadata and
 * the voxel volume are populated, otherwise an error is returned and no
 * object exists. A kretz_file never changes after construction and every
 * accessor returns an independent copy, so instances may be shared between
 * threads.
 *
 * @example
 * @code
 * auto result = kretz_file::open("scan.vol");
 * if (result.is_err()) {
 *     std::cerr << result.error().message << "\n";
 *     return;
 * }
 * const auto& file = result.value();
 * auto [x, y, z] = file.dimensions();
 * std::cout << file << "\n";
 * @endcode
 */
class kretz_file {
public:
    // ========================================================================
    // Static Factory Methods
    // ========================================================================

    /**
     * @brief Open and decode a Kretz file from disk
     *
     * @param path Path to the file
     * @param options Reader options
     * @return The decoded file, or one of file_not_found, not_a_regular_file,
     *         file_read_error, invalid_signature, truncated_header,
     *         volume_too_large, payload_size_mismatch (strict mode only)
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path,
                                   const reader_options& options = {})
        -> Result<kretz_file>;

    /**
     * @brief Decode a Kretz file held in memory
     * @param data Complete file contents
     * @param options Reader options
     */
    [[nodiscard]] static auto from_bytes(std::span<const uint8_t> data,
                                         const reader_options& options = {})
        -> Result<kretz_file>;

    // ========================================================================
    // Accessors
    // ========================================================================

    /// Path the file was opened from (empty for from_bytes)
    [[nodiscard]] auto path() const -> std::filesystem::path { return path_; }

    [[nodiscard]] auto metadata() const -> kretz_metadata { return metadata_; }

    /**
     * @brief Metadata as an ordered list of named entries
     * @see to_entries()
     */
    [[nodiscard]] auto metadata_entries() const -> std::vector<metadata_entry>;

    /**
     * @brief Copy of the voxel volume
     * @return The volume, or volume_not_loaded when the payload was not
     *         decoded (reader_options::decode_volume was false)
     */
    [[nodiscard]] auto volume() const -> Result<voxel_volume>;

    [[nodiscard]] auto has_volume() const noexcept -> bool { return volume_.has_value(); }

    /// Voxel counts (x, y, z)
    [[nodiscard]] auto dimensions() const -> std::array<uint32_t, 3>;

    /// Voxel spacing (x, y, z) in millimetres
    [[nodiscard]] auto spacing() const -> std::array<float, 3>;

    [[nodiscard]] auto origin() const -> std::array<float, 3>;

    /// Coordinate system label, e.g. "cartesian" or "unknown_9"
    [[nodiscard]] auto coordinate_system() const -> std::string;

    [[nodiscard]] auto patient_info() const -> core::patient_info {
        return metadata_.patient();
    }

    [[nodiscard]] auto system_info() const -> core::system_info {
        return metadata_.system();
    }

    /// True if the payload was short and the volume was zero-filled
    [[nodiscard]] auto volume_data_missing() const noexcept -> bool {
        return metadata_.volume_data_missing.value_or(false);
    }

    /**
     * @brief One-line summary
     *
     * Format:
     * kretz_file(file='scan.vol', dimensions=(8, 10, 12), coordinate_system='cartesian')
     */
    [[nodiscard]] auto to_string() const -> std::string;

    // ========================================================================
    // Construction
    // ========================================================================

    kretz_file(const kretz_file&) = default;
    kretz_file(kretz_file&&) noexcept = default;
    auto operator=(const kretz_file&) -> kretz_file& = default;
    auto operator=(kretz_file&&) noexcept -> kretz_file& = default;
    ~kretz_file() = default;

private:
    kretz_file(std::filesystem::path path, kretz_metadata metadata,
               std::optional<voxel_volume> volume);

    [[nodiscard]] static auto assemble(std::filesystem::path path,
                                       kretz_metadata metadata,
                                       std::span<const uint8_t> payload,
                                       const reader_options& options)
        -> Result<kretz_file>;

    std::filesystem::path path_;
    kretz_metadata metadata_;
    std::optional<voxel_volume> volume_;
};

auto operator<<(std::ostream& os, const kretz_file& file) -> std::ostream&;

}  // namespace kretz::core
