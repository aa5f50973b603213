/**
 * @file kretz_file.cpp
 * @brief Implementation of the Kretz file loader
 */

#include "kretz/core/kretz_file.hpp"

#include "kretz/core/header_decoder.hpp"
#include "kretz/core/volume_decoder.hpp"

#include <kretz/compat/format.hpp>
#include <kretz/integration/logger_adapter.hpp>

#include <algorithm>
#include <fstream>
#include <system_error>

namespace kretz::core {

using integration::logger_adapter;

namespace {

/**
 * @brief Reads up to @p max_bytes from @p file at its current position
 */
[[nodiscard]] auto read_up_to(std::ifstream& file, std::uintmax_t max_bytes)
    -> std::vector<uint8_t> {
    std::vector<uint8_t> buffer(static_cast<size_t>(max_bytes));
    file.read(reinterpret_cast<char*>(buffer.data()),
              static_cast<std::streamsize>(buffer.size()));
    buffer.resize(static_cast<size_t>(file.gcount()));
    return buffer;
}

/**
 * @brief Bytes of payload worth reading for the declared volume
 *
 * Uncompressed payloads never need more than count * width bytes. An RLE
 * stream has no upper bound other than the file itself.
 */
[[nodiscard]] auto payload_read_limit(const kretz_metadata& metadata, size_t voxel_count,
                                      std::uintmax_t available) -> std::uintmax_t {
    if (metadata.compressed) {
        return available;
    }
    const auto width = encoding::element_size(encoding::storage_type(metadata.data_type));
    return std::min<std::uintmax_t>(available,
                                    static_cast<std::uintmax_t>(voxel_count) * width);
}

void log_unknown_tags(const std::string& source, const kretz_metadata& metadata) {
    if (!metadata.coordinate_system.is_known()) {
        logger_adapter::warn("{}: unrecognized coordinate system code {}", source,
                             metadata.coordinate_system.code());
    }
    if (!metadata.data_type.is_known()) {
        logger_adapter::warn("{}: unrecognized data type code {}, reading samples as uint8",
                             source, metadata.data_type.code());
    }
}

[[nodiscard]] auto source_name(const std::filesystem::path& path) -> std::string {
    return path.empty() ? std::string{"<memory>"} : path.string();
}

template <typename T>
[[nodiscard]] auto log_failure(const std::string& source, Result<T> result) -> Result<T> {
    if (result.is_err()) {
        logger_adapter::error("Failed to load {}: {}", source, result.error().message);
    }
    return result;
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

kretz_file::kretz_file(std::filesystem::path path, kretz_metadata metadata,
                       std::optional<voxel_volume> volume)
    : path_(std::move(path)), metadata_(std::move(metadata)), volume_(std::move(volume)) {}

// ============================================================================
// Static Factory Methods
// ============================================================================

auto kretz_file::open(const std::filesystem::path& path, const reader_options& options)
    -> Result<kretz_file> {
    const auto source = source_name(path);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return log_failure(source, kretz_error<kretz_file>(
                                       error_codes::file_not_found,
                                       "File not found: " + path.string()));
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return log_failure(source, kretz_error<kretz_file>(
                                       error_codes::not_a_regular_file,
                                       "Not a regular file: " + path.string()));
    }

    const auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        return log_failure(source, kretz_error<kretz_file>(
                                       error_codes::file_read_error,
                                       "Failed to read file: " + path.string(),
                                       ec.message()));
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return log_failure(source, kretz_error<kretz_file>(
                                       error_codes::file_read_error,
                                       "Failed to open file: " + path.string()));
    }

    const auto header = read_up_to(file, std::min<std::uintmax_t>(file_size, kHeaderSize));
    if (file.bad()) {
        return log_failure(source, kretz_error<kretz_file>(
                                       error_codes::file_read_error,
                                       "Failed to read file: " + path.string()));
    }

    auto metadata = decode_header(header);
    if (metadata.is_err()) {
        return log_failure(source, Result<kretz_file>::err(metadata.error()));
    }

    std::vector<uint8_t> payload;
    if (options.decode_volume) {
        auto count = expected_voxel_count(metadata.value(), options);
        if (count.is_err()) {
            return log_failure(source, Result<kretz_file>::err(count.error()));
        }
        const auto available = file_size > kHeaderSize ? file_size - kHeaderSize : 0;
        payload = read_up_to(file, payload_read_limit(metadata.value(), count.value(),
                                                      available));
        if (file.bad()) {
            return log_failure(source, kretz_error<kretz_file>(
                                           error_codes::file_read_error,
                                           "Failed to read voxel data: " + path.string()));
        }
    }

    return log_failure(source,
                       assemble(path, std::move(metadata.value()), payload, options));
}

auto kretz_file::from_bytes(std::span<const uint8_t> data, const reader_options& options)
    -> Result<kretz_file> {
    auto metadata = decode_header(data);
    if (metadata.is_err()) {
        return log_failure(source_name({}), Result<kretz_file>::err(metadata.error()));
    }

    const auto payload = data.size() > kHeaderSize ? data.subspan(kHeaderSize)
                                                   : std::span<const uint8_t>{};
    return log_failure(source_name({}),
                       assemble({}, std::move(metadata.value()), payload, options));
}

auto kretz_file::assemble(std::filesystem::path path, kretz_metadata metadata,
                          std::span<const uint8_t> payload, const reader_options& options)
    -> Result<kretz_file> {
    const auto source = source_name(path);
    if (options.log_anomalies) {
        log_unknown_tags(source, metadata);
    }

    if (!options.decode_volume) {
        logger_adapter::debug("Loaded header of {} (voxel data not decoded)", source);
        return Result<kretz_file>::ok(
            kretz_file{std::move(path), std::move(metadata), std::nullopt});
    }

    auto decoded = decode_volume(payload, metadata, options);
    if (decoded.is_err()) {
        return Result<kretz_file>::err(decoded.error());
    }

    auto& result = decoded.value();
    if (result.data_missing) {
        metadata.volume_data_missing = true;
        if (options.log_anomalies) {
            logger_adapter::warn(
                "{}: volume data missing, expected {} voxels but decoded {}; "
                "volume filled with zeros",
                source, metadata.voxel_count(), result.decoded_samples);
        }
    }

    logger_adapter::debug("Loaded {}: dimensions=({}, {}, {}) type={} compressed={}", source,
                          metadata.dimensions.x, metadata.dimensions.y,
                          metadata.dimensions.z, metadata.data_type.label(),
                          metadata.compressed);

    return Result<kretz_file>::ok(
        kretz_file{std::move(path), std::move(metadata), std::move(result.volume)});
}

// ============================================================================
// Accessors
// ============================================================================

auto kretz_file::metadata_entries() const -> std::vector<metadata_entry> {
    return to_entries(metadata_);
}

auto kretz_file::volume() const -> Result<voxel_volume> {
    if (!volume_) {
        return kretz_error<voxel_volume>(error_codes::volume_not_loaded,
                                         "Volume data not loaded");
    }
    return Result<voxel_volume>::ok(*volume_);
}

auto kretz_file::dimensions() const -> std::array<uint32_t, 3> {
    const auto& d = metadata_.dimensions;
    return {d.x, d.y, d.z};
}

auto kretz_file::spacing() const -> std::array<float, 3> {
    const auto& s = metadata_.spacing;
    return {s.x, s.y, s.z};
}

auto kretz_file::origin() const -> std::array<float, 3> {
    const auto& o = metadata_.origin;
    return {o.x, o.y, o.z};
}

auto kretz_file::coordinate_system() const -> std::string {
    return metadata_.coordinate_system.label();
}

auto kretz_file::to_string() const -> std::string {
    const auto& d = metadata_.dimensions;
    return kretz::compat::format(
        "kretz_file(file='{}', dimensions=({}, {}, {}), coordinate_system='{}')",
        path_.filename().string(), d.x, d.y, d.z, coordinate_system());
}

auto operator<<(std::ostream& os, const kretz_file& file) -> std::ostream& {
    return os << file.to_string();
}

}  // namespace kretz::core
