/**
 * @file header_decoder.cpp
 * @brief Implementation of the fixed header decoder
 */

#include "kretz/core/header_decoder.hpp"

#include <kretz/encoding/byte_order.hpp>
#include <kretz/encoding/text_field.hpp>

#include <algorithm>
#include <array>
#include <cstring>
#include <string>

namespace kretz::core {

namespace {

using encoding::read_le32;
using encoding::read_le_f32;

[[nodiscard]] auto read_u32_triple(std::span<const uint8_t> bytes) -> vec3<uint32_t> {
    return {read_le32(bytes.data()), read_le32(bytes.data() + 4),
            read_le32(bytes.data() + 8)};
}

[[nodiscard]] auto read_f32_triple(std::span<const uint8_t> bytes) -> vec3<float> {
    return {read_le_f32(bytes.data()), read_le_f32(bytes.data() + 4),
            read_le_f32(bytes.data() + 8)};
}

constexpr std::array<header_field, 14> kLayout{{
    {"version", 9, 3,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.version = encoding::decode_utf8_lossy(b);
     }},
    {"frame_count", 16, 4,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.frame_count = read_le32(b.data());
     }},
    {"dimensions", 20, 12,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.dimensions = read_u32_triple(b);
     }},
    {"spacing", 32, 12,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.spacing = read_f32_triple(b);
     }},
    {"coordinate_system", 44, 1,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.coordinate_system = encoding::coordinate_system_tag{b[0]};
     }},
    {"data_type", 45, 1,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.data_type = encoding::data_type_tag{b[0]};
     }},
    {"compressed", 46, 1,
     [](std::span<const uint8_t> b, kretz_metadata& m) { m.compressed = b[0] != 0; }},
    {"patient_name", 48, 64,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.patient_name = encoding::decode_text_field(b);
     }},
    {"study_date", 112, 16,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.study_date = encoding::decode_text_field(b);
     }},
    {"study_time", 128, 16,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.study_time = encoding::decode_text_field(b);
     }},
    {"acquisition_mode", 144, 32,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.acquisition_mode = encoding::decode_text_field(b);
     }},
    {"system_name", 176, 32,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.system_name = encoding::decode_text_field(b);
     }},
    {"probe_name", 208, 32,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.probe_name = encoding::decode_text_field(b);
     }},
    {"origin", 240, 12,
     [](std::span<const uint8_t> b, kretz_metadata& m) {
         m.origin = read_f32_triple(b);
     }},
}};

static_assert(std::all_of(kLayout.begin(), kLayout.end(),
                          [](const header_field& f) { return f.offset + f.size <= kHeaderSize; }),
              "header field outside of the header region");

}  // namespace

auto header_layout() noexcept -> std::span<const header_field> {
    return kLayout;
}

auto check_signature(std::span<const uint8_t> data) -> VoidResult {
    const auto available = std::min(data.size(), kMagic.size());
    const auto actual = data.first(available);

    if (available == kMagic.size() &&
        std::memcmp(actual.data(), kMagic.data(), kMagic.size()) == 0) {
        return kretz::ok();
    }

    return kretz_void_error(
        error_codes::invalid_signature,
        "Invalid Kretzfile format. Expected magic string '" + std::string(kMagic) +
            "', got '" + encoding::decode_utf8_lossy(actual) + "'");
}

auto decode_header(std::span<const uint8_t> data) -> Result<kretz_metadata> {
    auto signature = check_signature(data);
    if (signature.is_err()) {
        return Result<kretz_metadata>::err(signature.error());
    }

    if (data.size() < kHeaderSize) {
        return kretz_error<kretz_metadata>(
            error_codes::truncated_header,
            "Header region truncated: expected " + std::to_string(kHeaderSize) +
                " bytes, got " + std::to_string(data.size()));
    }

    kretz_metadata metadata;
    for (const auto& field : kLayout) {
        field.decode(data.subspan(field.offset, field.size), metadata);
    }

    return Result<kretz_metadata>::ok(std::move(metadata));
}

}  // namespace kretz::core
