/**
 * @file volume_decoder_test.cpp
 * @brief Unit tests for voxel payload decoding
 */

#include <catch2/catch_test_macros.hpp>

#include <kretz/core/volume_decoder.hpp>

#include "../fixtures/kretz_file_builder.hpp"

#include <limits>
#include <vector>

using namespace kretz::core;
using kretz::encoding::data_type_tag;
using kretz::encoding::voxel_type;

namespace {

auto make_metadata(vec3<uint32_t> dims, uint8_t data_type, bool compressed)
    -> kretz_metadata {
    kretz_metadata m;
    m.dimensions = dims;
    m.data_type = data_type_tag{data_type};
    m.compressed = compressed;
    return m;
}

}  // namespace

TEST_CASE("expected_voxel_count guards against oversized volumes", "[core][volume_decoder]") {
    reader_options options;

    SECTION("product of the dimensions") {
        auto count = expected_voxel_count(make_metadata({8, 10, 12}, 0, false), options);
        REQUIRE(count.is_ok());
        CHECK(count.value() == 960);
    }

    SECTION("zero dimension gives an empty volume") {
        auto count = expected_voxel_count(make_metadata({0, 10, 12}, 0, false), options);
        REQUIRE(count.is_ok());
        CHECK(count.value() == 0);
    }

    SECTION("configured limit") {
        options.max_voxel_count = 100;
        auto count = expected_voxel_count(make_metadata({5, 5, 5}, 0, false), options);
        REQUIRE(count.is_err());
        CHECK(count.error().code == kretz::error_codes::volume_too_large);
    }

    SECTION("byte size of wide samples") {
        // 2^30 voxels pass the voxel limit; as float64 they need 8 GiB
        auto count =
            expected_voxel_count(make_metadata({1024, 1024, 1024}, 7, false), options);
        REQUIRE(count.is_err());
        CHECK(count.error().code == kretz::error_codes::volume_too_large);

        auto narrow =
            expected_voxel_count(make_metadata({1024, 1024, 1024}, 0, false), options);
        REQUIRE(narrow.is_ok());
        CHECK(narrow.value() == (std::size_t{1} << 30));
    }

    SECTION("64-bit overflow") {
        options.max_voxel_count = std::numeric_limits<uint64_t>::max();
        const auto max32 = std::numeric_limits<uint32_t>::max();
        auto count =
            expected_voxel_count(make_metadata({max32, max32, max32}, 0, false), options);
        REQUIRE(count.is_err());
        CHECK(count.error().code == kretz::error_codes::volume_too_large);
    }
}

TEST_CASE("decode_volume reads uncompressed payloads", "[core][volume_decoder]") {
    SECTION("exact payload") {
        const auto payload = kretz::testing::ramp_u8(24);
        auto result = decode_volume(payload, make_metadata({2, 3, 4}, 0, false));

        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().data_missing);
        CHECK(result.value().decoded_samples == 24);
        CHECK(result.value().volume.at<uint8_t>(1, 2, 3) == 23);
    }

    SECTION("bytes beyond the expected count are ignored") {
        auto payload = kretz::testing::ramp_u8(30);
        auto result = decode_volume(payload, make_metadata({2, 3, 4}, 0, false));

        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().data_missing);
        CHECK(result.value().volume.size() == 24);
    }

    SECTION("float32 samples") {
        std::vector<uint8_t> payload;
        for (float v : {1.5F, -2.0F, 0.0F, 8.25F}) {
            kretz::testing::append_le(payload, v);
        }
        auto result = decode_volume(payload, make_metadata({1, 2, 2}, 6, false));

        REQUIRE(result.is_ok());
        const auto& volume = result.value().volume;
        CHECK(volume.type() == voxel_type::float32);
        CHECK(volume.at<float>(0, 0, 0) == 1.5F);
        CHECK(volume.at<float>(0, 1, 1) == 8.25F);
    }

    SECTION("unknown data type is read as uint8") {
        const std::vector<uint8_t> payload{10, 20, 30, 40};
        auto result = decode_volume(payload, make_metadata({1, 2, 2}, 77, false));

        REQUIRE(result.is_ok());
        CHECK(result.value().volume.type() == voxel_type::uint8);
        CHECK(result.value().volume.value_at(0, 1, 0) == 30.0);
    }
}

TEST_CASE("decode_volume recovers from short payloads", "[core][volume_decoder]") {
    SECTION("uncompressed payload too short") {
        const std::vector<uint8_t> payload(100, 0xAB);
        auto result = decode_volume(payload, make_metadata({4, 4, 4}, 1, false));

        REQUIRE(result.is_ok());
        CHECK(result.value().data_missing);
        CHECK(result.value().decoded_samples == 50);
        CHECK(result.value().volume.shape() == vec3<uint32_t>{4, 4, 4});
        CHECK(result.value().volume.type() == voxel_type::uint16);
        CHECK(result.value().volume.is_zero_filled());
    }

    SECTION("empty payload") {
        auto result = decode_volume({}, make_metadata({2, 2, 2}, 0, false));

        REQUIRE(result.is_ok());
        CHECK(result.value().data_missing);
        CHECK(result.value().volume.size() == 8);
    }

    SECTION("strict mode reports the mismatch") {
        reader_options options;
        options.strict_payload = true;
        const std::vector<uint8_t> payload(7, 1);

        auto result = decode_volume(payload, make_metadata({2, 2, 2}, 0, false), options);
        REQUIRE(result.is_err());
        CHECK(result.error().code == kretz::error_codes::payload_size_mismatch);
    }
}

TEST_CASE("decode_volume expands RLE payloads", "[core][volume_decoder]") {
    SECTION("runs fill the volume") {
        const std::vector<uint8_t> payload{4, 0x11, 4, 0x22};
        auto result = decode_volume(payload, make_metadata({2, 2, 2}, 0, true));

        REQUIRE(result.is_ok());
        CHECK_FALSE(result.value().data_missing);
        CHECK(result.value().volume.at<uint8_t>(0, 1, 1) == 0x11);
        CHECK(result.value().volume.at<uint8_t>(1, 0, 0) == 0x22);
    }

    SECTION("16-bit runs round through the test encoder") {
        std::vector<uint8_t> samples;
        for (uint16_t v : {500, 500, 500, 7, 7, 65000}) {
            kretz::testing::append_le(samples, v);
        }
        const auto payload = kretz::testing::rle_encode(samples, 2);
        auto result = decode_volume(payload, make_metadata({1, 2, 3}, 1, true));

        REQUIRE(result.is_ok());
        auto values = result.value().volume.as<uint16_t>();
        REQUIRE(values.is_ok());
        CHECK(values.value() == std::vector<uint16_t>{500, 500, 500, 7, 7, 65000});
    }

    SECTION("end marker before the volume is full") {
        const std::vector<uint8_t> payload{3, 0x05, 0, 5, 0x06};
        auto result = decode_volume(payload, make_metadata({2, 2, 2}, 0, true));

        REQUIRE(result.is_ok());
        CHECK(result.value().data_missing);
        CHECK(result.value().decoded_samples == 3);
        CHECK(result.value().volume.is_zero_filled());
    }

    SECTION("final run overshooting the volume is a size mismatch") {
        const std::vector<uint8_t> payload{5, 0x07, 5, 0x09};
        auto result = decode_volume(payload, make_metadata({2, 2, 2}, 0, true));

        REQUIRE(result.is_ok());
        CHECK(result.value().data_missing);
        CHECK(result.value().decoded_samples == 10);
        CHECK(result.value().volume.size() == 8);
        CHECK(result.value().volume.is_zero_filled());
    }

    SECTION("overshoot is rejected in strict mode") {
        reader_options options;
        options.strict_payload = true;
        const std::vector<uint8_t> payload{5, 0x07, 5, 0x09};
        auto result = decode_volume(payload, make_metadata({2, 2, 2}, 0, true), options);

        REQUIRE(result.is_err());
        CHECK(result.error().code == kretz::error_codes::payload_size_mismatch);
    }
}
