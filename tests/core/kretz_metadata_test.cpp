/**
 * @file kretz_metadata_test.cpp
 * @brief Unit tests for metadata projection
 */

#include <catch2/catch_test_macros.hpp>

#include <kretz/core/kretz_metadata.hpp>

#include <string>
#include <vector>

using namespace kretz::core;

namespace {

auto sample_metadata() -> kretz_metadata {
    kretz_metadata m;
    m.version = "1.0";
    m.frame_count = 1;
    m.dimensions = {8, 10, 12};
    m.spacing = {0.5F, 0.5F, 1.25F};
    m.coordinate_system = kretz::encoding::coordinate_system_tag{uint8_t{3}};
    m.data_type = kretz::encoding::data_type_tag{uint8_t{42}};
    m.patient_name = "John Doe";
    m.system_name = "GE Voluson";
    m.probe_name = "4D Probe";
    return m;
}

}  // namespace

TEST_CASE("to_entries lists fields in header order", "[core][metadata]") {
    const auto entries = to_entries(sample_metadata());

    const std::vector<std::string> expected{
        "version",      "frame_count",  "dimensions",       "spacing",
        "coordinate_system", "data_type", "compressed",     "patient_name",
        "study_date",   "study_time",   "acquisition_mode", "system_name",
        "probe_name",   "origin"};

    REQUIRE(entries.size() == expected.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        CHECK(entries[i].name == expected[i]);
    }
}

TEST_CASE("to_entries renders tags by label", "[core][metadata]") {
    const auto entries = to_entries(sample_metadata());

    CHECK(std::get<std::string>(entries[4].value) == "cylindrical");
    CHECK(std::get<std::string>(entries[5].value) == "unknown_42");
    CHECK(std::get<bool>(entries[6].value) == false);
    CHECK(std::get<uint32_t>(entries[1].value) == 1);
}

TEST_CASE("to_entries includes volume_data_missing only when set", "[core][metadata]") {
    auto m = sample_metadata();
    CHECK(to_entries(m).size() == 14);

    m.volume_data_missing = true;
    const auto entries = to_entries(m);
    REQUIRE(entries.size() == 15);
    CHECK(entries.back().name == "volume_data_missing");
    CHECK(std::get<bool>(entries.back().value));
}

TEST_CASE("metadata values render as text", "[core][metadata]") {
    CHECK(to_string(metadata_value{vec3<uint32_t>{8, 10, 12}}) == "(8, 10, 12)");
    CHECK(to_string(metadata_value{vec3<float>{0.5F, 0.5F, 1.25F}}) == "(0.5, 0.5, 1.25)");
    CHECK(to_string(metadata_value{true}) == "true");
    CHECK(to_string(metadata_value{uint32_t{960}}) == "960");
    CHECK(to_string(metadata_value{std::string{"GE"}}) == "GE");
}

TEST_CASE("patient and system groupings", "[core][metadata]") {
    const auto m = sample_metadata();

    CHECK(m.patient() == patient_info{"John Doe", "", ""});
    CHECK(m.system() == system_info{"GE Voluson", "4D Probe"});
}
