/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <kretz/integration/logger_adapter.hpp>
#include <kretz/core/kretz_file.hpp>

#include "../fixtures/kretz_file_builder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <vector>

using namespace kretz::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "kretz_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

void cleanup_temp_directory(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

auto quiet_config(const std::filesystem::path& dir) -> logger_config {
    logger_config config;
    config.log_directory = dir;
    config.enable_console = false;
    config.enable_file = true;
    return config;
}

}  // namespace

// =============================================================================
// Initialization Tests
// =============================================================================

TEST_CASE("logger_adapter initialization and shutdown", "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();

    SECTION("Basic initialization") {
        logger_adapter::initialize(quiet_config(temp_dir));
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("Multiple initialization calls are safe") {
        auto config = quiet_config(temp_dir);
        logger_adapter::initialize(config);
        logger_adapter::initialize(config);
        REQUIRE(logger_adapter::is_initialized());

        logger_adapter::shutdown();
    }

    SECTION("Shutdown without initialization is safe") {
        logger_adapter::shutdown();
        REQUIRE_FALSE(logger_adapter::is_initialized());
    }

    SECTION("File output creates the log directory") {
        auto nested = temp_dir / "nested" / "logs";
        logger_adapter::initialize(quiet_config(nested));
        logger_adapter::shutdown();

        CHECK(std::filesystem::is_directory(nested));
    }

    cleanup_temp_directory(temp_dir);
}

TEST_CASE("logger_adapter is silent until initialized", "[logger_adapter][init]") {
    logger_adapter::shutdown();

    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::error));
    CHECK_FALSE(logger_adapter::is_level_enabled(log_level::fatal));

    // Dropped without a logger; must not throw
    CHECK_NOTHROW(logger_adapter::warn("dropped {}", 1));
    CHECK_NOTHROW(logger_adapter::flush());
}

// =============================================================================
// Standard Logging Tests
// =============================================================================

TEST_CASE("logger_adapter standard logging", "[logger_adapter][logging]") {
    auto config = quiet_config(create_temp_log_directory());
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);

    SECTION("Log at different levels") {
        logger_adapter::trace("Trace message: {}", 1);
        logger_adapter::debug("Debug message: {}", 2);
        logger_adapter::info("Info message: {}", 3);
        logger_adapter::warn("Warn message: {}", 4);
        logger_adapter::error("Error message: {}", 5);

        logger_adapter::flush();
        CHECK(std::filesystem::exists(config.log_directory));
    }

    SECTION("Log level filtering") {
        logger_adapter::set_min_level(log_level::warn);
        REQUIRE(logger_adapter::get_min_level() == log_level::warn);

        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::trace));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
        REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
        REQUIRE(logger_adapter::is_level_enabled(log_level::error));
        REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));
    }

    SECTION("off disables every level") {
        logger_adapter::set_min_level(log_level::off);
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::fatal));
        REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::off));
    }
}

TEST_CASE("logger_adapter configuration", "[logger_adapter][config]") {
    auto config = quiet_config(create_temp_log_directory());
    config.min_level = log_level::debug;
    config.max_file_size_mb = 50;
    config.max_files = 3;

    logger_test_fixture fixture(config);

    const auto& retrieved = logger_adapter::get_config();
    CHECK(retrieved.min_level == log_level::debug);
    CHECK(retrieved.max_file_size_mb == 50);
    CHECK(retrieved.max_files == 3);
    CHECK_FALSE(retrieved.enable_console);
}

TEST_CASE("log level names", "[logger_adapter][config]") {
    CHECK(parse_log_level("debug") == log_level::debug);
    CHECK(parse_log_level("warning") == log_level::warn);
    CHECK(parse_log_level("off") == log_level::off);
    CHECK_FALSE(parse_log_level("verbose").has_value());
    CHECK(to_string(log_level::error) == "error");
}

// =============================================================================
// Reader Integration
// =============================================================================

TEST_CASE("loading with logging enabled reports anomalies without failing",
          "[logger_adapter][reader]") {
    auto config = quiet_config(create_temp_log_directory());
    config.min_level = log_level::debug;
    logger_test_fixture fixture(config);

    const auto bytes = kretz::testing::kretz_file_builder{}
                           .dimensions(4, 4, 4)
                           .coordinate_system(12)
                           .payload(std::vector<uint8_t>(10, 1))
                           .build();

    auto result = kretz::core::kretz_file::from_bytes(bytes);
    REQUIRE(result.is_ok());
    CHECK(result.value().volume_data_missing());
    CHECK(result.value().coordinate_system() == "unknown_12");

    auto failed = kretz::core::kretz_file::open("/nonexistent/kretz/scan.vol");
    CHECK(failed.is_err());

    logger_adapter::flush();
}
