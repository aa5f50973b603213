/**
 * @file main.cpp
 * @brief Kretz Info - Volume File Summary Utility
 *
 * A command-line utility for displaying summary information of Kretz
 * (KRETZFILE) 3D ultrasound volume files: geometry, patient, study and
 * system metadata, and optionally voxel statistics.
 *
 * Usage:
 *   kretz_info <path> [options]
 *
 * Example:
 *   kretz_info scan.vol
 *   kretz_info scan.vol --format json
 *   kretz_info scan1.vol scan2.vol --verbose
 */

#include "kretz/core/kretz_file.hpp"
#include "kretz/integration/logger_adapter.hpp"
#include "kretz/version.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace {

/**
 * @brief Output format options
 */
enum class output_format { text, json };

/**
 * @brief Command line options
 */
struct options {
    std::vector<std::filesystem::path> paths;
    output_format format{output_format::text};
    bool verbose{false};
    bool quiet{false};
    std::optional<kretz::integration::log_level> log_level;
};

/**
 * @brief Voxel statistics (verbose mode)
 */
struct voxel_statistics {
    double min{0.0};
    double max{0.0};
    double mean{0.0};
    std::size_t zero_count{0};
};

void print_usage(const char* program_name) {
    std::cout << R"(
Kretz Info - Volume File Summary Utility (version )"
              << kretz::version_string() << R"()

Usage: )" << program_name
              << R"( <path> [path2 ...] [options]

Arguments:
  path              Kretz volume file(s) to inspect

Options:
  -h, --help        Show this help message
  -v, --verbose     Verbose output (adds voxel statistics)
  -q, --quiet       Minimal output (file path and dimensions only)
  -f, --format <f>  Output format: text (default), json
  --log-level <l>   Enable library logging: trace, debug, info, warn, error

Examples:
  )" << program_name
              << R"( scan.vol
  )" << program_name
              << R"( scan.vol --format json
  )" << program_name
              << R"( scan1.vol scan2.vol -v --log-level debug

Exit Codes:
  0  Success
  1  Error - Invalid arguments
  2  Error - File not found or invalid Kretz file
)";
}

/**
 * @brief Parse command line arguments
 * @return true if arguments are valid
 */
bool parse_arguments(int argc, char* argv[], options& opts) {
    if (argc < 2) {
        return false;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if ((arg == "--format" || arg == "-f") && i + 1 < argc) {
            std::string fmt = argv[++i];
            if (fmt == "json") {
                opts.format = output_format::json;
            } else if (fmt == "text") {
                opts.format = output_format::text;
            } else {
                std::cerr << "Error: Unknown format '" << fmt
                          << "'. Use: text, json\n";
                return false;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            std::string level = argv[++i];
            opts.log_level = kretz::integration::parse_log_level(level);
            if (!opts.log_level) {
                std::cerr << "Error: Unknown log level '" << level << "'\n";
                return false;
            }
        } else if (arg[0] == '-') {
            std::cerr << "Error: Unknown option '" << arg << "'\n";
            return false;
        } else {
            opts.paths.emplace_back(arg);
        }
    }

    if (opts.paths.empty()) {
        std::cerr << "Error: No path specified\n";
        return false;
    }

    if (opts.quiet) {
        opts.verbose = false;
    }

    return true;
}

std::string json_escape(const std::string& str) {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':
                oss << "\\\"";
                break;
            case '\\':
                oss << "\\\\";
                break;
            case '\n':
                oss << "\\n";
                break;
            case '\r':
                oss << "\\r";
                break;
            case '\t':
                oss << "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

std::string or_not_specified(const std::string& value) {
    return value.empty() ? "(not specified)" : value;
}

/**
 * @brief Format a number as a JSON value; NaN and infinities become null
 */
template <typename T>
std::string json_number(T value) {
    if (!std::isfinite(static_cast<double>(value))) {
        return "null";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

template <typename T>
std::string json_triple(const std::array<T, 3>& v) {
    return "[" + json_number(v[0]) + ", " + json_number(v[1]) + ", " + json_number(v[2]) + "]";
}

template <typename T>
std::string format_triple(const std::array<T, 3>& v) {
    std::ostringstream oss;
    oss << v[0] << " x " << v[1] << " x " << v[2];
    return oss.str();
}

voxel_statistics compute_statistics(const kretz::core::voxel_volume& volume) {
    voxel_statistics stats;
    if (volume.empty()) {
        return stats;
    }

    const auto shape = volume.shape();
    stats.min = std::numeric_limits<double>::max();
    stats.max = std::numeric_limits<double>::lowest();
    double sum = 0.0;

    for (uint32_t x = 0; x < shape.x; ++x) {
        for (uint32_t y = 0; y < shape.y; ++y) {
            for (uint32_t z = 0; z < shape.z; ++z) {
                const double v = volume.value_at(x, y, z);
                stats.min = std::min(stats.min, v);
                stats.max = std::max(stats.max, v);
                sum += v;
                if (v == 0.0) {
                    ++stats.zero_count;
                }
            }
        }
    }
    stats.mean = sum / static_cast<double>(volume.size());
    return stats;
}

void print_summary_text(const kretz::core::kretz_file& file, const options& opts) {
    const auto metadata = file.metadata();
    const auto dims = file.dimensions();

    if (opts.quiet) {
        std::cout << file.path().string() << " " << format_triple(dims) << " ["
                  << metadata.data_type.label() << "]\n";
        return;
    }

    const int label_width = 24;
    auto row = [&](const std::string& label, const std::string& value) {
        std::cout << std::left << std::setw(label_width) << ("  " + label + ":") << value
                  << "\n";
    };

    std::cout << "========================================\n";
    std::cout << "File Information\n";
    std::cout << "----------------------------------------\n";
    row("Path", file.path().string());
    std::error_code ec;
    const auto size = std::filesystem::file_size(file.path(), ec);
    row("Size", ec ? "(unknown)" : std::to_string(size) + " bytes");
    row("Format Version", metadata.version);
    row("Frames", std::to_string(metadata.frame_count));
    row("Compressed", metadata.compressed ? "yes" : "no");
    std::cout << "\n";

    std::cout << "Geometry\n";
    std::cout << "----------------------------------------\n";
    row("Dimensions", format_triple(dims) + " voxels");
    row("Spacing", format_triple(file.spacing()) + " mm");
    row("Origin", format_triple(file.origin()));
    row("Coordinate System", file.coordinate_system());
    row("Data Type", metadata.data_type.label());
    row("Acquisition Mode", or_not_specified(metadata.acquisition_mode));
    std::cout << "\n";

    const auto patient = file.patient_info();
    std::cout << "Patient Information\n";
    std::cout << "----------------------------------------\n";
    row("Name", or_not_specified(patient.patient_name));
    row("Study Date", or_not_specified(patient.study_date));
    row("Study Time", or_not_specified(patient.study_time));
    std::cout << "\n";

    const auto system = file.system_info();
    std::cout << "System Information\n";
    std::cout << "----------------------------------------\n";
    row("System", or_not_specified(system.system_name));
    row("Probe", or_not_specified(system.probe_name));

    if (file.volume_data_missing()) {
        std::cout << "\n  WARNING: voxel data missing, volume is zero-filled\n";
    }

    if (opts.verbose) {
        auto volume = file.volume();
        if (volume.is_ok()) {
            const auto stats = compute_statistics(volume.value());
            std::cout << "\nVoxel Statistics\n";
            std::cout << "----------------------------------------\n";
            row("Voxels", std::to_string(volume.value().size()));
            row("Min", std::to_string(stats.min));
            row("Max", std::to_string(stats.max));
            row("Mean", std::to_string(stats.mean));
            row("Zero Voxels", std::to_string(stats.zero_count));
        }
    }
    std::cout << "========================================\n";
}

void print_summary_json(const kretz::core::kretz_file& file, const options& opts) {
    const auto metadata = file.metadata();
    const auto dims = file.dimensions();
    const auto spacing = file.spacing();
    const auto origin = file.origin();
    const auto patient = file.patient_info();
    const auto system = file.system_info();

    std::cout << "{\n";
    std::cout << "  \"file\": {\n";
    std::cout << "    \"path\": \"" << json_escape(file.path().string()) << "\",\n";
    std::cout << "    \"version\": \"" << json_escape(metadata.version) << "\",\n";
    std::cout << "    \"frameCount\": " << metadata.frame_count << ",\n";
    std::cout << "    \"compressed\": " << (metadata.compressed ? "true" : "false")
              << ",\n";
    std::cout << "    \"volumeDataMissing\": "
              << (file.volume_data_missing() ? "true" : "false") << "\n";
    std::cout << "  },\n";

    std::cout << "  \"geometry\": {\n";
    std::cout << "    \"dimensions\": " << json_triple(dims) << ",\n";
    std::cout << "    \"spacing\": " << json_triple(spacing) << ",\n";
    std::cout << "    \"origin\": " << json_triple(origin) << ",\n";
    std::cout << "    \"coordinateSystem\": \"" << file.coordinate_system() << "\",\n";
    std::cout << "    \"dataType\": \"" << metadata.data_type.label() << "\",\n";
    std::cout << "    \"acquisitionMode\": \"" << json_escape(metadata.acquisition_mode)
              << "\"\n";
    std::cout << "  },\n";

    std::cout << "  \"patient\": {\n";
    std::cout << "    \"name\": \"" << json_escape(patient.patient_name) << "\",\n";
    std::cout << "    \"studyDate\": \"" << json_escape(patient.study_date) << "\",\n";
    std::cout << "    \"studyTime\": \"" << json_escape(patient.study_time) << "\"\n";
    std::cout << "  },\n";

    std::cout << "  \"system\": {\n";
    std::cout << "    \"name\": \"" << json_escape(system.system_name) << "\",\n";
    std::cout << "    \"probe\": \"" << json_escape(system.probe_name) << "\"\n";

    if (opts.verbose) {
        auto volume = file.volume();
        if (volume.is_ok()) {
            const auto stats = compute_statistics(volume.value());
            std::cout << "  },\n";
            std::cout << "  \"statistics\": {\n";
            std::cout << "    \"min\": " << json_number(stats.min) << ",\n";
            std::cout << "    \"max\": " << json_number(stats.max) << ",\n";
            std::cout << "    \"mean\": " << json_number(stats.mean) << ",\n";
            std::cout << "    \"zeroCount\": " << stats.zero_count << "\n";
        }
    }
    std::cout << "  }\n";

    std::cout << "}";
}

/**
 * @brief Process a single Kretz file
 * @param printed Number of summaries printed so far; incremented on success
 * @return 0 on success, non-zero on error
 */
int process_file(const std::filesystem::path& file_path, const options& opts,
                 std::size_t& printed) {
    auto result = kretz::core::kretz_file::open(file_path);
    if (result.is_err()) {
        if (!opts.quiet) {
            std::cerr << "Error: " << result.error().message << "\n";
        }
        return 2;
    }

    if (opts.format == output_format::json) {
        // Separator between printed entries
        std::cout << (printed > 0 ? ",\n" : "");
        print_summary_json(result.value(), opts);
    } else {
        if (printed > 0 && !opts.quiet) {
            std::cout << "\n";
        }
        print_summary_text(result.value(), opts);
    }

    ++printed;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    options opts;

    if (!parse_arguments(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    if (opts.log_level) {
        kretz::integration::logger_config config;
        config.min_level = *opts.log_level;
        config.enable_console = true;
        config.enable_file = false;
        kretz::integration::logger_adapter::initialize(config);
    }

    if (opts.format == output_format::json && opts.paths.size() > 1) {
        std::cout << "[\n";
    }

    int exit_code = 0;
    std::size_t printed = 0;
    for (const auto& path : opts.paths) {
        if (process_file(path, opts, printed) != 0) {
            exit_code = 2;
        }
    }

    if (opts.format == output_format::json && printed > 0) {
        std::cout << "\n";
    }
    if (opts.format == output_format::json && opts.paths.size() > 1) {
        std::cout << "]\n";
    }

    kretz::integration::logger_adapter::shutdown();
    return exit_code;
}
