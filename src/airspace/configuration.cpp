// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the admission engine. The loader transforms raw environment variables into
// the strongly-typed `Configuration` structure consumed by downstream modules.
//
// Responsibilities
// - Enforce defaults and sane bounds for regulatory limits, separation minima
//   and runtime cadence.
// - Surface clear diagnostics via the logging subsystem whenever user input
//   cannot be parsed or violates expectations.
// - Attach the compiled-in region data (border ring, airports, zones).
//
// Reads no files; callers populate the process environment ahead of time.

#include "airspace/configuration.hpp"

#include <chrono>
#include <cstdlib>
#include <string_view>

#include "airspace/logging.hpp"
#include "airspace/region_data.hpp"

namespace airspace {

namespace {
constexpr double k_default_max_altitude_m{120.0};
constexpr double k_default_vertical_separation_m{30.0};
constexpr double k_default_horizontal_separation_m{200.0};
constexpr double k_default_tick_hz{1.0};
constexpr int k_default_daylight_start_hour{6};
constexpr int k_default_daylight_end_hour{20};
constexpr int k_default_utc_offset_hours{1};
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_log_level{"info"};
constexpr std::string_view k_default_flight_number_prefix{"KS"};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return clamp_positive(parsed_value, fallback);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double from environment; using fallback {}", fallback);
        return fallback;
    }
}

int parse_int_in_range(const char* raw_value, int fallback, int min_value, int max_value) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value < min_value || parsed_value > max_value) {
            get_logger()->warn("Integer {} outside [{}, {}]; using fallback {}", parsed_value, min_value, max_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse integer from environment; using fallback {}", fallback);
        return fallback;
    }
}

std::string parse_string(const char* env_name, std::string_view fallback) {
    const char* raw_value = std::getenv(env_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("AIRSPACE_LOG_DIR", k_default_log_directory);
    config.log_level = parse_string("AIRSPACE_LOG_LEVEL", k_default_log_level);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.border_mode = load_border_mode();
    config.border_ring = default_border_ring();
    config.region_bounds = default_region_bounds();
    config.restricted_zones = default_restricted_zones();
    config.airports = default_airports();
    config.limits = load_limits();
    config.separation = load_separation();
    config.flight_number_prefix = parse_string("AIRSPACE_FLIGHT_NUMBER_PREFIX", k_default_flight_number_prefix);
    config.tick_hz = parse_double(std::getenv("AIRSPACE_TICK_HZ"), k_default_tick_hz);

    logger->info(
        "Configuration loaded: log_level={} border_mode={} max_altitude_m={} vertical_sep_m={} horizontal_sep_m={} spacing_m={} tick_hz={}",
        config.log_level,
        config.border_mode == BorderMode::Polygon ? "polygon" : "bounding_box",
        config.limits.max_altitude_agl_m,
        config.separation.min_vertical_separation_m,
        config.separation.min_horizontal_separation_m,
        config.separation.sample_spacing_m,
        config.tick_hz
    );

    return config;
}

BorderMode ConfigurationLoader::load_border_mode() {
    const std::string str_mode = parse_string("AIRSPACE_BORDER_MODE", "polygon");
    if (str_mode == "polygon") {
        return BorderMode::Polygon;
    }
    if (str_mode == "bounding_box") {
        return BorderMode::BoundingBoxFallback;
    }
    get_logger()->warn("Unknown border mode {}; using polygon", str_mode);
    return BorderMode::Polygon;
}

RegulatoryLimits ConfigurationLoader::load_limits() {
    RegulatoryLimits limits{};
    limits.max_altitude_agl_m = parse_double(std::getenv("AIRSPACE_MAX_ALTITUDE_M"), k_default_max_altitude_m);
    limits.daylight_start_hour = parse_int_in_range(std::getenv("AIRSPACE_DAYLIGHT_START_HOUR"), k_default_daylight_start_hour, 0, 23);
    limits.daylight_end_hour = parse_int_in_range(std::getenv("AIRSPACE_DAYLIGHT_END_HOUR"), k_default_daylight_end_hour, 1, 24);
    if (limits.daylight_start_hour >= limits.daylight_end_hour) {
        get_logger()->warn(
            "Daylight window {}-{} is empty; using {}-{}",
            limits.daylight_start_hour,
            limits.daylight_end_hour,
            k_default_daylight_start_hour,
            k_default_daylight_end_hour
        );
        limits.daylight_start_hour = k_default_daylight_start_hour;
        limits.daylight_end_hour = k_default_daylight_end_hour;
    }
    limits.utc_offset = std::chrono::hours{
        parse_int_in_range(std::getenv("AIRSPACE_UTC_OFFSET_HOURS"), k_default_utc_offset_hours, -12, 14)
    };
    return limits;
}

SeparationConfig ConfigurationLoader::load_separation() {
    SeparationConfig separation{};
    separation.min_vertical_separation_m = parse_double(
        std::getenv("AIRSPACE_MIN_VERTICAL_SEPARATION_M"),
        k_default_vertical_separation_m
    );
    separation.min_horizontal_separation_m = parse_double(
        std::getenv("AIRSPACE_MIN_HORIZONTAL_SEPARATION_M"),
        k_default_horizontal_separation_m
    );
    separation.sample_spacing_m = parse_double(std::getenv("AIRSPACE_SAMPLE_SPACING_M"), k_default_sample_spacing_m);
    return separation;
}

BorderGeometry make_border_geometry(const Configuration& configuration) {
    if (configuration.border_mode == BorderMode::BoundingBoxFallback) {
        return BorderGeometry::bounding_box_fallback(configuration.region_bounds);
    }
    return BorderGeometry{configuration.border_ring};
}

}  // namespace airspace
