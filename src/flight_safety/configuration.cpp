// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the control runtime. `ConfigurationLoader` transforms raw environment
// variables into the strongly-typed `Configuration` bundle.
//
// Responsibilities
// - Apply documented defaults when a variable is absent.
// - Warn through the logging subsystem and keep the default whenever a value
//   cannot be parsed.
// - Reject values that parse but break a precondition (fractions outside
//   [0, 1], non-decreasing reserve thresholds, non-positive limits).
//
// Note: nothing is read from disk; callers populate the process environment
// ahead of time (service unit, launch script, or a shell-sourced `.env`).

#include "flight_safety/configuration.hpp"

#include <cstdlib>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <vector>

#include <fmt/format.h>

#include "flight_safety/errors.hpp"
#include "flight_safety/logging.hpp"

namespace flight_safety {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};

const char* lookup(std::string_view name) {
    const std::string key = fmt::format("FLIGHT_SAFETY_{}", name);
    return std::getenv(key.c_str());
}

std::optional<double> to_double(const std::string& raw_value) {
    try {
        std::size_t consumed = 0;
        const double parsed_value = std::stod(raw_value, &consumed);
        if (consumed != raw_value.size()) {
            return std::nullopt;
        }
        return parsed_value;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

double parse_double(std::string_view name, double fallback) {
    const char* raw_value = lookup(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::optional<double> parsed_value = to_double(raw_value);
    if (!parsed_value) {
        get_logger()->warn(R"({{"component":"configuration","event":"parse_fallback","variable":"FLIGHT_SAFETY_{}","value":{},"expected":"number","fallback":{}}})",
                           name, json_quote(raw_value), fallback);
        return fallback;
    }
    return *parsed_value;
}

Duration parse_seconds(std::string_view name, Duration fallback) {
    return Duration{parse_double(name, fallback.count())};
}

std::size_t parse_size(std::string_view name, std::size_t fallback) {
    const char* raw_value = lookup(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const long long parsed_value = std::stoll(raw_value, &consumed);
        if (consumed != std::string_view{raw_value}.size()) {
            throw std::invalid_argument("trailing characters");
        }
        if (parsed_value <= 0) {
            throw ConfigurationError(fmt::format("FLIGHT_SAFETY_{} must be positive (got {})", name, parsed_value));
        }
        return static_cast<std::size_t>(parsed_value);
    } catch (const ConfigurationError&) {
        throw;
    } catch (const std::exception&) {
        get_logger()->warn(R"({{"component":"configuration","event":"parse_fallback","variable":"FLIGHT_SAFETY_{}","value":{},"expected":"integer","fallback":{}}})",
                           name, json_quote(raw_value), fallback);
        return fallback;
    }
}

bool parse_bool(std::string_view name, bool fallback) {
    const char* raw_value = lookup(name);
    if (raw_value == nullptr) {
        return fallback;
    }
    const std::string_view value{raw_value};
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        return false;
    }
    get_logger()->warn(R"({{"component":"configuration","event":"parse_fallback","variable":"FLIGHT_SAFETY_{}","value":{},"expected":"boolean","fallback":{}}})",
                       name, json_quote(value), fallback);
    return fallback;
}

/**
 * @brief Parse `x,y,z;x,y,z` into points; malformed entries are skipped with a warning.
 */
std::vector<Vector3> parse_points(std::string_view name) {
    std::vector<Vector3> list_points;
    const char* raw_value = lookup(name);
    if (raw_value == nullptr) {
        return list_points;
    }
    std::stringstream stream_entries{std::string{raw_value}};
    std::string entry;
    while (std::getline(stream_entries, entry, ';')) {
        if (entry.empty()) {
            continue;
        }
        std::stringstream stream_components{entry};
        std::string component;
        std::vector<double> list_components;
        bool valid = true;
        while (std::getline(stream_components, component, ',')) {
            const std::optional<double> parsed_value = to_double(component);
            if (!parsed_value) {
                valid = false;
                break;
            }
            list_components.push_back(*parsed_value);
        }
        if (!valid || list_components.size() != 3) {
            get_logger()->warn(R"({{"component":"configuration","event":"malformed_point","variable":"FLIGHT_SAFETY_{}","value":{}}})", name, json_quote(entry));
            continue;
        }
        list_points.push_back(Vector3{list_components[0], list_components[1], list_components[2]});
    }
    return list_points;
}

std::string parse_log_directory() {
    const char* raw_directory = lookup("LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

}  // namespace

void validate(const RuntimeConfig& config) {
    if (config.reserve_check_interval.count() <= 0.0) {
        throw ConfigurationError("Reserve check interval must be positive");
    }
    if (config.telemetry_capacity == 0) {
        throw ConfigurationError("Telemetry capacity must be positive");
    }
}

void validate(const Configuration& configuration) {
    validate(configuration.reserve);
    validate(configuration.decision);
    validate(configuration.failsafe);
    validate(configuration.runtime);
}

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_log_directory();

    auto logger = initialize_logger(config.log_directory);
    logger->info(R"({"component":"configuration","event":"loading","source":"environment"})");

    config.reserve = load_reserve();
    config.decision = load_decision();
    config.failsafe = load_failsafe();
    config.runtime = load_runtime();

    const RecoveryPoints recovery = load_recovery();
    config.decision.recovery = recovery;
    config.failsafe.recovery = recovery;

    validate(config);

    logger->info(R"({{"component":"configuration","event":"loaded","decision_rate_hz":{},"reserve_interval_s":{},"failsafe_interval_s":{},"landing_zones":{},"auto_rtb":{},"auto_land":{},"parachute":{}}})",
                 config.decision.decision_rate_hz,
                 config.runtime.reserve_check_interval.count(),
                 config.failsafe.check_interval.count(),
                 recovery.landing_zones.size(),
                 config.failsafe.enable_auto_rtb,
                 config.failsafe.enable_auto_land,
                 config.failsafe.enable_parachute);
    return config;
}

ReserveConfig ConfigurationLoader::load_reserve() {
    ReserveConfig config{};
    config.mission_battery_soc = parse_double("RESERVE_MISSION_SOC", config.mission_battery_soc);
    config.contingency_battery_soc = parse_double("RESERVE_CONTINGENCY_SOC", config.contingency_battery_soc);
    config.emergency_battery_soc = parse_double("RESERVE_EMERGENCY_SOC", config.emergency_battery_soc);
    config.absolute_battery_soc = parse_double("RESERVE_ABSOLUTE_SOC", config.absolute_battery_soc);
    config.mission_fuel_level = parse_double("RESERVE_MISSION_FUEL", config.mission_fuel_level);
    config.contingency_fuel_level = parse_double("RESERVE_CONTINGENCY_FUEL", config.contingency_fuel_level);
    config.emergency_fuel_level = parse_double("RESERVE_EMERGENCY_FUEL", config.emergency_fuel_level);
    config.absolute_fuel_level = parse_double("RESERVE_ABSOLUTE_FUEL", config.absolute_fuel_level);
    config.mission_reserve_minutes = parse_double("RESERVE_MISSION_MINUTES", config.mission_reserve_minutes);
    config.contingency_reserve_minutes = parse_double("RESERVE_CONTINGENCY_MINUTES", config.contingency_reserve_minutes);
    config.emergency_reserve_minutes = parse_double("RESERVE_EMERGENCY_MINUTES", config.emergency_reserve_minutes);
    return config;
}

DecisionConfig ConfigurationLoader::load_decision() {
    DecisionConfig config{};
    config.max_roll_angle_rad = parse_double("MAX_ROLL_RAD", config.max_roll_angle_rad);
    config.max_pitch_angle_rad = parse_double("MAX_PITCH_RAD", config.max_pitch_angle_rad);
    config.max_yaw_rate_rad_s = parse_double("MAX_YAW_RATE_RAD_S", config.max_yaw_rate_rad_s);
    config.min_safe_altitude_m = parse_double("MIN_SAFE_ALTITUDE_M", config.min_safe_altitude_m);
    config.max_vertical_speed_mps = parse_double("MAX_VERTICAL_SPEED_MPS", config.max_vertical_speed_mps);
    config.enable_threat_avoidance = parse_bool("THREAT_AVOIDANCE", config.enable_threat_avoidance);
    config.threat_avoidance_radius_m = parse_double("THREAT_RADIUS_M", config.threat_avoidance_radius_m);
    config.waypoint_acceptance_radius_m = parse_double("WAYPOINT_RADIUS_M", config.waypoint_acceptance_radius_m);
    config.cruise_throttle = parse_double("CRUISE_THROTTLE", config.cruise_throttle);
    config.decision_rate_hz = parse_double("DECISION_RATE_HZ", config.decision_rate_hz);
    config.backup_limit_scale = parse_double("BACKUP_LIMIT_SCALE", config.backup_limit_scale);
    config.emergency_power_cap = parse_double("EMERGENCY_POWER_CAP", config.emergency_power_cap);
    return config;
}

FailsafeConfig ConfigurationLoader::load_failsafe() {
    FailsafeConfig config{};
    config.enable_auto_rtb = parse_bool("AUTO_RTB", config.enable_auto_rtb);
    config.enable_auto_land = parse_bool("AUTO_LAND", config.enable_auto_land);
    config.enable_parachute = parse_bool("PARACHUTE", config.enable_parachute);
    config.min_safe_fuel = parse_double("MIN_SAFE_FUEL", config.min_safe_fuel);
    config.min_safe_battery = parse_double("MIN_SAFE_BATTERY", config.min_safe_battery);
    config.exhaustion_level = parse_double("EXHAUSTION_LEVEL", config.exhaustion_level);
    config.max_time_without_comms = parse_seconds("COMMS_TIMEOUT_S", config.max_time_without_comms);
    config.check_interval = parse_seconds("FAILSAFE_INTERVAL_S", config.check_interval);
    return config;
}

RuntimeConfig ConfigurationLoader::load_runtime() {
    RuntimeConfig config{};
    config.reserve_check_interval = parse_seconds("RESERVE_INTERVAL_S", config.reserve_check_interval);
    config.telemetry_capacity = parse_size("TELEMETRY_CAPACITY", config.telemetry_capacity);
    return config;
}

RecoveryPoints ConfigurationLoader::load_recovery() {
    RecoveryPoints recovery{};
    recovery.home.x = parse_double("HOME_X_M", recovery.home.x);
    recovery.home.y = parse_double("HOME_Y_M", recovery.home.y);
    recovery.home.z = parse_double("HOME_Z_M", recovery.home.z);
    recovery.landing_zones = parse_points("LANDING_ZONES");
    return recovery;
}

}  // namespace flight_safety
