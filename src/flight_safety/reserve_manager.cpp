#include "flight_safety/reserve_manager.hpp"

#include <cmath>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "flight_safety/errors.hpp"
#include "flight_safety/logging.hpp"

namespace flight_safety {

namespace {
constexpr double k_warning_band{0.05}; /**< SOC band above the mission threshold that triggers a warning. */

void validate_ladder(std::string_view picture, double mission, double contingency, double emergency, double absolute) {
    for (const double value : {mission, contingency, emergency, absolute}) {
        if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
            throw ConfigurationError(fmt::format("Reserve {} threshold {} outside [0, 1]", picture, value));
        }
    }
    if (!(mission > contingency && contingency > emergency && emergency > absolute)) {
        throw ConfigurationError(fmt::format(
            "Reserve {} thresholds must be strictly decreasing (mission {} contingency {} emergency {} absolute {})",
            picture, mission, contingency, emergency, absolute));
    }
}

std::string describe(const std::vector<ReserveAction>& actions) {
    std::string text{"["};
    for (const ReserveAction& entry : actions) {
        if (text.size() > 1) {
            text += ",";
        }
        text += fmt::format(R"({{"priority":{},"action":"{}","mandatory":{}}})", entry.priority, to_string(entry.action), entry.mandatory);
    }
    text += "]";
    return text;
}
}  // namespace

void validate(const ReserveConfig& config) {
    validate_ladder("battery", config.mission_battery_soc, config.contingency_battery_soc,
                    config.emergency_battery_soc, config.absolute_battery_soc);
    validate_ladder("fuel", config.mission_fuel_level, config.contingency_fuel_level,
                    config.emergency_fuel_level, config.absolute_fuel_level);
    if (config.mission_reserve_minutes < 0.0 || config.contingency_reserve_minutes < 0.0 || config.emergency_reserve_minutes < 0.0) {
        throw ConfigurationError("Reserve minutes cannot be negative");
    }
}

std::string_view to_string(ReserveLevel level) noexcept {
    switch (level) {
        case ReserveLevel::Mission:
            return "mission";
        case ReserveLevel::Contingency:
            return "contingency";
        case ReserveLevel::Emergency:
            return "emergency";
        case ReserveLevel::Absolute:
            return "absolute";
    }
    return "mission";
}

std::string_view to_string(ActionType action) noexcept {
    switch (action) {
        case ActionType::WarnOperator:
            return "warn_operator";
        case ActionType::AbortMission:
            return "abort_mission";
        case ActionType::ReturnToBase:
            return "return_to_base";
        case ActionType::ReducePower:
            return "reduce_power";
        case ActionType::FindNearestLanding:
            return "find_nearest_landing";
        case ActionType::ImmediateLanding:
            return "immediate_landing";
    }
    return "warn_operator";
}

ReserveManager::ReserveManager(ReserveConfig config)
    : config_(config),
      logger_(get_logger()) {}

void ReserveManager::set_battery_soc_source(EnergySourcePtr source) {
    std::scoped_lock lock(mutex_);
    battery_source_ = std::move(source);
}

void ReserveManager::set_fuel_level_source(EnergySourcePtr source) {
    std::scoped_lock lock(mutex_);
    fuel_source_ = std::move(source);
}

void ReserveManager::set_level_change_callback(LevelChangeCallback callback) {
    std::scoped_lock lock(mutex_);
    callback_level_change_ = std::move(callback);
}

ReserveLevel ReserveManager::classify(double value, double absolute, double emergency, double contingency) noexcept {
    // An unreadable gauge counts as empty.
    if (!std::isfinite(value) || value <= absolute) {
        return ReserveLevel::Absolute;
    }
    if (value <= emergency) {
        return ReserveLevel::Emergency;
    }
    if (value <= contingency) {
        return ReserveLevel::Contingency;
    }
    return ReserveLevel::Mission;
}

/**
 * @brief Evaluate battery and fuel independently and keep the worse tier.
 */
ReserveLevel ReserveManager::check() {
    LevelChangeCallback callback;
    ReserveLevel previous{};
    ReserveLevel evaluated{};
    {
        std::scoped_lock lock(mutex_);
        previous = current_level_;
        evaluated = ReserveLevel::Mission;
        if (battery_source_ != nullptr) {
            evaluated = classify(battery_source_->read_level(), config_.absolute_battery_soc,
                                 config_.emergency_battery_soc, config_.contingency_battery_soc);
        }
        if (fuel_source_ != nullptr) {
            const ReserveLevel fuel_level = classify(fuel_source_->read_level(), config_.absolute_fuel_level,
                                                     config_.emergency_fuel_level, config_.contingency_fuel_level);
            if (is_worse(fuel_level, evaluated)) {
                evaluated = fuel_level;
            }
        }
        current_level_ = evaluated;
        if (evaluated != previous) {
            callback = callback_level_change_;
        }
    }

    if (evaluated != previous) {
        logger_->warn(R"({{"component":"reserve","event":"level_change","from":"{}","to":"{}","actions":{}}})",
                      to_string(previous), to_string(evaluated), describe(get_reserve_actions()));
        if (callback) {
            callback(previous, evaluated);
        }
    }
    return evaluated;
}

ReserveLevel ReserveManager::current_level() const {
    std::scoped_lock lock(mutex_);
    return current_level_;
}

double ReserveManager::get_available_energy(double total_energy) const {
    std::scoped_lock lock(mutex_);
    if (battery_source_ == nullptr) {
        return 0.0;
    }
    const double soc = battery_source_->read_level();
    if (!std::isfinite(soc) || soc <= config_.contingency_battery_soc || soc <= 0.0) {
        return 0.0;
    }
    return (soc - config_.contingency_battery_soc) / soc * total_energy;
}

std::vector<ReserveAction> ReserveManager::get_reserve_actions() const {
    std::scoped_lock lock(mutex_);
    switch (current_level_) {
        case ReserveLevel::Absolute:
            return {{1, ActionType::ImmediateLanding, true}};
        case ReserveLevel::Emergency:
            return {{1, ActionType::FindNearestLanding, true}, {2, ActionType::ReducePower, true}};
        case ReserveLevel::Contingency:
            return {{1, ActionType::ReturnToBase, true}, {2, ActionType::AbortMission, true}};
        case ReserveLevel::Mission:
            if (battery_source_ != nullptr && battery_source_->read_level() <= config_.mission_battery_soc + k_warning_band) {
                return {{3, ActionType::WarnOperator, false}};
            }
            return {};
    }
    return {};
}

bool ReserveManager::is_operation_allowed(double required_energy, double total_energy) const {
    return required_energy <= get_available_energy(total_energy);
}

const ReserveConfig& ReserveManager::config() const noexcept {
    return config_;
}

bool ReserveManager::has_energy_source() const {
    std::scoped_lock lock(mutex_);
    return battery_source_ != nullptr || fuel_source_ != nullptr;
}

}  // namespace flight_safety
