#include "flight_safety/failsafe_system.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include <fmt/format.h>

#include "flight_safety/errors.hpp"
#include "flight_safety/logging.hpp"

namespace flight_safety {

namespace {
constexpr std::string_view k_comm_subsystem{"comm"};
constexpr std::string_view k_propulsion_subsystem{"propulsion"};
constexpr double k_target_tolerance_m{1.0}; /**< Target moves below this do not count as a new target. */

const std::vector<std::string> k_seeded_subsystems{"primary_flight", "backup_flight", "gps", "ins", "comm"};

bool is_severe(EmergencyType type) noexcept {
    switch (type) {
        case EmergencyType::StructuralDamage:
        case EmergencyType::EngineFailure:
        case EmergencyType::HydraulicFailure:
            return true;
        case EmergencyType::ElectricalFailure:
        case EmergencyType::SevereWeather:
        case EmergencyType::ThreatInbound:
        case EmergencyType::FuelCritical:
        case EmergencyType::SensorFailure:
        case EmergencyType::CommunicationLoss:
        case EmergencyType::LowBattery:
            return false;
    }
    return false;
}

bool is_fraction(double value) noexcept {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}
}  // namespace

void validate(const FailsafeConfig& config) {
    if (!is_fraction(config.min_safe_fuel) || !is_fraction(config.min_safe_battery) || !is_fraction(config.exhaustion_level)) {
        throw ConfigurationError(fmt::format("Failsafe energy thresholds must lie in [0, 1] (fuel {} battery {} exhaustion {})",
                                             config.min_safe_fuel, config.min_safe_battery, config.exhaustion_level));
    }
    if (config.max_time_without_comms.count() <= 0.0) {
        throw ConfigurationError("Failsafe communication timeout must be positive");
    }
    if (config.check_interval.count() <= 0.0) {
        throw ConfigurationError("Failsafe check interval must be positive");
    }
}

std::string_view to_string(FlightMode mode) noexcept {
    switch (mode) {
        case FlightMode::Primary:
            return "primary";
        case FlightMode::Backup:
            return "backup";
        case FlightMode::Emergency:
            return "emergency";
        case FlightMode::Manual:
            return "manual";
    }
    return "primary";
}

std::string_view to_string(EmergencyResolution resolution) noexcept {
    switch (resolution) {
        case EmergencyResolution::Detected:
            return "detected";
        case EmergencyResolution::Escalated:
            return "escalated";
    }
    return "detected";
}

FailsafeSystem::FailsafeSystem(FailsafeConfig config)
    : config_(std::move(config)),
      position_(config_.recovery.home),
      last_comm_time_(SteadyClock::now()),
      logger_(get_logger()) {
    validate(config_);
    for (const std::string& subsystem : k_seeded_subsystems) {
        map_subsystem_health_.emplace(subsystem, HealthStatus::Ok);
    }
}

void FailsafeSystem::monitor() {
    monitor(SteadyClock::now());
}

void FailsafeSystem::monitor(TimePoint now) {
    PendingDispatch pending{};
    {
        std::scoped_lock lock(mutex_);
        evaluate_locked(now, pending);
    }
    dispatch(pending);
}

void FailsafeSystem::update_health(const std::string& subsystem, HealthStatus status) {
    std::scoped_lock lock(mutex_);
    map_subsystem_health_[subsystem] = status;
    if (subsystem == k_comm_subsystem && status == HealthStatus::Ok) {
        last_comm_time_ = SteadyClock::now();
    }
}

void FailsafeSystem::update_fuel(double level) {
    std::scoped_lock lock(mutex_);
    fuel_level_ = level;
}

void FailsafeSystem::update_battery(double level) {
    std::scoped_lock lock(mutex_);
    battery_level_ = level;
}

void FailsafeSystem::update_position(const Vector3& position) {
    std::scoped_lock lock(mutex_);
    position_ = position;
}

void FailsafeSystem::record_comm_contact() {
    record_comm_contact(SteadyClock::now());
}

void FailsafeSystem::record_comm_contact(TimePoint at) {
    std::scoped_lock lock(mutex_);
    last_comm_time_ = std::max(last_comm_time_, at);
}

void FailsafeSystem::raise_emergency(EmergencyType type, const std::string& detail) {
    std::scoped_lock lock(mutex_);
    map_raised_emergencies_[type] = detail;
}

void FailsafeSystem::clear_emergency(EmergencyType type) {
    std::scoped_lock lock(mutex_);
    map_raised_emergencies_.erase(type);
    if (type == EmergencyType::EngineFailure) {
        flag_fatal_propulsion_ = false;
    }
}

void FailsafeSystem::ingest_propulsion_health(const PropulsionHealth& health) {
    std::scoped_lock lock(mutex_);
    map_subsystem_health_[std::string{k_propulsion_subsystem}] = health.overall;
    std::set<std::string> set_current_ids;
    for (const Fault& fault : health.active_faults) {
        set_current_ids.insert(fault.id);
        if (!set_seen_fault_ids_.contains(fault.id)) {
            logger_->warn(R"({{"component":"failsafe","event":"propulsion_fault","id":{},"source":{},"severity":{},"description":{}}})",
                          json_quote(fault.id), json_quote(fault.component), fault.severity, json_quote(fault.description));
        }
    }
    set_seen_fault_ids_ = std::move(set_current_ids);
}

void FailsafeSystem::report_fatal_propulsion_failure(const std::string& reason) {
    PendingDispatch pending{};
    {
        std::scoped_lock lock(mutex_);
        logger_->critical(R"({{"component":"failsafe","event":"fatal_propulsion","reason":{}}})", json_quote(reason));
        flag_fatal_propulsion_ = true;
        map_raised_emergencies_[EmergencyType::EngineFailure] = reason;
        evaluate_locked(SteadyClock::now(), pending);
    }
    dispatch(pending);
}

void FailsafeSystem::engage_manual_override() {
    PendingDispatch pending{};
    {
        std::scoped_lock lock(mutex_);
        flag_manual_override_ = true;
        set_mode_locked(FlightMode::Manual, pending);
    }
    dispatch(pending);
}

void FailsafeSystem::release_manual_override() {
    PendingDispatch pending{};
    {
        std::scoped_lock lock(mutex_);
        if (!flag_manual_override_) {
            return;
        }
        flag_manual_override_ = false;
        evaluate_locked(SteadyClock::now(), pending);
    }
    dispatch(pending);
}

void FailsafeSystem::set_mode_change_callback(ModeChangeCallback callback) {
    std::scoped_lock lock(mutex_);
    callback_mode_change_ = std::move(callback);
}

void FailsafeSystem::set_emergency_callback(EmergencyCallback callback) {
    std::scoped_lock lock(mutex_);
    callback_emergency_ = std::move(callback);
}

bool FailsafeSystem::is_healthy() {
    monitor();
    std::scoped_lock lock(mutex_);
    return mode_ == FlightMode::Primary && list_active_emergencies_.empty();
}

std::vector<ActiveEmergency> FailsafeSystem::get_active_emergencies() const {
    std::scoped_lock lock(mutex_);
    return list_active_emergencies_;
}

FlightMode FailsafeSystem::get_mode() const {
    std::scoped_lock lock(mutex_);
    return mode_;
}

HealthStatus FailsafeSystem::overall_health() const {
    std::scoped_lock lock(mutex_);
    HealthStatus worst = HealthStatus::Ok;
    for (const auto& [subsystem, status] : map_subsystem_health_) {
        worst = worst_of(worst, status);
    }
    return worst;
}

std::optional<HealthStatus> FailsafeSystem::health_of(const std::string& subsystem) const {
    std::scoped_lock lock(mutex_);
    const auto found = map_subsystem_health_.find(subsystem);
    if (found == map_subsystem_health_.end()) {
        return std::nullopt;
    }
    return found->second;
}

Escalation FailsafeSystem::current_escalation() const {
    std::scoped_lock lock(mutex_);
    return escalation_;
}

const FailsafeConfig& FailsafeSystem::config() const noexcept {
    return config_;
}

/**
 * @brief Reconcile the registry with the live conditions, pick an escalation,
 *        and recompute the mode.
 */
void FailsafeSystem::evaluate_locked(TimePoint now, PendingDispatch& pending) {
    const std::map<EmergencyType, std::string> map_conditions = collect_conditions_locked(now);
    bool flag_registry_changed = false;

    const auto removed = std::stable_partition(list_active_emergencies_.begin(), list_active_emergencies_.end(),
                                               [&map_conditions](const ActiveEmergency& record) {
                                                   return map_conditions.contains(record.type);
                                               });
    for (auto it = removed; it != list_active_emergencies_.end(); ++it) {
        logger_->info(R"({{"component":"failsafe","event":"emergency_cleared","type":"{}"}})", to_string(it->type));
        flag_registry_changed = true;
    }
    list_active_emergencies_.erase(removed, list_active_emergencies_.end());

    for (const auto& [type, detail] : map_conditions) {
        const auto existing = std::find_if(list_active_emergencies_.begin(), list_active_emergencies_.end(),
                                           [type = type](const ActiveEmergency& record) { return record.type == type; });
        if (existing != list_active_emergencies_.end()) {
            existing->detail = detail;
            continue;
        }
        logger_->error(R"({{"component":"failsafe","event":"emergency_detected","type":"{}","detail":{},"procedure":{}}})",
                       to_string(type), json_quote(detail), json_quote(procedure_for(type).name));
        list_active_emergencies_.push_back(ActiveEmergency{type, now, EmergencyResolution::Detected, detail});
        flag_registry_changed = true;
    }
    std::stable_sort(list_active_emergencies_.begin(), list_active_emergencies_.end(),
                     [](const ActiveEmergency& lhs, const ActiveEmergency& rhs) { return lhs.detected_at < rhs.detected_at; });

    Escalation next{};
    if (!list_active_emergencies_.empty()) {
        next = select_escalation_locked(now);
    }
    if (next.action != escalation_.action || next.trigger != escalation_.trigger || next.procedure.name != escalation_.procedure.name) {
        if (!list_active_emergencies_.empty()) {
            logger_->critical(R"({{"component":"failsafe","event":"escalation","action":"{}","trigger":"{}","procedure":{},"priority":{},"steps":{},"target":[{:.1f},{:.1f},{:.1f}]}})",
                              to_string(next.action), to_string(next.trigger), json_quote(next.procedure.name), next.procedure.priority,
                              next.procedure.steps.size(), next.target.x, next.target.y, next.target.z);
        }
        escalation_ = next;
        flag_registry_changed = true;
    } else if (distance_m(next.target, escalation_.target) > k_target_tolerance_m) {
        if (escalation_.action == EscalationAction::NearestLanding) {
            logger_->warn(R"({{"component":"failsafe","event":"landing_target","target":[{:.1f},{:.1f},{:.1f}]}})",
                          next.target.x, next.target.y, next.target.z);
            flag_registry_changed = true;
        }
        escalation_.target = next.target;
    }

    if (!escalation_.procedure.steps.empty()) {
        const std::size_t step = active_step_at(escalation_.procedure, std::chrono::duration_cast<Duration>(now - escalation_.issued_at));
        if (step > escalation_.active_step) {
            const ProcedureStep& current = escalation_.procedure.steps[step];
            logger_->warn(R"({{"component":"failsafe","event":"procedure_step","procedure":{},"index":{},"action":"{}","description":{},"critical":{}}})",
                          json_quote(escalation_.procedure.name), step, to_string(current.action), json_quote(current.description), current.critical);
            escalation_.active_step = step;
            flag_registry_changed = true;
        }
    }
    if (escalation_.action != EscalationAction::None) {
        for (ActiveEmergency& record : list_active_emergencies_) {
            if (record.resolution == EmergencyResolution::Detected) {
                record.resolution = EmergencyResolution::Escalated;
                flag_registry_changed = true;
            }
        }
    }

    FlightMode target = FlightMode::Primary;
    if (!list_active_emergencies_.empty()) {
        target = FlightMode::Emergency;
    } else {
        const bool any_impaired = std::any_of(map_subsystem_health_.begin(), map_subsystem_health_.end(), [](const auto& entry) {
            return entry.second == HealthStatus::Degraded || entry.second == HealthStatus::Critical;
        });
        if (any_impaired) {
            target = FlightMode::Backup;
        }
    }
    if (!flag_manual_override_) {
        set_mode_locked(target, pending);
    }

    if (flag_registry_changed) {
        pending.flag_registry_changed = true;
        pending.list_emergencies = list_active_emergencies_;
        pending.escalation = escalation_;
        pending.callback_emergency = callback_emergency_;
    }
}

std::map<EmergencyType, std::string> FailsafeSystem::collect_conditions_locked(TimePoint now) const {
    std::map<EmergencyType, std::string> map_conditions;
    auto add = [&map_conditions](EmergencyType type, const std::string& detail) {
        auto [entry, inserted] = map_conditions.emplace(type, detail);
        if (!inserted) {
            entry->second += "; " + detail;
        }
    };

    for (const auto& [subsystem, status] : map_subsystem_health_) {
        if (status == HealthStatus::Failed) {
            add(emergency_for(subsystem), subsystem + " failed");
        }
    }
    if (!std::isfinite(fuel_level_)) {
        add(EmergencyType::FuelCritical, "fuel reading invalid");
    } else if (fuel_level_ < config_.min_safe_fuel) {
        add(EmergencyType::FuelCritical, fmt::format("fuel {:.2f} below {:.2f}", fuel_level_, config_.min_safe_fuel));
    }
    if (!std::isfinite(battery_level_)) {
        add(EmergencyType::LowBattery, "battery reading invalid");
    } else if (battery_level_ < config_.min_safe_battery) {
        add(EmergencyType::LowBattery, fmt::format("battery {:.2f} below {:.2f}", battery_level_, config_.min_safe_battery));
    }
    const Duration silence = std::chrono::duration_cast<Duration>(now - last_comm_time_);
    if (silence > config_.max_time_without_comms) {
        add(EmergencyType::CommunicationLoss, fmt::format("no contact for {:.0f} s", silence.count()));
    }
    for (const auto& [type, detail] : map_raised_emergencies_) {
        add(type, detail);
    }
    return map_conditions;
}

/**
 * @brief Apply the configured preferences to the most severe active record.
 */
Escalation FailsafeSystem::select_escalation_locked(TimePoint now) const {
    Escalation escalation{};
    escalation.issued_at = now;
    escalation.target = position_;

    if (flag_fatal_propulsion_) {
        escalation.trigger = EmergencyType::EngineFailure;
        escalation.action = config_.enable_parachute ? EscalationAction::Parachute : EscalationAction::ImmediateLanding;
        escalation.procedure = with_terminal_step(procedure_for(escalation.trigger), escalation.action);
        return escalation;
    }

    const bool exhausted = energy_exhausted_locked();
    const auto severe_record = std::find_if(list_active_emergencies_.begin(), list_active_emergencies_.end(),
                                            [](const ActiveEmergency& record) { return is_severe(record.type); });
    const bool severe = exhausted || severe_record != list_active_emergencies_.end();
    if (severe_record != list_active_emergencies_.end()) {
        escalation.trigger = severe_record->type;
    } else {
        const auto urgent_record = std::min_element(list_active_emergencies_.begin(), list_active_emergencies_.end(),
                                                    [](const ActiveEmergency& lhs, const ActiveEmergency& rhs) {
                                                        return procedure_for(lhs.type).priority < procedure_for(rhs.type).priority;
                                                    });
        escalation.trigger = urgent_record->type;
    }
    const bool rtb_achievable = config_.enable_auto_rtb && !exhausted;
    auto choose_landing = [this, &escalation]() {
        if (config_.recovery.landing_zones.empty()) {
            escalation.action = EscalationAction::ImmediateLanding;
            escalation.target = position_;
        } else {
            escalation.action = EscalationAction::NearestLanding;
            escalation.target = nearest_landing_locked();
        }
    };
    auto choose_rtb = [this, &escalation]() {
        escalation.action = EscalationAction::ReturnToBase;
        escalation.target = config_.recovery.home;
    };

    if (severe) {
        if (config_.enable_auto_land) {
            choose_landing();
        } else if (config_.enable_parachute) {
            escalation.action = EscalationAction::Parachute;
        } else if (rtb_achievable) {
            choose_rtb();
        }
    } else {
        if (rtb_achievable) {
            choose_rtb();
        } else if (config_.enable_auto_land) {
            choose_landing();
        } else if (config_.enable_parachute) {
            escalation.action = EscalationAction::Parachute;
        }
    }
    escalation.procedure = with_terminal_step(procedure_for(escalation.trigger), escalation.action);
    return escalation;
}

bool FailsafeSystem::energy_exhausted_locked() const noexcept {
    const auto exhausted = [this](double level) { return !std::isfinite(level) || level <= config_.exhaustion_level; };
    return exhausted(fuel_level_) || exhausted(battery_level_);
}

Vector3 FailsafeSystem::nearest_landing_locked() const {
    Vector3 nearest = config_.recovery.home;
    double best_distance_m = std::numeric_limits<double>::max();
    for (const Vector3& zone : config_.recovery.landing_zones) {
        const double distance = horizontal_distance_m(position_, zone);
        if (distance < best_distance_m) {
            best_distance_m = distance;
            nearest = zone;
        }
    }
    return nearest;
}

EmergencyType FailsafeSystem::emergency_for(const std::string& subsystem) const {
    const auto found = config_.failure_emergencies.find(subsystem);
    if (found == config_.failure_emergencies.end()) {
        return EmergencyType::ElectricalFailure;
    }
    return found->second;
}

void FailsafeSystem::set_mode_locked(FlightMode mode, PendingDispatch& pending) {
    if (mode == mode_) {
        return;
    }
    logger_->warn(R"({{"component":"failsafe","event":"mode_change","from":"{}","to":"{}"}})", to_string(mode_), to_string(mode));
    if (!pending.flag_mode_changed) {
        pending.mode_from = mode_;
    }
    pending.flag_mode_changed = true;
    pending.mode_to = mode;
    pending.callback_mode = callback_mode_change_;
    mode_ = mode;
}

void FailsafeSystem::dispatch(const PendingDispatch& pending) const {
    if (pending.flag_mode_changed && pending.callback_mode && pending.mode_from != pending.mode_to) {
        pending.callback_mode(pending.mode_from, pending.mode_to);
    }
    if (pending.flag_registry_changed && pending.callback_emergency) {
        pending.callback_emergency(pending.list_emergencies, pending.escalation);
    }
}

}  // namespace flight_safety
