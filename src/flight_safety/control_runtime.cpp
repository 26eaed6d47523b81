#include "flight_safety/control_runtime.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

#include "flight_safety/energy_source.hpp"
#include "flight_safety/errors.hpp"
#include "flight_safety/logging.hpp"

namespace flight_safety {

namespace {

bool carries_battery(PropulsionType type) noexcept {
    switch (type) {
        case PropulsionType::Electric:
        case PropulsionType::Hybrid:
            return true;
        case PropulsionType::Combustion:
        case PropulsionType::Turbine:
        case PropulsionType::Rocket:
            return false;
    }
    return false;
}

bool carries_fuel(PropulsionType type) noexcept {
    switch (type) {
        case PropulsionType::Combustion:
        case PropulsionType::Turbine:
        case PropulsionType::Hybrid:
        case PropulsionType::Rocket:
            return true;
        case PropulsionType::Electric:
            return false;
    }
    return false;
}

}  // namespace

ControlRuntime::ControlRuntime(Configuration configuration, PropulsionSystemPtr propulsion)
    : configuration_(std::move(configuration)),
      propulsion_(std::move(propulsion)),
      telemetry_bus_(configuration_.runtime.telemetry_capacity),
      reserve_manager_(configuration_.reserve),
      failsafe_system_(configuration_.failsafe),
      decision_engine_(configuration_.decision),
      logger_(get_logger()) {
    if (propulsion_ == nullptr) {
        throw ConfigurationError("Control runtime requires a propulsion backend");
    }
}

ControlRuntime::~ControlRuntime() {
    shutdown();
}

/**
 * @brief Bring up every component; any error here halts startup.
 */
void ControlRuntime::initialize() {
    if (flag_initialized_) {
        return;
    }
    validate(configuration_);

    propulsion_->initialize();
    propulsion_->start();

    register_energy_sources();
    wire_callbacks();

    decision_engine_.attach_reserve_manager(reserve_manager_);
    decision_engine_.attach_failsafe(failsafe_system_);
    decision_engine_.initialize();

    flag_initialized_ = true;
    logger_->info(R"({{"component":"runtime","event":"initialized","propulsion":"{}"}})", to_string(propulsion_->type()));
}

void ControlRuntime::run() {
    if (!flag_initialized_) {
        throw LifecycleError("run() called before initialize()");
    }
    if (flag_running_.exchange(true)) {
        return;
    }
    const Duration decision_interval{1.0 / configuration_.decision.decision_rate_hz};
    decision_thread_ = std::thread([this, decision_interval]() {
        run_periodic(decision_interval, "decision", [this]() { decision_tick(); });
    });
    reserve_thread_ = std::thread([this]() {
        run_periodic(configuration_.runtime.reserve_check_interval, "reserve", [this]() { reserve_tick(); });
    });
    failsafe_thread_ = std::thread([this]() {
        run_periodic(configuration_.failsafe.check_interval, "failsafe", [this]() { failsafe_tick(); });
    });
    logger_->info(R"({"component":"runtime","event":"running"})");
}

void ControlRuntime::shutdown() {
    {
        std::scoped_lock lock(mutex_wake_);
        flag_running_.store(false);
    }
    cv_wake_.notify_all();

    for (std::thread* worker : {&decision_thread_, &reserve_thread_, &failsafe_thread_}) {
        if (worker->joinable()) {
            worker->join();
        }
    }

    if (!flag_initialized_) {
        return;
    }
    try {
        if (propulsion_->lifecycle_state() != LifecycleState::Stopped) {
            propulsion_->stop();
            logger_->info(R"({"component":"runtime","event":"shutdown"})");
        }
    } catch (const FlightSafetyError& exc) {
        logger_->error(R"({{"component":"runtime","event":"propulsion_stop_failed","error":{}}})", json_quote(exc.what()));
    }
}

void ControlRuntime::emergency_shutdown() {
    try {
        propulsion_->emergency_shutdown();
    } catch (const std::exception& exc) {
        failsafe_system_.report_fatal_propulsion_failure(exc.what());
        return;
    }
    failsafe_system_.raise_emergency(EmergencyType::EngineFailure, "propulsion emergency shutdown");
    failsafe_system_.monitor();
}

void ControlRuntime::update_vehicle_state(const VehicleState& state) {
    decision_engine_.update_vehicle_state(state);
    failsafe_system_.update_position(state.position);
}

bool ControlRuntime::is_running() const noexcept {
    return flag_running_.load();
}

TelemetryBus& ControlRuntime::telemetry_bus() noexcept {
    return telemetry_bus_;
}

ReserveManager& ControlRuntime::reserve_manager() noexcept {
    return reserve_manager_;
}

FailsafeSystem& ControlRuntime::failsafe_system() noexcept {
    return failsafe_system_;
}

DecisionEngine& ControlRuntime::decision_engine() noexcept {
    return decision_engine_;
}

void ControlRuntime::decision_tick() {
    const FlightCommand command = decision_engine_.decide();
    if (propulsion_->lifecycle_state() == LifecycleState::Running) {
        propulsion_->set_thrust_command(command.throttle);
    }
    telemetry_bus_.publish(TelemetryEvent{command.timestamp, command});
}

void ControlRuntime::reserve_tick() {
    const ReserveLevel level = reserve_manager_.check();
    std::vector<ReserveAction> actions = reserve_manager_.get_reserve_actions();
    const bool any_mandatory = std::any_of(actions.begin(), actions.end(), [](const ReserveAction& entry) { return entry.mandatory; });
    if (level != last_published_level_ || any_mandatory) {
        telemetry_bus_.publish(TelemetryEvent{SteadyClock::now(), ReserveStatus{level, std::move(actions)}});
        last_published_level_ = level;
    }
}

void ControlRuntime::failsafe_tick() {
    const EnergyState energy = propulsion_->get_energy_state();
    const PropulsionType type = propulsion_->type();
    if (carries_battery(type)) {
        failsafe_system_.update_battery(energy.battery_soc);
    }
    if (carries_fuel(type)) {
        failsafe_system_.update_fuel(energy.fuel_level);
    }
    failsafe_system_.ingest_propulsion_health(propulsion_->get_health());
    failsafe_system_.monitor();
}

/**
 * @brief Fixed-period loop; each tick runs to completion before cancellation
 *        is observed.
 */
void ControlRuntime::run_periodic(Duration interval, std::string_view loop_name, const std::function<void()>& tick) {
    const SteadyClock::duration steady_interval = std::chrono::duration_cast<SteadyClock::duration>(interval);
    auto next_tick = SteadyClock::now();
    while (flag_running_.load()) {
        try {
            tick();
        } catch (const std::exception& exc) {
            logger_->error(R"({{"component":"runtime","event":"tick_error","loop":"{}","error":{}}})", loop_name, json_quote(exc.what()));
        }
        next_tick += steady_interval;
        const TimePoint now = SteadyClock::now();
        if (next_tick < now) {
            next_tick = now;
        }
        std::unique_lock lock(mutex_wake_);
        cv_wake_.wait_until(lock, next_tick, [this]() { return !flag_running_.load(); });
    }
}

void ControlRuntime::register_energy_sources() {
    const PropulsionType type = propulsion_->type();
    if (carries_battery(type)) {
        reserve_manager_.set_battery_soc_source(std::make_shared<PropulsionBatterySource>(propulsion_));
    }
    if (carries_fuel(type)) {
        reserve_manager_.set_fuel_level_source(std::make_shared<PropulsionFuelSource>(propulsion_));
    }
}

void ControlRuntime::wire_callbacks() {
    reserve_manager_.set_level_change_callback([this](ReserveLevel, ReserveLevel current) {
        if (is_worse(current, ReserveLevel::Mission)) {
            decision_engine_.abort_mission();
        }
    });
    failsafe_system_.set_mode_change_callback([this](FlightMode from, FlightMode to) {
        telemetry_bus_.publish(TelemetryEvent{SteadyClock::now(), FlightModeChanged{from, to}});
    });
    failsafe_system_.set_emergency_callback([this](const std::vector<ActiveEmergency>& emergencies, const Escalation& escalation) {
        telemetry_bus_.publish(TelemetryEvent{SteadyClock::now(), EmergencyStatus{emergencies, escalation}});
    });
}

}  // namespace flight_safety
