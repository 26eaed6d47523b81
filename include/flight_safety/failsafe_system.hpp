// === Failsafe System =========================================================
//
// Authoritative arbiter of flight mode and registry of active emergencies.
// Collaborators push subsystem health, energy levels, and communication
// contacts; `monitor()` re-evaluates the mode, reconciles the emergency
// registry, and selects an escalation according to `FailsafeConfig`.
//
// Escalation policy
// - Severe triggers (structural damage, engine or hydraulic failure, energy at
//   or below the exhaustion level) prefer a controlled landing, then the
//   parachute, then return-to-base.
// - Every other trigger prefers return-to-base, then a controlled landing,
//   then the parachute.
// - An unconfirmed propulsion shutdown always takes the worst tier available.
// - The trigger is the first severe record, otherwise the record whose
//   procedure has the most urgent priority. Its catalogue procedure runs
//   before the terminal action; a landing target follows the vehicle while
//   the escalation stays in force.

#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "flight_safety/emergency_procedure.hpp"
#include "flight_safety/propulsion.hpp"
#include "flight_safety/types.hpp"

namespace flight_safety {

enum class FlightMode {
    Primary,    /**< All subsystems nominal. */
    Backup,     /**< At least one subsystem Degraded or Critical. */
    Emergency,  /**< At least one emergency condition active. */
    Manual      /**< Operator override; sticky until released. */
};

enum class EmergencyResolution {
    Detected,   /**< Condition seen; no escalation covers it yet. */
    Escalated   /**< An escalation action has been issued for it. */
};

struct ActiveEmergency final {
    EmergencyType type{EmergencyType::EngineFailure};
    TimePoint detected_at{};
    EmergencyResolution resolution{EmergencyResolution::Detected};
    std::string detail{};

    friend bool operator==(const ActiveEmergency&, const ActiveEmergency&) = default;
};

struct Escalation final {
    EscalationAction action{EscalationAction::None};
    EmergencyType trigger{EmergencyType::EngineFailure};
    Vector3 target{};
    TimePoint issued_at{};
    Procedure procedure{};       /**< Catalogue procedure of the trigger plus the terminal step for `action`. */
    std::size_t active_step{0};  /**< Index into `procedure.steps`. */
};

struct FailsafeConfig final {
    bool enable_auto_rtb{true};
    bool enable_auto_land{true};
    bool enable_parachute{false};

    double min_safe_fuel{0.15};
    double min_safe_battery{0.15};
    double exhaustion_level{0.05};               /**< Energy at or below this is treated as exhaustion. */
    Duration max_time_without_comms{300.0};
    Duration check_interval{0.1};

    RecoveryPoints recovery{};
    std::map<std::string, EmergencyType> failure_emergencies{
        {"primary_flight", EmergencyType::ElectricalFailure},
        {"backup_flight", EmergencyType::ElectricalFailure},
        {"gps", EmergencyType::SensorFailure},
        {"ins", EmergencyType::SensorFailure},
        {"radar", EmergencyType::SensorFailure},
        {"comm", EmergencyType::CommunicationLoss},
        {"propulsion", EmergencyType::EngineFailure},
        {"hydraulics", EmergencyType::HydraulicFailure},
        {"airframe", EmergencyType::StructuralDamage},
    };  /**< Failed subsystem -> emergency; unknown names map to ElectricalFailure. */
};

/** @brief Throws ConfigurationError when a limit is outside its domain. */
void validate(const FailsafeConfig& config);

[[nodiscard]] std::string_view to_string(FlightMode mode) noexcept;
[[nodiscard]] std::string_view to_string(EmergencyResolution resolution) noexcept;

/**
 * @brief Flight-mode state machine and emergency registry.
 *
 * Setters only record the latest input; the mode is recomputed by
 * `monitor()` or `is_healthy()`.
 */
class FailsafeSystem final {
  public:
    using ModeChangeCallback = std::function<void(FlightMode, FlightMode)>;
    using EmergencyCallback = std::function<void(const std::vector<ActiveEmergency>&, const Escalation&)>;

    explicit FailsafeSystem(FailsafeConfig config = {});

    /** @brief Re-evaluate mode, emergencies, and escalation at @p now. */
    void monitor(TimePoint now);
    void monitor();

    /** @brief Overwrite one subsystem status (last write wins). */
    void update_health(const std::string& subsystem, HealthStatus status);
    void update_fuel(double level);
    void update_battery(double level);
    /** @brief Latest vehicle position, used to pick landing targets. */
    void update_position(const Vector3& position);
    void record_comm_contact();
    void record_comm_contact(TimePoint at);

    /** @brief Register an externally detected condition until cleared. */
    void raise_emergency(EmergencyType type, const std::string& detail);
    void clear_emergency(EmergencyType type);

    /** @brief Fold a propulsion backend health snapshot into subsystem `propulsion`. */
    void ingest_propulsion_health(const PropulsionHealth& health);
    /** @brief Unconfirmed propulsion shutdown: force Emergency and the worst escalation. */
    void report_fatal_propulsion_failure(const std::string& reason);

    void engage_manual_override();
    void release_manual_override();

    void set_mode_change_callback(ModeChangeCallback callback);
    void set_emergency_callback(EmergencyCallback callback);

    /** @brief Re-evaluates, then reports Primary with an empty registry. */
    [[nodiscard]] bool is_healthy();
    [[nodiscard]] std::vector<ActiveEmergency> get_active_emergencies() const;
    [[nodiscard]] FlightMode get_mode() const;
    [[nodiscard]] HealthStatus overall_health() const;
    [[nodiscard]] std::optional<HealthStatus> health_of(const std::string& subsystem) const;
    [[nodiscard]] Escalation current_escalation() const;
    [[nodiscard]] const FailsafeConfig& config() const noexcept;

  private:
    struct PendingDispatch final {
        bool flag_mode_changed{false};
        FlightMode mode_from{FlightMode::Primary};
        FlightMode mode_to{FlightMode::Primary};
        bool flag_registry_changed{false};
        std::vector<ActiveEmergency> list_emergencies{};
        Escalation escalation{};
        ModeChangeCallback callback_mode{};
        EmergencyCallback callback_emergency{};
    };

    void evaluate_locked(TimePoint now, PendingDispatch& pending);
    [[nodiscard]] std::map<EmergencyType, std::string> collect_conditions_locked(TimePoint now) const;
    [[nodiscard]] Escalation select_escalation_locked(TimePoint now) const;
    [[nodiscard]] bool energy_exhausted_locked() const noexcept;
    [[nodiscard]] Vector3 nearest_landing_locked() const;
    [[nodiscard]] EmergencyType emergency_for(const std::string& subsystem) const;
    void set_mode_locked(FlightMode mode, PendingDispatch& pending);
    void dispatch(const PendingDispatch& pending) const;

    const FailsafeConfig config_;
    mutable std::mutex mutex_;
    std::map<std::string, HealthStatus> map_subsystem_health_;
    double fuel_level_{1.0};
    double battery_level_{1.0};
    Vector3 position_{};
    TimePoint last_comm_time_{};
    FlightMode mode_{FlightMode::Primary};
    std::vector<ActiveEmergency> list_active_emergencies_;
    std::map<EmergencyType, std::string> map_raised_emergencies_;
    std::set<std::string> set_seen_fault_ids_;
    Escalation escalation_{};
    bool flag_fatal_propulsion_{false};
    bool flag_manual_override_{false};
    ModeChangeCallback callback_mode_change_;
    EmergencyCallback callback_emergency_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flight_safety
