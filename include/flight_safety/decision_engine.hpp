// === Decision Engine =========================================================
//
// Converts the active mission, the tracked threats, and the recovery state of
// the reserve manager and failsafe system into one bounded flight command per
// control tick.
//
// Per-tick pipeline
// 1. Derive the guidance directive (the more severe of reserve tier and
//    failsafe state wins).
// 2. Without an active mission or a recovery directive, emit the safe default.
// 3. Nominal guidance toward the current target, then threat-avoidance bias,
//    then the emergency power cap, then the altitude floor.
// 4. Clamp every axis to the configured envelope. Always last.

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "flight_safety/failsafe_system.hpp"
#include "flight_safety/mission.hpp"
#include "flight_safety/reserve_manager.hpp"
#include "flight_safety/types.hpp"

namespace flight_safety {

/**
 * @brief What the engine is flying toward, ordered from least to most severe.
 */
enum class GuidanceDirective {
    FollowMission,
    ReturnToBase,
    NearestLanding,
    ImmediateLanding,
    Hold
};

struct DecisionConfig final {
    double max_roll_angle_rad{0.785};
    double max_pitch_angle_rad{0.524};
    double max_yaw_rate_rad_s{0.349};
    double min_safe_altitude_m{100.0};
    double max_vertical_speed_mps{10.0};
    bool enable_threat_avoidance{true};
    double threat_avoidance_radius_m{5000.0};
    double waypoint_acceptance_radius_m{50.0};
    double cruise_throttle{0.5};           /**< Throttle of the safe default and nominal cruise. */
    double decision_rate_hz{50.0};
    double backup_limit_scale{0.5};        /**< Attitude limit scale while the failsafe is in Backup. */
    double emergency_power_cap{0.6};       /**< Throttle ceiling at the Emergency reserve tier. */
    RecoveryPoints recovery{};
};

/** @brief Throws ConfigurationError when a limit is outside its domain. */
void validate(const DecisionConfig& config);

struct FlightCommand final {
    TimePoint timestamp{};
    double roll_rad{};
    double pitch_rad{};
    double yaw_rate_rad_s{};
    double throttle{};
    bool auto_throttle{};
    bool auto_land{};
    bool emergency_rtb{};
    GuidanceDirective directive{GuidanceDirective::FollowMission};
};

/** @brief Fused navigation state pushed by the navigation collaborator. */
struct VehicleState final {
    Vector3 position{0.0, 0.0, 500.0};
    Vector3 velocity{};
    double heading_rad{};  /**< Clockwise from north. */
    TimePoint timestamp{SteadyClock::now()};
};

[[nodiscard]] std::string_view to_string(GuidanceDirective directive) noexcept;

/**
 * @brief Rate-driven flight-command generator.
 *
 * `decide()` fails only on internal invariant violations; a missing mission
 * or an empty threat set are ordinary states.
 */
class DecisionEngine final {
  public:
    explicit DecisionEngine(DecisionConfig config = {});

    /** @brief Validate the configuration and arm `decide()`. */
    void initialize();
    [[nodiscard]] bool is_initialized() const;

    /** @brief Replace the mission wholesale; status is kept as supplied. */
    void set_mission(Mission mission);
    /** @brief Pending -> Active. */
    void start_mission();
    /** @brief Pending/Active -> Aborted. */
    void abort_mission();
    [[nodiscard]] MissionStatus mission_status() const;
    [[nodiscard]] std::shared_ptr<const Mission> mission() const;
    [[nodiscard]] std::size_t current_waypoint_index() const;

    /** @brief Replace the working threat set wholesale. */
    void update_threats(std::vector<Threat> threats);
    void update_vehicle_state(const VehicleState& state);

    /** @brief Non-owning; @p reserve must outlive the engine. */
    void attach_reserve_manager(const ReserveManager& reserve);
    /** @brief Non-owning; @p failsafe must outlive the engine. */
    void attach_failsafe(const FailsafeSystem& failsafe);

    /** @brief Produce the command for the current tick. */
    [[nodiscard]] FlightCommand decide();

    [[nodiscard]] const DecisionConfig& config() const noexcept;

  private:
    struct RecoveryState final {
        GuidanceDirective directive{GuidanceDirective::FollowMission};
        std::optional<Vector3> target{};
        bool flag_power_cap{false};
        bool flag_backup_limits{false};
        bool flag_parachute{false};
    };

    struct Envelope final {
        double roll_rad{};
        double pitch_rad{};
        double yaw_rate_rad_s{};
    };

    [[nodiscard]] RecoveryState read_recovery_state(const ReserveManager* reserve, const FailsafeSystem* failsafe) const;
    [[nodiscard]] FlightCommand safe_default_locked(GuidanceDirective directive) const;
    [[nodiscard]] FlightCommand guide_toward_locked(const Vector3& target, double target_altitude_m, double target_speed_mps) const;
    [[nodiscard]] FlightCommand immediate_landing_locked(bool parachute) const;
    [[nodiscard]] std::optional<FlightCommand> follow_mission_locked(TimePoint now);
    void apply_threat_bias_locked(FlightCommand& command) const;
    void apply_altitude_floor_locked(FlightCommand& command) const;
    [[nodiscard]] Vector3 nearest_landing_zone_locked() const;
    [[nodiscard]] Envelope envelope(bool backup_limits) const noexcept;
    static void clamp_to_envelope(FlightCommand& command, const Envelope& limits) noexcept;

    const DecisionConfig config_;
    mutable std::mutex mutex_;
    bool flag_initialized_{false};
    std::shared_ptr<const Mission> mission_;
    MissionStatus mission_status_{MissionStatus::Pending};
    std::size_t waypoint_index_{};
    std::optional<TimePoint> loiter_until_{};
    std::shared_ptr<const std::vector<Threat>> threats_;
    VehicleState vehicle_state_{};
    const ReserveManager* reserve_{nullptr};
    const FailsafeSystem* failsafe_{nullptr};
    GuidanceDirective last_directive_{GuidanceDirective::FollowMission};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flight_safety
