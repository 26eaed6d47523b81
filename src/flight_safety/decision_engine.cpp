#include "flight_safety/decision_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

#include <fmt/format.h>

#include "flight_safety/errors.hpp"
#include "flight_safety/logging.hpp"

namespace flight_safety {

namespace {
constexpr double k_heading_to_yaw_gain{1.0};       /**< Yaw rate per radian of heading error. */
constexpr double k_heading_to_roll_gain{1.0};      /**< Bank angle per radian of heading error. */
constexpr double k_altitude_gain{0.2};             /**< Vertical speed per metre of altitude error. */
constexpr double k_min_airspeed_mps{15.0};         /**< Floor for the flight-path angle computation. */
constexpr double k_climb_throttle_gain{0.3};
constexpr double k_speed_throttle_gain{0.02};
constexpr double k_landing_descent_fraction{0.5};  /**< Share of the max vertical speed used to land. */
constexpr double k_landing_throttle_fraction{0.6};
constexpr double k_threat_throttle_gain{0.3};
constexpr double k_missile_pitch_gain{0.5};
constexpr double k_floor_pitch_fraction{0.8};

bool is_positive(double value) noexcept {
    return std::isfinite(value) && value > 0.0;
}

bool is_fraction(double value) noexcept {
    return std::isfinite(value) && value >= 0.0 && value <= 1.0;
}

double finite_or_zero(double value) noexcept {
    return std::isfinite(value) ? value : 0.0;
}
}  // namespace

void validate(const DecisionConfig& config) {
    if (!is_positive(config.max_roll_angle_rad) || !is_positive(config.max_pitch_angle_rad) || !is_positive(config.max_yaw_rate_rad_s)) {
        throw ConfigurationError("Decision attitude and rate limits must be positive");
    }
    if (!is_positive(config.max_vertical_speed_mps) || !is_positive(config.decision_rate_hz)) {
        throw ConfigurationError("Decision vertical speed and rate must be positive");
    }
    if (!std::isfinite(config.min_safe_altitude_m) || config.min_safe_altitude_m < 0.0) {
        throw ConfigurationError("Minimum safe altitude cannot be negative");
    }
    if (!is_positive(config.threat_avoidance_radius_m) || !is_positive(config.waypoint_acceptance_radius_m)) {
        throw ConfigurationError("Threat and waypoint radii must be positive");
    }
    if (!is_fraction(config.cruise_throttle) || !is_fraction(config.emergency_power_cap)) {
        throw ConfigurationError(fmt::format("Cruise throttle {} and emergency power cap {} must lie in [0, 1]",
                                             config.cruise_throttle, config.emergency_power_cap));
    }
    if (!is_positive(config.backup_limit_scale) || config.backup_limit_scale > 1.0) {
        throw ConfigurationError(fmt::format("Backup limit scale {} must lie in (0, 1]", config.backup_limit_scale));
    }
}

std::string_view to_string(GuidanceDirective directive) noexcept {
    switch (directive) {
        case GuidanceDirective::FollowMission:
            return "follow_mission";
        case GuidanceDirective::ReturnToBase:
            return "return_to_base";
        case GuidanceDirective::NearestLanding:
            return "nearest_landing";
        case GuidanceDirective::ImmediateLanding:
            return "immediate_landing";
        case GuidanceDirective::Hold:
            return "hold";
    }
    return "follow_mission";
}

DecisionEngine::DecisionEngine(DecisionConfig config)
    : config_(std::move(config)),
      threats_(std::make_shared<const std::vector<Threat>>()),
      logger_(get_logger()) {}

void DecisionEngine::initialize() {
    validate(config_);
    std::scoped_lock lock(mutex_);
    flag_initialized_ = true;
    logger_->info(R"({{"component":"decision","event":"initialized","rate_hz":{},"threat_avoidance":{}}})",
                  config_.decision_rate_hz, config_.enable_threat_avoidance);
}

bool DecisionEngine::is_initialized() const {
    std::scoped_lock lock(mutex_);
    return flag_initialized_;
}

void DecisionEngine::set_mission(Mission mission) {
    auto snapshot = std::make_shared<const Mission>(std::move(mission));
    std::scoped_lock lock(mutex_);
    mission_status_ = snapshot->status;
    waypoint_index_ = 0;
    loiter_until_.reset();
    mission_ = std::move(snapshot);
    logger_->info(R"({{"component":"decision","event":"mission_set","id":{},"type":"{}","waypoints":{},"status":"{}"}})",
                  json_quote(mission_->id), to_string(mission_->type), mission_->waypoints.size(), to_string(mission_status_));
}

void DecisionEngine::start_mission() {
    std::scoped_lock lock(mutex_);
    if (mission_ == nullptr) {
        throw LifecycleError("start_mission() without a mission");
    }
    switch (mission_status_) {
        case MissionStatus::Active:
            return;
        case MissionStatus::Completed:
        case MissionStatus::Aborted:
            throw LifecycleError(fmt::format("start_mission() not allowed while {}", to_string(mission_status_)));
        case MissionStatus::Pending:
            break;
    }
    mission_status_ = MissionStatus::Active;
    logger_->info(R"({{"component":"decision","event":"mission_started","id":{}}})", json_quote(mission_->id));
}

void DecisionEngine::abort_mission() {
    std::scoped_lock lock(mutex_);
    if (mission_ == nullptr) {
        return;
    }
    if (mission_status_ == MissionStatus::Pending || mission_status_ == MissionStatus::Active) {
        mission_status_ = MissionStatus::Aborted;
        logger_->warn(R"({{"component":"decision","event":"mission_aborted","id":{}}})", json_quote(mission_->id));
    }
}

MissionStatus DecisionEngine::mission_status() const {
    std::scoped_lock lock(mutex_);
    return mission_status_;
}

std::shared_ptr<const Mission> DecisionEngine::mission() const {
    std::scoped_lock lock(mutex_);
    return mission_;
}

std::size_t DecisionEngine::current_waypoint_index() const {
    std::scoped_lock lock(mutex_);
    return waypoint_index_;
}

void DecisionEngine::update_threats(std::vector<Threat> threats) {
    auto snapshot = std::make_shared<const std::vector<Threat>>(std::move(threats));
    std::scoped_lock lock(mutex_);
    threats_ = std::move(snapshot);
}

void DecisionEngine::update_vehicle_state(const VehicleState& state) {
    std::scoped_lock lock(mutex_);
    vehicle_state_ = state;
}

void DecisionEngine::attach_reserve_manager(const ReserveManager& reserve) {
    std::scoped_lock lock(mutex_);
    reserve_ = &reserve;
}

void DecisionEngine::attach_failsafe(const FailsafeSystem& failsafe) {
    std::scoped_lock lock(mutex_);
    failsafe_ = &failsafe;
}

const DecisionConfig& DecisionEngine::config() const noexcept {
    return config_;
}

FlightCommand DecisionEngine::decide() {
    const ReserveManager* reserve = nullptr;
    const FailsafeSystem* failsafe = nullptr;
    {
        std::scoped_lock lock(mutex_);
        if (!flag_initialized_) {
            throw InvariantError("decide() called before initialize()");
        }
        reserve = reserve_;
        failsafe = failsafe_;
    }
    // Collaborator accessors are read before taking our own lock.
    const RecoveryState recovery = read_recovery_state(reserve, failsafe);

    std::scoped_lock lock(mutex_);
    const TimePoint now = SteadyClock::now();
    if (recovery.directive != last_directive_) {
        logger_->warn(R"({{"component":"decision","event":"directive_change","from":"{}","to":"{}"}})",
                      to_string(last_directive_), to_string(recovery.directive));
        last_directive_ = recovery.directive;
    }

    FlightCommand command{};
    bool flag_guided = false;
    bool flag_landing = false;
    switch (recovery.directive) {
        case GuidanceDirective::FollowMission: {
            std::optional<FlightCommand> nominal = follow_mission_locked(now);
            if (!nominal) {
                command = safe_default_locked(GuidanceDirective::FollowMission);
                clamp_to_envelope(command, envelope(recovery.flag_backup_limits));
                command.timestamp = now;
                return command;
            }
            command = *nominal;
            flag_guided = true;
            break;
        }
        case GuidanceDirective::ReturnToBase: {
            const Vector3 target = recovery.target.value_or(config_.recovery.home);
            command = guide_toward_locked(target, std::max(target.z, config_.min_safe_altitude_m), 0.0);
            command.emergency_rtb = true;
            flag_guided = true;
            break;
        }
        case GuidanceDirective::NearestLanding: {
            const Vector3 target = recovery.target.value_or(nearest_landing_zone_locked());
            if (horizontal_distance_m(vehicle_state_.position, target) <= config_.waypoint_acceptance_radius_m) {
                command = immediate_landing_locked(false);
                flag_landing = true;
            } else {
                const double cruise_altitude_m = std::max(vehicle_state_.position.z, config_.min_safe_altitude_m);
                command = guide_toward_locked(target, cruise_altitude_m, 0.0);
                flag_guided = true;
            }
            command.auto_land = true;
            break;
        }
        case GuidanceDirective::ImmediateLanding:
            command = immediate_landing_locked(recovery.flag_parachute);
            flag_landing = true;
            break;
        case GuidanceDirective::Hold:
            command = safe_default_locked(GuidanceDirective::Hold);
            break;
    }
    command.directive = recovery.directive;

    if (flag_guided) {
        apply_threat_bias_locked(command);
    }
    if (recovery.flag_power_cap) {
        command.throttle = std::min(command.throttle, config_.emergency_power_cap);
    }
    if (!flag_landing) {
        apply_altitude_floor_locked(command);
    }
    clamp_to_envelope(command, envelope(recovery.flag_backup_limits));
    command.timestamp = now;
    return command;
}

/**
 * @brief Map the reserve tier and failsafe state onto a directive; the more
 *        severe input wins.
 */
DecisionEngine::RecoveryState DecisionEngine::read_recovery_state(const ReserveManager* reserve,
                                                                  const FailsafeSystem* failsafe) const {
    RecoveryState state{};
    auto escalate = [&state](GuidanceDirective directive, std::optional<Vector3> target) {
        if (static_cast<int>(directive) > static_cast<int>(state.directive)) {
            state.directive = directive;
            state.target = target;
        }
    };

    if (reserve != nullptr) {
        switch (reserve->current_level()) {
            case ReserveLevel::Mission:
                break;
            case ReserveLevel::Contingency:
                escalate(GuidanceDirective::ReturnToBase, config_.recovery.home);
                break;
            case ReserveLevel::Emergency:
                escalate(GuidanceDirective::NearestLanding, std::nullopt);
                state.flag_power_cap = true;
                break;
            case ReserveLevel::Absolute:
                escalate(GuidanceDirective::ImmediateLanding, std::nullopt);
                break;
        }
    }

    if (failsafe != nullptr) {
        switch (failsafe->get_mode()) {
            case FlightMode::Primary:
                break;
            case FlightMode::Backup:
                state.flag_backup_limits = true;
                break;
            case FlightMode::Emergency: {
                const Escalation escalation = failsafe->current_escalation();
                if (reached_step(escalation.procedure, escalation.active_step, ProcedureStepAction::ReduceThrottle)) {
                    state.flag_power_cap = true;
                }
                switch (escalation.action) {
                    case EscalationAction::None:
                        break;
                    case EscalationAction::ReturnToBase:
                        escalate(GuidanceDirective::ReturnToBase, escalation.target);
                        break;
                    case EscalationAction::NearestLanding:
                        escalate(GuidanceDirective::NearestLanding, escalation.target);
                        break;
                    case EscalationAction::ImmediateLanding:
                        escalate(GuidanceDirective::ImmediateLanding, std::nullopt);
                        break;
                    case EscalationAction::Parachute:
                        escalate(GuidanceDirective::ImmediateLanding, std::nullopt);
                        state.flag_parachute = true;
                        break;
                }
                break;
            }
            case FlightMode::Manual:
                escalate(GuidanceDirective::Hold, std::nullopt);
                break;
        }
    }
    return state;
}

FlightCommand DecisionEngine::safe_default_locked(GuidanceDirective directive) const {
    FlightCommand command{};
    command.roll_rad = 0.0;
    command.pitch_rad = 0.0;
    command.yaw_rate_rad_s = 0.0;
    command.throttle = config_.cruise_throttle;
    command.auto_throttle = true;
    command.directive = directive;
    return command;
}

FlightCommand DecisionEngine::guide_toward_locked(const Vector3& target, double target_altitude_m, double target_speed_mps) const {
    const VehicleState& state = vehicle_state_;
    FlightCommand command{};

    const double heading_error = wrap_pi(bearing_rad(state.position, target) - state.heading_rad);
    command.yaw_rate_rad_s = k_heading_to_yaw_gain * heading_error;
    command.roll_rad = k_heading_to_roll_gain * heading_error;

    const double vertical_rate = std::clamp(k_altitude_gain * (target_altitude_m - state.position.z),
                                            -config_.max_vertical_speed_mps, config_.max_vertical_speed_mps);
    const double ground_speed = std::hypot(state.velocity.x, state.velocity.y);
    command.pitch_rad = std::atan2(vertical_rate, std::max(ground_speed, k_min_airspeed_mps));

    command.throttle = config_.cruise_throttle + k_climb_throttle_gain * vertical_rate / config_.max_vertical_speed_mps;
    if (target_speed_mps > 0.0) {
        command.throttle += k_speed_throttle_gain * (target_speed_mps - ground_speed);
    }
    command.auto_throttle = false;
    return command;
}

FlightCommand DecisionEngine::immediate_landing_locked(bool parachute) const {
    FlightCommand command{};
    const double ground_speed = std::hypot(vehicle_state_.velocity.x, vehicle_state_.velocity.y);
    const double descent_rate = k_landing_descent_fraction * config_.max_vertical_speed_mps;
    command.roll_rad = 0.0;
    command.yaw_rate_rad_s = 0.0;
    command.pitch_rad = -std::atan2(descent_rate, std::max(ground_speed, k_min_airspeed_mps));
    command.throttle = parachute ? 0.0 : config_.cruise_throttle * k_landing_throttle_fraction;
    command.auto_throttle = !parachute;
    command.auto_land = true;
    return command;
}

/**
 * @brief Advance waypoint bookkeeping and compute the nominal command.
 *
 * Returns nullopt when there is nothing to fly (no mission, not active, or
 * just completed).
 */
std::optional<FlightCommand> DecisionEngine::follow_mission_locked(TimePoint now) {
    if (mission_ == nullptr || mission_status_ != MissionStatus::Active) {
        return std::nullopt;
    }
    const std::vector<Waypoint>& waypoints = mission_->waypoints;

    if (loiter_until_) {
        if (now < *loiter_until_) {
            return safe_default_locked(GuidanceDirective::FollowMission);
        }
        loiter_until_.reset();
        ++waypoint_index_;
    }

    while (waypoint_index_ < waypoints.size()) {
        const Waypoint& waypoint = waypoints[waypoint_index_];
        if (horizontal_distance_m(vehicle_state_.position, waypoint.position) > config_.waypoint_acceptance_radius_m) {
            break;
        }
        logger_->info(R"({{"component":"decision","event":"waypoint_reached","mission":{},"waypoint":{},"index":{}}})",
                      json_quote(mission_->id), json_quote(waypoint.id), waypoint_index_);
        if (waypoint.loiter.count() > 0.0) {
            loiter_until_ = now + std::chrono::duration_cast<SteadyClock::duration>(waypoint.loiter);
            return safe_default_locked(GuidanceDirective::FollowMission);
        }
        ++waypoint_index_;
    }

    if (waypoint_index_ >= waypoints.size()) {
        mission_status_ = MissionStatus::Completed;
        logger_->info(R"({{"component":"decision","event":"mission_completed","id":{}}})", json_quote(mission_->id));
        return std::nullopt;
    }

    const Waypoint& waypoint = waypoints[waypoint_index_];
    double target_altitude_m = vehicle_state_.position.z;
    if (waypoint.altitude_m > 0.0) {
        target_altitude_m = waypoint.altitude_m;
    } else if (waypoint.position.z > 0.0) {
        target_altitude_m = waypoint.position.z;
    }
    return guide_toward_locked(waypoint.position, target_altitude_m, waypoint.speed_mps);
}

/**
 * @brief Bias roll away from each threat inside the avoidance radius.
 *
 * Weight is severity x (1 - distance / radius). Threats dead ahead are
 * avoided to the left.
 */
void DecisionEngine::apply_threat_bias_locked(FlightCommand& command) const {
    if (!config_.enable_threat_avoidance) {
        return;
    }
    const VehicleState& state = vehicle_state_;
    const double radius = config_.threat_avoidance_radius_m;
    for (const Threat& threat : *threats_) {
        const bool has_reported_range = threat.distance_m > 0.0;
        const double distance = has_reported_range ? threat.distance_m : distance_m(state.position, threat.position);
        if (distance > radius) {
            continue;
        }
        const double weight = std::clamp(threat.severity, 0.0, 1.0) * (1.0 - distance / radius);
        const double absolute_bearing = has_reported_range ? threat.bearing_rad : bearing_rad(state.position, threat.position);
        const double relative_bearing = wrap_pi(absolute_bearing - state.heading_rad);
        const double side = relative_bearing < 0.0 ? -1.0 : 1.0;

        command.roll_rad -= side * weight * config_.max_roll_angle_rad;
        command.throttle += k_threat_throttle_gain * weight;
        if (threat.type == ThreatType::Missile) {
            const double away = threat.position.z >= state.position.z ? -1.0 : 1.0;
            command.pitch_rad += away * weight * k_missile_pitch_gain * config_.max_pitch_angle_rad;
        }
    }
}

void DecisionEngine::apply_altitude_floor_locked(FlightCommand& command) const {
    const double altitude = vehicle_state_.position.z;
    const double projected = altitude + vehicle_state_.velocity.z / config_.decision_rate_hz;
    if (altitude < config_.min_safe_altitude_m || projected < config_.min_safe_altitude_m) {
        command.pitch_rad = k_floor_pitch_fraction * config_.max_pitch_angle_rad;
        command.throttle = 1.0;
    }
}

Vector3 DecisionEngine::nearest_landing_zone_locked() const {
    Vector3 nearest = config_.recovery.home;
    double best_distance_m = std::numeric_limits<double>::max();
    for (const Vector3& zone : config_.recovery.landing_zones) {
        const double distance = horizontal_distance_m(vehicle_state_.position, zone);
        if (distance < best_distance_m) {
            best_distance_m = distance;
            nearest = zone;
        }
    }
    return nearest;
}

DecisionEngine::Envelope DecisionEngine::envelope(bool backup_limits) const noexcept {
    const double scale = backup_limits ? config_.backup_limit_scale : 1.0;
    return Envelope{config_.max_roll_angle_rad * scale, config_.max_pitch_angle_rad * scale, config_.max_yaw_rate_rad_s * scale};
}

void DecisionEngine::clamp_to_envelope(FlightCommand& command, const Envelope& limits) noexcept {
    command.roll_rad = std::clamp(finite_or_zero(command.roll_rad), -limits.roll_rad, limits.roll_rad);
    command.pitch_rad = std::clamp(finite_or_zero(command.pitch_rad), -limits.pitch_rad, limits.pitch_rad);
    command.yaw_rate_rad_s = std::clamp(finite_or_zero(command.yaw_rate_rad_s), -limits.yaw_rate_rad_s, limits.yaw_rate_rad_s);
    command.throttle = std::clamp(finite_or_zero(command.throttle), 0.0, 1.0);
}

}  // namespace flight_safety
