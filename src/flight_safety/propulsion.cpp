#include "flight_safety/propulsion.hpp"

#include <cmath>
#include <exception>
#include <utility>

#include <fmt/format.h>

#include "flight_safety/errors.hpp"
#include "flight_safety/logging.hpp"

namespace flight_safety {

namespace {
constexpr double k_min_vector_norm{0.5}; /**< Lower bound for a "unit-ish" thrust vector. */
constexpr double k_max_vector_norm{1.5}; /**< Upper bound for a "unit-ish" thrust vector. */

void log_transition(const std::string& identifier, LifecycleState from, LifecycleState to) {
    get_logger()->info(
        R"({{"component":"propulsion","backend":{},"event":"lifecycle","from":"{}","to":"{}"}})",
        json_quote(identifier),
        to_string(from),
        to_string(to)
    );
}
}  // namespace

std::string_view to_string(PropulsionType type) noexcept {
    switch (type) {
        case PropulsionType::Electric:
            return "electric";
        case PropulsionType::Combustion:
            return "combustion";
        case PropulsionType::Turbine:
            return "turbine";
        case PropulsionType::Hybrid:
            return "hybrid";
        case PropulsionType::Rocket:
            return "rocket";
    }
    return "electric";
}

std::string_view to_string(LifecycleState state) noexcept {
    switch (state) {
        case LifecycleState::Uninitialized:
            return "uninitialized";
        case LifecycleState::Initialized:
            return "initialized";
        case LifecycleState::Running:
            return "running";
        case LifecycleState::Stopped:
            return "stopped";
    }
    return "uninitialized";
}

PropulsionBase::PropulsionBase(std::string identifier)
    : str_identifier_(std::move(identifier)) {
    if (str_identifier_.empty()) {
        throw ConfigurationError("Propulsion backend identifier cannot be empty");
    }
}

const std::string& PropulsionBase::identifier() const noexcept {
    return str_identifier_;
}

LifecycleState PropulsionBase::lifecycle_state() const {
    std::scoped_lock lock(mutex_lifecycle_);
    return lifecycle_state_;
}

void PropulsionBase::initialize() {
    std::scoped_lock lock(mutex_lifecycle_);
    switch (lifecycle_state_) {
        case LifecycleState::Initialized:
            return;
        case LifecycleState::Running:
        case LifecycleState::Stopped:
            throw LifecycleError(fmt::format("{}: initialize() not allowed while {}", str_identifier_, to_string(lifecycle_state_)));
        case LifecycleState::Uninitialized:
            break;
    }
    on_initialize();
    log_transition(str_identifier_, lifecycle_state_, LifecycleState::Initialized);
    lifecycle_state_ = LifecycleState::Initialized;
}

void PropulsionBase::start() {
    std::scoped_lock lock(mutex_lifecycle_);
    switch (lifecycle_state_) {
        case LifecycleState::Running:
            return;
        case LifecycleState::Uninitialized:
        case LifecycleState::Stopped:
            throw LifecycleError(fmt::format("{}: start() not allowed while {}", str_identifier_, to_string(lifecycle_state_)));
        case LifecycleState::Initialized:
            break;
    }
    on_start();
    log_transition(str_identifier_, lifecycle_state_, LifecycleState::Running);
    lifecycle_state_ = LifecycleState::Running;
}

void PropulsionBase::stop() {
    std::scoped_lock lock(mutex_lifecycle_);
    switch (lifecycle_state_) {
        case LifecycleState::Stopped:
            return;
        case LifecycleState::Uninitialized:
            throw LifecycleError(fmt::format("{}: stop() before initialize()", str_identifier_));
        case LifecycleState::Initialized:
        case LifecycleState::Running:
            break;
    }
    on_stop();
    log_transition(str_identifier_, lifecycle_state_, LifecycleState::Stopped);
    lifecycle_state_ = LifecycleState::Stopped;
}

void PropulsionBase::set_thrust_command(double thrust) {
    if (!std::isfinite(thrust) || thrust < 0.0 || thrust > 1.0) {
        throw OutOfRangeError(fmt::format("{}: thrust command {} outside [0, 1]", str_identifier_, thrust));
    }
    std::scoped_lock lock(mutex_lifecycle_);
    require_running("set_thrust_command");
    apply_thrust_command(thrust);
}

void PropulsionBase::set_thrust_vector(const Vector3& vector) {
    const double norm = std::sqrt(vector.x * vector.x + vector.y * vector.y + vector.z * vector.z);
    if (!std::isfinite(norm) || norm < k_min_vector_norm || norm > k_max_vector_norm) {
        throw OutOfRangeError(fmt::format("{}: thrust vector norm {} outside [{}, {}]",
                                          str_identifier_, norm, k_min_vector_norm, k_max_vector_norm));
    }
    std::scoped_lock lock(mutex_lifecycle_);
    require_running("set_thrust_vector");
    apply_thrust_vector(vector);
}

void PropulsionBase::emergency_shutdown() {
    std::scoped_lock lock(mutex_lifecycle_);
    auto logger = get_logger();
    logger->critical(R"({{"component":"propulsion","backend":{},"event":"emergency_shutdown","from":"{}"}})",
                     json_quote(str_identifier_), to_string(lifecycle_state_));
    bool confirmed = false;
    try {
        confirmed = perform_emergency_shutdown();
    } catch (const std::exception& exc) {
        lifecycle_state_ = LifecycleState::Stopped;
        throw FatalPropulsionError(fmt::format("{}: emergency shutdown failed: {}", str_identifier_, exc.what()));
    }
    lifecycle_state_ = LifecycleState::Stopped;
    if (!confirmed) {
        throw FatalPropulsionError(fmt::format("{}: emergency shutdown not confirmed", str_identifier_));
    }
}

void PropulsionBase::require_running(std::string_view operation) const {
    if (lifecycle_state_ != LifecycleState::Running) {
        throw LifecycleError(fmt::format("{}: {}() requires running backend (state {})",
                                         str_identifier_, operation, to_string(lifecycle_state_)));
    }
}

}  // namespace flight_safety
