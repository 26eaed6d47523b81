// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the flight-safety core (time primitives, local-frame vectors, health
// classification, recovery points).

#pragma once

#include <chrono>
#include <string_view>
#include <vector>

namespace flight_safety {

/**
 * @brief Alias for the steady clock used across the core.
 */
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief Alias for timestamps captured from the steady clock.
 */
using TimePoint = std::chrono::time_point<SteadyClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Local-frame vector in metres: x east, y north, z up.
 */
struct Vector3 final {
    double x{};  /**< East component. */
    double y{};  /**< North component. */
    double z{};  /**< Up component (altitude above ground for positions). */
};

/**
 * @brief Ordered health classification shared by propulsion and failsafe.
 *
 * A worse status has a strictly greater ordinal.
 */
enum class HealthStatus {
    Ok,        /**< Nominal operation. */
    Degraded,  /**< Operating with reduced margin. */
    Critical,  /**< Close to failure; still functional. */
    Failed     /**< Not functional. */
};

/**
 * @brief Fixed locations used by recovery manoeuvres.
 */
struct RecoveryPoints final {
    Vector3 home{0.0, 0.0, 500.0};         /**< Return-to-base target. */
    std::vector<Vector3> landing_zones{};  /**< Pre-surveyed emergency landing zones. */
};

[[nodiscard]] std::string_view to_string(HealthStatus status) noexcept;

/**
 * @brief Return the worse of two health statuses.
 */
[[nodiscard]] constexpr HealthStatus worst_of(HealthStatus lhs, HealthStatus rhs) noexcept {
    return static_cast<int>(lhs) >= static_cast<int>(rhs) ? lhs : rhs;
}

/**
 * @brief Euclidean distance between two local-frame points.
 */
[[nodiscard]] double distance_m(const Vector3& from, const Vector3& to) noexcept;

/**
 * @brief Horizontal (x/y) distance between two local-frame points.
 */
[[nodiscard]] double horizontal_distance_m(const Vector3& from, const Vector3& to) noexcept;

/**
 * @brief Bearing from @p from to @p to in radians, clockwise from north.
 */
[[nodiscard]] double bearing_rad(const Vector3& from, const Vector3& to) noexcept;

/**
 * @brief Wrap an angle into (-pi, pi].
 */
[[nodiscard]] double wrap_pi(double angle_rad) noexcept;

}  // namespace flight_safety
