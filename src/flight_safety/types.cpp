#include "flight_safety/types.hpp"

#include <cmath>
#include <numbers>

namespace flight_safety {

std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Ok:
            return "ok";
        case HealthStatus::Degraded:
            return "degraded";
        case HealthStatus::Critical:
            return "critical";
        case HealthStatus::Failed:
            return "failed";
    }
    return "ok";
}

double distance_m(const Vector3& from, const Vector3& to) noexcept {
    const double dx = to.x - from.x;
    const double dy = to.y - from.y;
    const double dz = to.z - from.z;
    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

double horizontal_distance_m(const Vector3& from, const Vector3& to) noexcept {
    return std::hypot(to.x - from.x, to.y - from.y);
}

double bearing_rad(const Vector3& from, const Vector3& to) noexcept {
    return std::atan2(to.x - from.x, to.y - from.y);
}

double wrap_pi(double angle_rad) noexcept {
    double wrapped = std::fmod(angle_rad + std::numbers::pi, 2.0 * std::numbers::pi);
    if (wrapped <= 0.0) {
        wrapped += 2.0 * std::numbers::pi;
    }
    return wrapped - std::numbers::pi;
}

}  // namespace flight_safety
