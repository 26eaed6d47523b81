// === Mission Model ===========================================================
//
// Mission, waypoint, and threat records supplied by the external mission and
// threat providers. Waypoints are immutable once part of a mission snapshot.

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "flight_safety/types.hpp"

namespace flight_safety {

enum class MissionType {
    Recon,
    Transport,
    Patrol,
    Intercept,
    Rescue,
    Training
};

enum class MissionStatus {
    Pending,
    Active,
    Completed,
    Aborted
};

struct Waypoint final {
    std::string id{};
    Vector3 position{};
    double speed_mps{};
    double altitude_m{};    /**< Target altitude; position.z is ignored when positive. */
    double heading_rad{};
    Duration loiter{};
};

struct Mission final {
    std::string id{};
    MissionType type{MissionType::Recon};
    std::vector<Waypoint> waypoints{};
    MissionStatus status{MissionStatus::Pending};
};

enum class ThreatType {
    Radar,
    Missile,
    Aircraft,
    Sam,
    Weather,
    Terrain,
    BirdStrike
};

struct Threat final {
    std::string id{};
    ThreatType type{ThreatType::Radar};
    Vector3 position{};
    double distance_m{};   /**< Range from the vehicle as reported by the provider. */
    double bearing_rad{};  /**< Absolute bearing from the vehicle, clockwise from north. */
    double severity{};     /**< 0..1 */
};

[[nodiscard]] std::string_view to_string(MissionType type) noexcept;
[[nodiscard]] std::string_view to_string(MissionStatus status) noexcept;
[[nodiscard]] std::string_view to_string(ThreatType type) noexcept;

}  // namespace flight_safety
