#include "flight_safety/mission.hpp"

namespace flight_safety {

std::string_view to_string(MissionType type) noexcept {
    switch (type) {
        case MissionType::Recon:
            return "recon";
        case MissionType::Transport:
            return "transport";
        case MissionType::Patrol:
            return "patrol";
        case MissionType::Intercept:
            return "intercept";
        case MissionType::Rescue:
            return "rescue";
        case MissionType::Training:
            return "training";
    }
    return "recon";
}

std::string_view to_string(MissionStatus status) noexcept {
    switch (status) {
        case MissionStatus::Pending:
            return "pending";
        case MissionStatus::Active:
            return "active";
        case MissionStatus::Completed:
            return "completed";
        case MissionStatus::Aborted:
            return "aborted";
    }
    return "pending";
}

std::string_view to_string(ThreatType type) noexcept {
    switch (type) {
        case ThreatType::Radar:
            return "radar";
        case ThreatType::Missile:
            return "missile";
        case ThreatType::Aircraft:
            return "aircraft";
        case ThreatType::Sam:
            return "sam";
        case ThreatType::Weather:
            return "weather";
        case ThreatType::Terrain:
            return "terrain";
        case ThreatType::BirdStrike:
            return "bird_strike";
    }
    return "radar";
}

}  // namespace flight_safety
