#include "flight_safety/emergency_procedure.hpp"

#include <utility>

namespace flight_safety {

namespace {

ProcedureStep step(ProcedureStepAction action, std::string description, bool critical, double timeout_s) {
    return ProcedureStep{action, std::move(description), critical, Duration{timeout_s}};
}

}  // namespace

std::string_view to_string(EmergencyType type) noexcept {
    switch (type) {
        case EmergencyType::EngineFailure:
            return "engine_failure";
        case EmergencyType::ElectricalFailure:
            return "electrical_failure";
        case EmergencyType::HydraulicFailure:
            return "hydraulic_failure";
        case EmergencyType::StructuralDamage:
            return "structural_damage";
        case EmergencyType::SevereWeather:
            return "severe_weather";
        case EmergencyType::ThreatInbound:
            return "threat_inbound";
        case EmergencyType::FuelCritical:
            return "fuel_critical";
        case EmergencyType::SensorFailure:
            return "sensor_failure";
        case EmergencyType::CommunicationLoss:
            return "communication_loss";
        case EmergencyType::LowBattery:
            return "low_battery";
    }
    return "engine_failure";
}

std::string_view to_string(EscalationAction action) noexcept {
    switch (action) {
        case EscalationAction::None:
            return "none";
        case EscalationAction::ReturnToBase:
            return "return_to_base";
        case EscalationAction::NearestLanding:
            return "nearest_landing";
        case EscalationAction::ImmediateLanding:
            return "immediate_landing";
        case EscalationAction::Parachute:
            return "parachute";
    }
    return "none";
}

std::string_view to_string(ProcedureStepAction action) noexcept {
    switch (action) {
        case ProcedureStepAction::SwitchToBackupEngine:
            return "switch_to_backup_engine";
        case ProcedureStepAction::EstablishBestGlide:
            return "establish_best_glide";
        case ProcedureStepAction::IdentifyLandingZone:
            return "identify_landing_zone";
        case ProcedureStepAction::AttemptBackupRadio:
            return "attempt_backup_radio";
        case ProcedureStepAction::ContinueAutonomous:
            return "continue_autonomous";
        case ProcedureStepAction::SwitchToBackupSensors:
            return "switch_to_backup_sensors";
        case ProcedureStepAction::RecalibrateNavigation:
            return "recalibrate_navigation";
        case ProcedureStepAction::AssessFlightCapability:
            return "assess_flight_capability";
        case ProcedureStepAction::ReduceThrottle:
            return "reduce_throttle";
        case ProcedureStepAction::FindNearestLanding:
            return "find_nearest_landing";
        case ProcedureStepAction::DisableNonEssential:
            return "disable_non_essential";
        case ProcedureStepAction::SwitchToBackupPower:
            return "switch_to_backup_power";
        case ProcedureStepAction::SwitchToBackupActuators:
            return "switch_to_backup_actuators";
        case ProcedureStepAction::ReduceLoadFactor:
            return "reduce_load_factor";
        case ProcedureStepAction::DivertAroundWeather:
            return "divert_around_weather";
        case ProcedureStepAction::EvasiveManeuver:
            return "evasive_maneuver";
        case ProcedureStepAction::ReturnToBase:
            return "return_to_base";
        case ProcedureStepAction::LandAtNearestZone:
            return "land_at_nearest_zone";
        case ProcedureStepAction::EmergencyLanding:
            return "emergency_landing";
        case ProcedureStepAction::DeployParachute:
            return "deploy_parachute";
    }
    return "assess_flight_capability";
}

Procedure procedure_for(EmergencyType type) {
    switch (type) {
        case EmergencyType::EngineFailure:
            return Procedure{"Engine Failure", 1, true, Duration{30.0}, {
                step(ProcedureStepAction::SwitchToBackupEngine, "Switch to backup engine", true, 5.0),
                step(ProcedureStepAction::EstablishBestGlide, "Establish best glide speed", true, 10.0),
                step(ProcedureStepAction::IdentifyLandingZone, "Identify landing zone", true, 5.0),
            }};
        case EmergencyType::ElectricalFailure:
            return Procedure{"Electrical Failure", 2, true, Duration{60.0}, {
                step(ProcedureStepAction::SwitchToBackupPower, "Switch to backup power bus", true, 5.0),
                step(ProcedureStepAction::DisableNonEssential, "Disable non-essential systems", true, 5.0),
            }};
        case EmergencyType::HydraulicFailure:
            return Procedure{"Hydraulic Failure", 1, true, Duration{60.0}, {
                step(ProcedureStepAction::SwitchToBackupActuators, "Switch to backup actuators", true, 5.0),
                step(ProcedureStepAction::ReduceLoadFactor, "Limit manoeuvre load factor", true, 5.0),
            }};
        case EmergencyType::StructuralDamage:
            return Procedure{"Structural Damage", 1, true, Duration{30.0}, {
                step(ProcedureStepAction::ReduceLoadFactor, "Limit manoeuvre load factor", true, 5.0),
                step(ProcedureStepAction::AssessFlightCapability, "Assess flight capability", true, 5.0),
            }};
        case EmergencyType::SevereWeather:
            return Procedure{"Severe Weather", 2, true, Duration{120.0}, {
                step(ProcedureStepAction::DivertAroundWeather, "Divert around weather cell", false, 30.0),
            }};
        case EmergencyType::ThreatInbound:
            return Procedure{"Threat Inbound", 1, true, Duration{60.0}, {
                step(ProcedureStepAction::EvasiveManeuver, "Execute evasive manoeuvre", true, 10.0),
            }};
        case EmergencyType::FuelCritical:
            return Procedure{"Fuel Critical", 1, true, Duration{120.0}, {
                step(ProcedureStepAction::ReduceThrottle, "Reduce throttle to economy", true, 5.0),
                step(ProcedureStepAction::FindNearestLanding, "Find nearest landing zone", true, 10.0),
            }};
        case EmergencyType::SensorFailure:
            return Procedure{"Sensor Failure", 3, true, Duration{60.0}, {
                step(ProcedureStepAction::SwitchToBackupSensors, "Switch to backup sensors", true, 5.0),
                step(ProcedureStepAction::RecalibrateNavigation, "Recalibrate navigation", false, 10.0),
                step(ProcedureStepAction::AssessFlightCapability, "Assess flight capability", true, 5.0),
            }};
        case EmergencyType::CommunicationLoss:
            return Procedure{"Communication Loss", 2, true, Duration{300.0}, {
                step(ProcedureStepAction::AttemptBackupRadio, "Attempt backup radio", false, 30.0),
                step(ProcedureStepAction::ContinueAutonomous, "Continue mission autonomously", false, 0.0),
            }};
        case EmergencyType::LowBattery:
            return Procedure{"Low Battery", 1, true, Duration{120.0}, {
                step(ProcedureStepAction::DisableNonEssential, "Disable non-essential systems", true, 5.0),
            }};
    }
    return Procedure{};
}

Procedure with_terminal_step(Procedure procedure, EscalationAction action) {
    switch (action) {
        case EscalationAction::None:
            break;
        case EscalationAction::ReturnToBase:
            procedure.steps.push_back(step(ProcedureStepAction::ReturnToBase, "Initiate RTB", true, 0.0));
            break;
        case EscalationAction::NearestLanding:
            procedure.steps.push_back(step(ProcedureStepAction::LandAtNearestZone, "Land at nearest landing zone", true, 60.0));
            break;
        case EscalationAction::ImmediateLanding:
            procedure.steps.push_back(step(ProcedureStepAction::EmergencyLanding, "Execute emergency landing", true, 60.0));
            break;
        case EscalationAction::Parachute:
            procedure.steps.push_back(step(ProcedureStepAction::DeployParachute, "Deploy recovery parachute", true, 0.0));
            break;
    }
    return procedure;
}

std::size_t active_step_at(const Procedure& procedure, Duration elapsed) noexcept {
    if (procedure.steps.empty()) {
        return 0;
    }
    const std::size_t last = procedure.steps.size() - 1;
    if (elapsed >= procedure.timeout) {
        return last;
    }
    Duration boundary{0.0};
    for (std::size_t index = 0; index < last; ++index) {
        boundary += procedure.steps[index].timeout;
        if (elapsed < boundary) {
            return index;
        }
    }
    return last;
}

bool reached_step(const Procedure& procedure, std::size_t active_step, ProcedureStepAction action) noexcept {
    for (std::size_t index = 0; index < procedure.steps.size() && index <= active_step; ++index) {
        if (procedure.steps[index].action == action) {
            return true;
        }
    }
    return false;
}

}  // namespace flight_safety
