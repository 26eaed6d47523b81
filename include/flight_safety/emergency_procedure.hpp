// === Emergency Procedures ====================================================
//
// Catalogue of named emergency procedures keyed by emergency type. Each
// procedure is an ordered list of preparatory steps that run automatically;
// the failsafe appends one terminal step chosen by its RTB / landing /
// parachute preferences.

#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "flight_safety/types.hpp"

namespace flight_safety {

enum class EmergencyType {
    EngineFailure,
    ElectricalFailure,
    HydraulicFailure,
    StructuralDamage,
    SevereWeather,
    ThreatInbound,
    FuelCritical,
    SensorFailure,
    CommunicationLoss,
    LowBattery
};

enum class EscalationAction {
    None,
    ReturnToBase,
    NearestLanding,
    ImmediateLanding,
    Parachute
};

enum class ProcedureStepAction {
    SwitchToBackupEngine,
    EstablishBestGlide,
    IdentifyLandingZone,
    AttemptBackupRadio,
    ContinueAutonomous,
    SwitchToBackupSensors,
    RecalibrateNavigation,
    AssessFlightCapability,
    ReduceThrottle,
    FindNearestLanding,
    DisableNonEssential,
    SwitchToBackupPower,
    SwitchToBackupActuators,
    ReduceLoadFactor,
    DivertAroundWeather,
    EvasiveManeuver,
    ReturnToBase,       /**< Terminal. */
    LandAtNearestZone,  /**< Terminal. */
    EmergencyLanding,   /**< Terminal. */
    DeployParachute     /**< Terminal. */
};

struct ProcedureStep final {
    ProcedureStepAction action{ProcedureStepAction::AssessFlightCapability};
    std::string description{};
    bool critical{true};
    Duration timeout{0.0};  /**< Zero: the step completes as soon as it is issued. */
};

struct Procedure final {
    std::string name{};
    int priority{0};  /**< 1 is the most urgent. */
    bool auto_execute{true};
    Duration timeout{0.0};  /**< Once exceeded, the procedure jumps to its last step. */
    std::vector<ProcedureStep> steps{};
};

[[nodiscard]] std::string_view to_string(EmergencyType type) noexcept;
[[nodiscard]] std::string_view to_string(EscalationAction action) noexcept;
[[nodiscard]] std::string_view to_string(ProcedureStepAction action) noexcept;

/** @brief Preparatory steps for @p type, without a terminal step. */
[[nodiscard]] Procedure procedure_for(EmergencyType type);

/**
 * @brief Append the terminal step for @p action; None leaves the procedure
 *        ending on its last preparatory step.
 */
[[nodiscard]] Procedure with_terminal_step(Procedure procedure, EscalationAction action);

/**
 * @brief Index of the step in progress @p elapsed after issue. Steps run in
 *        order for their timeout; the last step is held.
 */
[[nodiscard]] std::size_t active_step_at(const Procedure& procedure, Duration elapsed) noexcept;

/** @brief True when @p action is among the steps up to and including @p active_step. */
[[nodiscard]] bool reached_step(const Procedure& procedure, std::size_t active_step, ProcedureStepAction action) noexcept;

}  // namespace flight_safety
