#include <cstddef>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "flight_safety/emergency_procedure.hpp"

using namespace flight_safety;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_safety::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("Every emergency type has a named procedure") {
    const EmergencyType type = GENERATE(EmergencyType::EngineFailure, EmergencyType::ElectricalFailure,
                                        EmergencyType::HydraulicFailure, EmergencyType::StructuralDamage,
                                        EmergencyType::SevereWeather, EmergencyType::ThreatInbound,
                                        EmergencyType::FuelCritical, EmergencyType::SensorFailure,
                                        EmergencyType::CommunicationLoss, EmergencyType::LowBattery);
    const Procedure procedure = procedure_for(type);

    CHECK_FALSE(procedure.name.empty());
    CHECK(procedure.priority >= 1);
    CHECK(procedure.priority <= 3);
    CHECK(procedure.timeout.count() > 0.0);
    CHECK_FALSE(procedure.steps.empty());
}

TEST_CASE("The engine failure procedure glides before it lands") {
    const Procedure procedure = with_terminal_step(procedure_for(EmergencyType::EngineFailure), EscalationAction::ImmediateLanding);

    REQUIRE(procedure.name == "Engine Failure");
    REQUIRE(procedure.priority == 1);
    REQUIRE(procedure.steps.size() == 4);
    CHECK(procedure.steps[0].action == ProcedureStepAction::SwitchToBackupEngine);
    CHECK(procedure.steps[1].action == ProcedureStepAction::EstablishBestGlide);
    CHECK(procedure.steps[2].action == ProcedureStepAction::IdentifyLandingZone);
    CHECK(procedure.steps[3].action == ProcedureStepAction::EmergencyLanding);
}

TEST_CASE("The terminal step follows the escalation action") {
    const Procedure base = procedure_for(EmergencyType::LowBattery);

    CHECK(with_terminal_step(base, EscalationAction::None).steps.size() == base.steps.size());
    CHECK(with_terminal_step(base, EscalationAction::ReturnToBase).steps.back().action == ProcedureStepAction::ReturnToBase);
    CHECK(with_terminal_step(base, EscalationAction::NearestLanding).steps.back().action == ProcedureStepAction::LandAtNearestZone);
    CHECK(with_terminal_step(base, EscalationAction::Parachute).steps.back().action == ProcedureStepAction::DeployParachute);
}

TEST_CASE("Procedure steps advance with their timeouts") {
    const Procedure procedure = with_terminal_step(procedure_for(EmergencyType::FuelCritical), EscalationAction::ReturnToBase);
    REQUIRE(procedure.steps.size() == 3);

    CHECK(active_step_at(procedure, Duration{0.0}) == 0);
    CHECK(active_step_at(procedure, Duration{4.9}) == 0);
    CHECK(active_step_at(procedure, Duration{5.0}) == 1);
    CHECK(active_step_at(procedure, Duration{14.0}) == 1);
    CHECK(active_step_at(procedure, Duration{15.0}) == 2);
    CHECK(active_step_at(procedure, Duration{500.0}) == 2);

    CHECK(reached_step(procedure, 0, ProcedureStepAction::ReduceThrottle));
    CHECK_FALSE(reached_step(procedure, 0, ProcedureStepAction::FindNearestLanding));
    CHECK(reached_step(procedure, 2, ProcedureStepAction::ReturnToBase));
    CHECK_FALSE(reached_step(procedure, 2, ProcedureStepAction::DeployParachute));
}

TEST_CASE("A procedure past its timeout jumps to its last step") {
    Procedure procedure = with_terminal_step(procedure_for(EmergencyType::CommunicationLoss), EscalationAction::ReturnToBase);
    REQUIRE(procedure.steps.size() == 3);

    CHECK(active_step_at(procedure, Duration{31.0}) == 2);
    procedure.timeout = Duration{10.0};
    CHECK(active_step_at(procedure, Duration{12.0}) == 2);
    CHECK(active_step_at(Procedure{}, Duration{12.0}) == 0);
}

TEST_CASE("Procedure enums stringify") {
    CHECK(to_string(EmergencyType::LowBattery) == "low_battery");
    CHECK(to_string(EscalationAction::NearestLanding) == "nearest_landing");
    CHECK(to_string(ProcedureStepAction::ReduceThrottle) == "reduce_throttle");
    CHECK(to_string(ProcedureStepAction::DeployParachute) == "deploy_parachute");
}
