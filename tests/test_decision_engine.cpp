#include <cmath>
#include <memory>
#include <random>
#include <utility>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "flight_safety/decision_engine.hpp"
#include "flight_safety/energy_source.hpp"
#include "flight_safety/errors.hpp"
#include "flight_safety/failsafe_system.hpp"
#include "flight_safety/reserve_manager.hpp"

using namespace flight_safety;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_safety::test::ensure_logger_initialized();
    return true;
}();

Mission make_mission(std::vector<Waypoint> waypoints) {
    Mission mission{};
    mission.id = "test-mission";
    mission.type = MissionType::Recon;
    mission.waypoints = std::move(waypoints);
    return mission;
}

Waypoint make_waypoint(const char* id, Vector3 position, Duration loiter = Duration{0.0}) {
    return Waypoint{id, position, 0.0, position.z, 0.0, loiter};
}

VehicleState vehicle_at(Vector3 position, double heading_rad = 0.0) {
    VehicleState state{};
    state.position = position;
    state.heading_rad = heading_rad;
    return state;
}

void require_within_envelope(const FlightCommand& command, const DecisionConfig& config) {
    REQUIRE(std::isfinite(command.roll_rad));
    REQUIRE(std::isfinite(command.pitch_rad));
    REQUIRE(std::isfinite(command.yaw_rate_rad_s));
    REQUIRE(std::isfinite(command.throttle));
    REQUIRE(std::abs(command.roll_rad) <= config.max_roll_angle_rad);
    REQUIRE(std::abs(command.pitch_rad) <= config.max_pitch_angle_rad);
    REQUIRE(std::abs(command.yaw_rate_rad_s) <= config.max_yaw_rate_rad_s);
    REQUIRE(command.throttle >= 0.0);
    REQUIRE(command.throttle <= 1.0);
}

bool is_safe_default(const FlightCommand& command, const DecisionConfig& config) {
    return command.roll_rad == 0.0 && command.pitch_rad == 0.0 && command.yaw_rate_rad_s == 0.0 &&
           command.throttle == config.cruise_throttle && command.auto_throttle;
}
}  // namespace

TEST_CASE("DecisionEngine refuses to decide before initialization") {
    DecisionEngine engine{};
    REQUIRE_FALSE(engine.is_initialized());
    REQUIRE_THROWS_AS(engine.decide(), InvariantError);
}

TEST_CASE("DecisionEngine emits the safe default without a mission") {
    DecisionEngine engine{};
    engine.initialize();

    const FlightCommand first = engine.decide();
    const FlightCommand second = engine.decide();

    REQUIRE(is_safe_default(first, engine.config()));
    REQUIRE(first.directive == GuidanceDirective::FollowMission);
    REQUIRE_FALSE(first.auto_land);
    REQUIRE_FALSE(first.emergency_rtb);
    REQUIRE(second.roll_rad == first.roll_rad);
    REQUIRE(second.throttle == first.throttle);
}

TEST_CASE("DecisionEngine walks the mission status machine") {
    DecisionEngine engine{};
    engine.initialize();
    REQUIRE_THROWS_AS(engine.start_mission(), LifecycleError);

    engine.set_mission(make_mission({make_waypoint("wp-1", Vector3{0.0, 5000.0, 500.0})}));
    REQUIRE(engine.mission_status() == MissionStatus::Pending);
    REQUIRE(engine.mission()->id == "test-mission");

    engine.start_mission();
    REQUIRE(engine.mission_status() == MissionStatus::Active);
    REQUIRE_NOTHROW(engine.start_mission());

    engine.abort_mission();
    REQUIRE(engine.mission_status() == MissionStatus::Aborted);
    REQUIRE_THROWS_AS(engine.start_mission(), LifecycleError);

    Mission completed = make_mission({});
    completed.status = MissionStatus::Completed;
    engine.set_mission(completed);
    REQUIRE(engine.mission_status() == MissionStatus::Completed);
    REQUIRE_THROWS_AS(engine.start_mission(), LifecycleError);
}

TEST_CASE("DecisionEngine steers away from a threat dead ahead") {
    DecisionEngine engine{};
    engine.initialize();
    engine.set_mission(make_mission({make_waypoint("wp-1", Vector3{0.0, 10000.0, 500.0})}));
    engine.start_mission();
    engine.update_vehicle_state(vehicle_at(Vector3{0.0, 0.0, 500.0}));

    const FlightCommand clear = engine.decide();
    REQUIRE(clear.roll_rad == Approx(0.0).margin(1e-9));

    engine.update_threats({Threat{"t-1", ThreatType::Aircraft, Vector3{0.0, 2000.0, 500.0}, 0.0, 0.0, 1.0}});
    const FlightCommand avoiding = engine.decide();

    REQUIRE(avoiding.roll_rad < 0.0);
    REQUIRE(avoiding.roll_rad == Approx(-0.6 * engine.config().max_roll_angle_rad));
    REQUIRE(avoiding.throttle > clear.throttle);
    require_within_envelope(avoiding, engine.config());
}

TEST_CASE("DecisionEngine ignores threats when avoidance is disabled") {
    DecisionConfig config{};
    config.enable_threat_avoidance = false;
    DecisionEngine engine{config};
    engine.initialize();
    engine.set_mission(make_mission({make_waypoint("wp-1", Vector3{0.0, 10000.0, 500.0})}));
    engine.start_mission();
    engine.update_vehicle_state(vehicle_at(Vector3{0.0, 0.0, 500.0}));
    engine.update_threats({Threat{"t-1", ThreatType::Missile, Vector3{0.0, 1000.0, 500.0}, 0.0, 0.0, 1.0}});

    const FlightCommand command = engine.decide();
    REQUIRE(command.roll_rad == Approx(0.0).margin(1e-9));
    REQUIRE(command.pitch_rad == Approx(0.0).margin(1e-9));
}

TEST_CASE("DecisionEngine keeps every command inside the flight envelope") {
    std::mt19937 generator{20240611u};
    std::uniform_real_distribution<double> horizontal{-10000.0, 10000.0};
    std::uniform_real_distribution<double> altitude{0.0, 3000.0};
    std::uniform_real_distribution<double> angle{-7.0, 7.0};
    std::uniform_real_distribution<double> speed{-60.0, 60.0};
    std::uniform_real_distribution<double> unit{0.0, 1.0};
    std::uniform_int_distribution<int> threat_count{0, 6};

    auto battery = std::make_shared<PushedEnergySource>(1.0);
    ReserveManager reserve{};
    reserve.set_battery_soc_source(battery);

    DecisionEngine engine{};
    engine.attach_reserve_manager(reserve);
    engine.initialize();

    for (int iteration = 0; iteration < 500; ++iteration) {
        battery->set_level(unit(generator));
        reserve.check();

        engine.set_mission(make_mission({
            make_waypoint("a", Vector3{horizontal(generator), horizontal(generator), altitude(generator)}),
            make_waypoint("b", Vector3{horizontal(generator), horizontal(generator), altitude(generator)}),
        }));
        engine.start_mission();

        VehicleState state = vehicle_at(Vector3{horizontal(generator), horizontal(generator), altitude(generator)}, angle(generator));
        state.velocity = Vector3{speed(generator), speed(generator), speed(generator)};
        engine.update_vehicle_state(state);

        std::vector<Threat> threats;
        const int count = threat_count(generator);
        for (int index = 0; index < count; ++index) {
            Threat threat{};
            threat.id = "t";
            threat.type = index % 2 == 0 ? ThreatType::Missile : ThreatType::Sam;
            threat.position = Vector3{state.position.x + speed(generator) * 50.0, state.position.y + speed(generator) * 50.0,
                                      altitude(generator)};
            threat.severity = unit(generator);
            threats.push_back(threat);
        }
        engine.update_threats(std::move(threats));

        require_within_envelope(engine.decide(), engine.config());
    }
}

TEST_CASE("DecisionEngine sanitizes non-finite navigation input") {
    DecisionEngine engine{};
    engine.initialize();
    engine.set_mission(make_mission({make_waypoint("wp-1", Vector3{0.0, 10000.0, 500.0})}));
    engine.start_mission();
    engine.update_vehicle_state(vehicle_at(Vector3{0.0, 0.0, 500.0}, std::nan("")));

    require_within_envelope(engine.decide(), engine.config());
}

TEST_CASE("DecisionEngine climbs when below the minimum safe altitude") {
    DecisionEngine engine{};
    engine.initialize();
    engine.set_mission(make_mission({make_waypoint("wp-1", Vector3{0.0, 10000.0, 500.0})}));
    engine.start_mission();
    engine.update_vehicle_state(vehicle_at(Vector3{0.0, 0.0, 50.0}));

    const FlightCommand command = engine.decide();
    REQUIRE(command.pitch_rad == Approx(0.8 * engine.config().max_pitch_angle_rad));
    REQUIRE(command.throttle == Approx(1.0));
}

TEST_CASE("DecisionEngine completes a mission once the last waypoint is reached") {
    DecisionEngine engine{};
    engine.initialize();
    engine.set_mission(make_mission({make_waypoint("wp-1", Vector3{10.0, 10.0, 500.0})}));
    engine.start_mission();
    engine.update_vehicle_state(vehicle_at(Vector3{0.0, 0.0, 500.0}));

    const FlightCommand command = engine.decide();
    REQUIRE(engine.mission_status() == MissionStatus::Completed);
    REQUIRE(engine.current_waypoint_index() == 1);
    REQUIRE(is_safe_default(command, engine.config()));
}

TEST_CASE("DecisionEngine holds at a loiter waypoint") {
    DecisionEngine engine{};
    engine.initialize();
    engine.set_mission(make_mission({
        make_waypoint("loiter", Vector3{0.0, 0.0, 500.0}, Duration{60.0}),
        make_waypoint("far", Vector3{0.0, 8000.0, 500.0}),
    }));
    engine.start_mission();
    engine.update_vehicle_state(vehicle_at(Vector3{0.0, 0.0, 500.0}, 1.0));

    const FlightCommand command = engine.decide();
    REQUIRE(is_safe_default(command, engine.config()));
    REQUIRE(engine.current_waypoint_index() == 0);
    REQUIRE(engine.mission_status() == MissionStatus::Active);
}

TEST_CASE("DecisionEngine follows the reserve tier") {
    auto battery = std::make_shared<PushedEnergySource>(1.0);
    ReserveManager reserve{};
    reserve.set_battery_soc_source(battery);

    DecisionEngine engine{};
    engine.attach_reserve_manager(reserve);
    engine.initialize();
    engine.update_vehicle_state(vehicle_at(Vector3{3000.0, 3000.0, 500.0}));

    SECTION("Contingency returns to base") {
        battery->set_level(0.25);
        reserve.check();
        const FlightCommand command = engine.decide();
        REQUIRE(command.directive == GuidanceDirective::ReturnToBase);
        REQUIRE(command.emergency_rtb);
        REQUIRE_FALSE(command.auto_throttle);
        REQUIRE(command.roll_rad < 0.0);
    }

    SECTION("Emergency lands at the nearest site under the power cap") {
        battery->set_level(0.15);
        reserve.check();
        const FlightCommand command = engine.decide();
        REQUIRE(command.directive == GuidanceDirective::NearestLanding);
        REQUIRE(command.auto_land);
        REQUIRE(command.throttle <= engine.config().emergency_power_cap);
    }

    SECTION("Absolute lands immediately") {
        battery->set_level(0.05);
        reserve.check();
        const FlightCommand command = engine.decide();
        REQUIRE(command.directive == GuidanceDirective::ImmediateLanding);
        REQUIRE(command.auto_land);
        REQUIRE(command.pitch_rad < 0.0);
        REQUIRE(command.roll_rad == 0.0);
    }
}

TEST_CASE("DecisionEngine follows the failsafe mode") {
    FailsafeSystem failsafe{};
    DecisionEngine engine{};
    engine.attach_failsafe(failsafe);
    engine.initialize();
    engine.set_mission(make_mission({make_waypoint("east", Vector3{8000.0, 0.0, 500.0})}));
    engine.start_mission();
    engine.update_vehicle_state(vehicle_at(Vector3{0.0, 0.0, 500.0}));

    SECTION("Backup scales the attitude limits") {
        failsafe.update_health("gps", HealthStatus::Degraded);
        failsafe.monitor();
        const FlightCommand command = engine.decide();
        REQUIRE(command.directive == GuidanceDirective::FollowMission);
        REQUIRE(command.roll_rad == Approx(engine.config().max_roll_angle_rad * engine.config().backup_limit_scale));
    }

    SECTION("Manual holds the safe default") {
        failsafe.engage_manual_override();
        const FlightCommand command = engine.decide();
        REQUIRE(command.directive == GuidanceDirective::Hold);
        REQUIRE(is_safe_default(command, engine.config()));
    }

    SECTION("An emergency escalation overrides the mission") {
        failsafe.update_health("gps", HealthStatus::Failed);
        failsafe.monitor();
        const FlightCommand command = engine.decide();
        REQUIRE(command.directive == GuidanceDirective::ReturnToBase);
        REQUIRE(command.emergency_rtb);
    }

    SECTION("A fuel critical procedure reduces throttle on its way home") {
        failsafe.update_fuel(0.10);
        failsafe.monitor();
        REQUIRE(failsafe.current_escalation().procedure.steps.front().action == ProcedureStepAction::ReduceThrottle);
        const FlightCommand command = engine.decide();
        REQUIRE(command.directive == GuidanceDirective::ReturnToBase);
        REQUIRE(command.throttle <= engine.config().emergency_power_cap);
    }

    SECTION("A parachute escalation cuts the throttle") {
        FailsafeConfig config{};
        config.enable_parachute = true;
        FailsafeSystem parachute_failsafe{config};
        engine.attach_failsafe(parachute_failsafe);
        parachute_failsafe.report_fatal_propulsion_failure("no confirmation");
        const FlightCommand command = engine.decide();
        REQUIRE(command.directive == GuidanceDirective::ImmediateLanding);
        REQUIRE(command.throttle == 0.0);
        REQUIRE_FALSE(command.auto_throttle);
    }
}

TEST_CASE("DecisionConfig validation rejects unusable limits") {
    DecisionConfig config{};
    config.backup_limit_scale = 0.0;
    REQUIRE_THROWS_AS(validate(config), ConfigurationError);

    DecisionEngine engine{config};
    REQUIRE_THROWS_AS(engine.initialize(), ConfigurationError);
    REQUIRE_FALSE(engine.is_initialized());
}
