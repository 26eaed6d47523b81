#include <limits>
#include <memory>

#include <catch2/catch.hpp>

#include "fake_propulsion.hpp"
#include "logging_test_fixture.hpp"
#include "flight_safety/energy_source.hpp"
#include "flight_safety/errors.hpp"

using namespace flight_safety;
using flight_safety::test::FakePropulsion;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_safety::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("PropulsionBase forwards commands only while running") {
    FakePropulsion backend{};
    REQUIRE_THROWS_AS(backend.set_thrust_command(0.4), LifecycleError);
    REQUIRE_FALSE(backend.last_thrust().has_value());

    backend.initialize();
    backend.start();
    backend.set_thrust_command(0.4);
    REQUIRE(backend.last_thrust() == 0.4);

    REQUIRE_NOTHROW(backend.set_thrust_vector(Vector3{0.0, 0.0, 1.0}));
    REQUIRE_THROWS_AS(backend.set_thrust_vector(Vector3{0.0, 0.0, 0.4}), OutOfRangeError);
    REQUIRE_THROWS_AS(backend.set_thrust_vector(Vector3{std::numeric_limits<double>::infinity(), 0.0, 0.0}),
                      OutOfRangeError);
}

TEST_CASE("PropulsionBase reports an unconfirmed emergency shutdown as fatal") {
    FakePropulsion backend{PropulsionType::Electric, false};
    backend.initialize();
    backend.start();

    REQUIRE_THROWS_AS(backend.emergency_shutdown(), FatalPropulsionError);
    REQUIRE(backend.lifecycle_state() == LifecycleState::Stopped);
    REQUIRE(backend.shutdown_calls() == 1);
    REQUIRE(backend.last_thrust() == 0.0);
}

TEST_CASE("PropulsionBase treats a driver error during emergency shutdown as fatal") {
    FakePropulsion backend{};
    backend.initialize();
    backend.start();
    backend.set_thrust_command(0.7);
    backend.fail_shutdown_with("relay driver I/O error");

    REQUIRE_THROWS_WITH(backend.emergency_shutdown(), Catch::Contains("relay driver I/O error"));
    REQUIRE(backend.lifecycle_state() == LifecycleState::Stopped);
    REQUIRE_THROWS_AS(backend.emergency_shutdown(), FatalPropulsionError);
    REQUIRE_THROWS_AS(backend.set_thrust_command(0.7), LifecycleError);
}

TEST_CASE("PropulsionBase requires an identifier") {
    REQUIRE_THROWS_AS(FakePropulsion(PropulsionType::Electric, true, ""), ConfigurationError);
    REQUIRE(FakePropulsion{}.identifier() == "fake");
}

TEST_CASE("Propulsion-backed energy sources read the cached snapshot") {
    auto backend = std::make_shared<FakePropulsion>(PropulsionType::Hybrid);
    backend->set_battery_soc(0.42);
    backend->set_fuel_level(0.17);

    const PropulsionBatterySource battery{backend};
    const PropulsionFuelSource fuel{backend};
    REQUIRE(battery.read_level() == Approx(0.42));
    REQUIRE(fuel.read_level() == Approx(0.17));

    REQUIRE_THROWS_AS(PropulsionBatterySource{nullptr}, ConfigurationError);
    REQUIRE_THROWS_AS(PropulsionFuelSource{nullptr}, ConfigurationError);
}

TEST_CASE("Propulsion enums stringify every variant") {
    CHECK(to_string(PropulsionType::Turbine) == "turbine");
    CHECK(to_string(LifecycleState::Stopped) == "stopped");
}
