#include <optional>
#include <variant>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "flight_safety/errors.hpp"
#include "flight_safety/telemetry_bus.hpp"

using namespace flight_safety;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_safety::test::ensure_logger_initialized();
    return true;
}();

TelemetryEvent command_event(double throttle) {
    FlightCommand command{};
    command.throttle = throttle;
    return TelemetryEvent{SteadyClock::now(), command};
}
}  // namespace

TEST_CASE("TelemetryBus delivers events in publication order") {
    TelemetryBus bus{4};
    bus.publish(command_event(0.1));
    bus.publish(TelemetryEvent{SteadyClock::now(), FlightModeChanged{FlightMode::Primary, FlightMode::Backup}});
    bus.publish(command_event(0.3));
    REQUIRE(bus.size() == 3);

    std::optional<TelemetryEvent> first = bus.try_consume();
    REQUIRE(first.has_value());
    REQUIRE(std::get<FlightCommand>(first->payload).throttle == Approx(0.1));

    std::optional<TelemetryEvent> second = bus.try_consume();
    REQUIRE(second.has_value());
    const auto& change = std::get<FlightModeChanged>(second->payload);
    CHECK(change.from == FlightMode::Primary);
    CHECK(change.to == FlightMode::Backup);

    std::optional<TelemetryEvent> third = bus.try_consume();
    REQUIRE(third.has_value());
    REQUIRE(std::get<FlightCommand>(third->payload).throttle == Approx(0.3));

    REQUIRE_FALSE(bus.try_consume().has_value());
    REQUIRE(bus.dropped_count() == 0);
}

TEST_CASE("TelemetryBus drops the oldest event when full") {
    TelemetryBus bus{2};
    bus.publish(command_event(0.1));
    bus.publish(command_event(0.2));
    bus.publish(command_event(0.3));

    REQUIRE(bus.size() == 2);
    REQUIRE(bus.capacity() == 2);
    REQUIRE(bus.dropped_count() == 1);
    REQUIRE(std::get<FlightCommand>(bus.try_consume()->payload).throttle == Approx(0.2));
    REQUIRE(std::get<FlightCommand>(bus.try_consume()->payload).throttle == Approx(0.3));
}

TEST_CASE("TelemetryBus rejects a zero capacity") {
    REQUIRE_THROWS_AS(TelemetryBus{0}, ConfigurationError);
    REQUIRE(TelemetryBus{}.capacity() == TelemetryBus::k_default_capacity);
}
