#include <cmath>
#include <memory>
#include <utility>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "flight_safety/energy_source.hpp"
#include "flight_safety/errors.hpp"
#include "flight_safety/reserve_manager.hpp"

using namespace flight_safety;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_safety::test::ensure_logger_initialized();
    return true;
}();

ReserveLevel expected_level(double value) {
    if (value <= 0.10) {
        return ReserveLevel::Absolute;
    }
    if (value <= 0.20) {
        return ReserveLevel::Emergency;
    }
    if (value <= 0.30) {
        return ReserveLevel::Contingency;
    }
    return ReserveLevel::Mission;
}
}  // namespace

TEST_CASE("ReserveManager classifies battery SOC by threshold") {
    const double soc = GENERATE(1.0, 0.41, 0.31, 0.30, 0.25, 0.2000001, 0.20, 0.15, 0.10, 0.05, 0.0);
    ReserveManager manager{};
    auto battery = std::make_shared<PushedEnergySource>(soc);
    manager.set_battery_soc_source(battery);

    REQUIRE(manager.check() == expected_level(soc));
}

TEST_CASE("ReserveManager classifies fuel level by threshold") {
    const double fuel = GENERATE(0.9, 0.30, 0.20, 0.10);
    ReserveManager manager{};
    manager.set_fuel_level_source(std::make_shared<PushedEnergySource>(fuel));

    REQUIRE(manager.check() == expected_level(fuel));
}

TEST_CASE("ReserveManager reports the worse of battery and fuel") {
    ReserveManager manager{};
    auto battery = std::make_shared<PushedEnergySource>(0.8);
    auto fuel = std::make_shared<PushedEnergySource>(0.15);
    manager.set_battery_soc_source(battery);
    manager.set_fuel_level_source(fuel);

    REQUIRE(manager.check() == ReserveLevel::Emergency);

    fuel->set_level(0.9);
    battery->set_level(0.05);
    REQUIRE(manager.check() == ReserveLevel::Absolute);
}

TEST_CASE("ReserveManager walks the default tiers and their actions") {
    ReserveManager manager{};
    auto battery = std::make_shared<PushedEnergySource>(0.80);
    manager.set_battery_soc_source(battery);

    REQUIRE(manager.check() == ReserveLevel::Mission);
    REQUIRE(manager.get_reserve_actions().empty());

    battery->set_level(0.25);
    REQUIRE(manager.check() == ReserveLevel::Contingency);
    const std::vector<ReserveAction> contingency_actions = manager.get_reserve_actions();
    REQUIRE(contingency_actions == std::vector<ReserveAction>{
                                       {1, ActionType::ReturnToBase, true},
                                       {2, ActionType::AbortMission, true},
                                   });

    battery->set_level(0.15);
    REQUIRE(manager.check() == ReserveLevel::Emergency);
    REQUIRE(manager.get_reserve_actions() == std::vector<ReserveAction>{
                                                 {1, ActionType::FindNearestLanding, true},
                                                 {2, ActionType::ReducePower, true},
                                             });

    battery->set_level(0.05);
    REQUIRE(manager.check() == ReserveLevel::Absolute);
    REQUIRE(manager.get_reserve_actions() == std::vector<ReserveAction>{{1, ActionType::ImmediateLanding, true}});
}

TEST_CASE("ReserveManager warns the operator near the mission threshold") {
    ReserveManager manager{};
    auto battery = std::make_shared<PushedEnergySource>(0.43);
    manager.set_battery_soc_source(battery);

    REQUIRE(manager.check() == ReserveLevel::Mission);
    const std::vector<ReserveAction> actions = manager.get_reserve_actions();
    REQUIRE(actions.size() == 1);
    CHECK(actions.front().action == ActionType::WarnOperator);
    CHECK(actions.front().priority == 3);
    CHECK_FALSE(actions.front().mandatory);

    battery->set_level(0.46);
    REQUIRE(manager.get_reserve_actions().empty());
}

TEST_CASE("ReserveManager without sources stays at Mission") {
    ReserveManager manager{};

    REQUIRE_FALSE(manager.has_energy_source());
    REQUIRE(manager.check() == ReserveLevel::Mission);
    REQUIRE(manager.get_reserve_actions().empty());
    REQUIRE(manager.get_available_energy(1000.0) == Approx(0.0));
    REQUIRE_FALSE(manager.is_operation_allowed(1.0, 1000.0));
}

TEST_CASE("ReserveManager returns to Mission when its sources are unregistered") {
    ReserveManager manager{};
    manager.set_battery_soc_source(std::make_shared<PushedEnergySource>(0.05));
    REQUIRE(manager.check() == ReserveLevel::Absolute);

    manager.set_battery_soc_source(nullptr);
    REQUIRE(manager.check() == ReserveLevel::Mission);
}

TEST_CASE("ReserveManager scales available energy above the contingency reserve") {
    ReserveManager manager{};
    auto battery = std::make_shared<PushedEnergySource>(0.6);
    manager.set_battery_soc_source(battery);

    REQUIRE(manager.get_available_energy(100.0) == Approx(50.0));
    REQUIRE(manager.is_operation_allowed(50.0, 100.0));
    REQUIRE_FALSE(manager.is_operation_allowed(50.5, 100.0));

    battery->set_level(0.30);
    REQUIRE(manager.get_available_energy(100.0) == Approx(0.0));
    battery->set_level(0.2);
    REQUIRE(manager.get_available_energy(100.0) == Approx(0.0));
}

TEST_CASE("ReserveManager treats an unreadable gauge as empty") {
    ReserveManager manager{};
    auto battery = std::make_shared<PushedEnergySource>(std::nan(""));
    manager.set_battery_soc_source(battery);

    REQUIRE(manager.check() == ReserveLevel::Absolute);
    REQUIRE(manager.get_available_energy(100.0) == Approx(0.0));
    REQUIRE_FALSE(manager.is_operation_allowed(1.0, 100.0));

    ReserveManager fuel_manager{};
    fuel_manager.set_fuel_level_source(std::make_shared<PushedEnergySource>(std::nan("")));
    REQUIRE(fuel_manager.check() == ReserveLevel::Absolute);
}

TEST_CASE("ReserveManager fires the level callback once per change outside its lock") {
    ReserveManager manager{};
    auto battery = std::make_shared<PushedEnergySource>(0.9);
    manager.set_battery_soc_source(battery);

    std::vector<std::pair<ReserveLevel, ReserveLevel>> list_changes;
    ReserveLevel observed_inside{ReserveLevel::Mission};
    manager.set_level_change_callback([&](ReserveLevel from, ReserveLevel to) {
        list_changes.emplace_back(from, to);
        observed_inside = manager.current_level();
    });

    manager.check();
    REQUIRE(list_changes.empty());

    battery->set_level(0.25);
    manager.check();
    manager.check();
    REQUIRE(list_changes.size() == 1);
    CHECK(list_changes.front().first == ReserveLevel::Mission);
    CHECK(list_changes.front().second == ReserveLevel::Contingency);
    CHECK(observed_inside == ReserveLevel::Contingency);
}

TEST_CASE("ReserveConfig validation rejects inconsistent thresholds") {
    REQUIRE_NOTHROW(validate(ReserveConfig{}));

    ReserveConfig equal_thresholds{};
    equal_thresholds.contingency_battery_soc = equal_thresholds.mission_battery_soc;
    REQUIRE_THROWS_AS(validate(equal_thresholds), ConfigurationError);

    ReserveConfig inverted_fuel{};
    inverted_fuel.absolute_fuel_level = 0.25;
    REQUIRE_THROWS_AS(validate(inverted_fuel), ConfigurationError);

    ReserveConfig out_of_range{};
    out_of_range.mission_battery_soc = 1.5;
    REQUIRE_THROWS_AS(validate(out_of_range), ConfigurationError);

    ReserveConfig negative_minutes{};
    negative_minutes.emergency_reserve_minutes = -1.0;
    REQUIRE_THROWS_AS(validate(negative_minutes), ConfigurationError);
}

TEST_CASE("Reserve enums stringify every variant") {
    CHECK(to_string(ReserveLevel::Absolute) == "absolute");
    CHECK(to_string(ActionType::FindNearestLanding) == "find_nearest_landing");
}
