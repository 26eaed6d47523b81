#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "flight_safety/configuration.hpp"
#include "flight_safety/errors.hpp"

using namespace flight_safety;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    flight_safety::test::ensure_logger_initialized();
    return true;
}();

/**
 * @brief Sets one environment variable for the lifetime of the guard and
 *        restores the previous value afterwards.
 */
class ScopedEnvironment final {
  public:
    ScopedEnvironment(std::string name, const std::string& value)
        : str_name_(std::move(name)) {
        if (const char* previous = std::getenv(str_name_.c_str()); previous != nullptr) {
            previous_value_ = std::string{previous};
        }
        ::setenv(str_name_.c_str(), value.c_str(), 1);
    }

    ~ScopedEnvironment() {
        if (previous_value_) {
            ::setenv(str_name_.c_str(), previous_value_->c_str(), 1);
        } else {
            ::unsetenv(str_name_.c_str());
        }
    }

    ScopedEnvironment(const ScopedEnvironment&) = delete;
    ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

  private:
    std::string str_name_;
    std::optional<std::string> previous_value_;
};

std::string test_log_directory() {
    return (std::filesystem::temp_directory_path() / "flight_safety_tests_logs").string();
}
}  // namespace

TEST_CASE("ConfigurationLoader applies defaults") {
    const ScopedEnvironment log_dir{"FLIGHT_SAFETY_LOG_DIR", test_log_directory()};
    const Configuration config = ConfigurationLoader::load();

    CHECK(config.log_directory == test_log_directory());
    CHECK(config.reserve.mission_battery_soc == Approx(0.40));
    CHECK(config.reserve.absolute_fuel_level == Approx(0.10));
    CHECK(config.decision.max_roll_angle_rad == Approx(0.785));
    CHECK(config.decision.decision_rate_hz == Approx(50.0));
    CHECK(config.failsafe.enable_auto_rtb);
    CHECK_FALSE(config.failsafe.enable_parachute);
    CHECK(config.failsafe.max_time_without_comms.count() == Approx(300.0));
    CHECK(config.runtime.reserve_check_interval.count() == Approx(0.5));
    CHECK(config.runtime.telemetry_capacity == TelemetryBus::k_default_capacity);
    CHECK(config.decision.recovery.home.z == Approx(500.0));
    CHECK(config.failsafe.recovery.landing_zones.empty());
}

TEST_CASE("ConfigurationLoader reads overrides from the environment") {
    const ScopedEnvironment log_dir{"FLIGHT_SAFETY_LOG_DIR", test_log_directory()};
    const ScopedEnvironment mission_soc{"FLIGHT_SAFETY_RESERVE_MISSION_SOC", "0.5"};
    const ScopedEnvironment auto_rtb{"FLIGHT_SAFETY_AUTO_RTB", "off"};
    const ScopedEnvironment parachute{"FLIGHT_SAFETY_PARACHUTE", "yes"};
    const ScopedEnvironment comms_timeout{"FLIGHT_SAFETY_COMMS_TIMEOUT_S", "120"};
    const ScopedEnvironment capacity{"FLIGHT_SAFETY_TELEMETRY_CAPACITY", "64"};
    const ScopedEnvironment home_x{"FLIGHT_SAFETY_HOME_X_M", "-250"};
    const ScopedEnvironment zones{"FLIGHT_SAFETY_LANDING_ZONES", "100,200,0;not,a,point;300,-50,10"};

    const Configuration config = ConfigurationLoader::load();

    CHECK(config.reserve.mission_battery_soc == Approx(0.5));
    CHECK_FALSE(config.failsafe.enable_auto_rtb);
    CHECK(config.failsafe.enable_parachute);
    CHECK(config.failsafe.max_time_without_comms.count() == Approx(120.0));
    CHECK(config.runtime.telemetry_capacity == 64u);
    CHECK(config.failsafe.recovery.home.x == Approx(-250.0));
    CHECK(config.decision.recovery.home.x == Approx(-250.0));

    REQUIRE(config.failsafe.recovery.landing_zones.size() == 2);
    REQUIRE(config.decision.recovery.landing_zones.size() == 2);
    CHECK(config.failsafe.recovery.landing_zones[1].x == Approx(300.0));
    CHECK(config.failsafe.recovery.landing_zones[1].y == Approx(-50.0));
    CHECK(config.failsafe.recovery.landing_zones[1].z == Approx(10.0));
}

TEST_CASE("ConfigurationLoader keeps defaults for unparseable values") {
    const ScopedEnvironment log_dir{"FLIGHT_SAFETY_LOG_DIR", test_log_directory()};
    const ScopedEnvironment roll{"FLIGHT_SAFETY_MAX_ROLL_RAD", "steep"};
    const ScopedEnvironment avoidance{"FLIGHT_SAFETY_THREAT_AVOIDANCE", "maybe"};
    const ScopedEnvironment capacity{"FLIGHT_SAFETY_TELEMETRY_CAPACITY", "12x"};

    const Configuration config = ConfigurationLoader::load();

    CHECK(config.decision.max_roll_angle_rad == Approx(0.785));
    CHECK(config.decision.enable_threat_avoidance);
    CHECK(config.runtime.telemetry_capacity == TelemetryBus::k_default_capacity);
}

TEST_CASE("ConfigurationLoader rejects inconsistent values") {
    const ScopedEnvironment log_dir{"FLIGHT_SAFETY_LOG_DIR", test_log_directory()};

    SECTION("reserve thresholds out of order") {
        const ScopedEnvironment contingency{"FLIGHT_SAFETY_RESERVE_CONTINGENCY_SOC", "0.5"};
        REQUIRE_THROWS_AS(ConfigurationLoader::load(), ConfigurationError);
    }

    SECTION("cruise throttle above one") {
        const ScopedEnvironment cruise{"FLIGHT_SAFETY_CRUISE_THROTTLE", "1.5"};
        REQUIRE_THROWS_AS(ConfigurationLoader::load(), ConfigurationError);
    }

    SECTION("zero telemetry capacity") {
        const ScopedEnvironment capacity{"FLIGHT_SAFETY_TELEMETRY_CAPACITY", "0"};
        REQUIRE_THROWS_AS(ConfigurationLoader::load(), ConfigurationError);
    }

    SECTION("non-positive failsafe interval") {
        const ScopedEnvironment interval{"FLIGHT_SAFETY_FAILSAFE_INTERVAL_S", "0"};
        REQUIRE_THROWS_AS(ConfigurationLoader::load(), ConfigurationError);
    }
}

TEST_CASE("RuntimeConfig validation rejects a zero reserve interval") {
    RuntimeConfig config{};
    config.reserve_check_interval = Duration{0.0};
    REQUIRE_THROWS_AS(validate(config), ConfigurationError);
}
