// === Configuration ===========================================================
//
// Exposes the configuration bundle consumed by the control runtime: reserve
// thresholds, decision envelope, failsafe policy, and loop cadence.
// `ConfigurationLoader` translates environment variables into these
// structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <cstddef>
#include <string>

#include "flight_safety/decision_engine.hpp"
#include "flight_safety/failsafe_system.hpp"
#include "flight_safety/reserve_manager.hpp"
#include "flight_safety/telemetry_bus.hpp"
#include "flight_safety/types.hpp"

namespace flight_safety {

/** @brief Loop cadence and plumbing owned by the control runtime. */
struct RuntimeConfig final {
    Duration reserve_check_interval{0.5};
    std::size_t telemetry_capacity{TelemetryBus::k_default_capacity};
};

/** @brief Throws ConfigurationError when a runtime knob is outside its domain. */
void validate(const RuntimeConfig& config);

/**
 * @brief Bundle of runtime knobs for the flight-safety core.
 *
 * Every field is populated by ConfigurationLoader; `decision.recovery` and
 * `failsafe.recovery` always carry the same recovery points.
 */
struct Configuration final {
    std::string log_directory{};  /**< Destination directory for structured logs. */
    ReserveConfig reserve{};
    DecisionConfig decision{};
    FailsafeConfig failsafe{};
    RuntimeConfig runtime{};
};

/** @brief Validate every section of @p configuration. */
void validate(const Configuration& configuration);

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /**
     * @brief Initialize logging and read every `FLIGHT_SAFETY_*` variable.
     *
     * Unparseable values fall back to their defaults with a warning; values
     * that parse but are inconsistent raise ConfigurationError.
     */
    static Configuration load();

  private:
    static ReserveConfig load_reserve();
    static DecisionConfig load_decision();
    static FailsafeConfig load_failsafe();
    static RuntimeConfig load_runtime();
    static RecoveryPoints load_recovery();
};

}  // namespace flight_safety
