// === Control Runtime =========================================================
//
// Owns the flight-safety components and drives them from three periodic
// threads: the decision loop at the configured decision rate, the reserve
// loop, and the failsafe monitor loop. State changes and commands are
// published on the telemetry bus for the operator feed.

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

#include <spdlog/logger.h>

#include "flight_safety/configuration.hpp"
#include "flight_safety/decision_engine.hpp"
#include "flight_safety/failsafe_system.hpp"
#include "flight_safety/propulsion.hpp"
#include "flight_safety/reserve_manager.hpp"
#include "flight_safety/telemetry_bus.hpp"

namespace flight_safety {

/** @brief High-level owner of the control, reserve, and failsafe loops. */
class ControlRuntime final {
  public:
    ControlRuntime(Configuration configuration, PropulsionSystemPtr propulsion);
    ~ControlRuntime();

    ControlRuntime(const ControlRuntime&) = delete;
    ControlRuntime& operator=(const ControlRuntime&) = delete;

    /** @brief Validate configuration, bring up propulsion, and wire components. */
    void initialize();
    /** @brief Start the periodic loops. */
    void run();
    /** @brief Cancel and join the loops, then stop propulsion. Idempotent. */
    void shutdown();
    /** @brief Out-of-band propulsion shutdown; escalates when unconfirmed. */
    void emergency_shutdown();

    /** @brief Forward the fused navigation state to the engine and failsafe. */
    void update_vehicle_state(const VehicleState& state);

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] TelemetryBus& telemetry_bus() noexcept;
    [[nodiscard]] ReserveManager& reserve_manager() noexcept;
    [[nodiscard]] FailsafeSystem& failsafe_system() noexcept;
    [[nodiscard]] DecisionEngine& decision_engine() noexcept;

    /** @brief Single iteration of each loop body; exposed for deterministic tests. */
    void decision_tick();
    void reserve_tick();
    void failsafe_tick();

  private:
    void run_periodic(Duration interval, std::string_view loop_name, const std::function<void()>& tick);
    void register_energy_sources();
    void wire_callbacks();

    Configuration configuration_;
    PropulsionSystemPtr propulsion_;
    TelemetryBus telemetry_bus_;
    ReserveManager reserve_manager_;
    FailsafeSystem failsafe_system_;
    DecisionEngine decision_engine_;

    bool flag_initialized_{false};
    std::atomic<bool> flag_running_{false};
    std::mutex mutex_wake_;
    std::condition_variable cv_wake_;
    std::thread decision_thread_;
    std::thread reserve_thread_;
    std::thread failsafe_thread_;
    ReserveLevel last_published_level_{ReserveLevel::Mission};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flight_safety
