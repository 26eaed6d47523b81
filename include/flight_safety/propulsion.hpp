// === Propulsion Contract =====================================================
//
// Shared vocabulary every propulsion backend exposes (energy, thermal, thrust,
// health snapshots) plus the `PropulsionSystem` interface the rest of the
// core programs against. `PropulsionBase` implements the lifecycle state
// machine and command-domain checks once so concrete backends only supply
// hardware-specific hooks.

#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "flight_safety/types.hpp"

namespace flight_safety {

/**
 * @brief Supported power-source families.
 */
enum class PropulsionType {
    Electric,
    Combustion,
    Turbine,
    Hybrid,
    Rocket
};

/**
 * @brief Lifecycle of a propulsion backend.
 */
enum class LifecycleState {
    Uninitialized,  /**< Constructed; hardware not yet configured. */
    Initialized,    /**< Configured; not producing thrust. */
    Running,        /**< Accepting thrust commands. */
    Stopped         /**< Terminal; only emergency shutdown is accepted. */
};

/**
 * @brief Point-in-time energy reading produced by a backend.
 *
 * Superseded by the next reading; consumers never mutate it.
 */
struct EnergyState final {
    double battery_soc{};                    /**< State of charge (0..1). */
    double battery_voltage_v{};              /**< Pack voltage. */
    double battery_current_a{};              /**< Current draw, positive when discharging. */
    double battery_temperature_c{};          /**< Mean pack temperature. */
    double battery_health{1.0};              /**< State of health (0..1), scales usable capacity. */
    std::vector<double> cell_voltages_v{};   /**< Index = cell id. */
    std::vector<double> cell_temperatures_c{};  /**< Index = cell id. */
    double fuel_level{};                     /**< Fuel remaining (0..1). */
    double fuel_mass_kg{};                   /**< Fuel mass on board. */
    double fuel_flow_rate_kg_h{};            /**< Current fuel consumption. */
    double remaining_energy_wh{};            /**< Derived usable energy. */
    Duration estimated_endurance{};          /**< Derived flight time at the current draw. */
    double specific_energy_wh_per_kg{};      /**< Remaining energy per kilogram of storage mass. */
    double confidence{};                     /**< Estimate confidence (0..1). */
    TimePoint timestamp{SteadyClock::now()}; /**< Capture time. */
};

/**
 * @brief Point-in-time thermal reading of propulsion components.
 */
struct ThermalState final {
    double motor_temperature_c{};
    double esc_temperature_c{};
    double battery_temperature_c{};
    double engine_temperature_c{};
    double ambient_temperature_c{};
    double cooling_efficiency{};  /**< 0..1 */
    double thermal_margin{};      /**< Margin to the nearest thermal limit (0..1). */
    TimePoint timestamp{SteadyClock::now()};
};

/**
 * @brief Achievable thrust characteristics at the time of capture.
 */
struct ThrustCapability final {
    double max_thrust_n{};
    double current_thrust_n{};
    Vector3 thrust_vector{0.0, 0.0, 1.0};
    Duration response_time{};         /**< Time to reach 90% of commanded thrust. */
    double efficiency_at_current{};
    Duration sustainable_duration{};  /**< How long max thrust can be held. */
};

/**
 * @brief Fault appended by a backend; read by the failsafe system.
 */
struct Fault final {
    std::string id{};
    std::string component{};
    double severity{};  /**< 0..1 */
    std::string description{};
    TimePoint timestamp{SteadyClock::now()};
};

/**
 * @brief Component health summary of a backend.
 */
struct PropulsionHealth final {
    HealthStatus overall{HealthStatus::Ok};
    HealthStatus motor{HealthStatus::Ok};
    HealthStatus battery{HealthStatus::Ok};
    HealthStatus esc{HealthStatus::Ok};
    HealthStatus fuel_system{HealthStatus::Ok};
    HealthStatus thermal{HealthStatus::Ok};
    std::vector<Fault> active_faults{};
    TimePoint timestamp{SteadyClock::now()};
};

[[nodiscard]] std::string_view to_string(PropulsionType type) noexcept;
[[nodiscard]] std::string_view to_string(LifecycleState state) noexcept;

/**
 * @brief Contract implemented by every propulsion backend.
 *
 * Queries return the latest cached snapshot and never block on hardware I/O.
 * Predictions are best-effort planning aids and must not gate safety
 * decisions.
 */
class PropulsionSystem {
  public:
    virtual ~PropulsionSystem() = default;

    virtual void initialize() = 0;
    virtual void start() = 0;
    virtual void stop() = 0;

    [[nodiscard]] virtual EnergyState get_energy_state() const = 0;
    [[nodiscard]] virtual ThermalState get_thermal_state() const = 0;
    [[nodiscard]] virtual ThrustCapability get_thrust_capability() const = 0;
    [[nodiscard]] virtual PropulsionHealth get_health() const = 0;

    /** @brief Normalized thrust in [0, 1]. */
    virtual void set_thrust_command(double thrust) = 0;
    /** @brief Thrust direction; must be finite with a norm near 1. */
    virtual void set_thrust_vector(const Vector3& vector) = 0;
    /** @brief Last-resort shutdown; throws FatalPropulsionError when unconfirmed or when the hardware reports an error. */
    virtual void emergency_shutdown() = 0;

    [[nodiscard]] virtual Duration predict_endurance(const std::vector<double>& power_profile_w) const = 0;
    [[nodiscard]] virtual ThermalState predict_thermal_state(Duration horizon) const = 0;

    [[nodiscard]] virtual PropulsionType type() const noexcept = 0;
    [[nodiscard]] virtual LifecycleState lifecycle_state() const = 0;
};

using PropulsionSystemPtr = std::shared_ptr<PropulsionSystem>;

/**
 * @brief Lifecycle and command-domain enforcement shared by all backends.
 */
class PropulsionBase : public PropulsionSystem {
  public:
    explicit PropulsionBase(std::string identifier);

    void initialize() final;
    void start() final;
    void stop() final;
    void set_thrust_command(double thrust) final;
    void set_thrust_vector(const Vector3& vector) final;
    void emergency_shutdown() final;

    [[nodiscard]] LifecycleState lifecycle_state() const final;
    [[nodiscard]] const std::string& identifier() const noexcept;

  protected:
    virtual void on_initialize() = 0;
    virtual void on_start() = 0;
    virtual void on_stop() = 0;
    virtual void apply_thrust_command(double thrust) = 0;
    virtual void apply_thrust_vector(const Vector3& vector) = 0;
    /** @brief Return false when the hardware cannot confirm the shutdown; a thrown error counts as a failed shutdown. */
    virtual bool perform_emergency_shutdown() = 0;

  private:
    void require_running(std::string_view operation) const;

    std::string str_identifier_;
    mutable std::mutex mutex_lifecycle_;
    LifecycleState lifecycle_state_{LifecycleState::Uninitialized};
};

}  // namespace flight_safety
