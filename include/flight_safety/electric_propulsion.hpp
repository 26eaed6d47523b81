// === Electric Propulsion =====================================================
//
// Battery + brushless-motor backend implementing the propulsion contract.
// The backend either simulates its own draw from the last thrust command
// (`update`) or is fed pack measurements by a sensor driver
// (`ingest_measurement`); both paths refresh the cached snapshots returned by
// the contract queries.

#pragma once

#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "flight_safety/propulsion.hpp"

namespace flight_safety {

/** @brief Cell chemistries with distinct discharge curves. */
enum class BatteryChemistry {
    LiPo,
    LiFe,
    LiIon,
    LiHV
};

/**
 * @brief Pack description. Defaults describe a 6S2P 5 Ah LiPo.
 */
struct BatteryConfig final {
    BatteryChemistry chemistry{BatteryChemistry::LiPo};
    int cell_count{6};
    int parallel_count{2};
    double nominal_capacity_ah{5.0};          /**< Per parallel string. */
    double nominal_voltage_per_cell{3.70};
    double max_voltage_per_cell{4.20};
    double min_voltage_per_cell{3.30};
    double cutoff_voltage_per_cell{3.00};
    double max_discharge_c{25.0};
    double internal_resistance_ohm{0.015};
    double max_discharge_temp_c{60.0};
    double min_operating_temp_c{0.0};
    double pack_mass_kg{1.4};
    double state_of_health{1.0};              /**< From the pack log; scales usable capacity. */
};

/** @brief Point on the motor load/efficiency curve. */
struct EfficiencyPoint final {
    double load{};        /**< 0..1 */
    double efficiency{};  /**< 0..1 */
};

/**
 * @brief Motor description. Defaults describe a 1000 KV outrunner.
 */
struct MotorConfig final {
    double kv_rating{1000.0};
    double max_power_w{2000.0};
    double peak_efficiency{0.90};
    double no_load_current_a{1.5};
    double winding_resistance_ohm{0.015};
    double thermal_mass_j_per_k{50.0};
    double max_winding_temp_c{120.0};
    double cooling_coeff_w_per_k{2.5};
    double max_thrust_n{60.0};
    Duration response_time{0.15};
    std::vector<EfficiencyPoint> efficiency_map{
        {0.1, 0.60}, {0.3, 0.80}, {0.5, 0.88}, {0.7, 0.90}, {0.9, 0.87}, {1.0, 0.82},
    };
};

struct ElectricPropulsionConfig final {
    BatteryConfig battery{};
    MotorConfig motor{};
};

[[nodiscard]] std::string_view to_string(BatteryChemistry chemistry) noexcept;

/**
 * @brief Electric propulsion backend (battery pack, ESC, single motor group).
 */
class ElectricPropulsion final : public PropulsionBase {
  public:
    ElectricPropulsion(std::string identifier, ElectricPropulsionConfig config);

    [[nodiscard]] EnergyState get_energy_state() const override;
    [[nodiscard]] ThermalState get_thermal_state() const override;
    [[nodiscard]] ThrustCapability get_thrust_capability() const override;
    [[nodiscard]] PropulsionHealth get_health() const override;

    [[nodiscard]] Duration predict_endurance(const std::vector<double>& power_profile_w) const override;
    [[nodiscard]] ThermalState predict_thermal_state(Duration horizon) const override;

    [[nodiscard]] PropulsionType type() const noexcept override;

    /** @brief Advance the simulated pack and motor by @p tick. */
    void update(Duration tick, double ambient_temp_c, double airspeed_mps);
    /** @brief Fuse a measured pack reading into the state estimate. */
    void ingest_measurement(double pack_voltage_v,
                            double pack_current_a,
                            const std::vector<double>& cell_temperatures_c,
                            Duration tick);

    /** @brief Throttle ceiling imposed by the motor thermal margin. */
    [[nodiscard]] double max_safe_throttle() const;

  protected:
    void on_initialize() override;
    void on_start() override;
    void on_stop() override;
    void apply_thrust_command(double thrust) override;
    void apply_thrust_vector(const Vector3& vector) override;
    bool perform_emergency_shutdown() override;

  private:
    [[nodiscard]] double usable_capacity_ah() const noexcept;
    [[nodiscard]] double soc_to_cell_voltage(double soc) const;
    [[nodiscard]] double cell_voltage_to_soc(double cell_voltage_v, double c_rate) const;
    [[nodiscard]] double efficiency_at(double load) const;
    [[nodiscard]] double thermal_margin_locked() const;
    [[nodiscard]] double max_safe_throttle_locked() const;
    void update_motor_thermal_locked(double electrical_power_w, double mechanical_power_w, double airspeed_mps, double dt_s);
    void refresh_snapshots_locked(TimePoint now);
    void refresh_health_locked(TimePoint now);
    void set_condition_locked(const std::string& key, bool active, const std::string& component, double severity,
                              const std::string& description, TimePoint now);

    ElectricPropulsionConfig config_;
    mutable std::mutex mutex_state_;

    bool flag_energized_{false};
    bool flag_measured_{false};
    double throttle_command_{};
    Vector3 thrust_vector_{0.0, 0.0, 1.0};

    double soc_{1.0};
    double soh_{1.0};
    double pack_voltage_v_{};
    double pack_current_a_{};
    double battery_temp_c_{25.0};
    std::vector<double> list_cell_voltages_v_;
    std::vector<double> list_cell_temps_c_;
    double energy_used_wh_{};

    double motor_power_w_{};
    double motor_efficiency_{};
    double winding_temp_c_{25.0};
    double ambient_temp_c_{25.0};

    EnergyState energy_snapshot_{};
    ThermalState thermal_snapshot_{};
    ThrustCapability thrust_snapshot_{};
    PropulsionHealth health_snapshot_{};
    std::set<std::string> set_active_conditions_;
    std::size_t fault_sequence_{};
};

}  // namespace flight_safety
