#include "flight_safety/electric_propulsion.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

#include <fmt/format.h>

#include "flight_safety/errors.hpp"
#include "flight_safety/logging.hpp"

namespace flight_safety {

namespace {

struct CurvePoint final {
    double soc{};
    double voltage_v{};
};

using DischargeCurve = std::vector<CurvePoint>;

constexpr double k_seconds_per_hour{3600.0};
constexpr double k_reference_temp_c{25.0};
constexpr double k_high_c_rate{3.0};             /**< C-rate above which the sagged curve applies. */
constexpr double k_min_dt_s{0.01};
constexpr double k_cell_thermal_mass_j_per_k{50.0};
constexpr double k_cell_cooling_w_per_k{0.4};
constexpr double k_airflow_cooling_gain{0.1};     /**< Cooling increase per m/s of airspeed. */
constexpr double k_thermal_derate_margin{0.2};
constexpr double k_thermal_caution_margin{0.4};

// 1C curves, voltage per cell vs SOC, ordered from full to empty.
const DischargeCurve k_lipo_curve{
    {1.0, 4.20}, {0.9, 4.08}, {0.8, 3.96}, {0.7, 3.87}, {0.6, 3.80}, {0.5, 3.73},
    {0.4, 3.70}, {0.3, 3.65}, {0.2, 3.55}, {0.1, 3.40}, {0.0, 3.00},
};
const DischargeCurve k_lipo_high_c_curve{
    {1.0, 4.10}, {0.9, 3.98}, {0.8, 3.86}, {0.7, 3.77}, {0.6, 3.70}, {0.5, 3.63},
    {0.4, 3.60}, {0.3, 3.55}, {0.2, 3.45}, {0.1, 3.30}, {0.0, 2.90},
};
const DischargeCurve k_life_curve{
    {1.0, 3.60}, {0.9, 3.35}, {0.8, 3.30}, {0.7, 3.28}, {0.6, 3.26}, {0.5, 3.25},
    {0.4, 3.24}, {0.3, 3.22}, {0.2, 3.18}, {0.1, 3.10}, {0.0, 2.50},
};
const DischargeCurve k_liion_curve{
    {1.0, 4.20}, {0.9, 4.06}, {0.8, 3.95}, {0.7, 3.85}, {0.6, 3.77}, {0.5, 3.71},
    {0.4, 3.67}, {0.3, 3.61}, {0.2, 3.50}, {0.1, 3.35}, {0.0, 3.00},
};
const DischargeCurve k_lihv_curve{
    {1.0, 4.35}, {0.9, 4.22}, {0.8, 4.08}, {0.7, 3.97}, {0.6, 3.88}, {0.5, 3.80},
    {0.4, 3.75}, {0.3, 3.68}, {0.2, 3.58}, {0.1, 3.42}, {0.0, 3.00},
};

const DischargeCurve& discharge_curve(BatteryChemistry chemistry, double c_rate) {
    switch (chemistry) {
        case BatteryChemistry::LiPo:
            return c_rate >= k_high_c_rate ? k_lipo_high_c_curve : k_lipo_curve;
        case BatteryChemistry::LiFe:
            return k_life_curve;
        case BatteryChemistry::LiIon:
            return k_liion_curve;
        case BatteryChemistry::LiHV:
            return k_lihv_curve;
    }
    return k_lipo_curve;
}

void validate_config(const ElectricPropulsionConfig& config) {
    const BatteryConfig& battery = config.battery;
    if (battery.cell_count <= 0 || battery.parallel_count <= 0) {
        throw ConfigurationError("Battery cell and parallel counts must be positive");
    }
    if (battery.nominal_capacity_ah <= 0.0) {
        throw ConfigurationError("Battery capacity must be positive");
    }
    if (!(battery.pack_mass_kg > 0.0)) {
        throw ConfigurationError("Battery pack mass must be positive");
    }
    if (!(battery.state_of_health > 0.0 && battery.state_of_health <= 1.0)) {
        throw ConfigurationError("Battery state of health must lie in (0, 1]");
    }
    if (!(battery.max_voltage_per_cell > battery.min_voltage_per_cell
          && battery.min_voltage_per_cell > battery.cutoff_voltage_per_cell
          && battery.cutoff_voltage_per_cell > 0.0)) {
        throw ConfigurationError("Battery cell voltages must satisfy max > min > cutoff > 0");
    }
    const MotorConfig& motor = config.motor;
    if (motor.max_power_w <= 0.0 || motor.thermal_mass_j_per_k <= 0.0 || motor.max_thrust_n <= 0.0) {
        throw ConfigurationError("Motor power, thermal mass and thrust must be positive");
    }
    if (motor.max_winding_temp_c <= k_reference_temp_c) {
        throw ConfigurationError("Motor winding limit must exceed the reference temperature");
    }
    for (std::size_t index = 1; index < motor.efficiency_map.size(); ++index) {
        if (motor.efficiency_map[index].load <= motor.efficiency_map[index - 1].load) {
            throw ConfigurationError("Motor efficiency map loads must be strictly increasing");
        }
    }
}

}  // namespace

std::string_view to_string(BatteryChemistry chemistry) noexcept {
    switch (chemistry) {
        case BatteryChemistry::LiPo:
            return "lipo";
        case BatteryChemistry::LiFe:
            return "life";
        case BatteryChemistry::LiIon:
            return "lion";
        case BatteryChemistry::LiHV:
            return "lihv";
    }
    return "lipo";
}

ElectricPropulsion::ElectricPropulsion(std::string identifier, ElectricPropulsionConfig config)
    : PropulsionBase(std::move(identifier)),
      config_(std::move(config)) {
    validate_config(config_);
    const auto cells = static_cast<std::size_t>(config_.battery.cell_count);
    list_cell_voltages_v_.assign(cells, config_.battery.max_voltage_per_cell);
    list_cell_temps_c_.assign(cells, k_reference_temp_c);
    pack_voltage_v_ = config_.battery.max_voltage_per_cell * config_.battery.cell_count;
    motor_efficiency_ = efficiency_at(0.0);
    soh_ = config_.battery.state_of_health;

    std::scoped_lock lock(mutex_state_);
    refresh_snapshots_locked(SteadyClock::now());
}

PropulsionType ElectricPropulsion::type() const noexcept {
    return PropulsionType::Electric;
}

EnergyState ElectricPropulsion::get_energy_state() const {
    std::scoped_lock lock(mutex_state_);
    return energy_snapshot_;
}

ThermalState ElectricPropulsion::get_thermal_state() const {
    std::scoped_lock lock(mutex_state_);
    return thermal_snapshot_;
}

ThrustCapability ElectricPropulsion::get_thrust_capability() const {
    std::scoped_lock lock(mutex_state_);
    return thrust_snapshot_;
}

PropulsionHealth ElectricPropulsion::get_health() const {
    std::scoped_lock lock(mutex_state_);
    return health_snapshot_;
}

double ElectricPropulsion::max_safe_throttle() const {
    std::scoped_lock lock(mutex_state_);
    return max_safe_throttle_locked();
}

/**
 * @brief Remaining energy divided by the mean power of the profile.
 */
Duration ElectricPropulsion::predict_endurance(const std::vector<double>& power_profile_w) const {
    if (power_profile_w.empty()) {
        return Duration::max();
    }
    const double mean_power_w = std::accumulate(power_profile_w.begin(), power_profile_w.end(), 0.0)
        / static_cast<double>(power_profile_w.size());
    if (mean_power_w <= 0.0) {
        return Duration::max();
    }
    std::scoped_lock lock(mutex_state_);
    const double hours = energy_snapshot_.remaining_energy_wh / mean_power_w;
    return Duration{hours * k_seconds_per_hour};
}

/**
 * @brief First-order projection of the winding temperature at the current load.
 */
ThermalState ElectricPropulsion::predict_thermal_state(Duration horizon) const {
    std::scoped_lock lock(mutex_state_);
    ThermalState predicted = thermal_snapshot_;
    const double mechanical_w = motor_power_w_;
    const double electrical_w = motor_efficiency_ > 0.0 ? mechanical_w / motor_efficiency_ : 0.0;
    const double losses_w = electrical_w - mechanical_w;
    const double cooling = config_.motor.cooling_coeff_w_per_k;
    const double steady_state_c = ambient_temp_c_ + (cooling > 0.0 ? losses_w / cooling : 0.0);
    const double decay = std::exp(-cooling * std::max(0.0, horizon.count()) / config_.motor.thermal_mass_j_per_k);
    predicted.motor_temperature_c = steady_state_c + (winding_temp_c_ - steady_state_c) * decay;
    predicted.esc_temperature_c = predicted.motor_temperature_c * 0.8;
    const double span = config_.motor.max_winding_temp_c - k_reference_temp_c;
    predicted.thermal_margin = std::clamp((config_.motor.max_winding_temp_c - predicted.motor_temperature_c) / span, 0.0, 1.0);
    predicted.timestamp = SteadyClock::now() + std::chrono::duration_cast<SteadyClock::duration>(horizon);
    return predicted;
}

void ElectricPropulsion::update(Duration tick, double ambient_temp_c, double airspeed_mps) {
    std::scoped_lock lock(mutex_state_);
    const double dt_s = std::max(tick.count(), k_min_dt_s);
    ambient_temp_c_ = ambient_temp_c;

    const double throttle = flag_energized_ ? throttle_command_ : 0.0;
    const double mechanical_w = throttle * config_.motor.max_power_w;
    motor_efficiency_ = efficiency_at(throttle);
    const double open_circuit_v = soc_to_cell_voltage(soc_) * config_.battery.cell_count;
    const double idle_current_a = flag_energized_ ? config_.motor.no_load_current_a * (1.0 - throttle * 0.5) : 0.0;
    const double electrical_w = mechanical_w / motor_efficiency_ + idle_current_a * open_circuit_v;

    pack_current_a_ = open_circuit_v > 0.0 ? electrical_w / open_circuit_v : 0.0;
    pack_voltage_v_ = open_circuit_v - pack_current_a_ * config_.battery.internal_resistance_ohm * config_.battery.cell_count;

    const double usable_coulombs = usable_capacity_ah() * k_seconds_per_hour * soh_;
    soc_ = std::clamp(soc_ - (pack_current_a_ * dt_s) / usable_coulombs, 0.0, 1.0);
    energy_used_wh_ += pack_voltage_v_ * pack_current_a_ * dt_s / k_seconds_per_hour;

    const double cell_voltage = pack_voltage_v_ / config_.battery.cell_count;
    std::fill(list_cell_voltages_v_.begin(), list_cell_voltages_v_.end(), cell_voltage);

    const double heating_w = pack_current_a_ * pack_current_a_ * config_.battery.internal_resistance_ohm;
    for (double& cell_temp_c : list_cell_temps_c_) {
        cell_temp_c += (heating_w - k_cell_cooling_w_per_k * (cell_temp_c - ambient_temp_c)) * dt_s / k_cell_thermal_mass_j_per_k;
    }

    motor_power_w_ = mechanical_w;
    update_motor_thermal_locked(electrical_w, mechanical_w, airspeed_mps, dt_s);
    refresh_snapshots_locked(SteadyClock::now());
}

/**
 * @brief Blend coulomb counting with the discharge-curve estimate.
 *
 * At rest the voltage estimate dominates; under load coulomb counting does.
 */
void ElectricPropulsion::ingest_measurement(double pack_voltage_v,
                                            double pack_current_a,
                                            const std::vector<double>& cell_temperatures_c,
                                            Duration tick) {
    if (!std::isfinite(pack_voltage_v) || pack_voltage_v <= 0.0 || !std::isfinite(pack_current_a)) {
        throw OutOfRangeError(fmt::format("{}: invalid pack measurement {} V / {} A", identifier(), pack_voltage_v, pack_current_a));
    }
    std::scoped_lock lock(mutex_state_);
    const double dt_s = std::max(tick.count(), k_min_dt_s);
    flag_measured_ = true;
    pack_voltage_v_ = pack_voltage_v;
    pack_current_a_ = pack_current_a;
    if (cell_temperatures_c.size() == list_cell_temps_c_.size()) {
        list_cell_temps_c_ = cell_temperatures_c;
    }

    const double cell_voltage = pack_voltage_v / config_.battery.cell_count;
    std::fill(list_cell_voltages_v_.begin(), list_cell_voltages_v_.end(), cell_voltage);

    const double usable_coulombs = usable_capacity_ah() * k_seconds_per_hour * soh_;
    const double soc_coulomb = soc_ - (pack_current_a * dt_s) / usable_coulombs;
    const double c_rate = std::abs(pack_current_a) / usable_capacity_ah();
    const double soc_voltage = cell_voltage_to_soc(cell_voltage, c_rate);
    if (pack_current_a == 0.0) {
        soc_ = 0.7 * soc_voltage + 0.3 * soc_coulomb;
    } else {
        soc_ = 0.3 * soc_voltage + 0.7 * soc_coulomb;
    }
    soc_ = std::clamp(soc_, 0.0, 1.0);
    energy_used_wh_ += pack_voltage_v * pack_current_a * dt_s / k_seconds_per_hour;
    refresh_snapshots_locked(SteadyClock::now());
}

void ElectricPropulsion::on_initialize() {
    std::scoped_lock lock(mutex_state_);
    refresh_snapshots_locked(SteadyClock::now());
}

void ElectricPropulsion::on_start() {
    std::scoped_lock lock(mutex_state_);
    flag_energized_ = true;
    throttle_command_ = 0.0;
}

void ElectricPropulsion::on_stop() {
    std::scoped_lock lock(mutex_state_);
    flag_energized_ = false;
    throttle_command_ = 0.0;
    motor_power_w_ = 0.0;
    refresh_snapshots_locked(SteadyClock::now());
}

void ElectricPropulsion::apply_thrust_command(double thrust) {
    std::scoped_lock lock(mutex_state_);
    const double ceiling = max_safe_throttle_locked();
    if (thrust > ceiling) {
        get_logger()->warn(R"({{"component":"propulsion","backend":{},"event":"thermal_derate","requested":{},"applied":{}}})",
                           json_quote(identifier()), thrust, ceiling);
    }
    throttle_command_ = std::min(thrust, ceiling);
}

void ElectricPropulsion::apply_thrust_vector(const Vector3& vector) {
    std::scoped_lock lock(mutex_state_);
    const double norm = std::sqrt(vector.x * vector.x + vector.y * vector.y + vector.z * vector.z);
    thrust_vector_ = Vector3{vector.x / norm, vector.y / norm, vector.z / norm};
    thrust_snapshot_.thrust_vector = thrust_vector_;
}

bool ElectricPropulsion::perform_emergency_shutdown() {
    std::scoped_lock lock(mutex_state_);
    flag_energized_ = false;
    throttle_command_ = 0.0;
    motor_power_w_ = 0.0;
    pack_current_a_ = 0.0;
    refresh_snapshots_locked(SteadyClock::now());
    return true;
}

double ElectricPropulsion::usable_capacity_ah() const noexcept {
    return config_.battery.nominal_capacity_ah * config_.battery.parallel_count;
}

double ElectricPropulsion::soc_to_cell_voltage(double soc) const {
    const DischargeCurve& curve = discharge_curve(config_.battery.chemistry, 0.0);
    for (std::size_t index = 0; index + 1 < curve.size(); ++index) {
        const CurvePoint& upper = curve[index];
        const CurvePoint& lower = curve[index + 1];
        if (soc <= upper.soc && soc >= lower.soc) {
            const double fraction = (soc - lower.soc) / (upper.soc - lower.soc);
            return lower.voltage_v + fraction * (upper.voltage_v - lower.voltage_v);
        }
    }
    return soc > curve.front().soc ? curve.front().voltage_v : curve.back().voltage_v;
}

double ElectricPropulsion::cell_voltage_to_soc(double cell_voltage_v, double c_rate) const {
    const DischargeCurve& curve = discharge_curve(config_.battery.chemistry, c_rate);
    for (std::size_t index = 0; index + 1 < curve.size(); ++index) {
        const CurvePoint& upper = curve[index];
        const CurvePoint& lower = curve[index + 1];
        if (cell_voltage_v <= upper.voltage_v && cell_voltage_v >= lower.voltage_v) {
            const double span_v = upper.voltage_v - lower.voltage_v;
            return lower.soc + (cell_voltage_v - lower.voltage_v) / span_v * (upper.soc - lower.soc);
        }
    }
    return cell_voltage_v >= curve.front().voltage_v ? 1.0 : 0.0;
}

double ElectricPropulsion::efficiency_at(double load) const {
    const std::vector<EfficiencyPoint>& curve = config_.motor.efficiency_map;
    if (curve.empty()) {
        return config_.motor.peak_efficiency;
    }
    if (load <= curve.front().load) {
        return curve.front().efficiency;
    }
    for (std::size_t index = 0; index + 1 < curve.size(); ++index) {
        const EfficiencyPoint& lower = curve[index];
        const EfficiencyPoint& upper = curve[index + 1];
        if (load >= lower.load && load <= upper.load) {
            return lower.efficiency + (load - lower.load) / (upper.load - lower.load) * (upper.efficiency - lower.efficiency);
        }
    }
    return curve.back().efficiency;
}

double ElectricPropulsion::thermal_margin_locked() const {
    const double span = config_.motor.max_winding_temp_c - k_reference_temp_c;
    return std::clamp((config_.motor.max_winding_temp_c - winding_temp_c_) / span, 0.0, 1.0);
}

double ElectricPropulsion::max_safe_throttle_locked() const {
    const double margin = thermal_margin_locked();
    if (margin < k_thermal_derate_margin) {
        return 0.5;
    }
    if (margin < k_thermal_caution_margin) {
        return 0.75;
    }
    return 1.0;
}

void ElectricPropulsion::update_motor_thermal_locked(double electrical_power_w,
                                                     double mechanical_power_w,
                                                     double airspeed_mps,
                                                     double dt_s) {
    const double winding_current_a = pack_voltage_v_ > 0.0 ? electrical_power_w / pack_voltage_v_ : 0.0;
    const double losses_w = (electrical_power_w - mechanical_power_w)
        + winding_current_a * winding_current_a * config_.motor.winding_resistance_ohm;
    const double cooling_w = config_.motor.cooling_coeff_w_per_k * (1.0 + airspeed_mps * k_airflow_cooling_gain)
        * (winding_temp_c_ - ambient_temp_c_);
    winding_temp_c_ += (losses_w - cooling_w) * dt_s / config_.motor.thermal_mass_j_per_k;
    winding_temp_c_ = std::max(ambient_temp_c_, winding_temp_c_);
}

void ElectricPropulsion::refresh_snapshots_locked(TimePoint now) {
    const double nominal_pack_v = config_.battery.nominal_voltage_per_cell * config_.battery.cell_count;
    const double remaining_wh = usable_capacity_ah() * nominal_pack_v * soc_ * soh_;
    battery_temp_c_ = std::accumulate(list_cell_temps_c_.begin(), list_cell_temps_c_.end(), 0.0)
        / static_cast<double>(list_cell_temps_c_.size());

    EnergyState energy{};
    energy.battery_soc = soc_;
    energy.battery_voltage_v = pack_voltage_v_;
    energy.battery_current_a = pack_current_a_;
    energy.battery_temperature_c = battery_temp_c_;
    energy.battery_health = soh_;
    energy.cell_voltages_v = list_cell_voltages_v_;
    energy.cell_temperatures_c = list_cell_temps_c_;
    energy.remaining_energy_wh = remaining_wh;
    energy.specific_energy_wh_per_kg = remaining_wh / config_.battery.pack_mass_kg;
    const double draw_w = pack_voltage_v_ * pack_current_a_;
    energy.estimated_endurance = draw_w > 0.0 ? Duration{remaining_wh / draw_w * k_seconds_per_hour} : Duration::max();
    if (flag_measured_) {
        energy.confidence = pack_current_a_ == 0.0 ? 0.9 : 0.8;
    } else {
        energy.confidence = 0.7;
    }
    energy.timestamp = now;
    energy_snapshot_ = std::move(energy);

    ThermalState thermal{};
    thermal.motor_temperature_c = winding_temp_c_;
    thermal.esc_temperature_c = ambient_temp_c_ + (winding_temp_c_ - ambient_temp_c_) * 0.8;
    thermal.battery_temperature_c = battery_temp_c_;
    thermal.ambient_temperature_c = ambient_temp_c_;
    thermal.cooling_efficiency = std::clamp(config_.motor.cooling_coeff_w_per_k / (config_.motor.cooling_coeff_w_per_k + 1.0), 0.0, 1.0);
    thermal.thermal_margin = thermal_margin_locked();
    thermal.timestamp = now;
    thermal_snapshot_ = thermal;

    ThrustCapability thrust{};
    const double ceiling = max_safe_throttle_locked();
    const double throttle = flag_energized_ ? throttle_command_ : 0.0;
    thrust.max_thrust_n = config_.motor.max_thrust_n * ceiling * ceiling;
    thrust.current_thrust_n = config_.motor.max_thrust_n * throttle * throttle;
    thrust.thrust_vector = thrust_vector_;
    thrust.response_time = config_.motor.response_time;
    thrust.efficiency_at_current = motor_efficiency_;
    const double full_load_losses_w = config_.motor.max_power_w * (1.0 / efficiency_at(1.0) - 1.0);
    const double headroom_c = config_.motor.max_winding_temp_c - winding_temp_c_;
    thrust.sustainable_duration = full_load_losses_w > 0.0
        ? Duration{std::max(0.0, headroom_c) * config_.motor.thermal_mass_j_per_k / full_load_losses_w}
        : Duration::max();
    thrust_snapshot_ = thrust;

    refresh_health_locked(now);
}

void ElectricPropulsion::refresh_health_locked(TimePoint now) {
    const BatteryConfig& battery = config_.battery;
    const double margin = thermal_margin_locked();

    HealthStatus motor = HealthStatus::Ok;
    if (winding_temp_c_ >= config_.motor.max_winding_temp_c) {
        motor = HealthStatus::Critical;
    } else if (margin < k_thermal_derate_margin) {
        motor = HealthStatus::Degraded;
    }

    const bool any_cell_below_cutoff = std::any_of(list_cell_voltages_v_.begin(), list_cell_voltages_v_.end(),
                                                   [&battery](double volts) { return volts < battery.cutoff_voltage_per_cell; });
    HealthStatus pack = HealthStatus::Ok;
    if (soc_ <= 0.0) {
        pack = HealthStatus::Failed;
    } else if (any_cell_below_cutoff) {
        pack = HealthStatus::Critical;
    }

    HealthStatus thermal = motor;
    const bool battery_overheated = battery_temp_c_ > battery.max_discharge_temp_c;
    const bool battery_too_cold = battery_temp_c_ < battery.min_operating_temp_c;
    if (battery_overheated || battery_too_cold) {
        thermal = worst_of(thermal, HealthStatus::Critical);
    }

    set_condition_locked("motor_thermal", motor != HealthStatus::Ok, "motor", motor == HealthStatus::Critical ? 0.8 : 0.4,
                         fmt::format("winding at {:.1f} C (margin {:.2f})", winding_temp_c_, margin), now);
    set_condition_locked("cell_undervoltage", any_cell_below_cutoff, "battery", 0.8,
                         "cell voltage below cutoff", now);
    set_condition_locked("pack_depleted", soc_ <= 0.0, "battery", 1.0, "pack depleted", now);
    set_condition_locked("battery_thermal", battery_overheated || battery_too_cold, "battery", 0.7,
                         fmt::format("pack temperature {:.1f} C outside limits", battery_temp_c_), now);

    health_snapshot_.motor = motor;
    health_snapshot_.battery = pack;
    health_snapshot_.esc = motor == HealthStatus::Critical ? HealthStatus::Degraded : HealthStatus::Ok;
    health_snapshot_.fuel_system = HealthStatus::Ok;
    health_snapshot_.thermal = thermal;
    health_snapshot_.overall = worst_of(worst_of(motor, pack), worst_of(health_snapshot_.esc, thermal));
    health_snapshot_.timestamp = now;
}

void ElectricPropulsion::set_condition_locked(const std::string& key,
                                              bool active,
                                              const std::string& component,
                                              double severity,
                                              const std::string& description,
                                              TimePoint now) {
    const bool was_active = set_active_conditions_.contains(key);
    if (active && !was_active) {
        set_active_conditions_.insert(key);
        Fault fault{};
        fault.id = fmt::format("F-{}", ++fault_sequence_);
        fault.component = component;
        fault.severity = severity;
        fault.description = key + ": " + description;
        fault.timestamp = now;
        get_logger()->warn(R"({{"component":"propulsion","backend":{},"event":"fault","id":"{}","source":"{}","severity":{},"description":{}}})",
                           json_quote(identifier()), fault.id, component, severity, json_quote(fault.description));
        health_snapshot_.active_faults.push_back(std::move(fault));
    } else if (!active && was_active) {
        set_active_conditions_.erase(key);
        const std::string prefix = key + ": ";
        std::erase_if(health_snapshot_.active_faults,
                      [&prefix](const Fault& fault) { return fault.description.starts_with(prefix); });
    }
}

}  // namespace flight_safety
