#pragma once

#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "flight_safety/propulsion.hpp"

namespace flight_safety::test {

/**
 * @brief Scriptable backend: energy and health are set by the test, and the
 *        emergency shutdown can be made to fail.
 */
class FakePropulsion final : public PropulsionBase {
  public:
    explicit FakePropulsion(PropulsionType type = PropulsionType::Electric,
                            bool confirm_shutdown = true,
                            std::string identifier = "fake")
        : PropulsionBase(std::move(identifier)),
          type_(type),
          flag_confirm_shutdown_(confirm_shutdown) {
        energy_.battery_soc = 1.0;
        energy_.fuel_level = 1.0;
    }

    void set_battery_soc(double soc) {
        std::scoped_lock lock(mutex_);
        energy_.battery_soc = soc;
    }

    void set_fuel_level(double level) {
        std::scoped_lock lock(mutex_);
        energy_.fuel_level = level;
    }

    void set_overall_health(HealthStatus status) {
        std::scoped_lock lock(mutex_);
        health_.overall = status;
    }

    /** @brief Make the next emergency shutdown throw a driver-level error. */
    void fail_shutdown_with(std::string message) {
        std::scoped_lock lock(mutex_);
        shutdown_error_ = std::move(message);
    }

    [[nodiscard]] std::optional<double> last_thrust() const {
        std::scoped_lock lock(mutex_);
        return last_thrust_;
    }

    [[nodiscard]] int shutdown_calls() const {
        std::scoped_lock lock(mutex_);
        return shutdown_calls_;
    }

    [[nodiscard]] EnergyState get_energy_state() const override {
        std::scoped_lock lock(mutex_);
        return energy_;
    }

    [[nodiscard]] ThermalState get_thermal_state() const override {
        return ThermalState{};
    }

    [[nodiscard]] ThrustCapability get_thrust_capability() const override {
        return ThrustCapability{};
    }

    [[nodiscard]] PropulsionHealth get_health() const override {
        std::scoped_lock lock(mutex_);
        return health_;
    }

    [[nodiscard]] Duration predict_endurance(const std::vector<double>&) const override {
        return Duration::max();
    }

    [[nodiscard]] ThermalState predict_thermal_state(Duration) const override {
        return ThermalState{};
    }

    [[nodiscard]] PropulsionType type() const noexcept override {
        return type_;
    }

  protected:
    void on_initialize() override {}
    void on_start() override {}
    void on_stop() override {}

    void apply_thrust_command(double thrust) override {
        std::scoped_lock lock(mutex_);
        last_thrust_ = thrust;
    }

    void apply_thrust_vector(const Vector3&) override {}

    bool perform_emergency_shutdown() override {
        std::scoped_lock lock(mutex_);
        ++shutdown_calls_;
        if (shutdown_error_) {
            throw std::runtime_error(*shutdown_error_);
        }
        last_thrust_ = 0.0;
        return flag_confirm_shutdown_;
    }

  private:
    const PropulsionType type_;
    const bool flag_confirm_shutdown_;
    mutable std::mutex mutex_;
    EnergyState energy_{};
    PropulsionHealth health_{};
    std::optional<double> last_thrust_{};
    std::optional<std::string> shutdown_error_{};
    int shutdown_calls_{};
};

}  // namespace flight_safety::test
