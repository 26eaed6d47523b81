// === Energy Sources ==========================================================
//
// Substitutable readers that feed the reserve manager with a normalized
// battery or fuel level. Propulsion-backed sources read the backend's cached
// energy snapshot; `PushedEnergySource` holds a value set by a collaborator
// (sensor driver, test harness).

#pragma once

#include <atomic>
#include <memory>

#include "flight_safety/propulsion.hpp"

namespace flight_safety {

/** @brief Reader for one normalized energy level (0..1). */
class EnergySource {
  public:
    virtual ~EnergySource() = default;

    /** @brief Latest level; must not block. */
    [[nodiscard]] virtual double read_level() const = 0;
};

using EnergySourcePtr = std::shared_ptr<EnergySource>;

/** @brief Battery state of charge taken from a propulsion backend. */
class PropulsionBatterySource final : public EnergySource {
  public:
    explicit PropulsionBatterySource(PropulsionSystemPtr propulsion);

    [[nodiscard]] double read_level() const override;

  private:
    PropulsionSystemPtr propulsion_;
};

/** @brief Fuel level taken from a propulsion backend. */
class PropulsionFuelSource final : public EnergySource {
  public:
    explicit PropulsionFuelSource(PropulsionSystemPtr propulsion);

    [[nodiscard]] double read_level() const override;

  private:
    PropulsionSystemPtr propulsion_;
};

/** @brief Level pushed in by a collaborator; lock-free. */
class PushedEnergySource final : public EnergySource {
  public:
    explicit PushedEnergySource(double initial_level = 1.0) noexcept;

    [[nodiscard]] double read_level() const override;
    void set_level(double level) noexcept;

  private:
    std::atomic<double> level_;
};

}  // namespace flight_safety
