#include "flight_safety/energy_source.hpp"

#include <utility>

#include "flight_safety/errors.hpp"

namespace flight_safety {

PropulsionBatterySource::PropulsionBatterySource(PropulsionSystemPtr propulsion)
    : propulsion_(std::move(propulsion)) {
    if (propulsion_ == nullptr) {
        throw ConfigurationError("Battery source requires a propulsion backend");
    }
}

double PropulsionBatterySource::read_level() const {
    return propulsion_->get_energy_state().battery_soc;
}

PropulsionFuelSource::PropulsionFuelSource(PropulsionSystemPtr propulsion)
    : propulsion_(std::move(propulsion)) {
    if (propulsion_ == nullptr) {
        throw ConfigurationError("Fuel source requires a propulsion backend");
    }
}

double PropulsionFuelSource::read_level() const {
    return propulsion_->get_energy_state().fuel_level;
}

PushedEnergySource::PushedEnergySource(double initial_level) noexcept
    : level_(initial_level) {}

double PushedEnergySource::read_level() const {
    return level_.load();
}

void PushedEnergySource::set_level(double level) noexcept {
    level_.store(level);
}

}  // namespace flight_safety
