// === Reserve Manager =========================================================
//
// Classifies the battery and fuel pictures into reserve tiers and maps the
// current tier to the actions the vehicle must take. The manager is not
// self-scheduling: the owning control loop calls `check()` periodically.

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>

#include "flight_safety/energy_source.hpp"

namespace flight_safety {

/**
 * @brief Reserve tiers, ordered from best to worst.
 */
enum class ReserveLevel {
    Mission,      /**< Mission objectives may continue. */
    Contingency,  /**< Return to base required. */
    Emergency,    /**< Land at the nearest suitable site. */
    Absolute      /**< Land immediately. */
};

/** @brief Action kinds emitted for a reserve tier. */
enum class ActionType {
    WarnOperator,
    AbortMission,
    ReturnToBase,
    ReducePower,
    FindNearestLanding,
    ImmediateLanding
};

struct ReserveAction final {
    int priority{};  /**< Lower is more urgent. */
    ActionType action{ActionType::WarnOperator};
    bool mandatory{};

    friend bool operator==(const ReserveAction&, const ReserveAction&) = default;
};

/**
 * @brief Threshold set for both energy pictures.
 *
 * Each picture must satisfy mission > contingency > emergency > absolute with
 * every value in [0, 1]; see validate().
 */
struct ReserveConfig final {
    double mission_battery_soc{0.40};
    double contingency_battery_soc{0.30};
    double emergency_battery_soc{0.20};
    double absolute_battery_soc{0.10};

    double mission_fuel_level{0.40};
    double contingency_fuel_level{0.30};
    double emergency_fuel_level{0.20};
    double absolute_fuel_level{0.10};

    double mission_reserve_minutes{10.0};     /**< Cruise minutes kept back for planning. */
    double contingency_reserve_minutes{5.0};
    double emergency_reserve_minutes{2.0};
};

/** @brief Throws ConfigurationError when the thresholds are inconsistent. */
void validate(const ReserveConfig& config);

[[nodiscard]] std::string_view to_string(ReserveLevel level) noexcept;
[[nodiscard]] std::string_view to_string(ActionType action) noexcept;

/** @brief True when @p lhs is strictly worse than @p rhs. */
[[nodiscard]] constexpr bool is_worse(ReserveLevel lhs, ReserveLevel rhs) noexcept {
    return static_cast<int>(lhs) > static_cast<int>(rhs);
}

/**
 * @brief Tiered energy-reserve tracker.
 *
 * Without any registered energy source the manager stays at Mission and
 * produces no actions.
 */
class ReserveManager final {
  public:
    using LevelChangeCallback = std::function<void(ReserveLevel, ReserveLevel)>;

    explicit ReserveManager(ReserveConfig config = {});

    /** @brief Register the battery SOC reader; nullptr unregisters. */
    void set_battery_soc_source(EnergySourcePtr source);
    /** @brief Register the fuel level reader; nullptr unregisters. */
    void set_fuel_level_source(EnergySourcePtr source);
    /**
     * @brief Callback invoked with (old, new) whenever `check()` changes the tier.
     *
     * Dispatched after the internal lock is released, so the callback may
     * query the manager.
     */
    void set_level_change_callback(LevelChangeCallback callback);

    /** @brief Re-evaluate the tier from the registered sources. */
    ReserveLevel check();

    [[nodiscard]] ReserveLevel current_level() const;
    [[nodiscard]] double get_available_energy(double total_energy) const;
    [[nodiscard]] std::vector<ReserveAction> get_reserve_actions() const;
    [[nodiscard]] bool is_operation_allowed(double required_energy, double total_energy) const;
    [[nodiscard]] const ReserveConfig& config() const noexcept;
    [[nodiscard]] bool has_energy_source() const;

  private:
    [[nodiscard]] static ReserveLevel classify(double value, double absolute, double emergency, double contingency) noexcept;

    const ReserveConfig config_;
    mutable std::mutex mutex_;
    EnergySourcePtr battery_source_;
    EnergySourcePtr fuel_source_;
    LevelChangeCallback callback_level_change_;
    ReserveLevel current_level_{ReserveLevel::Mission};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace flight_safety
