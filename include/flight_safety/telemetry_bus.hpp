// === Telemetry Bus ===========================================================
//
// Bounded thread-safe queue carrying operator-facing telemetry out of the
// control core: flight commands, reserve status, flight-mode changes, and the
// emergency registry. When full, the oldest event is dropped.

#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

#include "flight_safety/decision_engine.hpp"
#include "flight_safety/failsafe_system.hpp"
#include "flight_safety/reserve_manager.hpp"

namespace flight_safety {

/** @brief Reserve tier together with the actions it mandates. */
struct ReserveStatus final {
    ReserveLevel level{ReserveLevel::Mission};
    std::vector<ReserveAction> actions{};
};

struct FlightModeChanged final {
    FlightMode from{FlightMode::Primary};
    FlightMode to{FlightMode::Primary};
};

/** @brief Snapshot of the emergency registry and the escalation covering it. */
struct EmergencyStatus final {
    std::vector<ActiveEmergency> emergencies{};
    Escalation escalation{};
};

using TelemetryPayload = std::variant<FlightCommand, ReserveStatus, FlightModeChanged, EmergencyStatus>;

/** @brief Wrapper representing a single telemetry publication. */
struct TelemetryEvent final {
    TimePoint published_at{SteadyClock::now()};
    TelemetryPayload payload{};
};

/** @brief Thread-safe bounded FIFO used to exchange telemetry events. */
class TelemetryBus final {
  public:
    static constexpr std::size_t k_default_capacity{1024};

    explicit TelemetryBus(std::size_t capacity = k_default_capacity);

    /** @brief Publish a telemetry event; drops the oldest when full. */
    void publish(TelemetryEvent event);
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<TelemetryEvent> try_consume();

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const noexcept;
    [[nodiscard]] std::size_t dropped_count() const;

  private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<TelemetryEvent> queue_events_;
    std::size_t dropped_count_{};
};

}  // namespace flight_safety
