#include "flight_safety/telemetry_bus.hpp"

#include <utility>

#include "flight_safety/errors.hpp"

namespace flight_safety {

TelemetryBus::TelemetryBus(std::size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw ConfigurationError("Telemetry bus capacity must be positive");
    }
}

void TelemetryBus::publish(TelemetryEvent event) {
    std::scoped_lock lock(mutex_);
    if (queue_events_.size() >= capacity_) {
        queue_events_.pop_front();
        ++dropped_count_;
    }
    queue_events_.push_back(std::move(event));
}

std::optional<TelemetryEvent> TelemetryBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    TelemetryEvent event = std::move(queue_events_.front());
    queue_events_.pop_front();
    return event;
}

std::size_t TelemetryBus::size() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

std::size_t TelemetryBus::capacity() const noexcept {
    return capacity_;
}

std::size_t TelemetryBus::dropped_count() const {
    std::scoped_lock lock(mutex_);
    return dropped_count_;
}

}  // namespace flight_safety
