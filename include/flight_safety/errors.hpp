// === Error Taxonomy ==========================================================
//
// Exception types raised by the flight-safety core. Degraded inputs (no
// energy source, no active mission) are handled as defaults and never throw.

#pragma once

#include <stdexcept>
#include <string>

namespace flight_safety {

/** @brief Base class for every error raised by the core. */
class FlightSafetyError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Malformed or inconsistent configuration; fatal to startup. */
class ConfigurationError final : public FlightSafetyError {
  public:
    using FlightSafetyError::FlightSafetyError;
};

/** @brief Command outside its documented domain; rejected per call. */
class OutOfRangeError final : public FlightSafetyError {
  public:
    using FlightSafetyError::FlightSafetyError;
};

/** @brief Operation invoked in the wrong lifecycle state; rejected per call. */
class LifecycleError final : public FlightSafetyError {
  public:
    using FlightSafetyError::FlightSafetyError;
};

/** @brief Emergency shutdown could not be confirmed; caller must escalate. */
class FatalPropulsionError final : public FlightSafetyError {
  public:
    using FlightSafetyError::FlightSafetyError;
};

/** @brief Internal invariant violated (e.g. use before initialization). */
class InvariantError final : public FlightSafetyError {
  public:
    using FlightSafetyError::FlightSafetyError;
};

}  // namespace flight_safety
