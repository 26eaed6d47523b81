#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>
#include <type_traits>
#include <variant>

#include <spdlog/spdlog.h>

#include "flight_safety/configuration.hpp"
#include "flight_safety/control_runtime.hpp"
#include "flight_safety/electric_propulsion.hpp"
#include "flight_safety/logging.hpp"
#include "flight_safety/mission.hpp"
#include "flight_safety/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

constexpr std::chrono::milliseconds k_harness_period{100};  /**< Battery simulation and telemetry drain cadence. */
constexpr double k_demo_airspeed_mps{20.0};
constexpr double k_demo_ambient_c{20.0};

void handle_signal(int) {
    should_terminate.store(true);
}

flight_safety::Mission make_demo_mission() {
    using namespace flight_safety;
    Mission mission{};
    mission.id = "demo-patrol";
    mission.type = MissionType::Patrol;
    mission.waypoints = {
        Waypoint{"wp-1", Vector3{0.0, 1500.0, 500.0}, 20.0, 500.0, 0.0, Duration{0.0}},
        Waypoint{"wp-2", Vector3{1500.0, 1500.0, 600.0}, 20.0, 600.0, 0.0, Duration{10.0}},
        Waypoint{"wp-3", Vector3{0.0, 0.0, 500.0}, 20.0, 500.0, 0.0, Duration{0.0}},
    };
    return mission;
}

/**
 * @brief Point-mass integration of the last command so the demo vehicle moves.
 */
flight_safety::VehicleState advance(const flight_safety::VehicleState& state,
                                    const flight_safety::FlightCommand& command,
                                    double dt_s) {
    flight_safety::VehicleState next = state;
    next.heading_rad = flight_safety::wrap_pi(state.heading_rad + command.yaw_rate_rad_s * dt_s);
    const double horizontal = k_demo_airspeed_mps * std::cos(command.pitch_rad);
    next.velocity = flight_safety::Vector3{horizontal * std::sin(next.heading_rad),
                                           horizontal * std::cos(next.heading_rad),
                                           k_demo_airspeed_mps * std::sin(command.pitch_rad)};
    next.position.x += next.velocity.x * dt_s;
    next.position.y += next.velocity.y * dt_s;
    next.position.z = std::max(0.0, next.position.z + next.velocity.z * dt_s);
    next.timestamp = flight_safety::SteadyClock::now();
    return next;
}
}  // namespace

int main() {
    using namespace flight_safety;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();

        if (const char* desired_level = std::getenv("FLIGHT_SAFETY_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }
        auto logger = get_logger();
        logger->info(R"({{"component":"flight_core","event":"starting","version":"{}"}})", k_version);

        auto propulsion = std::make_shared<ElectricPropulsion>("main-motor", ElectricPropulsionConfig{});
        ControlRuntime runtime{configuration, propulsion};
        runtime.initialize();

        runtime.decision_engine().set_mission(make_demo_mission());
        runtime.decision_engine().start_mission();
        runtime.run();

        VehicleState vehicle{};
        std::optional<FlightCommand> last_command;
        const double dt_s = std::chrono::duration<double>(k_harness_period).count();
        while (!should_terminate.load()) {
            std::this_thread::sleep_for(k_harness_period);

            propulsion->update(Duration{dt_s}, k_demo_ambient_c, k_demo_airspeed_mps);
            runtime.failsafe_system().record_comm_contact();

            while (std::optional<TelemetryEvent> event = runtime.telemetry_bus().try_consume()) {
                std::visit(
                    [&](const auto& payload) {
                        using Payload = std::decay_t<decltype(payload)>;
                        if constexpr (std::is_same_v<Payload, FlightCommand>) {
                            last_command = payload;
                        } else if constexpr (std::is_same_v<Payload, ReserveStatus>) {
                            logger->info(R"({{"component":"flight_core","event":"reserve_status","level":"{}","actions":{}}})",
                                         to_string(payload.level), payload.actions.size());
                        } else if constexpr (std::is_same_v<Payload, FlightModeChanged>) {
                            logger->info(R"({{"component":"flight_core","event":"flight_mode","from":"{}","to":"{}"}})",
                                         to_string(payload.from), to_string(payload.to));
                        } else {
                            const Escalation& escalation = payload.escalation;
                            const std::string_view step = escalation.procedure.steps.empty()
                                                              ? std::string_view{"none"}
                                                              : to_string(escalation.procedure.steps[escalation.active_step].action);
                            logger->info(R"({{"component":"flight_core","event":"emergency_status","count":{},"escalation":"{}","procedure":{},"step":"{}"}})",
                                         payload.emergencies.size(), to_string(escalation.action), json_quote(escalation.procedure.name), step);
                        }
                    },
                    event->payload);
            }

            if (last_command) {
                vehicle = advance(vehicle, *last_command, dt_s);
                runtime.update_vehicle_state(vehicle);
            }
        }

        runtime.shutdown();
        logger->info(R"({{"component":"flight_core","event":"stopped","dropped_events":{}}})", runtime.telemetry_bus().dropped_count());
    } catch (const std::exception& exc) {
        if (is_logger_initialized()) {
            get_logger()->critical(R"({{"component":"flight_core","event":"fatal","error":{}}})", json_quote(exc.what()));
        } else {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
