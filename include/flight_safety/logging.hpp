// === Logging =================================================================
//
// Single process-wide spdlog logger shared by every component. Console output
// is human-oriented; the rotating file carries one JSON object per line so the
// flight-safety audit trail can be replayed by tooling.

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace flight_safety {

/**
 * @brief Create the shared logger under @p log_directory. Later calls return
 *        the existing logger unchanged.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief Shared logger; throws std::runtime_error before initialization. */
std::shared_ptr<spdlog::logger> get_logger();

[[nodiscard]] bool is_logger_initialized() noexcept;

/** @brief Apply an spdlog level name; unknown names fall back to info. */
void set_log_level(const std::string& str_level);

/**
 * @brief Quote and escape free text for embedding in a JSON log message,
 *        e.g. `"reason":{}` with `json_quote(reason)`.
 */
[[nodiscard]] std::string json_quote(std::string_view text);

}  // namespace flight_safety
