#include "flight_safety/logging.hpp"

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace flight_safety {

namespace {
constexpr std::string_view k_logger_name{"flight_safety"};
constexpr std::string_view k_log_file_name{"flight_safety.log"};
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};

std::mutex mutex_logger;
std::shared_ptr<spdlog::logger> shared_logger;

spdlog::sink_ptr make_console_sink() {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    sink->set_pattern("[%l] %v");
    return sink;
}

/**
 * @brief Rotating JSON-lines sink; timestamps are UTC to match the `Z` suffix.
 */
spdlog::sink_ptr make_audit_sink(const std::filesystem::path& path_log_dir) {
    const std::filesystem::path path_log_file = path_log_dir / k_log_file_name;
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path_log_file.string(), k_max_file_size_bytes, k_max_files);
    sink->set_formatter(std::make_unique<spdlog::pattern_formatter>(
        R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","msg":%v})", spdlog::pattern_time_type::utc));
    return sink;
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::scoped_lock lock(mutex_logger);
    if (shared_logger) {
        return shared_logger;
    }

    const std::filesystem::path path_log_dir{log_directory};
    std::error_code error_directory;
    std::filesystem::create_directories(path_log_dir, error_directory);
    if (error_directory) {
        throw std::runtime_error("Unable to create log directory at " + path_log_dir.string() + ": " + error_directory.message());
    }

    spdlog::sinks_init_list sinks{make_console_sink(), make_audit_sink(path_log_dir)};
    auto logger = std::make_shared<spdlog::logger>(std::string{k_logger_name}, sinks);
    logger->set_level(spdlog::level::info);
    // Emergencies and escalations log at warn or above; those lines are flushed immediately.
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    shared_logger = std::move(logger);
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    std::scoped_lock lock(mutex_logger);
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

bool is_logger_initialized() noexcept {
    std::scoped_lock lock(mutex_logger);
    return shared_logger != nullptr;
}

void set_log_level(const std::string& str_level) {
    std::shared_ptr<spdlog::logger> logger = get_logger();
    const spdlog::level::level_enum level = spdlog::level::from_str(str_level);
    if (level == spdlog::level::off && str_level != "off") {
        logger->warn(R"({{"component":"logging","event":"unknown_level","level":{},"fallback":"info"}})", json_quote(str_level));
        logger->set_level(spdlog::level::info);
        return;
    }
    logger->set_level(level);
}

std::string json_quote(std::string_view text) {
    fmt::memory_buffer buffer;
    buffer.push_back('"');
    for (const char character : text) {
        switch (character) {
            case '"':
                fmt::format_to(std::back_inserter(buffer), "\\\"");
                break;
            case '\\':
                fmt::format_to(std::back_inserter(buffer), "\\\\");
                break;
            case '\n':
                fmt::format_to(std::back_inserter(buffer), "\\n");
                break;
            case '\r':
                fmt::format_to(std::back_inserter(buffer), "\\r");
                break;
            case '\t':
                fmt::format_to(std::back_inserter(buffer), "\\t");
                break;
            default:
                if (static_cast<unsigned char>(character) < 0x20) {
                    fmt::format_to(std::back_inserter(buffer), "\\u{:04x}", static_cast<unsigned>(static_cast<unsigned char>(character)));
                } else {
                    buffer.push_back(character);
                }
                break;
        }
    }
    buffer.push_back('"');
    return fmt::to_string(buffer);
}

}  // namespace flight_safety
