#pragma once

/// @file log.hpp
/// @brief Named spdlog loggers for bundle registration and publishing

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <chrono>

// =============================================================================
// Logging Macros
// =============================================================================

#define FERRY_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define FERRY_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define FERRY_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define FERRY_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define FERRY_LOG_ERROR(...) spdlog::error(__VA_ARGS__)
#define FERRY_LOG_CRITICAL(...) spdlog::critical(__VA_ARGS__)

namespace ferry_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Sinks and level applied to every ferry logger.
/// Loggers pick up the sinks when first requested, so configure before use.
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;              ///< one "<logger>.log" per logger
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;
};

/// Replace the logging configuration; existing loggers follow the new level
void configure_logging(const LogConfig& config);

/// The configuration currently in effect
[[nodiscard]] LogConfig current_log_config();

// =============================================================================
// Named Loggers
// =============================================================================

/// Logger registered under `name`, created on first use
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// "ferry_core": error bookkeeping
std::shared_ptr<spdlog::logger> core_logger();

/// "ferry_bundle": manifest loading and registration
std::shared_ptr<spdlog::logger> bundle_logger();

/// "ferry_publish": directory copies and links
std::shared_ptr<spdlog::logger> publish_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

/// Accepts spdlog's names plus "warning", "err" and "fatal"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Logs `message {key="value", ...}` on the named logger
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// LogScope
// =============================================================================

/// Traces entry and exit (with elapsed microseconds) of an operation
class LogScope {
public:
    LogScope(const std::string& name, const std::string& logger_name = "ferry_core");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;
    LogScope(LogScope&&) = delete;
    LogScope& operator=(LogScope&&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

} // namespace ferry_core
