/// @file log.cpp
/// @brief Logger registry shared by the bundle and publish modules

#include <ferry/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <mutex>
#include <map>
#include <memory>
#include <sstream>
#include <filesystem>

namespace ferry_core {

namespace {

struct Loggers {
    std::mutex mutex;
    LogConfig config;
    std::map<std::string, std::shared_ptr<spdlog::logger>> by_name;
};

Loggers& loggers() {
    static Loggers instance;
    return instance;
}

/// Caller holds the registry mutex
std::vector<spdlog::sink_ptr> make_sinks(const LogConfig& config, const std::string& name) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console_enabled) {
        auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(console);
    }

    if (config.file_enabled && !config.log_directory.empty()) {
        auto path = std::filesystem::path(config.log_directory) / (name + ".log");
        try {
            auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                path.string(), config.max_file_size, config.max_files);
            file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
            sinks.push_back(file);
        } catch (const spdlog::spdlog_ex& ex) {
            // Console output still works; keep going without the file
            spdlog::warn("ferry: cannot open log file {}: {}", path.string(), ex.what());
        }
    }

    return sinks;
}

} // anonymous namespace

// =============================================================================
// Configuration
// =============================================================================

void configure_logging(const LogConfig& config) {
    auto& reg = loggers();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config = config;
    for (auto& [name, logger] : reg.by_name) {
        logger->set_level(config.level);
    }
    spdlog::set_level(config.level);
}

LogConfig current_log_config() {
    auto& reg = loggers();
    std::lock_guard<std::mutex> lock(reg.mutex);
    return reg.config;
}

// =============================================================================
// Named Loggers
// =============================================================================

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    auto& reg = loggers();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (auto it = reg.by_name.find(name); it != reg.by_name.end()) {
        return it->second;
    }

    auto sinks = make_sinks(reg.config, name);
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(reg.config.level);
    reg.by_name.emplace(name, logger);

    // An embedding application may already own a logger with this name
    if (!spdlog::get(name)) {
        spdlog::register_logger(logger);
    }
    return logger;
}

std::shared_ptr<spdlog::logger> core_logger() {
    static auto logger = get_logger("ferry_core");
    return logger;
}

std::shared_ptr<spdlog::logger> bundle_logger() {
    static auto logger = get_logger("ferry_bundle");
    return logger;
}

std::shared_ptr<spdlog::logger> publish_logger() {
    static auto logger = get_logger("ferry_publish");
    return logger;
}

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level) {
    auto& reg = loggers();
    std::lock_guard<std::mutex> lock(reg.mutex);

    reg.config.level = level;
    for (auto& [name, logger] : reg.by_name) {
        logger->set_level(level);
    }
    spdlog::set_level(level);
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str) {
    static const std::map<std::string, spdlog::level::level_enum> names = {
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"err", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"fatal", spdlog::level::critical},
        {"off", spdlog::level::off},
    };

    auto it = names.find(str);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* log_level_name(spdlog::level::level_enum level) {
    switch (level) {
        case spdlog::level::trace: return "trace";
        case spdlog::level::debug: return "debug";
        case spdlog::level::info: return "info";
        case spdlog::level::warn: return "warn";
        case spdlog::level::err: return "error";
        case spdlog::level::critical: return "critical";
        case spdlog::level::off: return "off";
        default: return "unknown";
    }
}

// =============================================================================
// Structured Logging
// =============================================================================

void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields)
{
    auto logger = get_logger(logger_name);
    if (!logger->should_log(level)) {
        return;
    }

    std::ostringstream line;
    line << message;
    if (!fields.empty()) {
        const char* separator = " {";
        for (const auto& [key, value] : fields) {
            line << separator << key << "=\"" << value << "\"";
            separator = ", ";
        }
        line << "}";
    }

    logger->log(level, line.str());
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(const std::string& name, const std::string& logger_name)
    : m_name(name)
    , m_logger(get_logger(logger_name))
    , m_start(std::chrono::steady_clock::now())
{
    m_logger->trace(">>> Entering {}", m_name);
}

LogScope::~LogScope() {
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - m_start);
    m_logger->trace("<<< Exiting {} ({}us)", m_name, elapsed.count());
}

} // namespace ferry_core
