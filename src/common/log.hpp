#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <string_view>

namespace dashstore {
namespace log {

// ============================================================================
// Logger Names
// ============================================================================
constexpr const char* MAIN_LOGGER = "dashstore";
constexpr const char* MIGRATE_LOGGER = "migrate";
constexpr const char* STORE_LOGGER = "store";
constexpr const char* CRYPTO_LOGGER = "crypto";

// ============================================================================
// Log Levels (runtime configurable)
// ============================================================================
enum class Level {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Critical = 5,
    Off = 6
};

// ============================================================================
// Log Configuration
// ============================================================================
struct LogConfig {
    Level level{Level::Info};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v"};
    bool console{true};
    std::string file_path;
    size_t max_file_size{10 * 1024 * 1024};  // 10 MB
    size_t max_files{5};
};

// Parse a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
// Unknown names map to Info.
Level parse_level(std::string_view level);

// Initialize logging with the given configuration
void init(const LogConfig& config = LogConfig{});

// Apply environment overrides on top of an existing configuration
// DASHSTORE_LOG_LEVEL: trace, debug, info, warn, error, critical, off
// DASHSTORE_LOG_FILE: path to log file
void apply_env(LogConfig& config);

// Get a logger by name, creates if doesn't exist
std::shared_ptr<spdlog::logger> get(const std::string& name = MAIN_LOGGER);

// Check if a level is enabled (for conditional logging)
bool is_level_enabled(Level level);

// Flush all loggers
void flush();

spdlog::level::level_enum to_spdlog_level(Level level);

// ============================================================================
// Named logger template functions
// ============================================================================

template<typename... Args>
inline void debug(const std::string& logger_name, fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Debug)) {
        get(logger_name)->debug(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void info(const std::string& logger_name, fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Info)) {
        get(logger_name)->info(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void warn(const std::string& logger_name, fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Warn)) {
        get(logger_name)->warn(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void error(const std::string& logger_name, fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Error)) {
        get(logger_name)->error(fmt, std::forward<Args>(args)...);
    }
}

#define NLOG_DEBUG(name, ...) ::dashstore::log::debug(name, __VA_ARGS__)
#define NLOG_INFO(name, ...) ::dashstore::log::info(name, __VA_ARGS__)
#define NLOG_WARN(name, ...) ::dashstore::log::warn(name, __VA_ARGS__)
#define NLOG_ERROR(name, ...) ::dashstore::log::error(name, __VA_ARGS__)

} // namespace log
} // namespace dashstore
