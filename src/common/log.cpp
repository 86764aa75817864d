#include "common/log.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace dashstore::log {

namespace {

std::mutex g_mutex;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
std::vector<spdlog::sink_ptr> g_sinks;
LogConfig g_config;
bool g_initialized = false;
std::atomic<Level> g_current_level{Level::Info};

// Sinks are shared by every named logger so a file sink is opened only once
void build_sinks() {
    g_sinks.clear();
    auto spdlog_level = to_spdlog_level(g_config.level);

    if (g_config.console) {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(spdlog_level);
        g_sinks.push_back(console_sink);
    }

    if (!g_config.file_path.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                g_config.file_path,
                g_config.max_file_size,
                g_config.max_files
            );
            file_sink->set_level(spdlog_level);
            g_sinks.push_back(file_sink);
        } catch (const spdlog::spdlog_ex& ex) {
            // Keep console logging alive; report through stderr sink
            spdlog::error("Failed to open log file {}: {}", g_config.file_path, ex.what());
        }
    }
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, g_sinks.begin(), g_sinks.end());
    logger->set_level(to_spdlog_level(g_config.level));
    logger->set_pattern(g_config.pattern);
    return logger;
}

void ensure_initialized() {
    if (!g_initialized) {
        build_sinks();
        g_loggers[MAIN_LOGGER] = create_logger(MAIN_LOGGER);
        g_initialized = true;
    }
}

} // anonymous namespace

Level parse_level(std::string_view level) {
    std::string lower(level);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return Level::Trace;
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error" || lower == "err") return Level::Error;
    if (lower == "critical" || lower == "crit") return Level::Critical;
    if (lower == "off") return Level::Off;
    return Level::Info;
}

spdlog::level::level_enum to_spdlog_level(Level level) {
    switch (level) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
        case Level::Off: return spdlog::level::off;
        default: return spdlog::level::info;
    }
}

void init(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);

    // Re-init replaces sinks; loggers created earlier are rebuilt lazily
    g_loggers.clear();
    g_config = config;
    g_current_level.store(config.level, std::memory_order_relaxed);
    g_initialized = false;
    ensure_initialized();
}

void apply_env(LogConfig& config) {
    if (const char* level = std::getenv("DASHSTORE_LOG_LEVEL")) {
        config.level = parse_level(level);
    }

    if (const char* file = std::getenv("DASHSTORE_LOG_FILE")) {
        config.file_path = file;
    }
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mutex);

    ensure_initialized();

    auto it = g_loggers.find(name);
    if (it != g_loggers.end()) {
        return it->second;
    }

    auto logger = create_logger(name);
    g_loggers[name] = logger;
    return logger;
}

bool is_level_enabled(Level level) {
    auto current = g_current_level.load(std::memory_order_relaxed);
    if (current == Level::Off) return false;
    return static_cast<int>(level) >= static_cast<int>(current);
}

void flush() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& [name, logger] : g_loggers) {
        logger->flush();
    }
}

} // namespace dashstore::log
