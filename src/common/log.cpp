#include "common/log.hpp"
#include <cstdlib>
#include <unordered_map>
#include <mutex>
#include <atomic>

namespace voxfleet::log {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_default_logger;
std::unordered_map<std::string, std::shared_ptr<spdlog::logger>> g_loggers;
std::vector<spdlog::sink_ptr> g_sinks;
LogConfig g_config;
bool g_initialized = false;
std::atomic<Level> g_current_level{Level::Info};

void create_sinks() {
    g_sinks.clear();

    if (g_config.console) {
        g_sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    if (!g_config.file_path.empty()) {
        g_sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            g_config.file_path,
            g_config.max_file_size,
            g_config.max_files
        ));
    }
}

Level effective_level(const std::string& name) {
    auto it = g_config.module_levels.find(name);
    if (it != g_config.module_levels.end()) {
        return it->second;
    }
    return g_config.level;
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
    auto logger = std::make_shared<spdlog::logger>(name, g_sinks.begin(), g_sinks.end());
    logger->set_level(to_spdlog_level(effective_level(name)));
    logger->set_pattern(g_config.pattern);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

void ensure_initialized() {
    if (g_initialized) {
        return;
    }
    create_sinks();
    g_default_logger = create_logger(MAIN_LOGGER);
    g_loggers[MAIN_LOGGER] = g_default_logger;
    g_initialized = true;
}

} // anonymous namespace

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

Level parse_level(std::string_view level) {
    if (level == "trace") return Level::Trace;
    if (level == "debug") return Level::Debug;
    if (level == "info") return Level::Info;
    if (level == "warn" || level == "warning") return Level::Warn;
    if (level == "error" || level == "err") return Level::Error;
    if (level == "critical" || level == "crit") return Level::Critical;
    if (level == "off") return Level::Off;
    return Level::Info;
}

void init(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(g_mutex);

    // Re-init replaces sinks; existing loggers are rebuilt on next get()
    g_loggers.clear();
    g_default_logger.reset();
    g_initialized = false;

    g_config = config;
    g_current_level.store(config.level, std::memory_order_relaxed);
    ensure_initialized();
}

LogConfig apply_env(LogConfig config) {
    if (const char* level = std::getenv("VOXFLEET_LOG_LEVEL")) {
        config.level = parse_level(level);
    }

    if (const char* file = std::getenv("VOXFLEET_LOG_FILE")) {
        config.file_path = file;
    }

    return config;
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mutex);

    // Auto-initialize with whatever g_config holds (set_level may have run first)
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
    return static_cast<int>(level) >= static_cast<int>(g_current_level.load(std::memory_order_relaxed));
}

const Logger& Logger::get(const std::string& name) {
    static std::mutex mutex;
    static std::unordered_map<std::string, std::unique_ptr<Logger>> instances;

    std::lock_guard<std::mutex> lock(mutex);
    auto& slot = instances[name];
    if (!slot) {
        slot = std::make_unique<Logger>(name);
    }
    return *slot;
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    for (auto& [name, logger] : g_loggers) {
        logger->flush();
    }
    g_loggers.clear();
    g_default_logger.reset();
    g_sinks.clear();
    g_initialized = false;
}

} // namespace voxfleet::log
