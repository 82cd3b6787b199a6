#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace voxfleet {
namespace log {

// ============================================================================
// Logger Names
// ============================================================================
constexpr const char* MAIN_LOGGER = "voxfleet";

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

    // Per-module overrides, keyed by logger name ("node.exit", "remote.router")
    std::unordered_map<std::string, Level> module_levels;
};

// ============================================================================
// Initialization
// ============================================================================

// Initialize logging with the given configuration
void init(const LogConfig& config = LogConfig{});

// Apply VOXFLEET_LOG_LEVEL (trace..off) and VOXFLEET_LOG_FILE on top of a config
LogConfig apply_env(LogConfig config);

// Get a logger by name, creates if doesn't exist
std::shared_ptr<spdlog::logger> get(const std::string& name = MAIN_LOGGER);

// Check if a level is enabled (for conditional logging)
bool is_level_enabled(Level level);

// Parse "debug", "warn", ... (unknown strings map to Info)
Level parse_level(std::string_view level);

// Shutdown logging
void shutdown();

spdlog::level::level_enum to_spdlog_level(Level level);

// ============================================================================
// Template logging functions - check level at runtime
// ============================================================================

template<typename... Args>
inline void trace(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Trace)) {
        get()->trace(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Debug)) {
        get()->debug(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void info(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Info)) {
        get()->info(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Warn)) {
        get()->warn(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void error(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Error)) {
        get()->error(fmt, std::forward<Args>(args)...);
    }
}

template<typename... Args>
inline void critical(fmt::format_string<Args...> fmt, Args&&... args) {
    if (is_level_enabled(Level::Critical)) {
        get()->critical(fmt, std::forward<Args>(args)...);
    }
}

// ============================================================================
// Logger class for component-specific logging
// ============================================================================

class Logger {
public:
    explicit Logger(const std::string& name) : name_(name) {}

    // Shared instance per module name, lives until process exit
    static const Logger& get(const std::string& name);

    template<typename... Args>
    void trace(fmt::format_string<Args...> fmt, Args&&... args) const {
        log_impl(spdlog::level::trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> fmt, Args&&... args) const {
        log_impl(spdlog::level::debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> fmt, Args&&... args) const {
        log_impl(spdlog::level::info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> fmt, Args&&... args) const {
        log_impl(spdlog::level::warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> fmt, Args&&... args) const {
        log_impl(spdlog::level::err, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> fmt, Args&&... args) const {
        log_impl(spdlog::level::critical, fmt, std::forward<Args>(args)...);
    }

    const std::string& name() const { return name_; }

private:
    // Module loggers carry their own level, so the check goes through spdlog
    template<typename... Args>
    void log_impl(spdlog::level::level_enum lvl, fmt::format_string<Args...> fmt, Args&&... args) const {
        auto logger = log::get(name_);
        if (logger->should_log(lvl)) {
            logger->log(lvl, fmt, std::forward<Args>(args)...);
        }
    }

    std::string name_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::voxfleet::log::trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::voxfleet::log::debug(__VA_ARGS__)
#define LOG_INFO(...) ::voxfleet::log::info(__VA_ARGS__)
#define LOG_WARN(...) ::voxfleet::log::warn(__VA_ARGS__)
#define LOG_ERROR(...) ::voxfleet::log::error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::voxfleet::log::critical(__VA_ARGS__)

} // namespace log
} // namespace voxfleet
