// regionmap Core
// logger.cpp - Logging system implementation

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <regionmap/core/logger.hpp>
#include <regionmap/platform/file_io.hpp>
#include <unordered_map>
#include <vector>

namespace regionmap::core {

namespace {

struct LoggerState {
    bool initialized = false;
    LogLevel global_level = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> category_levels;
    std::shared_ptr<spdlog::logger> logger;
    std::mutex mutex;
};

LoggerState& get_state() {
    static LoggerState state;
    return state;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return spdlog::level::trace;
        case LogLevel::Debug:
            return spdlog::level::debug;
        case LogLevel::Info:
            return spdlog::level::info;
        case LogLevel::Warn:
            return spdlog::level::warn;
        case LogLevel::Error:
            return spdlog::level::err;
        case LogLevel::Critical:
            return spdlog::level::critical;
        case LogLevel::Off:
            return spdlog::level::off;
        default:
            return spdlog::level::info;
    }
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "trace") {
        return LogLevel::Trace;
    }
    if (name == "debug") {
        return LogLevel::Debug;
    }
    if (name == "info") {
        return LogLevel::Info;
    }
    if (name == "warn" || name == "warning") {
        return LogLevel::Warn;
    }
    if (name == "error") {
        return LogLevel::Error;
    }
    if (name == "critical") {
        return LogLevel::Critical;
    }
    if (name == "off") {
        return LogLevel::Off;
    }
    return std::nullopt;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
            return "trace";
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
        case LogLevel::Critical:
            return "critical";
        case LogLevel::Off:
            return "off";
    }
    return "info";
}

void Logger::initialize(const LoggerConfig& config) {
    auto& state = get_state();
    std::filesystem::path log_path;

    {
        std::lock_guard lock(state.mutex);

        if (state.initialized) {
            return;
        }

        // Console output goes to stderr so stdout stays free for tool output
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(config.console_level));
        if (config.include_timestamps) {
            console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");
        } else {
            console_sink->set_pattern("[%^%l%$] %v");
        }

        std::vector<spdlog::sink_ptr> sinks{console_sink};

        if (!config.log_file.empty()) {
            try {
                auto parent = config.log_file.parent_path();
                if (!parent.empty() && !platform::FileSystem::exists(parent)) {
                    platform::FileSystem::create_directories(parent);
                }
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    config.log_file.string(), config.max_file_size, config.max_files);
                file_sink->set_level(to_spdlog_level(config.file_level));
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
                sinks.push_back(file_sink);
                log_path = config.log_file;
            } catch (const spdlog::spdlog_ex& ex) {
                // Keep console logging if the file cannot be created
                spdlog::error("Log file creation failed: {}", ex.what());
            }
        }

        state.logger = std::make_shared<spdlog::logger>("regionmap", sinks.begin(), sinks.end());
        state.logger->set_level(spdlog::level::trace);  // Let sinks filter
        state.logger->flush_on(spdlog::level::warn);

        state.global_level = config.console_level;
        state.initialized = true;
    }

    debug(log_category::APP, "Logger initialized");
    if (!log_path.empty()) {
        info(log_category::APP, "Log file: {}", log_path.string());
    }
}

void Logger::shutdown() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        return;
    }

    if (state.logger) {
        state.logger->flush();
    }
    state.logger.reset();
    state.category_levels.clear();
    state.initialized = false;
}

bool Logger::is_initialized() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.initialized;
}

void Logger::set_category_level(std::string_view category, LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.category_levels[std::string(category)] = level;
}

LogLevel Logger::get_category_level(std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    auto it = state.category_levels.find(std::string(category));
    if (it != state.category_levels.end()) {
        return it->second;
    }
    return state.global_level;
}

void Logger::set_global_level(LogLevel level) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    state.global_level = level;

    if (state.logger && !state.logger->sinks().empty()) {
        // Console sink is always first
        state.logger->sinks().front()->set_level(to_spdlog_level(level));
    }
}

LogLevel Logger::get_global_level() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);
    return state.global_level;
}

void Logger::flush() {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (state.logger) {
        state.logger->flush();
    }
}

bool Logger::should_log(LogLevel level, std::string_view category) {
    auto& state = get_state();
    std::lock_guard lock(state.mutex);

    if (!state.initialized) {
        // Before initialization, defer to spdlog's default logger level
        return spdlog::default_logger_raw()->should_log(to_spdlog_level(level));
    }

    LogLevel category_level = state.global_level;
    auto it = state.category_levels.find(std::string(category));
    if (it != state.category_levels.end()) {
        category_level = it->second;
    }

    return static_cast<int>(level) >= static_cast<int>(category_level);
}

void Logger::log_message(LogLevel level, std::string_view category, std::string_view message) {
    auto& state = get_state();
    auto spdlog_level = to_spdlog_level(level);

    std::lock_guard lock(state.mutex);

    if (!state.initialized || !state.logger) {
        spdlog::log(spdlog_level, "[{}] {}", category, message);
        return;
    }

    state.logger->log(spdlog_level, "[{}] {}", category, message);
}

}  // namespace regionmap::core
