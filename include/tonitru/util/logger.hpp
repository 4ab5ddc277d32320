/*
    Tonitru Logging

    Thin wrapper over Quill (asynchronous, low-latency logging).
    The decode hot path only logs failures and fallbacks; per-batch success
    is never logged.

    Compiled in when TNT_HAS_LOGGING is defined, otherwise every macro is a
    no-op and Quill is not required.
*/

#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

namespace tnt::logging {

enum class Level {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

struct LogConfig {
    std::string log_dir = "logs";
    std::string log_name = "tonitru";
    bool console_output = true;
    bool file_output = false;
    Level min_level = Level::Info;
    size_t max_file_size = 10 * 1024 * 1024;  // 10MB
    uint32_t max_backup_files = 5;
};

/// Parse a level name as accepted by TNT_LOG_LEVEL
[[nodiscard]] inline constexpr Level parse_level(std::string_view name, Level fallback) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warning" || name == "warn") return Level::Warning;
    if (name == "error") return Level::Error;
    if (name == "critical") return Level::Critical;
    return fallback;
}

/// Config level, overridden by the TNT_LOG_LEVEL environment variable
[[nodiscard]] inline Level effective_level(const LogConfig& config) noexcept {
    if (const char* env = std::getenv("TNT_LOG_LEVEL")) {
        return parse_level(env, config.min_level);
    }
    return config.min_level;
}

} // namespace tnt::logging

#ifdef TNT_HAS_LOGGING

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/RotatingFileSink.h>

#include <filesystem>
#include <memory>
#include <vector>

namespace tnt::logging {

inline constexpr const char* LOGGER_NAME = "tnt";

// Initialize logging subsystem
inline void init(const LogConfig& config = {}) {
    quill::BackendOptions backend_options;
    backend_options.thread_name = "tnt_logger";
    quill::Backend::start(backend_options);

    if (config.file_output) {
        std::filesystem::create_directories(config.log_dir);
    }

    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (config.console_output) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("tnt_console"));
    }

    if (config.file_output) {
        std::string log_path = config.log_dir + "/" + config.log_name + ".log";

        quill::RotatingFileSinkConfig file_config;
        file_config.set_open_mode('a');
        file_config.set_filename_append_option(quill::FilenameAppendOption::StartDateTime);
        file_config.set_rotation_max_file_size(config.max_file_size);
        file_config.set_max_backup_files(config.max_backup_files);

        sinks.push_back(quill::Frontend::create_or_get_sink<quill::RotatingFileSink>(
            log_path, file_config));
    }

    quill::Logger* logger = quill::Frontend::create_or_get_logger(LOGGER_NAME, std::move(sinks));

    switch (effective_level(config)) {
        case Level::Trace:    logger->set_log_level(quill::LogLevel::TraceL1); break;
        case Level::Debug:    logger->set_log_level(quill::LogLevel::Debug); break;
        case Level::Info:     logger->set_log_level(quill::LogLevel::Info); break;
        case Level::Warning:  logger->set_log_level(quill::LogLevel::Warning); break;
        case Level::Error:    logger->set_log_level(quill::LogLevel::Error); break;
        case Level::Critical: logger->set_log_level(quill::LogLevel::Critical); break;
    }
}

/// Logger instance, or nullptr until init() has run
inline quill::Logger* get() {
    return quill::Frontend::get_logger(LOGGER_NAME);
}

inline void shutdown() {
    quill::Backend::stop();
}

inline void flush() {
    if (auto* logger = get()) {
        logger->flush_log();
    }
}

} // namespace tnt::logging

// ============================================================================
// Convenience Macros
// ============================================================================

// Library code may run before (or without) init(), so every call checks
// that the logger exists.
#define TNT_LOG_IMPL_(macro, fmt, ...) \
    do { if (auto* tnt_logger_ = tnt::logging::get()) macro(tnt_logger_, fmt, ##__VA_ARGS__); } while (0)

#define TNT_LOG_TRACE(fmt, ...)    TNT_LOG_IMPL_(LOG_TRACE_L1, fmt, ##__VA_ARGS__)
#define TNT_LOG_DEBUG(fmt, ...)    TNT_LOG_IMPL_(LOG_DEBUG, fmt, ##__VA_ARGS__)
#define TNT_LOG_INFO(fmt, ...)     TNT_LOG_IMPL_(LOG_INFO, fmt, ##__VA_ARGS__)
#define TNT_LOG_WARN(fmt, ...)     TNT_LOG_IMPL_(LOG_WARNING, fmt, ##__VA_ARGS__)
#define TNT_LOG_ERROR(fmt, ...)    TNT_LOG_IMPL_(LOG_ERROR, fmt, ##__VA_ARGS__)
#define TNT_LOG_CRITICAL(fmt, ...) TNT_LOG_IMPL_(LOG_CRITICAL, fmt, ##__VA_ARGS__)

#else // TNT_HAS_LOGGING not defined

// ============================================================================
// No-op stubs when logging is disabled
// ============================================================================

namespace tnt::logging {

inline void init(const LogConfig& = {}) {}
inline void* get() { return nullptr; }
inline void shutdown() {}
inline void flush() {}

} // namespace tnt::logging

#define TNT_LOG_TRACE(fmt, ...)    ((void)0)
#define TNT_LOG_DEBUG(fmt, ...)    ((void)0)
#define TNT_LOG_INFO(fmt, ...)     ((void)0)
#define TNT_LOG_WARN(fmt, ...)     ((void)0)
#define TNT_LOG_ERROR(fmt, ...)    ((void)0)
#define TNT_LOG_CRITICAL(fmt, ...) ((void)0)

#endif // TNT_HAS_LOGGING
