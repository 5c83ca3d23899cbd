// =============================================================================
// idxz - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// This module provides a global logger instance with support for:
// - Multiple log levels (trace, debug, info, warning, error, critical)
// - Console and file output
// - Thread-safe logging from decode workers (Quill is inherently thread-safe)
//
// Usage:
//   idxz::log::init(idxz::log::Config{.logFile = "idxz.log"});
//   IDXZ_LOG_INFO("Decoded {} frames", frameCount);
// =============================================================================

#ifndef IDXZ_COMMON_LOGGER_H
#define IDXZ_COMMON_LOGGER_H

#include <string>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace idxz::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Log level enumeration matching Quill's log levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

// =============================================================================
// Logger Configuration
// =============================================================================

/// @brief Configuration options for logger initialization.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console (stderr) output.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "idxz";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Install the global logger described by `config`.
/// @note A later call installs a new logger under `config.loggerName`; a
///       name that already exists keeps the sinks it was created with.
void init(const Config& config);

/// @brief Get the global logger instance.
/// @note Installs a console logger at info level on first use, so library
///       code may log before main() configures anything.
[[nodiscard]] quill::Logger* logger();

/// @brief Block until every pending message reached its sinks.
void flush();

/// @brief Flush and stop the backend thread. Called once before exit.
void shutdown();

/// @brief Convert idxz::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

}  // namespace idxz::log

// =============================================================================
// Convenience Macros
// =============================================================================

/// @brief Log a trace message.
#define IDXZ_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(idxz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define IDXZ_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(idxz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define IDXZ_LOG_INFO(fmt, ...) \
    LOG_INFO(idxz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define IDXZ_LOG_WARNING(fmt, ...) \
    LOG_WARNING(idxz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define IDXZ_LOG_ERROR(fmt, ...) \
    LOG_ERROR(idxz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define IDXZ_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(idxz::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // IDXZ_COMMON_LOGGER_H
