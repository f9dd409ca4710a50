// =============================================================================
// sgff - Logger Module
// =============================================================================
// Quill-backed logging for the codec.
//
// The codec logs through the SGFF_LOG_* macros. They do nothing until init()
// has been called, so embedding applications that never set up logging pay
// only a pointer load per call site. Block-level decode and encode steps log
// at debug level; retained unknown blocks log at warning level.
//
// Usage:
//   sgff::log::init("sgff.log", sgff::log::Level::kDebug);
//   SGFF_LOG_INFO("Parsed {} blocks", count);
//
// or, for tools that want to be configurable without code changes:
//   sgff::log::initFromEnvironment();  // SGFF_LOG_LEVEL, SGFF_LOG_FILE
// =============================================================================

#ifndef SGFF_COMMON_LOGGER_H
#define SGFF_COMMON_LOGGER_H

#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace sgff::log {

// =============================================================================
// Log Level Enumeration
// =============================================================================

/// @brief Severity, mapped one-to-one onto Quill's levels.
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
    /// @brief Log file path, appended to. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum log level to output.
    Level level = Level::kInfo;

    /// @brief Enable console output. Forced on when logFile is empty.
    bool enableConsole = true;

    /// @brief Logger name for identification.
    std::string loggerName = "sgff";
};

// =============================================================================
// Logger Initialization and Access
// =============================================================================

/// @brief Initialize the global logger with the specified configuration.
/// @note Calling init() twice is a no-op.
void init(const Config& config);

/// @brief Initialize the global logger with default settings.
/// @param logFile Path to log file. Empty string disables file logging.
/// @param level Minimum log level to output.
void init(std::string_view logFile = "", Level level = Level::kInfo);

/// @brief Initialize from SGFF_LOG_LEVEL and SGFF_LOG_FILE.
/// @return false (and logging stays off) when neither variable is set.
bool initFromEnvironment();

/// @brief Get the global logger instance.
/// @return Pointer to the global Quill logger, nullptr before init().
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Check if the logger has been initialized.
[[nodiscard]] bool isInitialized() noexcept;

/// @brief Flush all pending log messages.
void flush();

/// @brief Shutdown the logging system.
/// @note Flushes all pending messages and stops the backend thread.
void shutdown();

// =============================================================================
// Level Conversion Utilities
// =============================================================================

/// @brief Convert sgff::log::Level to Quill's LogLevel.
[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Case-insensitive level name ("warn" and "fatal" accepted); kInfo if unknown.
[[nodiscard]] Level levelFromString(std::string_view levelStr) noexcept;

/// @brief Convert log level to string.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace sgff::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define SGFF_LOG_IMPL(MACRO, fmt, ...)                                   \
    do {                                                                 \
        if (quill::Logger* sgffLogger_ = sgff::log::logger()) {          \
            MACRO(sgffLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);          \
        }                                                                \
    } while (false)

/// @brief Log a trace message.
#define SGFF_LOG_TRACE(fmt, ...) SGFF_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define SGFF_LOG_DEBUG(fmt, ...) SGFF_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define SGFF_LOG_INFO(fmt, ...) SGFF_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define SGFF_LOG_WARNING(fmt, ...) SGFF_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define SGFF_LOG_ERROR(fmt, ...) SGFF_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define SGFF_LOG_CRITICAL(fmt, ...) SGFF_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // SGFF_COMMON_LOGGER_H
