// =============================================================================
// tid - Logger Module
// =============================================================================
// Quill-backed diagnostics for the tid library and tidtool.
//
// Log records always go to stderr (and optionally a file). stdout belongs to
// the identifiers and reports that tidtool prints, so no sink may write there.
//
// Usage:
//   tid::log::init({.level = tid::log::Level::kDebug});
//   TID_LOG_DEBUG("Generated {} identifiers", count);
//
// The TID_LOG_* macros are no-ops until init() has run, so library code may
// log unconditionally.
// =============================================================================

#ifndef TID_COMMON_LOGGER_H
#define TID_COMMON_LOGGER_H

#include <optional>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace tid::log {

/// @brief Severity threshold, mapped one-to-one onto Quill levels.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Logger settings chosen by the embedding program.
struct Config {
    /// @brief Extra file sink, opened for append. Empty disables it.
    std::string logFile;

    /// @brief Records below this level are discarded.
    Level level = Level::kWarning;

    /// @brief Write to stderr. Forced on when no log file is given.
    bool enableConsole = true;

    std::string loggerName = "tid";
};

// =============================================================================
// Lifecycle
// =============================================================================

/// @brief Start the Quill backend and install the global logger.
/// @note A second call is ignored until shutdown().
void init(const Config& config);

/// @brief Global logger, nullptr before init() and after shutdown().
[[nodiscard]] quill::Logger* logger() noexcept;

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Block until queued records have reached the sinks.
void flush();

/// @brief Flush, stop the backend thread and uninstall the logger.
void shutdown();

// =============================================================================
// Level Names
// =============================================================================

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name ("debug", "WARN", ...), case-insensitive.
/// @return std::nullopt for an unknown name.
[[nodiscard]] std::optional<Level> levelFromString(std::string_view name) noexcept;

/// @brief Canonical lowercase name of a level.
[[nodiscard]] std::string_view levelToString(Level level) noexcept;

}  // namespace tid::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define TID_LOG_IMPL_(macro, fmt, ...)                                        \
    do {                                                                      \
        if (quill::Logger* tidLogger_ = tid::log::logger()) {                 \
            macro(tidLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);                \
        }                                                                     \
    } while (false)

/// @brief Log a trace message.
#define TID_LOG_TRACE(fmt, ...) TID_LOG_IMPL_(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a debug message.
#define TID_LOG_DEBUG(fmt, ...) TID_LOG_IMPL_(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an info message.
#define TID_LOG_INFO(fmt, ...) TID_LOG_IMPL_(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a warning message.
#define TID_LOG_WARNING(fmt, ...) TID_LOG_IMPL_(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log an error message.
#define TID_LOG_ERROR(fmt, ...) TID_LOG_IMPL_(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)

/// @brief Log a critical message.
#define TID_LOG_CRITICAL(fmt, ...) TID_LOG_IMPL_(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // TID_COMMON_LOGGER_H
