// =============================================================================
// tid - Logger Module Implementation
// =============================================================================

#include "tid/common/logger.h"

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace tid::log {

namespace {

/// @brief One row of the level table.
struct LevelEntry {
    Level level;
    std::string_view name;
    quill::LogLevel quillLevel;
};

constexpr std::array<LevelEntry, 6> kLevels = {{
    {Level::kTrace, "trace", quill::LogLevel::TraceL1},
    {Level::kDebug, "debug", quill::LogLevel::Debug},
    {Level::kInfo, "info", quill::LogLevel::Info},
    {Level::kWarning, "warning", quill::LogLevel::Warning},
    {Level::kError, "error", quill::LogLevel::Error},
    {Level::kCritical, "critical", quill::LogLevel::Critical},
}};

/// @brief Accepted spellings besides the canonical names.
constexpr std::array<std::pair<std::string_view, Level>, 2> kLevelAliases = {{
    {"warn", Level::kWarning},
    {"fatal", Level::kCritical},
}};

[[nodiscard]] constexpr const LevelEntry& entryFor(Level level) noexcept {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry;
        }
    }
    return kLevels[static_cast<std::size_t>(Level::kInfo)];
}

[[nodiscard]] bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        const char c = (lhs[i] >= 'A' && lhs[i] <= 'Z') ? static_cast<char>(lhs[i] - 'A' + 'a')
                                                        : lhs[i];
        if (c != rhs[i]) {
            return false;
        }
    }
    return true;
}

/// @brief Console sink bound to stderr; stdout carries command output.
std::shared_ptr<quill::Sink> makeConsoleSink() {
    quill::ConsoleSinkConfig sinkConfig;
    sinkConfig.set_stream("stderr");
    return quill::Frontend::create_or_get_sink<quill::ConsoleSink>("tid-stderr", sinkConfig);
}

std::shared_ptr<quill::Sink> makeFileSink(const std::string& path) {
    quill::FileSinkConfig sinkConfig;
    sinkConfig.set_open_mode('a');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, sinkConfig,
                                                                quill::FileEventNotifier{});
}

// Guarded by gInitMutex for writes; read lock-free through logger().
std::mutex gInitMutex;
std::atomic<quill::Logger*> gLogger{nullptr};

}  // namespace

// =============================================================================
// Level Names
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    return entryFor(level).quillLevel;
}

std::optional<Level> levelFromString(std::string_view name) noexcept {
    for (const auto& entry : kLevels) {
        if (equalsIgnoreCase(name, entry.name)) {
            return entry.level;
        }
    }
    for (const auto& [alias, level] : kLevelAliases) {
        if (equalsIgnoreCase(name, alias)) {
            return level;
        }
    }
    return std::nullopt;
}

std::string_view levelToString(Level level) noexcept {
    return entryFor(level).name;
}

// =============================================================================
// Lifecycle
// =============================================================================

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(makeConsoleSink());
    }
    if (!config.logFile.empty()) {
        sinks.push_back(makeFileSink(config.logFile));
    }

    quill::Logger* created = quill::Frontend::create_or_get_logger(config.loggerName,
                                                                   std::move(sinks));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

bool isInitialized() noexcept {
    return logger() != nullptr;
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace tid::log
