// =============================================================================
// sgff - Logger Module Implementation
// =============================================================================

#include "sgff/common/logger.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <vector>

namespace sgff::log {

namespace {

constexpr const char* kLevelVariable = "SGFF_LOG_LEVEL";
constexpr const char* kFileVariable = "SGFF_LOG_FILE";

std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Guards init() and shutdown().
std::mutex gInitMutex;

struct LevelName {
    Level level;
    std::string_view name;
};

// Canonical names first; aliases after them.
constexpr std::array<LevelName, 8> kLevelNames{{
    {Level::kTrace, "trace"},
    {Level::kDebug, "debug"},
    {Level::kInfo, "info"},
    {Level::kWarning, "warning"},
    {Level::kError, "error"},
    {Level::kCritical, "critical"},
    {Level::kWarning, "warn"},
    {Level::kCritical, "fatal"},
}};

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole || config.logFile.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("sgff_console"));
    }
    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('a');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }
    return sinks;
}

}  // namespace

// =============================================================================
// Levels
// =============================================================================

quill::LogLevel toQuillLevel(Level level) noexcept {
    switch (level) {
        case Level::kTrace:
            return quill::LogLevel::TraceL1;
        case Level::kDebug:
            return quill::LogLevel::Debug;
        case Level::kInfo:
            return quill::LogLevel::Info;
        case Level::kWarning:
            return quill::LogLevel::Warning;
        case Level::kError:
            return quill::LogLevel::Error;
        case Level::kCritical:
            return quill::LogLevel::Critical;
    }
    return quill::LogLevel::Info;
}

Level levelFromString(std::string_view levelStr) noexcept {
    for (const auto& entry : kLevelNames) {
        if (equalsIgnoreCase(entry.name, levelStr)) {
            return entry.level;
        }
    }
    return Level::kInfo;
}

std::string_view levelToString(Level level) noexcept {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
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

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    created->set_log_level(toQuillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

void init(std::string_view logFile, Level level) {
    Config config;
    config.logFile = std::string(logFile);
    config.level = level;
    init(config);
}

bool initFromEnvironment() {
    const char* levelValue = std::getenv(kLevelVariable);
    const char* fileValue = std::getenv(kFileVariable);
    if (levelValue == nullptr && fileValue == nullptr) {
        return false;
    }

    Config config;
    if (levelValue != nullptr) {
        config.level = levelFromString(levelValue);
    }
    if (fileValue != nullptr) {
        config.logFile = fileValue;
        config.enableConsole = false;
    }
    init(config);
    return true;
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
    if (quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel)) {
        current->flush_log();
        quill::Backend::stop();
    }
}

}  // namespace sgff::log
