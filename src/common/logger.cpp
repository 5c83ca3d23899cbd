// =============================================================================
// idxz - Logger Module Implementation
// =============================================================================

#include "idxz/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace idxz::log {

namespace {

std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Serializes logger installation and shutdown.
std::mutex gInitMutex;

std::shared_ptr<quill::Sink> consoleSink() {
    return quill::Frontend::create_or_get_sink<quill::ConsoleSink>("idxz_console");
}

std::shared_ptr<quill::Sink> fileSink(const std::string& path) {
    quill::FileSinkConfig fileConfig;
    fileConfig.set_open_mode('w');
    return quill::Frontend::create_or_get_sink<quill::FileSink>(path, fileConfig,
                                                               quill::FileEventNotifier{});
}

void install(const Config& config) {
    quill::Backend::start(quill::BackendOptions{});

    std::vector<std::shared_ptr<quill::Sink>> sinks;
    if (config.enableConsole || config.logFile.empty()) {
        // A logger without a file sink always keeps the console
        sinks.push_back(consoleSink());
    }
    if (!config.logFile.empty()) {
        sinks.push_back(fileSink(config.logFile));
    }

    quill::Logger* loggerPtr =
        quill::Frontend::create_or_get_logger(config.loggerName, std::move(sinks));
    loggerPtr->set_log_level(toQuillLevel(config.level));
    gLogger.store(loggerPtr, std::memory_order_release);
}

}  // namespace

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

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gInitMutex);
    install(config);
}

quill::Logger* logger() {
    quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr != nullptr) {
        return loggerPtr;
    }

    std::lock_guard<std::mutex> lock(gInitMutex);
    loggerPtr = gLogger.load(std::memory_order_acquire);
    if (loggerPtr == nullptr) {
        install(Config{});
        loggerPtr = gLogger.load(std::memory_order_acquire);
    }
    return loggerPtr;
}

void flush() {
    if (quill::Logger* loggerPtr = gLogger.load(std::memory_order_acquire)) {
        loggerPtr->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gInitMutex);
    flush();
    if (gLogger.exchange(nullptr, std::memory_order_acq_rel) != nullptr) {
        quill::Backend::stop();
    }
}

}  // namespace idxz::log
