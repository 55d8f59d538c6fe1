// =============================================================================
// bsr - Logging Implementation
// =============================================================================

#include "bsr/common/logger.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace bsr::log {

namespace {

/// @brief Set by init(), cleared by shutdown(). Read on every BSR_LOG_* call.
std::atomic<quill::Logger*> gLogger{nullptr};

/// @brief Serializes init() against shutdown().
std::mutex gLifecycleMutex;

quill::LogLevel quillLevel(Level level) noexcept {
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

std::vector<std::shared_ptr<quill::Sink>> makeSinks(const Config& config) {
    std::vector<std::shared_ptr<quill::Sink>> sinks;

    if (!config.logFile.empty()) {
        quill::FileSinkConfig fileConfig;
        fileConfig.set_open_mode('w');
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::FileSink>(
            config.logFile, fileConfig, quill::FileEventNotifier{}));
    }

    // Quill rejects a logger without sinks, so stdout is the fallback
    if (config.enableConsole || sinks.empty()) {
        sinks.push_back(quill::Frontend::create_or_get_sink<quill::ConsoleSink>("bsr_console"));
    }
    return sinks;
}

}  // namespace

void init(const Config& config) {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    if (gLogger.load(std::memory_order_acquire) != nullptr) {
        return;
    }

    quill::Backend::start(quill::BackendOptions{});

    quill::Logger* created =
        quill::Frontend::create_or_get_logger(config.loggerName, makeSinks(config));
    created->set_log_level(quillLevel(config.level));
    gLogger.store(created, std::memory_order_release);
}

quill::Logger* logger() noexcept {
    return gLogger.load(std::memory_order_acquire);
}

void flush() {
    if (quill::Logger* current = logger()) {
        current->flush_log();
    }
}

void shutdown() {
    std::lock_guard<std::mutex> lock(gLifecycleMutex);
    quill::Logger* current = gLogger.exchange(nullptr, std::memory_order_acq_rel);
    if (current == nullptr) {
        return;
    }
    current->flush_log();
    quill::Backend::stop();
}

}  // namespace bsr::log
