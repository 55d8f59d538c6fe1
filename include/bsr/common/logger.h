// =============================================================================
// bsr - Logging
// =============================================================================
// Diagnostics for patch parsing, routed through a Quill logger owned by bsr.
//
// Parsing is silent unless the host application opts in. Until init() runs,
// logger() returns nullptr and the BSR_LOG_* macros expand to a null check.
//
// Usage:
//   bsr::log::Config config;
//   config.logFile = "reader.log";
//   config.level = bsr::log::Level::kDebug;
//   bsr::log::init(config);
//   BSR_LOG_DEBUG("control stream holds {} records", count);
//   bsr::log::shutdown();
// =============================================================================

#ifndef BSR_COMMON_LOGGER_H
#define BSR_COMMON_LOGGER_H

#include <string>

#include <quill/LogMacros.h>
#include <quill/Logger.h>

namespace bsr::log {

/// @brief Minimum severity forwarded to the sinks.
enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Sinks and threshold for the bsr logger.
struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    /// @brief Minimum severity to output.
    Level level = Level::kInfo;

    /// @brief Mirror messages to stdout.
    bool enableConsole = true;

    /// @brief Name registered with the Quill frontend.
    std::string loggerName = "bsr";
};

/// @brief Create the bsr logger and start the Quill backend.
/// @note A second call before shutdown() leaves the first configuration in place.
void init(const Config& config);

/// @brief The bsr logger, or nullptr when logging is off.
[[nodiscard]] quill::Logger* logger() noexcept;

/// @brief Block until queued messages reach the sinks.
void flush();

/// @brief Flush and stop the backend thread. Logging is off afterwards.
void shutdown();

}  // namespace bsr::log

// =============================================================================
// Logging Macros
// =============================================================================

#define BSR_LOG_IMPL(QUILL_MACRO, fmt, ...)                              \
    do {                                                                 \
        if (quill::Logger* bsrLogger_ = bsr::log::logger()) {            \
            QUILL_MACRO(bsrLogger_, fmt __VA_OPT__(, ) __VA_ARGS__);     \
        }                                                                \
    } while (0)

#define BSR_LOG_TRACE(fmt, ...) BSR_LOG_IMPL(LOG_TRACE_L1, fmt __VA_OPT__(, ) __VA_ARGS__)
#define BSR_LOG_DEBUG(fmt, ...) BSR_LOG_IMPL(LOG_DEBUG, fmt __VA_OPT__(, ) __VA_ARGS__)
#define BSR_LOG_INFO(fmt, ...) BSR_LOG_IMPL(LOG_INFO, fmt __VA_OPT__(, ) __VA_ARGS__)
#define BSR_LOG_WARNING(fmt, ...) BSR_LOG_IMPL(LOG_WARNING, fmt __VA_OPT__(, ) __VA_ARGS__)
#define BSR_LOG_ERROR(fmt, ...) BSR_LOG_IMPL(LOG_ERROR, fmt __VA_OPT__(, ) __VA_ARGS__)
#define BSR_LOG_CRITICAL(fmt, ...) BSR_LOG_IMPL(LOG_CRITICAL, fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // BSR_COMMON_LOGGER_H
