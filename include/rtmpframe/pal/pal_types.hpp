// RtmpFrame - RTMP message framing library
// Platform Abstraction Layer - Common Types
//
// Types shared by the logging interfaces and their platform sinks.

#ifndef RTMPFRAME_PAL_PAL_TYPES_HPP
#define RTMPFRAME_PAL_PAL_TYPES_HPP

#include <cstdint>
#include <string>

namespace rtmpframe {
namespace pal {

/**
 * @brief Log levels for the logging PAL.
 *
 * Levels are ordered from most verbose (Trace) to least verbose (Critical).
 */
enum class LogLevel : uint32_t {
    Trace = 0,      ///< Per-chunk tracing
    Debug = 1,      ///< Per-message and fallback decisions
    Info = 2,       ///< Session milestones (handshake done, chunk size change)
    Warning = 3,    ///< Recoverable oddities from the peer
    Error = 4,      ///< Conditions that end a session
    Critical = 5,   ///< Conditions requiring immediate attention
    Off = 6         ///< Disable all logging
};

/**
 * @brief Upper-case level name used by text sinks.
 */
inline const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/**
 * @brief Source location attached to a log record.
 */
struct LogContext {
    const char* file = nullptr;     ///< Source file name
    int line = 0;                   ///< Source line number
    const char* function = nullptr; ///< Function name
};

} // namespace pal
} // namespace rtmpframe

#endif // RTMPFRAME_PAL_PAL_TYPES_HPP
