// RtmpFrame - RTMP message framing library
// Platform Abstraction Layer - Logging Interface
//
// The framing layer never writes to a log destination directly. Components
// receive an ILogPAL (usually core::StructuredLogger) and the logger routes
// records to its sinks: stderr, syslog on Linux, or a test recorder.

#ifndef RTMPFRAME_PAL_LOG_PAL_HPP
#define RTMPFRAME_PAL_LOG_PAL_HPP

#include "rtmpframe/pal/pal_types.hpp"

#include <string>
#include <memory>

namespace rtmpframe {
namespace pal {

/**
 * @brief Interface for log output sinks.
 *
 * Sinks receive formatted log messages and handle output to
 * their respective destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Write a log message.
     *
     * @param level Log level of the message
     * @param message Formatted log message
     * @param category Log category (e.g., "Chunk", "Handshake")
     * @param context Source context (file, line, function)
     */
    virtual void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    /**
     * @brief Flush any buffered output.
     */
    virtual void flush() = 0;

    /**
     * @brief Get the sink name for debugging.
     */
    virtual std::string getName() const = 0;
};

/**
 * @brief Logging facade handed to protocol components.
 *
 * Messages below the minimum level are dropped before formatting.
 * Every registered sink receives each qualifying message.
 *
 * A single logger may be shared by many connections; implementations
 * must accept concurrent log() calls.
 */
class ILogPAL {
public:
    virtual ~ILogPAL() = default;

    /**
     * @brief Log a message.
     *
     * @param level Severity level of the message
     * @param message The log message
     * @param category Category for filtering/routing
     * @param context Source location context
     */
    virtual void log(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) = 0;

    virtual void setMinLevel(LogLevel level) = 0;

    virtual LogLevel getMinLevel() const = 0;

    /**
     * @brief Cheap check used to skip building expensive messages.
     */
    bool isEnabled(LogLevel level) const {
        return static_cast<uint32_t>(level) >= static_cast<uint32_t>(getMinLevel());
    }

    virtual void flush() = 0;

    /**
     * @brief Add a log sink (ownership is shared).
     */
    virtual void addSink(std::shared_ptr<ILogSink> sink) = 0;

    /**
     * @brief Remove a previously added sink. Unknown sinks are ignored.
     */
    virtual void removeSink(std::shared_ptr<ILogSink> sink) = 0;
};

// =============================================================================
// Convenience Macros for Logging
// =============================================================================

/**
 * Shortcuts that capture the source location. The logger argument may be a
 * raw or shared pointer; a null logger turns the call into a no-op and the
 * message expression is not evaluated.
 *
 * Usage:
 *   RTMPFRAME_LOG_DEBUG(logger_, "Chunk", "cid=" + std::to_string(cid));
 */

#define RTMPFRAME_LOG_CONTEXT() \
    ::rtmpframe::pal::LogContext{__FILE__, __LINE__, __FUNCTION__}

#define RTMPFRAME_LOG(logger, level, category, message) \
    do { \
        if ((logger) != nullptr && (logger)->isEnabled(level)) { \
            (logger)->log((level), (message), (category), RTMPFRAME_LOG_CONTEXT()); \
        } \
    } while (0)

#define RTMPFRAME_LOG_TRACE(logger, category, message) \
    RTMPFRAME_LOG(logger, ::rtmpframe::pal::LogLevel::Trace, category, message)

#define RTMPFRAME_LOG_DEBUG(logger, category, message) \
    RTMPFRAME_LOG(logger, ::rtmpframe::pal::LogLevel::Debug, category, message)

#define RTMPFRAME_LOG_INFO(logger, category, message) \
    RTMPFRAME_LOG(logger, ::rtmpframe::pal::LogLevel::Info, category, message)

#define RTMPFRAME_LOG_WARNING(logger, category, message) \
    RTMPFRAME_LOG(logger, ::rtmpframe::pal::LogLevel::Warning, category, message)

#define RTMPFRAME_LOG_ERROR(logger, category, message) \
    RTMPFRAME_LOG(logger, ::rtmpframe::pal::LogLevel::Error, category, message)

} // namespace pal
} // namespace rtmpframe

#endif // RTMPFRAME_PAL_LOG_PAL_HPP
