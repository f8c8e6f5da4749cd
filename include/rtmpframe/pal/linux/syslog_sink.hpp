// RtmpFrame - RTMP message framing library
// Linux syslog sink
//
// Routes records to syslog(3) with the "rtmpframe" ident.

#ifndef RTMPFRAME_PAL_LINUX_SYSLOG_SINK_HPP
#define RTMPFRAME_PAL_LINUX_SYSLOG_SINK_HPP

#include "rtmpframe/pal/log_pal.hpp"
#include "rtmpframe/pal/pal_types.hpp"

#if defined(__linux__)

namespace rtmpframe {
namespace pal {
namespace linux_pal {

/**
 * @brief ILogSink backed by syslog.
 *
 * Opens the log in the constructor and closes it in the destructor, so
 * at most one instance should exist per process. syslog itself is
 * thread-safe, no extra locking is done here.
 */
class SyslogSink : public ILogSink {
public:
    SyslogSink();
    ~SyslogSink() override;

    // Non-copyable, non-movable
    SyslogSink(const SyslogSink&) = delete;
    SyslogSink& operator=(const SyslogSink&) = delete;
    SyslogSink(SyslogSink&&) = delete;
    SyslogSink& operator=(SyslogSink&&) = delete;

    void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) override;

    void flush() override;

    std::string getName() const override;

    /**
     * @brief Map a PAL level onto a syslog priority.
     */
    static int toSyslogPriority(LogLevel level);
};

} // namespace linux_pal
} // namespace pal
} // namespace rtmpframe

#endif // defined(__linux__)
#endif // RTMPFRAME_PAL_LINUX_SYSLOG_SINK_HPP
