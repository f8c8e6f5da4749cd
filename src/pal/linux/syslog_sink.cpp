// RtmpFrame - RTMP message framing library
// Linux syslog sink implementation

#include "rtmpframe/pal/linux/syslog_sink.hpp"

#if defined(__linux__)

#include <syslog.h>

namespace rtmpframe {
namespace pal {
namespace linux_pal {

SyslogSink::SyslogSink() {
    openlog("rtmpframe", LOG_PID | LOG_NDELAY, LOG_USER);
}

SyslogSink::~SyslogSink() {
    closelog();
}

void SyslogSink::write(
    LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogContext& /*context*/
) {
    if (level == LogLevel::Off) {
        return;
    }
    syslog(toSyslogPriority(level), "[%s] %s", category.c_str(), message.c_str());
}

void SyslogSink::flush() {
    // syslog is unbuffered on our side
}

std::string SyslogSink::getName() const {
    return "syslog";
}

int SyslogSink::toSyslogPriority(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:
        case LogLevel::Debug:
            return LOG_DEBUG;
        case LogLevel::Info:
            return LOG_INFO;
        case LogLevel::Warning:
            return LOG_WARNING;
        case LogLevel::Error:
            return LOG_ERR;
        case LogLevel::Critical:
            return LOG_CRIT;
        case LogLevel::Off:
        default:
            return LOG_DEBUG;
    }
}

} // namespace linux_pal
} // namespace pal
} // namespace rtmpframe

#endif // defined(__linux__)
