// RtmpFrame - RTMP message framing library
// Console log sink writing one line per record to stderr

#ifndef RTMPFRAME_PAL_CONSOLE_LOG_SINK_HPP
#define RTMPFRAME_PAL_CONSOLE_LOG_SINK_HPP

#include "rtmpframe/pal/log_pal.hpp"

#include <cstdio>
#include <mutex>

namespace rtmpframe {
namespace pal {

/**
 * @brief Sink printing "[LEVEL] [category] message" lines.
 *
 * The stream defaults to stderr; tests may pass a tmpfile().
 */
class ConsoleLogSink : public ILogSink {
public:
    explicit ConsoleLogSink(std::FILE* stream = stderr);
    ~ConsoleLogSink() override = default;

    ConsoleLogSink(const ConsoleLogSink&) = delete;
    ConsoleLogSink& operator=(const ConsoleLogSink&) = delete;

    void write(
        LogLevel level,
        const std::string& message,
        const std::string& category,
        const LogContext& context
    ) override;

    void flush() override;

    std::string getName() const override;

private:
    std::FILE* stream_;
    std::mutex writeMutex_;
};

} // namespace pal
} // namespace rtmpframe

#endif // RTMPFRAME_PAL_CONSOLE_LOG_SINK_HPP
