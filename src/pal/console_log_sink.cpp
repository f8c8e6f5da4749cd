// RtmpFrame - RTMP message framing library
// Console log sink implementation

#include "rtmpframe/pal/console_log_sink.hpp"

namespace rtmpframe {
namespace pal {

ConsoleLogSink::ConsoleLogSink(std::FILE* stream)
    : stream_(stream != nullptr ? stream : stderr) {
}

void ConsoleLogSink::write(
    LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogContext& /*context*/
) {
    std::lock_guard<std::mutex> lock(writeMutex_);
    std::fprintf(stream_, "[%s] [%s] %s\n",
                 logLevelName(level), category.c_str(), message.c_str());
}

void ConsoleLogSink::flush() {
    std::lock_guard<std::mutex> lock(writeMutex_);
    std::fflush(stream_);
}

std::string ConsoleLogSink::getName() const {
    return "console";
}

} // namespace pal
} // namespace rtmpframe
