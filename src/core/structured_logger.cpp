// RtmpFrame - RTMP message framing library
// Structured Logging Component Implementation

#include "rtmpframe/core/structured_logger.hpp"
#include "rtmpframe/pal/console_log_sink.hpp"
#if defined(__linux__)
#include "rtmpframe/pal/linux/syslog_sink.hpp"
#endif

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <vector>

namespace rtmpframe {
namespace core {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

struct LevelName {
    pal::LogLevel level;
    const char* name;
};

constexpr LevelName LEVEL_NAMES[] = {
    {pal::LogLevel::Trace, "trace"},
    {pal::LogLevel::Debug, "debug"},
    {pal::LogLevel::Info, "info"},
    {pal::LogLevel::Warning, "warning"},
    {pal::LogLevel::Error, "error"},
    {pal::LogLevel::Critical, "critical"},
    {pal::LogLevel::Off, "off"},
};

// Present structured fields as (json key, text key, value) in a fixed order.
struct RenderedField {
    const char* jsonKey;
    const char* textKey;
    long long value;
};

std::vector<RenderedField> presentFields(const LogFields* fields) {
    std::vector<RenderedField> out;
    if (fields == nullptr) {
        return out;
    }
    if (fields->connectionId != 0) {
        out.push_back({"connection_id", "conn", static_cast<long long>(fields->connectionId)});
    }
    if (fields->chunkStreamId >= 0) {
        out.push_back({"cid", "cid", fields->chunkStreamId});
    }
    if (fields->messageType >= 0) {
        out.push_back({"message_type", "type", fields->messageType});
    }
    if (fields->errorCode != 0) {
        out.push_back({"error_code", "code", fields->errorCode});
    }
    return out;
}

} // namespace

std::string logLevelToString(pal::LogLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "info";
}

std::optional<pal::LogLevel> parseLogLevel(const std::string& str) {
    std::string lower(str.size(), '\0');
    std::transform(str.begin(), str.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "warn") {
        return pal::LogLevel::Warning;
    }
    for (const auto& entry : LEVEL_NAMES) {
        // Critical is emitted but not accepted as a configured threshold.
        if (entry.level != pal::LogLevel::Critical && lower == entry.name) {
            return entry.level;
        }
    }
    return std::nullopt;
}

// =============================================================================
// StructuredLogger Implementation
// =============================================================================

StructuredLogger::StructuredLogger() = default;

StructuredLogger::~StructuredLogger() {
    flush();
}

void StructuredLogger::log(
    pal::LogLevel level,
    const std::string& message,
    const std::string& category,
    const pal::LogContext& context)
{
    if (!isEnabled(level) || level == pal::LogLevel::Off) {
        return;
    }
    dispatch(level, formatMessage(level, message, category, nullptr), category, context);
}

void StructuredLogger::logWithFields(
    pal::LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogFields& fields)
{
    if (!isEnabled(level) || level == pal::LogLevel::Off) {
        return;
    }
    dispatch(level, formatMessage(level, message, category, &fields), category, pal::LogContext{});
}

void StructuredLogger::debug(const std::string& message, const std::string& category) {
    log(pal::LogLevel::Debug, message, category, pal::LogContext{});
}

void StructuredLogger::info(const std::string& message, const std::string& category) {
    log(pal::LogLevel::Info, message, category, pal::LogContext{});
}

void StructuredLogger::warning(const std::string& message, const std::string& category) {
    log(pal::LogLevel::Warning, message, category, pal::LogContext{});
}

void StructuredLogger::error(const std::string& message, const std::string& category) {
    log(pal::LogLevel::Error, message, category, pal::LogContext{});
}

void StructuredLogger::setMinLevel(pal::LogLevel level) {
    minLevel_.store(level);
}

pal::LogLevel StructuredLogger::getMinLevel() const {
    return minLevel_.load();
}

void StructuredLogger::setJsonFormat(bool enabled) {
    jsonFormat_.store(enabled);
}

bool StructuredLogger::isJsonFormat() const {
    return jsonFormat_.load();
}

void StructuredLogger::addSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void StructuredLogger::removeSink(std::shared_ptr<pal::ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(
        std::remove(sinks_.begin(), sinks_.end(), sink),
        sinks_.end()
    );
}

void StructuredLogger::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void StructuredLogger::dispatch(
    pal::LogLevel level,
    const std::string& formatted,
    const std::string& category,
    const pal::LogContext& context)
{
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->write(level, formatted, category, context);
    }
}

std::string StructuredLogger::formatMessage(
    pal::LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogFields* fields) const
{
    std::ostringstream oss;

    if (jsonFormat_.load()) {
        oss << "{\"timestamp\":\"" << getTimestamp()
            << "\",\"level\":\"" << logLevelToString(level)
            << "\",\"category\":\"" << escapeJson(category)
            << "\",\"message\":\"" << escapeJson(message) << "\"";
        for (const auto& field : presentFields(fields)) {
            oss << ",\"" << field.jsonKey << "\":" << field.value;
        }
        oss << "}";
    } else {
        oss << "[" << getTimestamp() << "] [" << logLevelToString(level) << "] ["
            << category << "] " << message;
        for (const auto& field : presentFields(fields)) {
            oss << " " << field.textKey << "=" << field.value;
        }
    }
    return oss.str();
}

std::string StructuredLogger::getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    gmtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();
    oss << "Z";
    return oss.str();
}

std::string StructuredLogger::escapeJson(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (char c : str) {
        const char* escape = nullptr;
        switch (c) {
            case '"': escape = "\\\""; break;
            case '\\': escape = "\\\\"; break;
            case '\n': escape = "\\n"; break;
            case '\r': escape = "\\r"; break;
            case '\t': escape = "\\t"; break;
            default: break;
        }
        if (escape != nullptr) {
            out += escape;
        } else if (static_cast<unsigned char>(c) < 0x20) {
            char code[8];
            std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned int>(c));
            out += code;
        } else {
            out += c;
        }
    }
    return out;
}

// =============================================================================
// Factory
// =============================================================================

std::shared_ptr<StructuredLogger> createLogger(const LoggingConfig& config) {
    auto logger = std::make_shared<StructuredLogger>();
    logger->setMinLevel(config.level);
    logger->setJsonFormat(config.json);

    if (config.console) {
        logger->addSink(std::make_shared<pal::ConsoleLogSink>());
    }
#if defined(__linux__)
    if (config.syslog) {
        logger->addSink(std::make_shared<pal::linux_pal::SyslogSink>());
    }
#endif
    return logger;
}

} // namespace core
} // namespace rtmpframe
