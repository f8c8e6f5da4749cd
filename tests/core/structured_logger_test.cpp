// RtmpFrame - RTMP message framing library
// Tests for Structured Logging Component
//
// Tests cover:
// - Level filtering, including the null-logger macro path
// - Plain-text and JSON line formats
// - Session fields (cid, message type, error code) on structured records
// - Level name parsing used by configuration
// - Console sink output to a stream

#include <gtest/gtest.h>

#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "rtmpframe/core/error_codes.hpp"
#include "rtmpframe/core/structured_logger.hpp"
#include "rtmpframe/pal/console_log_sink.hpp"
#include "rtmpframe/pal/log_pal.hpp"

namespace rtmpframe {
namespace core {
namespace test {

// =============================================================================
// Test Sink for Capturing Log Output
// =============================================================================

class CaptureSink : public pal::ILogSink {
public:
    struct Entry {
        pal::LogLevel level;
        std::string message;
        std::string category;
    };

    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogContext&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(Entry{level, message, category});
    }

    void flush() override {
        flushCount_++;
    }

    std::string getName() const override {
        return "CaptureSink";
    }

    std::vector<Entry> entries() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

    int flushCount() const { return flushCount_; }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    int flushCount_ = 0;
};

class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<CaptureSink>();
        logger_ = std::make_shared<StructuredLogger>();
        logger_->addSink(sink_);
    }

    std::shared_ptr<StructuredLogger> logger_;
    std::shared_ptr<CaptureSink> sink_;
};

// =============================================================================
// Filtering
// =============================================================================

TEST_F(StructuredLoggerTest, DefaultLevelIsInfo) {
    EXPECT_EQ(logger_->getMinLevel(), pal::LogLevel::Info);

    logger_->debug("dropped", "Chunk");
    logger_->info("kept", "Chunk");

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_NE(entries[0].message.find("kept"), std::string::npos);
}

TEST_F(StructuredLoggerTest, MacroRespectsMinLevel) {
    logger_->setMinLevel(pal::LogLevel::Warning);

    RTMPFRAME_LOG_INFO(logger_, "Protocol", "info");
    RTMPFRAME_LOG_WARNING(logger_, "Protocol", "warning");
    RTMPFRAME_LOG_ERROR(logger_, "Protocol", "error");

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, pal::LogLevel::Warning);
    EXPECT_EQ(entries[1].level, pal::LogLevel::Error);
    EXPECT_EQ(entries[1].category, "Protocol");
}

TEST_F(StructuredLoggerTest, MacroWithNullLoggerDoesNotEvaluateMessage) {
    std::shared_ptr<pal::ILogPAL> none;
    int evaluations = 0;
    auto build = [&evaluations]() {
        evaluations++;
        return std::string("never");
    };

    RTMPFRAME_LOG_ERROR(none, "Chunk", build());

    EXPECT_EQ(evaluations, 0);
}

TEST_F(StructuredLoggerTest, OffLevelSilencesEverything) {
    logger_->setMinLevel(pal::LogLevel::Off);

    logger_->error("nothing", "Chunk");

    EXPECT_TRUE(sink_->entries().empty());
}

TEST_F(StructuredLoggerTest, RemovedSinkReceivesNothing) {
    logger_->removeSink(sink_);

    logger_->error("gone", "Chunk");

    EXPECT_TRUE(sink_->entries().empty());
}

TEST_F(StructuredLoggerTest, FlushReachesSinks) {
    logger_->flush();

    EXPECT_EQ(sink_->flushCount(), 1);
}

// =============================================================================
// Formatting
// =============================================================================

TEST_F(StructuredLoggerTest, PlainTextFormat) {
    logger_->info("handshake complete", "Handshake");

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 1u);
    const std::string& line = entries[0].message;
    EXPECT_EQ(line.front(), '[');
    EXPECT_NE(line.find("Z] [info] [Handshake] handshake complete"), std::string::npos);
}

TEST_F(StructuredLoggerTest, JsonFormatEscapesMessage) {
    logger_->setJsonFormat(true);

    logger_->warning("command \"connect\"\n", "Codec");

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 1u);
    const std::string& line = entries[0].message;
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find("\"level\":\"warning\""), std::string::npos);
    EXPECT_NE(line.find("\"category\":\"Codec\""), std::string::npos);
    EXPECT_NE(line.find("\"message\":\"command \\\"connect\\\"\\n\""), std::string::npos);
}

TEST_F(StructuredLoggerTest, StructuredFieldsInJson) {
    logger_->setJsonFormat(true);
    LogFields fields;
    fields.connectionId = 9;
    fields.chunkStreamId = 3;
    fields.messageType = 20;
    fields.errorCode = static_cast<uint32_t>(ErrorCode::ProtocolViolation);

    logger_->logWithFields(pal::LogLevel::Error, "session ended", "Protocol", fields);

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 1u);
    const std::string& line = entries[0].message;
    EXPECT_NE(line.find("\"connection_id\":9"), std::string::npos);
    EXPECT_NE(line.find("\"cid\":3"), std::string::npos);
    EXPECT_NE(line.find("\"message_type\":20"), std::string::npos);
    EXPECT_NE(line.find("\"error_code\":300"), std::string::npos);
}

TEST_F(StructuredLoggerTest, UnsetFieldsAreOmitted) {
    LogFields fields;
    fields.chunkStreamId = 2;

    logger_->logWithFields(pal::LogLevel::Warning, "odd chunk", "Chunk", fields);

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 1u);
    const std::string& line = entries[0].message;
    EXPECT_NE(line.find(" cid=2"), std::string::npos);
    EXPECT_EQ(line.find("conn="), std::string::npos);
    EXPECT_EQ(line.find("type="), std::string::npos);
}

// =============================================================================
// Level Names
// =============================================================================

TEST(LogLevelNameTest, ParsesCaseInsensitively) {
    EXPECT_TRUE(parseLogLevel("DEBUG") == pal::LogLevel::Debug);
    EXPECT_TRUE(parseLogLevel("warn") == pal::LogLevel::Warning);
    EXPECT_TRUE(parseLogLevel("Trace") == pal::LogLevel::Trace);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(LogLevelNameTest, NamesRoundTrip) {
    for (auto level : {pal::LogLevel::Trace, pal::LogLevel::Debug, pal::LogLevel::Info,
                       pal::LogLevel::Warning, pal::LogLevel::Error}) {
        EXPECT_TRUE(parseLogLevel(logLevelToString(level)) == level);
    }
}

// =============================================================================
// Factory and Console Sink
// =============================================================================

TEST(CreateLoggerTest, AppliesLevelAndFormat) {
    LoggingConfig config;
    config.level = pal::LogLevel::Debug;
    config.json = true;
    config.console = false;

    auto logger = createLogger(config);

    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->getMinLevel(), pal::LogLevel::Debug);
    EXPECT_TRUE(logger->isJsonFormat());
}

TEST(ConsoleLogSinkTest, WritesOneLinePerRecord) {
    std::FILE* stream = std::tmpfile();
    ASSERT_NE(stream, nullptr);

    {
        pal::ConsoleLogSink sink(stream);
        sink.write(pal::LogLevel::Error, "chunk size 0 rejected", "Protocol", pal::LogContext{});
        sink.flush();
    }

    std::rewind(stream);
    char line[256] = {};
    ASSERT_NE(std::fgets(line, sizeof(line), stream), nullptr);
    std::string text(line);
    std::fclose(stream);

    EXPECT_NE(text.find("Protocol"), std::string::npos);
    EXPECT_NE(text.find("chunk size 0 rejected"), std::string::npos);
    EXPECT_EQ(text.back(), '\n');
}

} // namespace test
} // namespace core
} // namespace rtmpframe
