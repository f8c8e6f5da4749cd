// RtmpFrame - RTMP message framing library
// Tests for Buffer, BufferReader and BufferWriter
//
// Tests cover:
// - consume() dropping buffered bytes from the front
// - Big- and little-endian integer reads used by chunk headers
// - mark()/resetToMark() used to peek command names
// - readInto() appending payload fragments
// - Out-of-range reads throwing instead of reading past the end

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

#include "rtmpframe/core/buffer.hpp"

namespace rtmpframe {
namespace core {
namespace test {

// =============================================================================
// Buffer
// =============================================================================

TEST(BufferTest, ConsumeDropsLeadingBytes) {
    Buffer buffer{0x01, 0x02, 0x03, 0x04, 0x05};

    buffer.consume(2);

    ASSERT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer[0], 0x03);
    EXPECT_EQ(buffer[2], 0x05);
}

TEST(BufferTest, ConsumeMoreThanSizeEmptiesBuffer) {
    Buffer buffer{0x01, 0x02};

    buffer.consume(10);

    EXPECT_TRUE(buffer.empty());
}

TEST(BufferTest, ResizeKeepsPrefixAndZeroFillsGrowth) {
    Buffer buffer{0xAA};

    buffer.resize(3);

    ASSERT_EQ(buffer.size(), 3u);
    EXPECT_EQ(buffer[0], 0xAA);
    EXPECT_EQ(buffer[1], 0x00);
    EXPECT_EQ(buffer[2], 0x00);
}

TEST(BufferTest, AppendOtherBuffer) {
    Buffer first{0x01};
    Buffer second{0x02, 0x03};

    first.append(second);

    EXPECT_EQ(first.vector(), (std::vector<uint8_t>{0x01, 0x02, 0x03}));
}

// =============================================================================
// BufferReader
// =============================================================================

TEST(BufferReaderTest, ReadsBigEndianIntegers) {
    Buffer buffer{0x12, 0x34, 0x56, 0x78, 0x9A, 0xBC, 0xDE, 0xF0, 0x11};
    BufferReader reader(buffer);

    EXPECT_EQ(reader.readUint16BE(), 0x1234);
    EXPECT_EQ(reader.readUint24BE(), 0x56789Au);
    EXPECT_EQ(reader.readUint32BE(), 0xBCDEF011u);
    EXPECT_EQ(reader.remaining(), 0u);
}

TEST(BufferReaderTest, ReadsLittleEndianIntegers) {
    Buffer buffer{0x01, 0x02, 0x01, 0x00, 0x00, 0x00};
    BufferReader reader(buffer);

    EXPECT_EQ(reader.readUint16LE(), 0x0201);
    EXPECT_EQ(reader.readUint32LE(), 1u);
}

TEST(BufferReaderTest, MarkAndResetReturnToSavedPosition) {
    Buffer buffer{0x01, 0x02, 0x03, 0x04};
    BufferReader reader(buffer);

    reader.skip(1);
    reader.mark();
    EXPECT_EQ(reader.readUint8(), 0x02);
    EXPECT_EQ(reader.readUint8(), 0x03);

    reader.resetToMark();

    EXPECT_EQ(reader.position(), 1u);
    EXPECT_EQ(reader.peekUint8(), 0x02);
}

TEST(BufferReaderTest, ReadIntoAppendsToExistingBytes) {
    Buffer buffer{0x03, 0x04, 0x05};
    BufferReader reader(buffer);
    std::vector<uint8_t> out{0x01, 0x02};

    reader.readInto(out, 2);

    EXPECT_EQ(out, (std::vector<uint8_t>{0x01, 0x02, 0x03, 0x04}));
    EXPECT_EQ(reader.remaining(), 1u);
}

TEST(BufferReaderTest, CurrentPointsAtUnreadBytes) {
    Buffer buffer{0x0A, 0x0B, 0x0C};
    BufferReader reader(buffer);

    reader.skip(2);

    EXPECT_EQ(*reader.current(), 0x0C);
}

TEST(BufferReaderTest, ReadPastEndThrows) {
    Buffer buffer{0x01, 0x02};
    BufferReader reader(buffer);

    EXPECT_FALSE(reader.hasRemaining(3));
    EXPECT_THROW(reader.readUint24BE(), std::out_of_range);
    EXPECT_EQ(reader.position(), 0u);
}

TEST(BufferReaderTest, SeekPastEndThrows) {
    Buffer buffer{0x01};
    BufferReader reader(buffer);

    EXPECT_NO_THROW(reader.seek(1));
    EXPECT_THROW(reader.seek(2), std::out_of_range);
}

// =============================================================================
// BufferWriter
// =============================================================================

TEST(BufferWriterTest, WritesMixedEndianness) {
    Buffer buffer;
    BufferWriter writer(buffer);

    writer.writeUint24BE(0xFFFFFF);
    writer.writeUint32LE(0x01020304);
    writer.writeUint16LE(0x0100);

    EXPECT_EQ(buffer.vector(), (std::vector<uint8_t>{
        0xFF, 0xFF, 0xFF,
        0x04, 0x03, 0x02, 0x01,
        0x00, 0x01}));
    EXPECT_EQ(writer.size(), 9u);
}

TEST(BufferWriterTest, WrittenHeaderReadsBack) {
    Buffer buffer;
    BufferWriter writer(buffer);
    writer.writeUint8(0x03);
    writer.writeUint24BE(1000);
    writer.writeUint24BE(300);
    writer.writeUint8(20);
    writer.writeUint32LE(1);

    BufferReader reader(buffer);
    EXPECT_EQ(reader.readUint8(), 0x03);
    EXPECT_EQ(reader.readUint24BE(), 1000u);
    EXPECT_EQ(reader.readUint24BE(), 300u);
    EXPECT_EQ(reader.readUint8(), 20);
    EXPECT_EQ(reader.readUint32LE(), 1u);
}

} // namespace test
} // namespace core
} // namespace rtmpframe
