// RtmpFrame - RTMP message framing library
// Tests for Packet Codec and typed packets
//
// Tests cover:
// - Control message decoding (WindowAckSize, SetChunkSize, Ack, Abort)
// - connect command decoding from literal AMF0 bytes, AMF3 command prefix
// - Unrecognized message types and command names decode to nullptr
// - Malformed recognized messages fail with CodecError
// - Packet encoding into messages on the preferred cid

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "rtmpframe/core/buffer.hpp"
#include "rtmpframe/protocol/amf0_codec.hpp"
#include "rtmpframe/protocol/packet_codec.hpp"
#include "rtmpframe/protocol/packets.hpp"

namespace rtmpframe {
namespace protocol {
namespace test {

using Bytes = std::vector<uint8_t>;

namespace {

MessageHeader headerOf(uint8_t type, size_t length) {
    MessageHeader header;
    header.messageType = type;
    header.payloadLength = static_cast<uint32_t>(length);
    return header;
}

/**
 * @brief connect with app "live" and tcUrl "rtmp://localhost/live".
 */
Bytes connectPayload() {
    core::Buffer buffer;
    core::BufferWriter writer(buffer);
    Amf0Codec::writeString(writer, "connect");
    Amf0Codec::writeNumber(writer, 1.0);
    Amf0Codec::writeObject(writer, {
        {"app", AMFValue::makeString("live")},
        {"tcUrl", AMFValue::makeString("rtmp://localhost/live")},
        {"objectEncoding", AMFValue::makeNumber(0)},
    });
    return buffer.vector();
}

} // namespace

class PacketCodecTest : public ::testing::Test {
protected:
    core::Result<std::unique_ptr<Packet>, core::Error> decode(uint8_t type, const Bytes& payload) {
        return codec_.decode(headerOf(type, payload.size()), payload);
    }

    PacketCodec codec_;
};

// =============================================================================
// Control Messages
// =============================================================================

TEST_F(PacketCodecTest, DecodesWindowAckSize) {
    auto result = decode(message_type::WINDOW_ACK_SIZE, {0x00, 0x26, 0x25, 0xA0});

    ASSERT_TRUE(result.isSuccess());
    auto* packet = dynamic_cast<SetWindowAckSizePacket*>(result.value().get());
    ASSERT_NE(packet, nullptr);
    EXPECT_EQ(packet->getAckWindowSize(), 2500000u);
}

TEST_F(PacketCodecTest, SetChunkSizeMasksReservedBit) {
    auto result = decode(message_type::SET_CHUNK_SIZE, {0x80, 0x00, 0x10, 0x00});

    ASSERT_TRUE(result.isSuccess());
    auto* packet = dynamic_cast<SetChunkSizePacket*>(result.value().get());
    ASSERT_NE(packet, nullptr);
    EXPECT_EQ(packet->getChunkSize(), 4096u);
}

TEST_F(PacketCodecTest, DecodesAcknowledgementAndAbort) {
    auto ack = decode(message_type::ACKNOWLEDGEMENT, {0x00, 0x00, 0x10, 0x00});
    auto abort = decode(message_type::ABORT, {0x00, 0x00, 0x00, 0x06});

    ASSERT_TRUE(ack.isSuccess());
    ASSERT_TRUE(abort.isSuccess());
    auto* ackPacket = dynamic_cast<AcknowledgementPacket*>(ack.value().get());
    auto* abortPacket = dynamic_cast<AbortMessagePacket*>(abort.value().get());
    ASSERT_NE(ackPacket, nullptr);
    ASSERT_NE(abortPacket, nullptr);
    EXPECT_EQ(ackPacket->getSequenceNumber(), 4096u);
    EXPECT_EQ(abortPacket->getChunkStreamId(), 6u);
}

TEST_F(PacketCodecTest, ShortControlPayloadIsCodecError) {
    auto result = decode(message_type::WINDOW_ACK_SIZE, {0x00, 0x26});

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::CodecError);
}

TEST_F(PacketCodecTest, UnrecognizedTypesDecodeToNullptr) {
    for (uint8_t type : {message_type::USER_CONTROL, message_type::SET_PEER_BANDWIDTH,
                         message_type::AUDIO, message_type::VIDEO}) {
        auto result = decode(type, {0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
        ASSERT_TRUE(result.isSuccess()) << "type " << static_cast<int>(type);
        EXPECT_EQ(result.value().get(), nullptr) << "type " << static_cast<int>(type);
    }
}

// =============================================================================
// Commands
// =============================================================================

TEST_F(PacketCodecTest, DecodesConnect) {
    auto result = decode(message_type::AMF0_COMMAND, connectPayload());

    ASSERT_TRUE(result.isSuccess()) << result.error().toString();
    auto* connect = dynamic_cast<ConnectAppPacket*>(result.value().get());
    ASSERT_NE(connect, nullptr);
    EXPECT_EQ(connect->getCommandName(), "connect");
    EXPECT_DOUBLE_EQ(connect->getTransactionId(), 1.0);
    EXPECT_EQ(connect->getProperty("app"), "live");
    EXPECT_EQ(connect->getProperty("tcUrl"), "rtmp://localhost/live");
    EXPECT_EQ(connect->getProperty("objectEncoding"), "");
    EXPECT_FALSE(connect->getArguments().has_value());
}

TEST_F(PacketCodecTest, ConnectKeepsTrailingArguments) {
    Bytes payload = connectPayload();
    core::Buffer extra;
    core::BufferWriter writer(extra);
    Amf0Codec::writeObject(writer, {{"user", AMFValue::makeString("alice")}});
    payload.insert(payload.end(), extra.vector().begin(), extra.vector().end());

    auto result = decode(message_type::AMF0_COMMAND, payload);

    ASSERT_TRUE(result.isSuccess());
    auto* connect = dynamic_cast<ConnectAppPacket*>(result.value().get());
    ASSERT_NE(connect, nullptr);
    ASSERT_TRUE(connect->getArguments().has_value());
    EXPECT_EQ(connect->getArguments()->at("user").asString(), "alice");
}

TEST_F(PacketCodecTest, Amf3CommandSkipsLeadingByte) {
    Bytes payload = connectPayload();
    payload.insert(payload.begin(), 0x00);

    auto result = decode(message_type::AMF3_COMMAND, payload);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_NE(dynamic_cast<ConnectAppPacket*>(result.value().get()), nullptr);
}

TEST_F(PacketCodecTest, UnrecognizedCommandDecodesToNullptr) {
    core::Buffer buffer;
    core::BufferWriter writer(buffer);
    Amf0Codec::writeString(writer, "createStream");
    Amf0Codec::writeNumber(writer, 2.0);
    Amf0Codec::writeNull(writer);

    auto result = decode(message_type::AMF0_COMMAND, buffer.vector());

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value().get(), nullptr);
}

TEST_F(PacketCodecTest, CommandWithoutNameIsCodecError) {
    auto result = decode(message_type::AMF0_COMMAND, {0x00, 0x3F, 0xF0});

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::CodecError);
}

TEST_F(PacketCodecTest, ConnectWithWrongTransactionIdIsCodecError) {
    core::Buffer buffer;
    core::BufferWriter writer(buffer);
    Amf0Codec::writeString(writer, "connect");
    Amf0Codec::writeNumber(writer, 2.0);
    Amf0Codec::writeObject(writer, {});

    auto result = decode(message_type::AMF0_COMMAND, buffer.vector());

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::CodecError);
}

TEST_F(PacketCodecTest, ConnectPacketRejectsOtherCommandName) {
    core::Buffer buffer;
    core::BufferWriter writer(buffer);
    Amf0Codec::writeString(writer, "connekt");
    Amf0Codec::writeNumber(writer, 1.0);
    Amf0Codec::writeObject(writer, {});
    core::BufferReader reader(buffer);

    ConnectAppPacket packet;
    auto result = packet.decode(reader);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::CodecError);
}

TEST_F(PacketCodecTest, ConnectWithUnrepresentableDateArgumentIsCodecError) {
    Bytes payload = connectPayload();
    core::Buffer extra;
    core::BufferWriter writer(extra);
    Amf0Codec::writeNumber(writer, 1e300);
    Bytes date = extra.vector();
    date[0] = amf0::DATE_MARKER;
    date.insert(date.end(), {0x00, 0x00});
    payload.insert(payload.end(), date.begin(), date.end());

    auto result = decode(message_type::AMF0_COMMAND, payload);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::CodecError);
}

TEST_F(PacketCodecTest, TruncatedConnectIsCodecError) {
    Bytes payload = connectPayload();
    payload.resize(payload.size() - 3);

    auto result = decode(message_type::AMF0_COMMAND, payload);

    ASSERT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, core::ErrorCode::CodecError);
}

// =============================================================================
// Encoding
// =============================================================================

TEST_F(PacketCodecTest, EncodesControlPacketOnProtocolControlCid) {
    RtmpMessage message = PacketCodec::encode(SetWindowAckSizePacket(2500000), 0, 0);

    EXPECT_EQ(message.preferredCid, cid::PROTOCOL_CONTROL);
    EXPECT_EQ(message.header.messageType, message_type::WINDOW_ACK_SIZE);
    EXPECT_EQ(message.header.payloadLength, 4u);
    EXPECT_EQ(message.payload, (Bytes{0x00, 0x26, 0x25, 0xA0}));
}

TEST_F(PacketCodecTest, EncodedConnectDecodesBack) {
    ConnectAppPacket original;
    original.setCommandObject({{"app", AMFValue::makeString("vod")}});
    original.setArguments({{"token", AMFValue::makeString("abc")}});

    RtmpMessage message = PacketCodec::encode(original, 0, 0);
    auto result = codec_.decode(message);

    EXPECT_EQ(message.preferredCid, cid::OVER_CONNECTION);
    EXPECT_EQ(message.payload.size(), original.getSize());
    ASSERT_TRUE(result.isSuccess());
    auto* decoded = dynamic_cast<ConnectAppPacket*>(result.value().get());
    ASSERT_NE(decoded, nullptr);
    EXPECT_EQ(decoded->getProperty("app"), "vod");
    ASSERT_TRUE(decoded->getArguments().has_value());
    EXPECT_EQ(decoded->getArguments()->at("token").asString(), "abc");
}

} // namespace test
} // namespace protocol
} // namespace rtmpframe
