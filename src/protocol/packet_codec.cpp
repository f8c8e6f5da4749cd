// RtmpFrame - RTMP message framing library
// Packet Codec Implementation

#include "rtmpframe/protocol/packet_codec.hpp"
#include "rtmpframe/protocol/amf0_codec.hpp"

#include <string>

namespace rtmpframe {
namespace protocol {

PacketCodec::PacketCodec(std::shared_ptr<pal::ILogPAL> logger)
    : logger_(std::move(logger))
{
}

core::Result<std::unique_ptr<Packet>, core::Error> PacketCodec::decode(const RtmpMessage& message) const {
    return decode(message.header, message.payload);
}

core::Result<std::unique_ptr<Packet>, core::Error> PacketCodec::decode(
    const MessageHeader& header, const std::vector<uint8_t>& payload) const
{
    using DecodeResult = core::Result<std::unique_ptr<Packet>, core::Error>;

    core::BufferReader reader(payload);
    std::unique_ptr<Packet> packet;

    if (header.isAmf0Command() || header.isAmf3Command() ||
        header.isAmf0Data() || header.isAmf3Data()) {
        if (header.isAmf3Command() && reader.hasRemaining(1)) {
            reader.skip(1);
        }

        reader.mark();
        auto name = Amf0Codec::readString(reader);
        if (name.isError()) {
            RTMPFRAME_LOG_WARNING(logger_, "Codec",
                "Undecodable command name in type " + std::to_string(header.messageType) +
                " message: " + name.error().message);
            return DecodeResult::error(core::Error(core::ErrorCode::CodecError,
                "command name: " + name.error().message,
                "type=" + std::to_string(header.messageType)));
        }
        reader.resetToMark();

        if (name.value() == ConnectAppPacket::COMMAND_NAME) {
            packet = std::make_unique<ConnectAppPacket>();
        } else {
            RTMPFRAME_LOG_DEBUG(logger_, "Codec", "Ignoring command \"" + name.value() + "\"");
        }
    } else {
        switch (header.messageType) {
            case message_type::WINDOW_ACK_SIZE:
                packet = std::make_unique<SetWindowAckSizePacket>();
                break;
            case message_type::SET_CHUNK_SIZE:
                packet = std::make_unique<SetChunkSizePacket>();
                break;
            case message_type::ACKNOWLEDGEMENT:
                packet = std::make_unique<AcknowledgementPacket>();
                break;
            case message_type::ABORT:
                packet = std::make_unique<AbortMessagePacket>();
                break;
            default:
                break;
        }
    }

    if (!packet) {
        return DecodeResult::success(nullptr);
    }

    auto decoded = packet->decode(reader);
    if (decoded.isError()) {
        RTMPFRAME_LOG_WARNING(logger_, "Codec", decoded.error().toString());
        return DecodeResult::error(decoded.error());
    }

    RTMPFRAME_LOG_DEBUG(logger_, "Codec",
        std::string("Decoded ") + packet->getName() + " packet");
    return DecodeResult::success(std::move(packet));
}

RtmpMessage PacketCodec::encode(const Packet& packet, uint32_t streamId, uint64_t timestamp) {
    core::Buffer payload;
    payload.reserve(packet.getSize());
    core::BufferWriter writer(payload);
    packet.encode(writer);

    RtmpMessage message;
    message.header.messageType = packet.getMessageType();
    message.header.payloadLength = static_cast<uint32_t>(payload.size());
    message.header.timestamp = timestamp;
    message.header.streamId = streamId;
    message.payload = std::move(payload.vector());
    message.receivedLength = message.header.payloadLength;
    message.preferredCid = packet.getPreferredCid();
    return message;
}

} // namespace protocol
} // namespace rtmpframe
