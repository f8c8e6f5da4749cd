// RtmpFrame - RTMP message framing library
// RTMP Protocol Session Implementation

#include "rtmpframe/protocol/rtmp_protocol.hpp"

#include <vector>

namespace rtmpframe {
namespace protocol {

RtmpProtocol::RtmpProtocol(IByteSource& source,
                           IByteSink& sink,
                           const core::ProtocolConfig& config,
                           std::shared_ptr<pal::ILogPAL> logger)
    : source_(source)
    , sink_(sink)
    , config_(config)
    , logger_(logger)
    , handshake_(config.complexHandshake, logger)
    , reader_(logger)
    , writer_(logger)
    , codec_(logger)
    , outChunkSize_(chunk::DEFAULT_CHUNK_SIZE)
{
    reader_.setMaxMessageSize(config_.maxMessageSize);
}

// =============================================================================
// Handshake
// =============================================================================

core::Result<bool, core::Error> RtmpProtocol::handshakeWithClient() {
    using HandshakeResult = core::Result<bool, core::Error>;

    if (handshake_.isFailed()) {
        return HandshakeResult::error(core::Error(core::ErrorCode::HandshakeFailed,
            "Handshake already failed"));
    }

    while (!handshake_.isComplete()) {
        const size_t needed = handshake_.bytesExpected();
        if (needed > 0) {
            std::vector<uint8_t> packet(needed);
            IoStatus status = source_.readExact(packet.data(), needed);
            if (status == IoStatus::WouldBlock) {
                return HandshakeResult::success(false);
            }
            if (status != IoStatus::Ok) {
                return HandshakeResult::error(transportError(status, "handshake read"));
            }

            auto processed = handshake_.processData(packet.data(), packet.size());
            if (processed.isError()) {
                return HandshakeResult::error(processed.error());
            }
        }

        if (handshake_.getState() == HandshakeState::C0C1Received) {
            std::vector<uint8_t> response = handshake_.getResponseData();
            auto written = writeBytes(response.data(), response.size());
            if (written.isError()) {
                return HandshakeResult::error(written.error());
            }
            handshake_.onResponseSent();
        }
    }

    return HandshakeResult::success(true);
}

// =============================================================================
// Receiving
// =============================================================================

core::Result<std::optional<RtmpMessage>, core::Error> RtmpProtocol::recvMessage() {
    using RecvResult = core::Result<std::optional<RtmpMessage>, core::Error>;

    if (!handshake_.isComplete()) {
        return RecvResult::error(core::Error(core::ErrorCode::InvalidState,
            "recvMessage before handshake completed"));
    }

    while (true) {
        core::BufferReader cursor(input_.data(), input_.size());
        auto read = reader_.readChunk(cursor);
        if (read.isError()) {
            return RecvResult::error(read.error());
        }

        ReadOutcome& outcome = read.value();
        if (outcome.needsMoreData()) {
            const size_t buffered = input_.size();
            input_.resize(buffered + outcome.missingBytes);
            IoStatus status = source_.readExact(input_.data() + buffered, outcome.missingBytes);
            if (status != IoStatus::Ok) {
                input_.resize(buffered);
                if (status == IoStatus::WouldBlock) {
                    return RecvResult::success(std::nullopt);
                }
                return RecvResult::error(transportError(status, "chunk read"));
            }
            continue;
        }

        const size_t consumed = cursor.position();
        input_.consume(consumed);

        if (auto sequence = ackWindow_.onBytesReceived(consumed)) {
            RTMPFRAME_LOG_DEBUG(logger_, "Protocol",
                "Acknowledging " + std::to_string(*sequence) + " bytes");
            auto acked = sendPacket(AcknowledgementPacket(*sequence));
            if (acked.isError()) {
                return RecvResult::error(acked.error());
            }
        }

        if (!outcome.isMessageReady()) {
            continue;
        }

        RtmpMessage message = std::move(*outcome.message);
        if (message.header.isProtocolControl()) {
            auto applied = applyControlMessage(message);
            if (applied.isError()) {
                return RecvResult::error(applied.error());
            }
        }
        return RecvResult::success(std::move(message));
    }
}

core::Result<std::unique_ptr<Packet>, core::Error> RtmpProtocol::decodeMessage(
    const RtmpMessage& message) const
{
    return codec_.decode(message);
}

core::Result<void, core::Error> RtmpProtocol::applyControlMessage(const RtmpMessage& message) {
    auto decoded = codec_.decode(message);
    if (decoded.isError()) {
        return core::Result<void, core::Error>::error(decoded.error());
    }
    const Packet* packet = decoded.value().get();

    if (auto* setChunkSize = dynamic_cast<const SetChunkSizePacket*>(packet)) {
        const uint32_t size = setChunkSize->getChunkSize();
        if (size == 0 || size > chunk::MAX_PEER_CHUNK_SIZE) {
            RTMPFRAME_LOG_ERROR(logger_, "Protocol",
                "Peer announced invalid chunk size " + std::to_string(size));
            return core::Result<void, core::Error>::error(core::Error(
                core::ErrorCode::InvalidChunkSize,
                "Peer chunk size " + std::to_string(size) + " outside 1..2147483647"));
        }
        reader_.setChunkSize(size);
        RTMPFRAME_LOG_INFO(logger_, "Protocol", "Inbound chunk size set to " + std::to_string(size));
    } else if (auto* windowAck = dynamic_cast<const SetWindowAckSizePacket*>(packet)) {
        ackWindow_.setWindowSize(windowAck->getAckWindowSize());
        RTMPFRAME_LOG_INFO(logger_, "Protocol",
            "Acknowledgement window set to " + std::to_string(windowAck->getAckWindowSize()));
    } else if (auto* abort = dynamic_cast<const AbortMessagePacket*>(packet)) {
        reader_.abortChunkStream(abort->getChunkStreamId());
    }

    return core::Result<void, core::Error>::success();
}

// =============================================================================
// Sending
// =============================================================================

core::Result<void, core::Error> RtmpProtocol::sendPacket(const Packet& packet,
                                                         uint32_t streamId,
                                                         uint64_t timestamp)
{
    auto* setChunkSize = dynamic_cast<const SetChunkSizePacket*>(&packet);
    if (setChunkSize != nullptr &&
        (setChunkSize->getChunkSize() < chunk::MIN_CHUNK_SIZE ||
         setChunkSize->getChunkSize() > chunk::MAX_CHUNK_SIZE)) {
        return core::Result<void, core::Error>::error(core::Error(
            core::ErrorCode::InvalidChunkSize,
            "Outbound chunk size " + std::to_string(setChunkSize->getChunkSize()) +
            " outside 128..65536"));
    }

    RtmpMessage message = PacketCodec::encode(packet, streamId, timestamp);
    auto sent = sendMessage(message);
    if (sent.isError()) {
        return sent;
    }

    RTMPFRAME_LOG_DEBUG(logger_, "Protocol",
        std::string("Sent ") + packet.getName() + " (" +
        std::to_string(message.sentLength) + " bytes)");

    if (setChunkSize != nullptr) {
        outChunkSize_ = setChunkSize->getChunkSize();
        RTMPFRAME_LOG_INFO(logger_, "Protocol",
            "Outbound chunk size set to " + std::to_string(outChunkSize_));
    }
    return sent;
}

core::Result<void, core::Error> RtmpProtocol::sendMessage(RtmpMessage& message) {
    auto encoded = writer_.writeMessage(message, outChunkSize_);
    if (encoded.isError()) {
        return core::Result<void, core::Error>::error(encoded.error());
    }
    const core::Buffer& bytes = encoded.value();
    return writeBytes(bytes.data(), bytes.size());
}

core::Result<void, core::Error> RtmpProtocol::sendInitialControlMessages() {
    if (config_.windowAckSize > 0) {
        auto sent = sendPacket(SetWindowAckSizePacket(config_.windowAckSize));
        if (sent.isError()) {
            return sent;
        }
    }
    if (config_.outChunkSize != chunk::DEFAULT_CHUNK_SIZE) {
        return sendPacket(SetChunkSizePacket(config_.outChunkSize));
    }
    return core::Result<void, core::Error>::success();
}

core::Result<void, core::Error> RtmpProtocol::writeBytes(const uint8_t* data, size_t length) {
    IoStatus status = sink_.writeAll(data, length);
    if (status != IoStatus::Ok) {
        return core::Result<void, core::Error>::error(transportError(status, "write"));
    }
    return core::Result<void, core::Error>::success();
}

core::Error RtmpProtocol::transportError(IoStatus status, const std::string& operation) const {
    core::ErrorCode code = core::ErrorCode::ReceiveFailed;
    std::string message;
    switch (status) {
        case IoStatus::Closed:
            code = core::ErrorCode::ConnectionClosed;
            message = "Peer closed the connection";
            break;
        case IoStatus::WouldBlock:
            code = core::ErrorCode::SendFailed;
            message = "Sink would block";
            break;
        default:
            code = operation == "write" ? core::ErrorCode::SendFailed : core::ErrorCode::ReceiveFailed;
            message = "Transport failure";
            break;
    }
    RTMPFRAME_LOG_ERROR(logger_, "Protocol", message + " during " + operation);
    return core::Error(code, message, operation);
}

} // namespace protocol
} // namespace rtmpframe
