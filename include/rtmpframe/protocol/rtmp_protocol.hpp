// RtmpFrame - RTMP message framing library
// RTMP Protocol Session - one connection's handshake and message stream
//
// Owns the handshake engine, the chunk reader and writer, and the window
// acknowledgement state. Bytes come from an IByteSource and go to an
// IByteSink supplied by the caller.

#ifndef RTMPFRAME_PROTOCOL_RTMP_PROTOCOL_HPP
#define RTMPFRAME_PROTOCOL_RTMP_PROTOCOL_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "rtmpframe/core/buffer.hpp"
#include "rtmpframe/core/config_manager.hpp"
#include "rtmpframe/core/error_codes.hpp"
#include "rtmpframe/core/result.hpp"
#include "rtmpframe/pal/log_pal.hpp"
#include "rtmpframe/protocol/ack_window.hpp"
#include "rtmpframe/protocol/chunk_reader.hpp"
#include "rtmpframe/protocol/chunk_writer.hpp"
#include "rtmpframe/protocol/handshake_handler.hpp"
#include "rtmpframe/protocol/message.hpp"
#include "rtmpframe/protocol/packet_codec.hpp"
#include "rtmpframe/protocol/packets.hpp"
#include "rtmpframe/protocol/transport.hpp"

namespace rtmpframe {
namespace protocol {

/**
 * @brief A message together with the packet it decoded to.
 */
template <typename T>
struct ExpectedPacket {
    RtmpMessage message;
    std::unique_ptr<T> packet;
};

/**
 * @brief Server side of one RTMP connection.
 *
 * All calls are re-entrant after a would-block: handshakeWithClient()
 * returns false and recvMessage() returns an empty optional when the
 * source has too few bytes, and calling again once more bytes arrived
 * continues where the previous call stopped.
 *
 * Control messages are applied as they are received and still returned
 * to the caller:
 * - SetChunkSize changes the inbound chunk size;
 * - WindowAckSize changes the acknowledgement window;
 * - Abort drops the partial message on the named cid.
 *
 * ## Thread Safety
 * None. One session belongs to one sequential context.
 *
 * ## Usage Example
 * @code
 * RtmpProtocol session(source, sink, config.protocol, logger);
 * auto shaken = session.handshakeWithClient();
 * if (shaken.isSuccess() && shaken.value()) {
 *     session.sendInitialControlMessages();
 *     auto connect = session.expectMessage<ConnectAppPacket>();
 * }
 * @endcode
 */
class RtmpProtocol {
public:
    RtmpProtocol(IByteSource& source,
                 IByteSink& sink,
                 const core::ProtocolConfig& config = core::ProtocolConfig{},
                 std::shared_ptr<pal::ILogPAL> logger = nullptr);

    RtmpProtocol(const RtmpProtocol&) = delete;
    RtmpProtocol& operator=(const RtmpProtocol&) = delete;

    /**
     * @brief Run the server side of the handshake.
     * @return true once established, false while waiting for bytes
     */
    core::Result<bool, core::Error> handshakeWithClient();

    /**
     * @brief Receive the next complete message.
     * @return The message, or std::nullopt while waiting for bytes
     */
    core::Result<std::optional<RtmpMessage>, core::Error> recvMessage();

    /**
     * @brief Decode a received message into a packet (nullptr if unrecognized).
     */
    core::Result<std::unique_ptr<Packet>, core::Error> decodeMessage(const RtmpMessage& message) const;

    /**
     * @brief Receive until a message decodes to T; other messages are dropped.
     * @return The packet and its message, or std::nullopt while waiting for bytes
     */
    template <typename T>
    core::Result<std::optional<ExpectedPacket<T>>, core::Error> expectMessage();

    /**
     * @brief Encode and send a packet on its preferred cid.
     *
     * Sending SetChunkSize switches the outbound chunk size after the
     * packet itself went out with the old one.
     */
    core::Result<void, core::Error> sendPacket(const Packet& packet,
                                               uint32_t streamId = 0,
                                               uint64_t timestamp = 0);

    /**
     * @brief Chunk and send a message; sets message.sentLength.
     */
    core::Result<void, core::Error> sendMessage(RtmpMessage& message);

    /**
     * @brief Announce the configured window and outbound chunk size.
     *
     * Sends WindowAckSize when the configured window is non-zero and
     * SetChunkSize when the configured size differs from 128.
     */
    core::Result<void, core::Error> sendInitialControlMessages();

    uint32_t getInChunkSize() const { return reader_.getChunkSize(); }
    uint32_t getOutChunkSize() const { return outChunkSize_; }
    const AckWindow& getAckWindow() const { return ackWindow_; }
    HandshakeState getHandshakeState() const { return handshake_.getState(); }
    bool usedComplexHandshake() const { return handshake_.usedComplexHandshake(); }

private:
    core::Result<void, core::Error> applyControlMessage(const RtmpMessage& message);
    core::Result<void, core::Error> writeBytes(const uint8_t* data, size_t length);
    core::Error transportError(IoStatus status, const std::string& operation) const;

    IByteSource& source_;
    IByteSink& sink_;
    core::ProtocolConfig config_;
    std::shared_ptr<pal::ILogPAL> logger_;

    HandshakeHandler handshake_;
    ChunkReader reader_;
    ChunkWriter writer_;
    PacketCodec codec_;
    AckWindow ackWindow_;

    core::Buffer input_;
    uint32_t outChunkSize_;
};

// =============================================================================
// Template Implementation
// =============================================================================

template <typename T>
core::Result<std::optional<ExpectedPacket<T>>, core::Error> RtmpProtocol::expectMessage() {
    using ExpectResult = core::Result<std::optional<ExpectedPacket<T>>, core::Error>;

    while (true) {
        auto received = recvMessage();
        if (received.isError()) {
            return ExpectResult::error(received.error());
        }
        if (!received.value()) {
            return ExpectResult::success(std::nullopt);
        }

        RtmpMessage message = std::move(*received.value());
        auto decoded = decodeMessage(message);
        if (decoded.isError()) {
            return ExpectResult::error(decoded.error());
        }

        std::unique_ptr<Packet> packet = std::move(decoded.value());
        if (auto* typed = dynamic_cast<T*>(packet.get())) {
            packet.release();
            ExpectedPacket<T> expected{std::move(message), std::unique_ptr<T>(typed)};
            return ExpectResult::success(std::move(expected));
        }

        RTMPFRAME_LOG_DEBUG(logger_, "Protocol",
            "Dropping type " + std::to_string(message.header.messageType) +
            " message while waiting for another packet");
    }
}

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_RTMP_PROTOCOL_HPP
