// RtmpFrame - RTMP message framing library
// Packet Codec - maps complete messages to typed packets and back

#ifndef RTMPFRAME_PROTOCOL_PACKET_CODEC_HPP
#define RTMPFRAME_PROTOCOL_PACKET_CODEC_HPP

#include <cstdint>
#include <memory>

#include "rtmpframe/core/error_codes.hpp"
#include "rtmpframe/core/result.hpp"
#include "rtmpframe/pal/log_pal.hpp"
#include "rtmpframe/protocol/message.hpp"
#include "rtmpframe/protocol/packets.hpp"

namespace rtmpframe {
namespace protocol {

/**
 * @brief Decodes messages into packets and encodes packets into messages.
 *
 * Command and data messages (types 20, 17, 18, 15) are dispatched on the
 * command name: the name is read behind a cursor mark, the cursor is
 * reset, and the chosen packet decodes the whole payload. AMF3 commands
 * carry one leading byte that is skipped. Control messages are
 * dispatched on the message type.
 *
 * Recognized packets: connect, WindowAckSize, SetChunkSize,
 * Acknowledgement and Abort. Everything else decodes to nullptr.
 */
class PacketCodec {
public:
    explicit PacketCodec(std::shared_ptr<pal::ILogPAL> logger = nullptr);

    /**
     * @brief Decode a complete message.
     *
     * @return The packet, nullptr for an unrecognized message, or
     *         CodecError when a recognized message is malformed
     */
    core::Result<std::unique_ptr<Packet>, core::Error> decode(
        const MessageHeader& header, const std::vector<uint8_t>& payload) const;

    core::Result<std::unique_ptr<Packet>, core::Error> decode(const RtmpMessage& message) const;

    /**
     * @brief Build a message carrying the packet on its preferred cid.
     */
    static RtmpMessage encode(const Packet& packet, uint32_t streamId, uint64_t timestamp);

private:
    std::shared_ptr<pal::ILogPAL> logger_;
};

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_PACKET_CODEC_HPP
