// RtmpFrame - RTMP message framing library
// Typed RTMP packets carried in message payloads

#ifndef RTMPFRAME_PROTOCOL_PACKETS_HPP
#define RTMPFRAME_PROTOCOL_PACKETS_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "rtmpframe/core/buffer.hpp"
#include "rtmpframe/core/error_codes.hpp"
#include "rtmpframe/core/result.hpp"
#include "rtmpframe/protocol/amf0_codec.hpp"
#include "rtmpframe/protocol/message.hpp"

namespace rtmpframe {
namespace protocol {

/**
 * @brief A decoded message payload.
 *
 * decode() reads from the start of the payload and fails with
 * CodecError on truncated or malformed input. encode() writes exactly
 * getSize() bytes.
 */
class Packet {
public:
    virtual ~Packet() = default;

    virtual core::Result<void, core::Error> decode(core::BufferReader& reader) = 0;
    virtual void encode(core::BufferWriter& writer) const = 0;

    /**
     * @brief cid the packet is sent on.
     */
    virtual uint32_t getPreferredCid() const = 0;

    /**
     * @brief Encoded payload size in bytes.
     */
    virtual size_t getSize() const = 0;

    virtual uint8_t getMessageType() const = 0;

    /**
     * @brief Short name for logs.
     */
    virtual const char* getName() const = 0;
};

// =============================================================================
// Command packets
// =============================================================================

/**
 * @brief The client's connect command (AMF0 command, type 20).
 *
 * Layout: "connect", transaction id 1, command object, optional
 * arguments object.
 */
class ConnectAppPacket : public Packet {
public:
    static constexpr const char* COMMAND_NAME = "connect";
    static constexpr double TRANSACTION_ID = 1.0;

    ConnectAppPacket() = default;

    core::Result<void, core::Error> decode(core::BufferReader& reader) override;
    void encode(core::BufferWriter& writer) const override;
    uint32_t getPreferredCid() const override { return cid::OVER_CONNECTION; }
    size_t getSize() const override;
    uint8_t getMessageType() const override { return message_type::AMF0_COMMAND; }
    const char* getName() const override { return "connect"; }

    const std::string& getCommandName() const { return commandName_; }
    double getTransactionId() const { return transactionId_; }
    const AMFObject& getCommandObject() const { return commandObject_; }
    const std::optional<AMFObject>& getArguments() const { return arguments_; }

    void setCommandObject(AMFObject object) { commandObject_ = std::move(object); }
    void setArguments(AMFObject arguments) { arguments_ = std::move(arguments); }

    /**
     * @brief String property of the command object ("app", "tcUrl", ...),
     * empty if absent or not a string.
     */
    std::string getProperty(const std::string& name) const;

private:
    std::string commandName_ = COMMAND_NAME;
    double transactionId_ = TRANSACTION_ID;
    AMFObject commandObject_;
    std::optional<AMFObject> arguments_;
};

// =============================================================================
// Protocol control packets
// =============================================================================

/**
 * @brief Base for the 4-byte protocol control messages sent on cid 2.
 */
class ControlPacket : public Packet {
public:
    core::Result<void, core::Error> decode(core::BufferReader& reader) override;
    void encode(core::BufferWriter& writer) const override;
    uint32_t getPreferredCid() const override { return cid::PROTOCOL_CONTROL; }
    size_t getSize() const override { return 4; }

protected:
    explicit ControlPacket(uint32_t value) : value_(value) {}

    /**
     * @brief Transform applied to the decoded value.
     */
    virtual uint32_t normalize(uint32_t raw) const { return raw; }

    uint32_t value_;
};

/**
 * @brief Window Acknowledgement Size (type 5).
 */
class SetWindowAckSizePacket : public ControlPacket {
public:
    explicit SetWindowAckSizePacket(uint32_t ackWindowSize = 0) : ControlPacket(ackWindowSize) {}

    uint8_t getMessageType() const override { return message_type::WINDOW_ACK_SIZE; }
    const char* getName() const override { return "WindowAckSize"; }

    uint32_t getAckWindowSize() const { return value_; }
};

/**
 * @brief Set Chunk Size (type 1). The top bit is reserved and masked off.
 */
class SetChunkSizePacket : public ControlPacket {
public:
    explicit SetChunkSizePacket(uint32_t chunkSize = chunk::DEFAULT_CHUNK_SIZE) : ControlPacket(chunkSize) {}

    uint8_t getMessageType() const override { return message_type::SET_CHUNK_SIZE; }
    const char* getName() const override { return "SetChunkSize"; }

    uint32_t getChunkSize() const { return value_; }

protected:
    uint32_t normalize(uint32_t raw) const override { return raw & 0x7FFFFFFF; }
};

/**
 * @brief Acknowledgement (type 3) carrying the received byte count.
 */
class AcknowledgementPacket : public ControlPacket {
public:
    explicit AcknowledgementPacket(uint32_t sequenceNumber = 0) : ControlPacket(sequenceNumber) {}

    uint8_t getMessageType() const override { return message_type::ACKNOWLEDGEMENT; }
    const char* getName() const override { return "Acknowledgement"; }

    uint32_t getSequenceNumber() const { return value_; }
};

/**
 * @brief Abort Message (type 2) naming the cid to discard.
 */
class AbortMessagePacket : public ControlPacket {
public:
    explicit AbortMessagePacket(uint32_t chunkStreamId = 0) : ControlPacket(chunkStreamId) {}

    uint8_t getMessageType() const override { return message_type::ABORT; }
    const char* getName() const override { return "Abort"; }

    uint32_t getChunkStreamId() const { return value_; }
};

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_PACKETS_HPP
