// RtmpFrame - RTMP message framing library
// RTMP message model and protocol constants
//
// An RTMP message is a typed payload with a timestamp and a message stream
// id. On the wire it is split into chunks that belong to a chunk stream
// (cid); see chunk_reader.hpp and chunk_writer.hpp.

#ifndef RTMPFRAME_PROTOCOL_MESSAGE_HPP
#define RTMPFRAME_PROTOCOL_MESSAGE_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace rtmpframe {
namespace protocol {

// RTMP Message Type IDs
namespace message_type {
    constexpr uint8_t SET_CHUNK_SIZE = 1;
    constexpr uint8_t ABORT = 2;
    constexpr uint8_t ACKNOWLEDGEMENT = 3;
    constexpr uint8_t USER_CONTROL = 4;
    constexpr uint8_t WINDOW_ACK_SIZE = 5;
    constexpr uint8_t SET_PEER_BANDWIDTH = 6;
    constexpr uint8_t AUDIO = 8;
    constexpr uint8_t VIDEO = 9;
    constexpr uint8_t AMF3_DATA = 15;
    constexpr uint8_t AMF3_COMMAND = 17;
    constexpr uint8_t AMF0_DATA = 18;
    constexpr uint8_t AMF0_COMMAND = 20;
}

// Reserved chunk stream ids used as preferred cids when sending
namespace cid {
    constexpr uint32_t PROTOCOL_CONTROL = 2;
    constexpr uint32_t OVER_CONNECTION = 3;
    constexpr uint32_t OVER_CONNECTION2 = 4;
    constexpr uint32_t OVER_STREAM = 5;
    constexpr uint32_t VIDEO = 6;
    constexpr uint32_t AUDIO = 7;
    constexpr uint32_t OVER_STREAM2 = 8;

    constexpr uint32_t MIN = 2;
    constexpr uint32_t MAX = 65599;
}

// Chunk framing limits
namespace chunk {
    constexpr uint32_t DEFAULT_CHUNK_SIZE = 128;
    constexpr uint32_t MIN_CHUNK_SIZE = 128;
    constexpr uint32_t MAX_CHUNK_SIZE = 65536;

    /// Largest chunk size a peer may announce (31 bits).
    constexpr uint32_t MAX_PEER_CHUNK_SIZE = 0x7FFFFFFF;

    /// 3-byte timestamp value announcing a 4-byte extended timestamp.
    constexpr uint32_t EXTENDED_TIMESTAMP_MARKER = 0xFFFFFF;

    /// Largest payload expressible in the 3-byte length field.
    constexpr uint32_t MAX_MESSAGE_LENGTH = 0xFFFFFF;

    /// fmt0 header: 1B basic + 11B message + 4B extended timestamp.
    /// A 3-byte basic header adds two more bytes.
    constexpr size_t MAX_FMT0_HEADER_SIZE = 16;

    /// fmt3 header: 1B basic + 4B extended timestamp.
    constexpr size_t MAX_FMT3_HEADER_SIZE = 5;
}

/**
 * @brief Header fields of one RTMP message.
 */
struct MessageHeader {
    uint8_t messageType = 0;       ///< RTMP message type id
    uint32_t payloadLength = 0;    ///< Full logical payload size
    uint64_t timestamp = 0;        ///< Absolute timestamp (milliseconds)
    uint32_t timestampDelta = 0;   ///< Last wire delta field
    uint32_t streamId = 0;         ///< Message stream id

    bool isAmf0Command() const { return messageType == message_type::AMF0_COMMAND; }
    bool isAmf3Command() const { return messageType == message_type::AMF3_COMMAND; }
    bool isAmf0Data() const { return messageType == message_type::AMF0_DATA; }
    bool isAmf3Data() const { return messageType == message_type::AMF3_DATA; }

    bool isProtocolControl() const {
        return messageType >= message_type::SET_CHUNK_SIZE &&
               messageType <= message_type::SET_PEER_BANDWIDTH &&
               messageType != message_type::USER_CONTROL;
    }
};

/**
 * @brief A complete or in-progress RTMP message.
 *
 * While being reassembled the payload grows chunk by chunk and
 * receivedLength tracks how much of header.payloadLength has arrived.
 */
struct RtmpMessage {
    MessageHeader header;
    std::vector<uint8_t> payload;
    uint32_t receivedLength = 0;   ///< Payload bytes received so far
    uint32_t preferredCid = 0;     ///< cid used when sending
    size_t sentLength = 0;         ///< Wire bytes written by the last send

    /**
     * @brief Whether the whole payload has been received.
     */
    bool isComplete() const {
        return receivedLength == header.payloadLength;
    }
};

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_MESSAGE_HPP
