// RtmpFrame - RTMP message framing library
// RTMP Chunk Reader Implementation
//
// Parses one chunk per call:
// - Basic Header for chunk stream ID and format type
// - Message Header for all 4 types (0-3)
// - Extended timestamp when the 3-byte field is 0xFFFFFF
// - Payload fragment bounded by the inbound chunk size

#include "rtmpframe/protocol/chunk_reader.hpp"

#include <algorithm>

namespace rtmpframe {
namespace protocol {

namespace {

// Message header size indexed by fmt
constexpr size_t MESSAGE_HEADER_SIZE[4] = {11, 7, 3, 0};

uint32_t loadUint24BE(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 16) |
           (static_cast<uint32_t>(p[1]) << 8) |
           static_cast<uint32_t>(p[2]);
}

uint32_t loadUint32BE(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
           (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) |
           static_cast<uint32_t>(p[3]);
}

uint32_t loadUint32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

// =============================================================================
// Constructor
// =============================================================================

ChunkReader::ChunkReader(std::shared_ptr<pal::ILogPAL> logger)
    : chunkSize_(chunk::DEFAULT_CHUNK_SIZE)
    , maxMessageSize_(chunk::MAX_MESSAGE_LENGTH)
    , logger_(std::move(logger))
{
}

// =============================================================================
// Chunk Parsing
// =============================================================================

core::Result<ReadOutcome, core::Error> ChunkReader::readChunk(core::BufferReader& cursor) {
    using Outcome = core::Result<ReadOutcome, core::Error>;

    const uint8_t* data = cursor.current();
    const size_t available = cursor.remaining();

    // Basic header: fmt (2 bits) + cid (6 bits), cid 0/1 escape to 2/3 bytes
    if (available < 1) {
        return Outcome::success(ReadOutcome::needMoreData(1));
    }

    const uint8_t fmt = static_cast<uint8_t>((data[0] >> 6) & 0x03);
    uint32_t csid = data[0] & 0x3F;
    size_t offset = 1;

    if (csid == 0) {
        if (available < 2) {
            return Outcome::success(ReadOutcome::needMoreData(2 - available));
        }
        csid = 64 + static_cast<uint32_t>(data[1]);
        offset = 2;
    } else if (csid == 1) {
        if (available < 3) {
            return Outcome::success(ReadOutcome::needMoreData(3 - available));
        }
        csid = 64 + static_cast<uint32_t>(data[1]) + (static_cast<uint32_t>(data[2]) << 8);
        offset = 3;
    }

    auto it = chunkStreams_.find(csid);
    const ChunkStreamState* existing = it != chunkStreams_.end() ? &it->second : nullptr;
    const bool fresh = existing == nullptr || existing->isFresh();
    const bool inProgress = existing != nullptr && existing->inProgressMessage != nullptr;

    if (fresh && fmt != 0) {
        return Outcome::error(violation(csid,
            "fmt" + std::to_string(fmt) + " chunk on fresh chunk stream"));
    }
    if (fmt == 0 && inProgress) {
        return Outcome::error(violation(csid,
            "fmt0 chunk while a message is in progress"));
    }

    // Message header
    const size_t headerSize = MESSAGE_HEADER_SIZE[fmt];
    if (available < offset + headerSize) {
        return Outcome::success(ReadOutcome::needMoreData(offset + headerSize - available));
    }

    MessageHeader header = existing != nullptr ? existing->cachedHeader : MessageHeader{};
    const uint8_t* fields = data + offset;
    uint32_t timestampField = 0;
    bool extended = existing != nullptr && existing->hasExtendedTimestamp;

    if (fmt <= 2) {
        timestampField = loadUint24BE(fields);
        extended = timestampField == chunk::EXTENDED_TIMESTAMP_MARKER;
    }
    if (fmt <= 1) {
        header.payloadLength = loadUint24BE(fields + 3);
        header.messageType = fields[6];
    }
    if (fmt == 0) {
        header.streamId = loadUint32LE(fields + 7);
    }
    offset += headerSize;

    uint32_t extendedTimestamp = 0;
    if (extended) {
        if (available < offset + 4) {
            return Outcome::success(ReadOutcome::needMoreData(offset + 4 - available));
        }
        extendedTimestamp = loadUint32BE(data + offset);
        offset += 4;
    }

    if (fmt == 1 && inProgress &&
        header.payloadLength != existing->inProgressMessage->header.payloadLength) {
        return Outcome::error(violation(csid,
            "fmt1 length change from " +
            std::to_string(existing->inProgressMessage->header.payloadLength) +
            " to " + std::to_string(header.payloadLength) + " mid-message"));
    }
    if (fmt == 1 && inProgress &&
        header.messageType != existing->inProgressMessage->header.messageType) {
        return Outcome::error(violation(csid,
            "fmt1 type change from " +
            std::to_string(existing->inProgressMessage->header.messageType) +
            " to " + std::to_string(header.messageType) + " mid-message"));
    }

    if (header.payloadLength > maxMessageSize_) {
        RTMPFRAME_LOG_ERROR(logger_, "Chunk",
            "Message of " + std::to_string(header.payloadLength) +
            " bytes exceeds limit " + std::to_string(maxMessageSize_) +
            " on cid " + std::to_string(csid));
        return Outcome::error(core::Error(
            core::ErrorCode::MessageTooLarge,
            "Message length " + std::to_string(header.payloadLength) + " exceeds limit",
            "cid=" + std::to_string(csid)));
    }

    // Timestamp
    const uint32_t wireValue = extended ? extendedTimestamp : timestampField;
    switch (fmt) {
        case 0:
            header.timestamp = wireValue;
            header.timestampDelta = wireValue;
            break;
        case 1:
        case 2:
            header.timestampDelta = wireValue;
            header.timestamp += wireValue;
            break;
        default:
            if (!inProgress) {
                uint32_t delta = 0;
                if (extended) {
                    delta = extendedTimestamp;
                } else if (existing->messageCount > 0) {
                    delta = header.timestampDelta;
                }
                header.timestampDelta = delta;
                header.timestamp += delta;
            }
            break;
    }

    // Payload fragment
    const uint32_t alreadyReceived = inProgress ? existing->inProgressMessage->receivedLength : 0;
    const uint32_t fragment = std::min(chunkSize_, header.payloadLength - alreadyReceived);
    if (available < offset + fragment) {
        return Outcome::success(ReadOutcome::needMoreData(offset + fragment - available));
    }

    // Whole chunk is buffered; commit
    ChunkStreamState& state = it != chunkStreams_.end()
        ? it->second
        : chunkStreams_.emplace(csid, ChunkStreamState(csid)).first->second;

    state.cachedHeader = header;
    state.lastFmt = fmt;
    if (fmt <= 2) {
        state.hasExtendedTimestamp = extended;
    }

    if (!state.inProgressMessage) {
        state.inProgressMessage = std::make_unique<RtmpMessage>();
        state.inProgressMessage->header = header;
        state.inProgressMessage->preferredCid = csid;
        state.inProgressMessage->payload.reserve(header.payloadLength);
    } else if (fmt != 3) {
        // fmt1/fmt2 continuation: carry the updated timestamp
        state.inProgressMessage->header.timestamp = header.timestamp;
        state.inProgressMessage->header.timestampDelta = header.timestampDelta;
    }

    RtmpMessage& message = *state.inProgressMessage;
    message.payload.insert(message.payload.end(), data + offset, data + offset + fragment);
    message.receivedLength += fragment;
    cursor.skip(offset + fragment);

    RTMPFRAME_LOG_TRACE(logger_, "Chunk",
        "fmt" + std::to_string(fmt) + " chunk on cid " + std::to_string(csid) +
        ", " + std::to_string(message.receivedLength) + "/" +
        std::to_string(message.header.payloadLength) + " bytes");

    if (!message.isComplete()) {
        return Outcome::success(ReadOutcome::consumed());
    }

    RtmpMessage completed = std::move(message);
    state.inProgressMessage.reset();
    state.messageCount++;

    RTMPFRAME_LOG_DEBUG(logger_, "Chunk",
        "Message type " + std::to_string(completed.header.messageType) +
        " complete on cid " + std::to_string(csid) +
        " (" + std::to_string(completed.header.payloadLength) + " bytes, ts " +
        std::to_string(completed.header.timestamp) + ")");

    return Outcome::success(ReadOutcome::ready(std::move(completed)));
}

// =============================================================================
// State Management
// =============================================================================

void ChunkReader::setChunkSize(uint32_t size) {
    chunkSize_ = size;
}

uint32_t ChunkReader::getChunkSize() const {
    return chunkSize_;
}

void ChunkReader::setMaxMessageSize(uint32_t size) {
    maxMessageSize_ = size;
}

uint32_t ChunkReader::getMaxMessageSize() const {
    return maxMessageSize_;
}

void ChunkReader::abortChunkStream(uint32_t chunkStreamId) {
    auto it = chunkStreams_.find(chunkStreamId);
    if (it != chunkStreams_.end() && it->second.inProgressMessage) {
        RTMPFRAME_LOG_DEBUG(logger_, "Chunk",
            "Aborting partial message on cid " + std::to_string(chunkStreamId));
        it->second.resetPartial();
    }
}

const ChunkStreamState* ChunkReader::findChunkStream(uint32_t chunkStreamId) const {
    auto it = chunkStreams_.find(chunkStreamId);
    return it != chunkStreams_.end() ? &it->second : nullptr;
}

core::Error ChunkReader::violation(uint32_t chunkStreamId, const std::string& message) const {
    RTMPFRAME_LOG_ERROR(logger_, "Chunk",
        "Protocol violation on cid " + std::to_string(chunkStreamId) + ": " + message);
    return core::Error(core::ErrorCode::ProtocolViolation, message,
                       "cid=" + std::to_string(chunkStreamId));
}

} // namespace protocol
} // namespace rtmpframe
