// RtmpFrame - RTMP message framing library
// RTMP Chunk Writer Implementation

#include "rtmpframe/protocol/chunk_writer.hpp"

#include <algorithm>
#include <string>

namespace rtmpframe {
namespace protocol {

ChunkWriter::ChunkWriter(std::shared_ptr<pal::ILogPAL> logger)
    : logger_(std::move(logger))
{
}

core::Result<core::Buffer, core::Error> ChunkWriter::writeMessage(
    RtmpMessage& message, uint32_t chunkSize)
{
    using Written = core::Result<core::Buffer, core::Error>;

    const uint32_t csid = message.preferredCid;
    if (csid < cid::MIN || csid > cid::MAX) {
        return Written::error(core::Error(core::ErrorCode::InvalidArgument,
            "Chunk stream id " + std::to_string(csid) + " outside 2..65599"));
    }
    if (chunkSize == 0) {
        return Written::error(core::Error(core::ErrorCode::InvalidChunkSize,
            "Chunk size must be positive"));
    }
    if (message.payload.size() > chunk::MAX_MESSAGE_LENGTH) {
        return Written::error(core::Error(core::ErrorCode::MessageTooLarge,
            "Payload of " + std::to_string(message.payload.size()) +
            " bytes does not fit the 24-bit length field"));
    }

    MessageHeader& header = message.header;
    header.payloadLength = static_cast<uint32_t>(message.payload.size());

    auto it = chunkStreams_.find(csid);
    if (it == chunkStreams_.end()) {
        it = chunkStreams_.emplace(csid, ChunkStreamState(csid)).first;
    }
    ChunkStreamState& state = it->second;
    const MessageHeader& previous = state.cachedHeader;

    // Header selection
    uint8_t fmt = 0;
    uint64_t delta = 0;
    if (state.messageCount > 0 &&
        header.streamId == previous.streamId &&
        header.timestamp >= previous.timestamp) {
        delta = header.timestamp - previous.timestamp;
        if (delta > 0xFFFFFFFFULL) {
            fmt = 0;
        } else if (header.payloadLength != previous.payloadLength ||
                   header.messageType != previous.messageType) {
            fmt = 1;
        } else if (delta != previous.timestampDelta) {
            fmt = 2;
        } else {
            fmt = 3;
        }
    }

    // fmt0 carries the absolute timestamp, which the wire limits to 32 bits.
    if (fmt == 0 && header.timestamp > 0xFFFFFFFFULL) {
        return Written::error(core::Error(core::ErrorCode::InvalidArgument,
            "Timestamp " + std::to_string(header.timestamp) +
            " needs a full header but does not fit 32 bits",
            "cid=" + std::to_string(csid)));
    }

    // Value carried in the timestamp field (or its extension)
    const uint32_t wireValue = fmt == 0
        ? static_cast<uint32_t>(header.timestamp)
        : static_cast<uint32_t>(delta);
    const bool extended = fmt == 3
        ? state.hasExtendedTimestamp
        : wireValue >= chunk::EXTENDED_TIMESTAMP_MARKER;
    const uint32_t timestampField = extended ? chunk::EXTENDED_TIMESTAMP_MARKER : wireValue;

    core::Buffer output;
    const size_t chunkCount = header.payloadLength == 0
        ? 1
        : (header.payloadLength + chunkSize - 1) / chunkSize;
    output.reserve(header.payloadLength + chunk::MAX_FMT0_HEADER_SIZE + 2 +
                   (chunkCount - 1) * (chunk::MAX_FMT3_HEADER_SIZE + 2));
    core::BufferWriter writer(output);

    writeBasicHeader(writer, fmt, csid);
    if (fmt <= 2) {
        writer.writeUint24BE(timestampField);
    }
    if (fmt <= 1) {
        writer.writeUint24BE(header.payloadLength);
        writer.writeUint8(header.messageType);
    }
    if (fmt == 0) {
        writer.writeUint32LE(header.streamId);
    }
    if (extended) {
        writer.writeUint32BE(wireValue);
    }

    size_t written = 0;
    const size_t total = header.payloadLength;
    do {
        if (written > 0) {
            writeBasicHeader(writer, 3, csid);
            if (extended) {
                writer.writeUint32BE(wireValue);
            }
        }
        const size_t fragment = std::min<size_t>(chunkSize, total - written);
        writer.writeBytes(message.payload.data() + written, fragment);
        written += fragment;
    } while (written < total);

    header.timestampDelta = wireValue;
    state.cachedHeader = header;
    state.lastFmt = fmt;
    state.hasExtendedTimestamp = extended;
    state.messageCount++;
    message.sentLength = output.size();

    RTMPFRAME_LOG_TRACE(logger_, "Chunk",
        "Wrote type " + std::to_string(header.messageType) + " on cid " +
        std::to_string(csid) + " with fmt" + std::to_string(fmt) + ", " +
        std::to_string(output.size()) + " bytes");

    return Written::success(std::move(output));
}

const ChunkStreamState* ChunkWriter::findChunkStream(uint32_t chunkStreamId) const {
    auto it = chunkStreams_.find(chunkStreamId);
    return it != chunkStreams_.end() ? &it->second : nullptr;
}

void ChunkWriter::writeBasicHeader(core::BufferWriter& writer, uint8_t fmt, uint32_t chunkStreamId) {
    const uint8_t fmtBits = static_cast<uint8_t>(fmt << 6);
    if (chunkStreamId < 64) {
        writer.writeUint8(static_cast<uint8_t>(fmtBits | chunkStreamId));
    } else if (chunkStreamId < 64 + 256) {
        writer.writeUint8(fmtBits);
        writer.writeUint8(static_cast<uint8_t>(chunkStreamId - 64));
    } else {
        writer.writeUint8(static_cast<uint8_t>(fmtBits | 1));
        writer.writeUint16LE(static_cast<uint16_t>(chunkStreamId - 64));
    }
}

} // namespace protocol
} // namespace rtmpframe
