// RtmpFrame - RTMP message framing library
// Per-chunk-stream header compression state

#ifndef RTMPFRAME_PROTOCOL_CHUNK_STREAM_HPP
#define RTMPFRAME_PROTOCOL_CHUNK_STREAM_HPP

#include <cstdint>
#include <memory>

#include "rtmpframe/protocol/message.hpp"

namespace rtmpframe {
namespace protocol {

/**
 * @brief Per-chunk-stream state for header compression.
 *
 * Tracks the previous header on one cid so that fmt1, fmt2 and fmt3
 * headers can inherit the fields they omit. The reader and the writer
 * each keep their own set, one per cid, created on first use.
 */
struct ChunkStreamState {
    uint32_t cid = 0;                 ///< Chunk stream id
    int lastFmt = -1;                 ///< fmt of the last chunk, -1 before any
    MessageHeader cachedHeader;       ///< Header of the last chunk, fields expanded
    bool hasExtendedTimestamp = false; ///< Last fmt0/1/2 header used the extension

    /// Message being reassembled (reader side only).
    std::unique_ptr<RtmpMessage> inProgressMessage;

    /// Messages completed on this cid.
    int64_t messageCount = 0;

    ChunkStreamState() = default;
    explicit ChunkStreamState(uint32_t id) : cid(id) {}

    ChunkStreamState(const ChunkStreamState&) = delete;
    ChunkStreamState& operator=(const ChunkStreamState&) = delete;
    ChunkStreamState(ChunkStreamState&&) noexcept = default;
    ChunkStreamState& operator=(ChunkStreamState&&) noexcept = default;

    /**
     * @brief A cid is fresh until its first message completes, unless a
     * message is already being reassembled on it.
     */
    bool isFresh() const {
        return messageCount == 0 && !inProgressMessage;
    }

    /**
     * @brief Discard the partially received message.
     */
    void resetPartial() {
        inProgressMessage.reset();
    }
};

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_CHUNK_STREAM_HPP
