// RtmpFrame - RTMP message framing library
// RTMP Chunk Reader - Reassembles messages from the chunk stream
//
// Chunk format:
// +-------------+----------------+-------------------+-------------------+
// | Basic Header| Message Header | Extended Timestamp|    Chunk Data     |
// | (1-3 bytes) |(0/3/7/11 bytes)|   (0/4 bytes)     |   (variable)      |
// +-------------+----------------+-------------------+-------------------+

#ifndef RTMPFRAME_PROTOCOL_CHUNK_READER_HPP
#define RTMPFRAME_PROTOCOL_CHUNK_READER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include "rtmpframe/core/buffer.hpp"
#include "rtmpframe/core/error_codes.hpp"
#include "rtmpframe/core/result.hpp"
#include "rtmpframe/pal/log_pal.hpp"
#include "rtmpframe/protocol/chunk_stream.hpp"
#include "rtmpframe/protocol/message.hpp"

namespace rtmpframe {
namespace protocol {

/**
 * @brief Outcome of reading one chunk.
 */
struct ReadOutcome {
    enum class Kind {
        MessageReady,   ///< The chunk completed a message
        ChunkConsumed,  ///< The chunk was consumed, message still partial
        NeedMoreData    ///< The chunk is not fully buffered; nothing consumed
    };

    Kind kind = Kind::ChunkConsumed;
    std::optional<RtmpMessage> message;   ///< Set for MessageReady
    size_t missingBytes = 0;              ///< Set for NeedMoreData

    static ReadOutcome ready(RtmpMessage msg) {
        ReadOutcome outcome;
        outcome.kind = Kind::MessageReady;
        outcome.message = std::move(msg);
        return outcome;
    }

    static ReadOutcome consumed() {
        return ReadOutcome{};
    }

    static ReadOutcome needMoreData(size_t missing) {
        ReadOutcome outcome;
        outcome.kind = Kind::NeedMoreData;
        outcome.missingBytes = missing;
        return outcome;
    }

    bool isMessageReady() const { return kind == Kind::MessageReady; }
    bool needsMoreData() const { return kind == Kind::NeedMoreData; }
};

/**
 * @brief Decodes chunks into complete RTMP messages.
 *
 * Each call to readChunk() handles at most one chunk. The chunk is
 * parsed into locals first; the cursor and the per-cid state are only
 * touched once the whole chunk (headers and payload fragment) is
 * buffered. A short buffer yields NeedMoreData with the number of bytes
 * still missing for the part of the chunk that could be sized so far.
 *
 * Header rules:
 * - A fresh cid must start with fmt0.
 * - fmt0 while a message is in progress on the cid is rejected, as is a
 *   fmt1 that changes the length mid-message.
 * - fmt0 stores its timestamp field as the delta; a fmt3 chunk that
 *   starts a new message reapplies that delta.
 * - A fmt3 continuation chunk leaves the timestamp untouched.
 *
 * Protocol control messages are not acted upon here; the session applies
 * SetChunkSize and Abort through setChunkSize() and abortChunkStream().
 */
class ChunkReader {
public:
    explicit ChunkReader(std::shared_ptr<pal::ILogPAL> logger = nullptr);
    ~ChunkReader() = default;

    ChunkReader(const ChunkReader&) = delete;
    ChunkReader& operator=(const ChunkReader&) = delete;
    ChunkReader(ChunkReader&&) = default;
    ChunkReader& operator=(ChunkReader&&) = default;

    /**
     * @brief Read one chunk from the cursor.
     *
     * @param cursor Buffered input; advanced past the chunk on success
     * @return The outcome, or ProtocolViolation / MessageTooLarge
     */
    core::Result<ReadOutcome, core::Error> readChunk(core::BufferReader& cursor);

    /**
     * @brief Update the inbound chunk size.
     *
     * Takes effect for the next chunk, including continuation chunks of a
     * message already in progress.
     */
    void setChunkSize(uint32_t size);
    uint32_t getChunkSize() const;

    /**
     * @brief Largest payloadLength accepted in a fmt0/fmt1 header.
     */
    void setMaxMessageSize(uint32_t size);
    uint32_t getMaxMessageSize() const;

    /**
     * @brief Discard the partial message on a chunk stream (Abort message).
     */
    void abortChunkStream(uint32_t chunkStreamId);

    /**
     * @brief Look up the state of a cid, nullptr if never seen.
     */
    const ChunkStreamState* findChunkStream(uint32_t chunkStreamId) const;

private:
    core::Error violation(uint32_t chunkStreamId, const std::string& message) const;

    uint32_t chunkSize_;
    uint32_t maxMessageSize_;
    std::unordered_map<uint32_t, ChunkStreamState> chunkStreams_;
    std::shared_ptr<pal::ILogPAL> logger_;
};

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_CHUNK_READER_HPP
