// RtmpFrame - RTMP message framing library
// RTMP Chunk Writer - Splits messages into chunks with compressed headers

#ifndef RTMPFRAME_PROTOCOL_CHUNK_WRITER_HPP
#define RTMPFRAME_PROTOCOL_CHUNK_WRITER_HPP

#include <cstdint>
#include <memory>
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
 * @brief Encodes RTMP messages as chunk sequences.
 *
 * The header of the first chunk is chosen against the cid's write-side
 * state:
 * - fmt0 for the first message on the cid, a stream id change, or a
 *   timestamp that went backwards;
 * - fmt1 when the length or type changed;
 * - fmt2 when only the timestamp delta changed;
 * - fmt3 when the delta repeats the previous one.
 *
 * Continuation chunks always use fmt3 and repeat the extended timestamp
 * when the first chunk carried one. After a fmt0 the absolute timestamp
 * counts as the previous delta, mirroring what ChunkReader expects.
 */
class ChunkWriter {
public:
    explicit ChunkWriter(std::shared_ptr<pal::ILogPAL> logger = nullptr);
    ~ChunkWriter() = default;

    ChunkWriter(const ChunkWriter&) = delete;
    ChunkWriter& operator=(const ChunkWriter&) = delete;
    ChunkWriter(ChunkWriter&&) = default;
    ChunkWriter& operator=(ChunkWriter&&) = default;

    /**
     * @brief Encode a message on message.preferredCid.
     *
     * header.payloadLength is set from the payload size. On success
     * message.sentLength holds the number of wire bytes produced.
     *
     * @param message Message to encode
     * @param chunkSize Largest payload fragment per chunk
     * @return The chunk bytes, or InvalidArgument / InvalidChunkSize /
     *         MessageTooLarge
     */
    core::Result<core::Buffer, core::Error> writeMessage(RtmpMessage& message, uint32_t chunkSize);

    /**
     * @brief Look up the write-side state of a cid, nullptr if never used.
     */
    const ChunkStreamState* findChunkStream(uint32_t chunkStreamId) const;

private:
    static void writeBasicHeader(core::BufferWriter& writer, uint8_t fmt, uint32_t chunkStreamId);

    std::unordered_map<uint32_t, ChunkStreamState> chunkStreams_;
    std::shared_ptr<pal::ILogPAL> logger_;
};

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_CHUNK_WRITER_HPP
