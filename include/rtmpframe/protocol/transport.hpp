// RtmpFrame - RTMP message framing library
// Byte transport interfaces used by the protocol session
//
// The session never touches sockets. It pulls exact byte counts from an
// IByteSource and pushes whole chunk sequences into an IByteSink; the
// caller adapts these to whatever I/O model it runs.

#ifndef RTMPFRAME_PROTOCOL_TRANSPORT_HPP
#define RTMPFRAME_PROTOCOL_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

namespace rtmpframe {
namespace protocol {

/**
 * @brief Status of a transport operation.
 */
enum class IoStatus {
    Ok,          ///< All requested bytes transferred
    WouldBlock,  ///< Not enough bytes yet; nothing transferred
    Closed,      ///< Peer closed the stream
    Failed       ///< Transport error
};

/**
 * @brief Source of inbound bytes.
 */
class IByteSource {
public:
    virtual ~IByteSource() = default;

    /**
     * @brief Read exactly n bytes.
     *
     * All-or-nothing: unless Ok is returned, no bytes were consumed.
     */
    virtual IoStatus readExact(uint8_t* out, size_t n) = 0;
};

/**
 * @brief Sink for outbound bytes.
 */
class IByteSink {
public:
    virtual ~IByteSink() = default;

    /**
     * @brief Write all n bytes or fail.
     */
    virtual IoStatus writeAll(const uint8_t* data, size_t n) = 0;
};

// =============================================================================
// In-memory transport
// =============================================================================

/**
 * @brief Byte source over an in-memory buffer.
 *
 * Bytes become readable as they are fed. Until close() is called a short
 * read reports WouldBlock, afterwards Closed.
 */
class MemoryByteSource : public IByteSource {
public:
    MemoryByteSource() = default;
    explicit MemoryByteSource(std::vector<uint8_t> data);

    IoStatus readExact(uint8_t* out, size_t n) override;

    /**
     * @brief Make more bytes available.
     */
    void feed(const uint8_t* data, size_t n);
    void feed(const std::vector<uint8_t>& data);

    /**
     * @brief Mark end of stream.
     */
    void close();

    /**
     * @brief Make every later read fail.
     */
    void fail();

    size_t available() const;
    size_t totalRead() const;

private:
    std::vector<uint8_t> data_;
    size_t position_ = 0;
    bool closed_ = false;
    bool failed_ = false;
};

/**
 * @brief Byte sink collecting everything written.
 */
class MemoryByteSink : public IByteSink {
public:
    IoStatus writeAll(const uint8_t* data, size_t n) override;

    /**
     * @brief Reject writes once the given number of bytes was accepted.
     */
    void failAfter(size_t bytes);

    const std::vector<uint8_t>& data() const;
    void clear();

private:
    std::vector<uint8_t> data_;
    size_t limit_ = static_cast<size_t>(-1);
};

// =============================================================================
// File transport
// =============================================================================

/**
 * @brief Byte source replaying a captured stream from a file.
 *
 * A short read at end of file reports Closed.
 */
class FileByteSource : public IByteSource {
public:
    explicit FileByteSource(const std::string& path);

    bool isOpen() const;
    IoStatus readExact(uint8_t* out, size_t n) override;

private:
    std::ifstream stream_;
};

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_TRANSPORT_HPP
