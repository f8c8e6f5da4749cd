// RtmpFrame - RTMP message framing library
// Byte transport implementations

#include "rtmpframe/protocol/transport.hpp"

#include <cstring>

namespace rtmpframe {
namespace protocol {

// =============================================================================
// MemoryByteSource
// =============================================================================

MemoryByteSource::MemoryByteSource(std::vector<uint8_t> data)
    : data_(std::move(data))
{
}

IoStatus MemoryByteSource::readExact(uint8_t* out, size_t n) {
    if (failed_) {
        return IoStatus::Failed;
    }
    if (available() < n) {
        return closed_ ? IoStatus::Closed : IoStatus::WouldBlock;
    }
    if (n > 0) {
        std::memcpy(out, data_.data() + position_, n);
        position_ += n;
    }
    return IoStatus::Ok;
}

void MemoryByteSource::feed(const uint8_t* data, size_t n) {
    data_.insert(data_.end(), data, data + n);
}

void MemoryByteSource::feed(const std::vector<uint8_t>& data) {
    feed(data.data(), data.size());
}

void MemoryByteSource::close() {
    closed_ = true;
}

void MemoryByteSource::fail() {
    failed_ = true;
}

size_t MemoryByteSource::available() const {
    return data_.size() - position_;
}

size_t MemoryByteSource::totalRead() const {
    return position_;
}

// =============================================================================
// MemoryByteSink
// =============================================================================

IoStatus MemoryByteSink::writeAll(const uint8_t* data, size_t n) {
    if (data_.size() + n > limit_) {
        return IoStatus::Failed;
    }
    data_.insert(data_.end(), data, data + n);
    return IoStatus::Ok;
}

void MemoryByteSink::failAfter(size_t bytes) {
    limit_ = bytes;
}

const std::vector<uint8_t>& MemoryByteSink::data() const {
    return data_;
}

void MemoryByteSink::clear() {
    data_.clear();
}

// =============================================================================
// FileByteSource
// =============================================================================

FileByteSource::FileByteSource(const std::string& path)
    : stream_(path, std::ios::binary)
{
}

bool FileByteSource::isOpen() const {
    return stream_.is_open();
}

IoStatus FileByteSource::readExact(uint8_t* out, size_t n) {
    if (!stream_.is_open() || stream_.bad()) {
        return IoStatus::Failed;
    }
    if (n == 0) {
        return IoStatus::Ok;
    }

    const std::streampos start = stream_.tellg();
    stream_.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(n));
    if (static_cast<size_t>(stream_.gcount()) == n) {
        return IoStatus::Ok;
    }
    if (stream_.bad()) {
        return IoStatus::Failed;
    }

    // Short read at end of file: restore the position so nothing is consumed
    stream_.clear();
    stream_.seekg(start);
    return IoStatus::Closed;
}

} // namespace protocol
} // namespace rtmpframe
