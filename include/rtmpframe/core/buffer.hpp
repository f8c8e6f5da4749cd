// RtmpFrame - RTMP message framing library
// Byte buffers, a seekable read cursor and a big-endian writer

#ifndef RTMPFRAME_CORE_BUFFER_HPP
#define RTMPFRAME_CORE_BUFFER_HPP

#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <initializer_list>
#include <stdexcept>

namespace rtmpframe {
namespace core {

/**
 * @brief Growable owned byte sequence.
 */
class Buffer {
public:
    Buffer() = default;

    explicit Buffer(size_t size) : data_(size, 0) {}

    Buffer(const uint8_t* data, size_t size)
        : data_(data, data + size) {}

    Buffer(std::initializer_list<uint8_t> init)
        : data_(init) {}

    explicit Buffer(std::vector<uint8_t> vec)
        : data_(std::move(vec)) {}

    Buffer(const Buffer&) = default;
    Buffer& operator=(const Buffer&) = default;
    Buffer(Buffer&&) noexcept = default;
    Buffer& operator=(Buffer&&) noexcept = default;

    [[nodiscard]] size_t size() const noexcept {
        return data_.size();
    }

    [[nodiscard]] bool empty() const noexcept {
        return data_.empty();
    }

    [[nodiscard]] uint8_t* data() noexcept {
        return data_.data();
    }

    [[nodiscard]] const uint8_t* data() const noexcept {
        return data_.data();
    }

    uint8_t& operator[](size_t index) {
        return data_[index];
    }

    const uint8_t& operator[](size_t index) const {
        return data_[index];
    }

    void append(std::initializer_list<uint8_t> init) {
        data_.insert(data_.end(), init.begin(), init.end());
    }

    void append(const uint8_t* data, size_t size) {
        data_.insert(data_.end(), data, data + size);
    }

    void append(const Buffer& other) {
        data_.insert(data_.end(), other.data_.begin(), other.data_.end());
    }

    /**
     * @brief Drop the first @p count bytes, shifting the rest to the front.
     */
    void consume(size_t count) {
        count = std::min(count, data_.size());
        data_.erase(data_.begin(), data_.begin() + static_cast<std::ptrdiff_t>(count));
    }

    void clear() noexcept {
        data_.clear();
    }

    void reserve(size_t capacity) {
        data_.reserve(capacity);
    }

    void resize(size_t size) {
        data_.resize(size);
    }

    [[nodiscard]] std::vector<uint8_t>& vector() noexcept {
        return data_;
    }

    [[nodiscard]] const std::vector<uint8_t>& vector() const noexcept {
        return data_;
    }

    auto begin() noexcept { return data_.begin(); }
    auto end() noexcept { return data_.end(); }
    auto begin() const noexcept { return data_.begin(); }
    auto end() const noexcept { return data_.end(); }

private:
    std::vector<uint8_t> data_;
};

/**
 * @brief Seekable read cursor over a borrowed byte range.
 *
 * Reads past the end throw std::out_of_range; parsers check
 * hasRemaining() first and report a Result error instead, so the throw
 * only fires on a parser bug.
 *
 * The cursor supports one saved checkpoint (mark/resetToMark) which the
 * packet dispatcher uses to peek a command name and rewind before handing
 * the cursor to the concrete packet decoder.
 */
class BufferReader {
public:
    explicit BufferReader(const Buffer& buffer)
        : data_(buffer.data())
        , size_(buffer.size())
        , position_(0)
        , mark_(0) {}

    explicit BufferReader(const std::vector<uint8_t>& bytes)
        : data_(bytes.data())
        , size_(bytes.size())
        , position_(0)
        , mark_(0) {}

    BufferReader(const uint8_t* data, size_t size)
        : data_(data)
        , size_(size)
        , position_(0)
        , mark_(0) {}

    uint8_t readUint8() {
        checkRemaining(1);
        return data_[position_++];
    }

    [[nodiscard]] uint8_t peekUint8() const {
        checkRemaining(1);
        return data_[position_];
    }

    uint16_t readUint16BE() { return static_cast<uint16_t>(readUnsigned(2, true)); }
    uint16_t readUint16LE() { return static_cast<uint16_t>(readUnsigned(2, false)); }
    uint32_t readUint24BE() { return readUnsigned(3, true); }
    uint32_t readUint32BE() { return readUnsigned(4, true); }
    // Message stream id in chunk headers is the one little-endian field.
    uint32_t readUint32LE() { return readUnsigned(4, false); }

    std::vector<uint8_t> readBytes(size_t count) {
        checkRemaining(count);
        std::vector<uint8_t> result(data_ + position_, data_ + position_ + count);
        position_ += count;
        return result;
    }

    /**
     * @brief Append @p count bytes to @p out and advance.
     */
    void readInto(std::vector<uint8_t>& out, size_t count) {
        checkRemaining(count);
        out.insert(out.end(), data_ + position_, data_ + position_ + count);
        position_ += count;
    }

    void skip(size_t count) {
        checkRemaining(count);
        position_ += count;
    }

    void seek(size_t pos) {
        if (pos > size_) {
            throw std::out_of_range("Seek position past end of buffer");
        }
        position_ = pos;
    }

    /**
     * @brief Remember the current position.
     */
    void mark() noexcept {
        mark_ = position_;
    }

    /**
     * @brief Return to the position saved by the last mark().
     */
    void resetToMark() noexcept {
        position_ = mark_;
    }

    [[nodiscard]] size_t position() const noexcept {
        return position_;
    }

    [[nodiscard]] size_t remaining() const noexcept {
        return size_ - position_;
    }

    [[nodiscard]] bool hasRemaining(size_t n) const noexcept {
        return remaining() >= n;
    }

    [[nodiscard]] size_t size() const noexcept {
        return size_;
    }

    [[nodiscard]] const uint8_t* current() const noexcept {
        return data_ + position_;
    }

private:
    void checkRemaining(size_t n) const {
        if (remaining() < n) {
            throw std::out_of_range("Not enough data in buffer");
        }
    }

    uint32_t readUnsigned(size_t width, bool bigEndian) {
        checkRemaining(width);
        uint32_t value = 0;
        for (size_t i = 0; i < width; ++i) {
            uint32_t byte = data_[position_ + i];
            value |= byte << (8 * (bigEndian ? width - 1 - i : i));
        }
        position_ += width;
        return value;
    }

    const uint8_t* data_;
    size_t size_;
    size_t position_;
    size_t mark_;
};

/**
 * @brief Appends big- and little-endian integers to a Buffer.
 */
class BufferWriter {
public:
    explicit BufferWriter(Buffer& buffer)
        : buffer_(buffer) {}

    void writeUint8(uint8_t value) {
        buffer_.append({value});
    }

    void writeUint16BE(uint16_t value) { writeUnsigned(value, 2, true); }
    void writeUint16LE(uint16_t value) { writeUnsigned(value, 2, false); }
    void writeUint24BE(uint32_t value) { writeUnsigned(value, 3, true); }
    void writeUint32BE(uint32_t value) { writeUnsigned(value, 4, true); }
    void writeUint32LE(uint32_t value) { writeUnsigned(value, 4, false); }

    void writeBytes(const uint8_t* data, size_t size) {
        buffer_.append(data, size);
    }

    void writeBytes(const std::vector<uint8_t>& data) {
        buffer_.append(data.data(), data.size());
    }

    [[nodiscard]] size_t size() const noexcept {
        return buffer_.size();
    }

private:
    void writeUnsigned(uint32_t value, size_t width, bool bigEndian) {
        uint8_t bytes[4];
        for (size_t i = 0; i < width; ++i) {
            size_t shift = 8 * (bigEndian ? width - 1 - i : i);
            bytes[i] = static_cast<uint8_t>((value >> shift) & 0xFF);
        }
        buffer_.append(bytes, width);
    }

    Buffer& buffer_;
};

} // namespace core
} // namespace rtmpframe

#endif // RTMPFRAME_CORE_BUFFER_HPP
