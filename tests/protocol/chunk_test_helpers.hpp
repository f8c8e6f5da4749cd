// RtmpFrame - RTMP message framing library
// Chunk construction helpers shared by the protocol tests

#ifndef RTMPFRAME_TESTS_PROTOCOL_CHUNK_TEST_HELPERS_HPP
#define RTMPFRAME_TESTS_PROTOCOL_CHUNK_TEST_HELPERS_HPP

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace rtmpframe {
namespace protocol {
namespace test {

namespace ChunkTestHelpers {

using Bytes = std::vector<uint8_t>;

constexpr uint32_t EXTENDED_MARKER = 0xFFFFFF;

inline void appendUint24BE(Bytes& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline void appendUint32BE(Bytes& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline void appendUint32LE(Bytes& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

/**
 * @brief Basic header for any cid.
 *
 * - cid 2-63:      1 byte  (fmt:2, cid:6)
 * - cid 64-319:    2 bytes (fmt:2, 0; cid - 64)
 * - cid 320-65599: 3 bytes (fmt:2, 1; cid - 64 as 16-bit LE)
 */
inline Bytes basicHeader(uint8_t fmt, uint32_t cid) {
    const uint8_t fmtBits = static_cast<uint8_t>(fmt << 6);
    if (cid < 64) {
        return {static_cast<uint8_t>(fmtBits | cid)};
    }
    if (cid < 320) {
        return {fmtBits, static_cast<uint8_t>(cid - 64)};
    }
    const uint32_t rest = cid - 64;
    return {static_cast<uint8_t>(fmtBits | 1),
            static_cast<uint8_t>(rest & 0xFF),
            static_cast<uint8_t>((rest >> 8) & 0xFF)};
}

inline void appendTimestampField(Bytes& out, uint32_t value) {
    appendUint24BE(out, value >= EXTENDED_MARKER ? EXTENDED_MARKER : value);
}

inline void appendExtended(Bytes& out, uint32_t value) {
    if (value >= EXTENDED_MARKER) {
        appendUint32BE(out, value);
    }
}

inline Bytes fmt0(uint32_t cid, uint32_t timestamp, uint32_t length,
                  uint8_t type, uint32_t streamId) {
    Bytes out = basicHeader(0, cid);
    appendTimestampField(out, timestamp);
    appendUint24BE(out, length);
    out.push_back(type);
    appendUint32LE(out, streamId);
    appendExtended(out, timestamp);
    return out;
}

inline Bytes fmt1(uint32_t cid, uint32_t delta, uint32_t length, uint8_t type) {
    Bytes out = basicHeader(1, cid);
    appendTimestampField(out, delta);
    appendUint24BE(out, length);
    out.push_back(type);
    appendExtended(out, delta);
    return out;
}

inline Bytes fmt2(uint32_t cid, uint32_t delta) {
    Bytes out = basicHeader(2, cid);
    appendTimestampField(out, delta);
    appendExtended(out, delta);
    return out;
}

/**
 * @brief fmt3 header; pass the extended value when the stream uses one.
 */
inline Bytes fmt3(uint32_t cid, uint32_t extendedValue = 0) {
    Bytes out = basicHeader(3, cid);
    appendExtended(out, extendedValue);
    return out;
}

inline Bytes payloadOf(size_t size, uint8_t seed = 0) {
    Bytes out(size);
    for (size_t i = 0; i < size; ++i) {
        out[i] = static_cast<uint8_t>(seed + i);
    }
    return out;
}

inline Bytes slice(const Bytes& data, size_t offset, size_t length) {
    return Bytes(data.begin() + static_cast<std::ptrdiff_t>(offset),
                 data.begin() + static_cast<std::ptrdiff_t>(offset + length));
}

inline Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes out;
    for (const auto& part : parts) {
        out.insert(out.end(), part.begin(), part.end());
    }
    return out;
}

} // namespace ChunkTestHelpers

} // namespace test
} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_TESTS_PROTOCOL_CHUNK_TEST_HELPERS_HPP
