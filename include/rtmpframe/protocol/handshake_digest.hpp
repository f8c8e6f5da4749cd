// RtmpFrame - RTMP message framing library
// Digest helpers for the complex (Flash Player 9+) handshake
//
// C1/S1 layout (1536 bytes):
// +--------+---------+--------------------------------------------+
// | time 4 | version | schema0: key block 764 | digest block 764  |
// |        |    4    | schema1: digest block 764 | key block 764  |
// +--------+---------+--------------------------------------------+
//
// Digest block: offset(4) | random(offset) | digest(32) | random
// Key block:    random(offset) | key(128) | random | offset(4)

#ifndef RTMPFRAME_PROTOCOL_HANDSHAKE_DIGEST_HPP
#define RTMPFRAME_PROTOCOL_HANDSHAKE_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace rtmpframe {
namespace protocol {
namespace handshake_digest {

constexpr size_t PACKET_SIZE = 1536;
constexpr size_t DIGEST_SIZE = 32;
constexpr size_t BLOCK_SIZE = 764;
constexpr size_t BLOCK_START = 8;          ///< After time and version
constexpr size_t OFFSET_FIELD_SIZE = 4;

/// Bytes of the player key used to sign C1 ("Genuine Adobe Flash Player 001").
constexpr size_t FP_KEY_PARTIAL_SIZE = 30;
/// Bytes of the server key used to sign S1 ("Genuine Adobe Flash Media Server 001").
constexpr size_t FMS_KEY_PARTIAL_SIZE = 36;
constexpr size_t FMS_KEY_SIZE = 68;
constexpr size_t FP_KEY_SIZE = 62;

extern const uint8_t FP_KEY[FP_KEY_SIZE];
extern const uint8_t FMS_KEY[FMS_KEY_SIZE];

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Order of the key and digest blocks in C1/S1.
 */
enum class Schema {
    Schema0,   ///< key block, then digest block
    Schema1    ///< digest block, then key block
};

/**
 * @brief HMAC-SHA256 through OpenSSL.
 * @return The digest, or std::nullopt if OpenSSL reports a failure
 */
std::optional<Digest> hmacSha256(const uint8_t* key, size_t keyLength,
                                 const uint8_t* data, size_t length);

/**
 * @brief Position of the 32-byte digest inside a 1536-byte C1/S1 packet.
 */
size_t digestPosition(const uint8_t* packet, Schema schema);

/**
 * @brief HMAC over the packet with the 32 digest bytes at position left out.
 */
std::optional<Digest> computeDigest(const uint8_t* packet, size_t position,
                                    const uint8_t* key, size_t keyLength);

/**
 * @brief Check the client digest embedded in C1 under one schema.
 */
bool validateClientDigest(const uint8_t* c1, Schema schema);

/**
 * @brief Sign a client C1 in place (used to build digest C1 packets).
 * @return false if the HMAC could not be computed
 */
bool signClientDigest(uint8_t* c1, Schema schema);

/**
 * @brief Sign a server S1 in place with the partial server key.
 * @return false if the HMAC could not be computed
 */
bool signServerDigest(uint8_t* s1, Schema schema);

/**
 * @brief Fill the last 32 bytes of S2 with its signature.
 *
 * The signing key is HMAC(full server key, client digest); the signature
 * covers the first 1504 bytes of S2.
 * @return false if the HMAC could not be computed
 */
bool signServerResponse(uint8_t* s2, const Digest& clientDigest);

} // namespace handshake_digest
} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_HANDSHAKE_DIGEST_HPP
