// RtmpFrame - RTMP message framing library
// Complex handshake digest implementation (OpenSSL HMAC-SHA256)

#include "rtmpframe/protocol/handshake_digest.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <cstring>
#include <vector>

namespace rtmpframe {
namespace protocol {
namespace handshake_digest {

const uint8_t FP_KEY[FP_KEY_SIZE] = {
    0x47, 0x65, 0x6E, 0x75, 0x69, 0x6E, 0x65, 0x20,
    0x41, 0x64, 0x6F, 0x62, 0x65, 0x20, 0x46, 0x6C,
    0x61, 0x73, 0x68, 0x20, 0x50, 0x6C, 0x61, 0x79,
    0x65, 0x72, 0x20, 0x30, 0x30, 0x31,
    0xF0, 0xEE, 0xC2, 0x4A, 0x80, 0x68, 0xBE, 0xE8,
    0x2E, 0x00, 0xD0, 0xD1, 0x02, 0x9E, 0x7E, 0x57,
    0x6E, 0xEC, 0x5D, 0x2D, 0x29, 0x80, 0x6F, 0xAB,
    0x93, 0xB8, 0xE6, 0x36, 0xCF, 0xEB, 0x31, 0xAE
};

const uint8_t FMS_KEY[FMS_KEY_SIZE] = {
    0x47, 0x65, 0x6E, 0x75, 0x69, 0x6E, 0x65, 0x20,
    0x41, 0x64, 0x6F, 0x62, 0x65, 0x20, 0x46, 0x6C,
    0x61, 0x73, 0x68, 0x20, 0x4D, 0x65, 0x64, 0x69,
    0x61, 0x20, 0x53, 0x65, 0x72, 0x76, 0x65, 0x72,
    0x20, 0x30, 0x30, 0x31,
    0xF0, 0xEE, 0xC2, 0x4A, 0x80, 0x68, 0xBE, 0xE8,
    0x2E, 0x00, 0xD0, 0xD1, 0x02, 0x9E, 0x7E, 0x57,
    0x6E, 0xEC, 0x5D, 0x2D, 0x29, 0x80, 0x6F, 0xAB,
    0x93, 0xB8, 0xE6, 0x36, 0xCF, 0xEB, 0x31, 0xAE
};

namespace {

size_t digestBlockStart(Schema schema) {
    return schema == Schema::Schema0 ? BLOCK_START + BLOCK_SIZE : BLOCK_START;
}

size_t sumOfBytes(const uint8_t* p) {
    return static_cast<size_t>(p[0]) + p[1] + p[2] + p[3];
}

} // namespace

std::optional<Digest> hmacSha256(const uint8_t* key, size_t keyLength,
                                 const uint8_t* data, size_t length)
{
    Digest out{};
    unsigned int outLength = 0;
    const unsigned char* result = HMAC(EVP_sha256(), key, static_cast<int>(keyLength),
                                       data, length, out.data(), &outLength);
    if (result == nullptr || outLength != DIGEST_SIZE) {
        return std::nullopt;
    }
    return out;
}

size_t digestPosition(const uint8_t* packet, Schema schema) {
    const size_t block = digestBlockStart(schema);
    const size_t offset = sumOfBytes(packet + block) % (BLOCK_SIZE - OFFSET_FIELD_SIZE - DIGEST_SIZE);
    return block + OFFSET_FIELD_SIZE + offset;
}

std::optional<Digest> computeDigest(const uint8_t* packet, size_t position,
                                    const uint8_t* key, size_t keyLength)
{
    std::vector<uint8_t> joined;
    joined.reserve(PACKET_SIZE - DIGEST_SIZE);
    joined.insert(joined.end(), packet, packet + position);
    joined.insert(joined.end(), packet + position + DIGEST_SIZE, packet + PACKET_SIZE);
    return hmacSha256(key, keyLength, joined.data(), joined.size());
}

bool validateClientDigest(const uint8_t* c1, Schema schema) {
    const size_t position = digestPosition(c1, schema);
    auto expected = computeDigest(c1, position, FP_KEY, FP_KEY_PARTIAL_SIZE);
    return expected && std::memcmp(expected->data(), c1 + position, DIGEST_SIZE) == 0;
}

bool signClientDigest(uint8_t* c1, Schema schema) {
    const size_t position = digestPosition(c1, schema);
    auto digest = computeDigest(c1, position, FP_KEY, FP_KEY_PARTIAL_SIZE);
    if (!digest) {
        return false;
    }
    std::memcpy(c1 + position, digest->data(), DIGEST_SIZE);
    return true;
}

bool signServerDigest(uint8_t* s1, Schema schema) {
    const size_t position = digestPosition(s1, schema);
    auto digest = computeDigest(s1, position, FMS_KEY, FMS_KEY_PARTIAL_SIZE);
    if (!digest) {
        return false;
    }
    std::memcpy(s1 + position, digest->data(), DIGEST_SIZE);
    return true;
}

bool signServerResponse(uint8_t* s2, const Digest& clientDigest) {
    auto s2Key = hmacSha256(FMS_KEY, FMS_KEY_SIZE, clientDigest.data(), clientDigest.size());
    if (!s2Key) {
        return false;
    }
    auto signature = hmacSha256(s2Key->data(), s2Key->size(), s2, PACKET_SIZE - DIGEST_SIZE);
    if (!signature) {
        return false;
    }
    std::memcpy(s2 + PACKET_SIZE - DIGEST_SIZE, signature->data(), DIGEST_SIZE);
    return true;
}

} // namespace handshake_digest
} // namespace protocol
} // namespace rtmpframe
