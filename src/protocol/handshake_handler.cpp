// RtmpFrame - RTMP message framing library
// RTMP Handshake Handler Implementation
//
// - C0 version validation (must be 3)
// - Complex handshake: client digest check under schema0 and schema1,
//   signed S1 and S2
// - Plain handshake: random S1, S2 echoes C1
// - Cryptographically random fill for S1/S2

#include "rtmpframe/protocol/handshake_handler.hpp"
#include "rtmpframe/core/buffer.hpp"
#include "rtmpframe/protocol/handshake_digest.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <optional>
#include <random>

#if defined(__linux__)
    #include <sys/random.h>
#endif

namespace rtmpframe {
namespace protocol {

namespace {

// S1 version field of a digest-signed S1
constexpr uint8_t SERVER_VERSION[handshake::VERSION_SIZE] = {0x04, 0x05, 0x00, 0x01};

} // namespace

const char* handshakeStateName(HandshakeState state) {
    switch (state) {
        case HandshakeState::Idle: return "Idle";
        case HandshakeState::C0C1Received: return "C0C1Received";
        case HandshakeState::S0S1S2Sent: return "S0S1S2Sent";
        case HandshakeState::C2Received: return "C2Received";
        case HandshakeState::Established: return "Established";
        case HandshakeState::Failed: return "Failed";
    }
    return "Unknown";
}

HandshakeHandler::HandshakeHandler(bool complexHandshake, std::shared_ptr<pal::ILogPAL> logger)
    : complexEnabled_(complexHandshake)
    , usedComplex_(false)
    , state_(HandshakeState::Idle)
    , logger_(std::move(logger))
{
}

core::Result<size_t, core::Error> HandshakeHandler::processData(const uint8_t* data, size_t length) {
    if (data == nullptr || length == 0) {
        return core::Result<size_t, core::Error>::success(0);
    }

    switch (state_) {
        case HandshakeState::Idle:
            return processC0C1(data, length);
        case HandshakeState::S0S1S2Sent:
            return processC2(data, length);
        default:
            return core::Result<size_t, core::Error>::success(0);
    }
}

core::Result<size_t, core::Error> HandshakeHandler::processC0C1(const uint8_t* data, size_t length) {
    if (length < handshake::C0C1_SIZE) {
        return core::Result<size_t, core::Error>::success(0);
    }

    uint8_t version = data[0];
    if (version != handshake::RTMP_VERSION) {
        transition(HandshakeState::Failed);
        RTMPFRAME_LOG_ERROR(logger_, "Handshake",
            "Invalid RTMP version: expected 3, got " + std::to_string(version));
        return core::Result<size_t, core::Error>::error(core::Error(
            core::ErrorCode::InvalidHandshakeVersion,
            "Invalid RTMP version: expected 3, got " + std::to_string(version)));
    }

    c0c1_.assign(data, data + handshake::C0C1_SIZE);

    const uint8_t* c1 = c0c1_.data() + 1;
    const bool clientAdvertisesDigest =
        c1[4] != 0 || c1[5] != 0 || c1[6] != 0 || c1[7] != 0;

    usedComplex_ = false;
    if (complexEnabled_ && clientAdvertisesDigest) {
        usedComplex_ = generateComplexResponse();
        if (!usedComplex_) {
            RTMPFRAME_LOG_DEBUG(logger_, "Handshake",
                "Client digest not found under either schema, falling back to simple handshake");
        }
    }
    if (!usedComplex_) {
        generateSimpleResponse();
    }

    responseData_ = s0s1s2_;
    transition(HandshakeState::C0C1Received);
    return core::Result<size_t, core::Error>::success(handshake::C0C1_SIZE);
}

core::Result<size_t, core::Error> HandshakeHandler::processC2(const uint8_t* data, size_t length) {
    if (length < handshake::C2_SIZE) {
        return core::Result<size_t, core::Error>::success(0);
    }

    c2_.assign(data, data + handshake::C2_SIZE);
    transition(HandshakeState::C2Received);
    transition(HandshakeState::Established);

    RTMPFRAME_LOG_INFO(logger_, "Handshake",
        std::string("Handshake completed (") + (usedComplex_ ? "complex" : "simple") + ")");
    return core::Result<size_t, core::Error>::success(handshake::C2_SIZE);
}

bool HandshakeHandler::generateComplexResponse() {
    const uint8_t* c1 = c0c1_.data() + 1;

    std::optional<handshake_digest::Schema> schema;
    for (auto candidate : {handshake_digest::Schema::Schema0, handshake_digest::Schema::Schema1}) {
        if (handshake_digest::validateClientDigest(c1, candidate)) {
            schema = candidate;
            break;
        }
    }
    if (!schema) {
        return false;
    }

    handshake_digest::Digest clientDigest{};
    const size_t clientDigestPos = handshake_digest::digestPosition(c1, *schema);
    std::copy(c1 + clientDigestPos, c1 + clientDigestPos + handshake_digest::DIGEST_SIZE,
              clientDigest.begin());

    std::vector<uint8_t> response(handshake::S0S1S2_SIZE);
    response[0] = handshake::RTMP_VERSION;

    // S1: time + server version + random, digest at the client's schema
    uint8_t* s1 = response.data() + 1;
    const uint32_t now = getCurrentTimestamp();
    s1[0] = static_cast<uint8_t>((now >> 24) & 0xFF);
    s1[1] = static_cast<uint8_t>((now >> 16) & 0xFF);
    s1[2] = static_cast<uint8_t>((now >> 8) & 0xFF);
    s1[3] = static_cast<uint8_t>(now & 0xFF);
    std::memcpy(s1 + handshake::TIME_SIZE, SERVER_VERSION, handshake::VERSION_SIZE);
    generateRandomBytes(s1 + handshake::TIME_SIZE + handshake::VERSION_SIZE, handshake::RANDOM_SIZE);
    if (!handshake_digest::signServerDigest(s1, *schema)) {
        RTMPFRAME_LOG_WARNING(logger_, "Handshake", "Failed to sign S1 digest");
        return false;
    }

    // S2: random + HMAC keyed by the client digest
    uint8_t* s2 = s1 + handshake::PACKET_SIZE;
    generateRandomBytes(s2, handshake::PACKET_SIZE - handshake_digest::DIGEST_SIZE);
    if (!handshake_digest::signServerResponse(s2, clientDigest)) {
        RTMPFRAME_LOG_WARNING(logger_, "Handshake", "Failed to sign S2");
        return false;
    }

    RTMPFRAME_LOG_DEBUG(logger_, "Handshake",
        std::string("Client digest valid (") +
        (*schema == handshake_digest::Schema::Schema0 ? "schema0" : "schema1") + ")");

    s0s1s2_ = std::move(response);
    return true;
}

void HandshakeHandler::generateSimpleResponse() {
    core::Buffer response;
    response.reserve(handshake::S0S1S2_SIZE);
    core::BufferWriter writer(response);

    // S0
    writer.writeUint8(handshake::RTMP_VERSION);

    // S1: time + zero + random
    writer.writeUint32BE(getCurrentTimestamp());
    writer.writeUint32BE(0);
    std::vector<uint8_t> randomData(handshake::RANDOM_SIZE);
    generateRandomBytes(randomData.data(), randomData.size());
    writer.writeBytes(randomData);

    // S2: C1 time + time C1 was read + C1 random
    const uint8_t* c1 = c0c1_.data() + 1;
    writer.writeBytes(c1, handshake::TIME_SIZE);
    writer.writeUint32BE(getCurrentTimestamp());
    writer.writeBytes(c1 + handshake::TIME_SIZE + handshake::VERSION_SIZE, handshake::RANDOM_SIZE);

    s0s1s2_ = std::move(response.vector());
}

std::vector<uint8_t> HandshakeHandler::getResponseData() {
    std::vector<uint8_t> result;
    std::swap(result, responseData_);
    return result;
}

void HandshakeHandler::onResponseSent() {
    if (state_ == HandshakeState::C0C1Received) {
        transition(HandshakeState::S0S1S2Sent);
    }
}

size_t HandshakeHandler::bytesExpected() const {
    switch (state_) {
        case HandshakeState::Idle:
            return handshake::C0C1_SIZE;
        case HandshakeState::S0S1S2Sent:
            return handshake::C2_SIZE;
        default:
            return 0;
    }
}

HandshakeState HandshakeHandler::getState() const {
    return state_;
}

bool HandshakeHandler::isComplete() const {
    return state_ == HandshakeState::Established;
}

bool HandshakeHandler::isFailed() const {
    return state_ == HandshakeState::Failed;
}

bool HandshakeHandler::usedComplexHandshake() const {
    return usedComplex_;
}

void HandshakeHandler::transition(HandshakeState next) {
    RTMPFRAME_LOG_TRACE(logger_, "Handshake",
        std::string(handshakeStateName(state_)) + " -> " + handshakeStateName(next));
    state_ = next;
}

uint32_t HandshakeHandler::getCurrentTimestamp() {
    auto now = std::chrono::steady_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
    return static_cast<uint32_t>(millis & 0xFFFFFFFF);
}

void HandshakeHandler::generateRandomBytes(uint8_t* buffer, size_t length) {
    bool success = false;

#if defined(__linux__)
    ssize_t result = getrandom(buffer, length, 0);
    success = (result == static_cast<ssize_t>(length));
#endif

    // Fallback to std::random_device if the platform source fails
    if (!success) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 255);

        for (size_t i = 0; i < length; ++i) {
            buffer[i] = static_cast<uint8_t>(dis(gen));
        }
    }
}

} // namespace protocol
} // namespace rtmpframe
