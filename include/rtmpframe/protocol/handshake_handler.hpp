// RtmpFrame - RTMP message framing library
// RTMP Handshake Handler - Server-side state machine for the RTMP handshake
//
// - C0/S0: Version exchange (1 byte, must be 3)
// - C1/S1: 1536 bytes: 4-byte time + 4-byte version/zero + 1528 bytes
// - C2/S2: 1536 bytes
//
// State transitions:
//   Idle -> C0C1Received -> S0S1S2Sent -> C2Received -> Established | Failed

#ifndef RTMPFRAME_PROTOCOL_HANDSHAKE_HANDLER_HPP
#define RTMPFRAME_PROTOCOL_HANDSHAKE_HANDLER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "rtmpframe/core/error_codes.hpp"
#include "rtmpframe/core/result.hpp"
#include "rtmpframe/pal/log_pal.hpp"

namespace rtmpframe {
namespace protocol {

// RTMP Handshake Protocol Constants
namespace handshake {
    constexpr uint8_t RTMP_VERSION = 3;
    constexpr size_t PACKET_SIZE = 1536;         // C1, C2, S1, S2
    constexpr size_t C0C1_SIZE = 1 + PACKET_SIZE;
    constexpr size_t S0S1S2_SIZE = 1 + 2 * PACKET_SIZE;
    constexpr size_t C2_SIZE = PACKET_SIZE;
    constexpr size_t TIME_SIZE = 4;
    constexpr size_t VERSION_SIZE = 4;
    constexpr size_t RANDOM_SIZE = PACKET_SIZE - TIME_SIZE - VERSION_SIZE;
}

/**
 * @brief Handshake progress.
 */
enum class HandshakeState {
    Idle,           ///< Waiting for C0+C1
    C0C1Received,   ///< S0+S1+S2 generated, waiting for it to be sent
    S0S1S2Sent,     ///< Waiting for C2
    C2Received,     ///< C2 read
    Established,    ///< Chunk stream may start
    Failed          ///< Terminal
};

/**
 * @brief Human-readable state name for logs.
 */
const char* handshakeStateName(HandshakeState state);

/**
 * @brief Server side of the RTMP handshake.
 *
 * The handler never reads from the network itself: the caller passes
 * C0+C1 and C2 as whole units (bytesExpected() tells how many) and sends
 * what getResponseData() returns.
 *
 * With the complex handshake enabled a C1 carrying a non-zero version is
 * checked for a client digest under both schemas. A valid digest gets a
 * signed S1/S2; otherwise the handler falls back to the plain echo
 * handshake using the C1 it already has. Only a bad C0 version fails the
 * handshake. C2 is read but not validated.
 *
 * ## Usage Example
 * @code
 * HandshakeHandler handler(true, logger);
 * handler.processData(c0c1.data(), c0c1.size());
 * send(handler.getResponseData());
 * handler.onResponseSent();
 * handler.processData(c2.data(), c2.size());
 * bool established = handler.isComplete();
 * @endcode
 */
class HandshakeHandler {
public:
    explicit HandshakeHandler(bool complexHandshake = true,
                              std::shared_ptr<pal::ILogPAL> logger = nullptr);
    ~HandshakeHandler() = default;

    HandshakeHandler(const HandshakeHandler&) = delete;
    HandshakeHandler& operator=(const HandshakeHandler&) = delete;
    HandshakeHandler(HandshakeHandler&&) = default;
    HandshakeHandler& operator=(HandshakeHandler&&) = default;

    /**
     * @brief Feed handshake bytes.
     *
     * Consumes C0+C1 in Idle and C2 in S0S1S2Sent, nothing otherwise.
     * Input shorter than bytesExpected() is left unconsumed.
     *
     * @return Bytes consumed, or InvalidHandshakeVersion
     */
    core::Result<size_t, core::Error> processData(const uint8_t* data, size_t length);

    /**
     * @brief Take the pending S0+S1+S2 (empty if none).
     */
    std::vector<uint8_t> getResponseData();

    /**
     * @brief Confirm that S0+S1+S2 reached the transport.
     */
    void onResponseSent();

    /**
     * @brief Bytes the next processData() call needs, 0 when none.
     */
    size_t bytesExpected() const;

    HandshakeState getState() const;
    bool isComplete() const;
    bool isFailed() const;

    /**
     * @brief Whether S1/S2 were built with digests.
     */
    bool usedComplexHandshake() const;

    const std::vector<uint8_t>& c0c1() const { return c0c1_; }
    const std::vector<uint8_t>& s0s1s2() const { return s0s1s2_; }
    const std::vector<uint8_t>& c2() const { return c2_; }

private:
    core::Result<size_t, core::Error> processC0C1(const uint8_t* data, size_t length);
    core::Result<size_t, core::Error> processC2(const uint8_t* data, size_t length);

    bool generateComplexResponse();
    void generateSimpleResponse();

    void transition(HandshakeState next);
    static void generateRandomBytes(uint8_t* buffer, size_t length);
    static uint32_t getCurrentTimestamp();

    bool complexEnabled_;
    bool usedComplex_;
    HandshakeState state_;
    std::vector<uint8_t> c0c1_;
    std::vector<uint8_t> s0s1s2_;
    std::vector<uint8_t> c2_;
    std::vector<uint8_t> responseData_;
    std::shared_ptr<pal::ILogPAL> logger_;
};

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_HANDSHAKE_HANDLER_HPP
