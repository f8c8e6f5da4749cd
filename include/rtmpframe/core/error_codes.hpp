// RtmpFrame - RTMP message framing library
// Error codes and Error structure shared by every layer

#ifndef RTMPFRAME_CORE_ERROR_CODES_HPP
#define RTMPFRAME_CORE_ERROR_CODES_HPP

#include <string>
#include <cstdint>

namespace rtmpframe {
namespace core {

/**
 * @brief Error codes reported by the framing layer.
 *
 * Conditions that are not errors never appear here: running short of
 * buffered bytes is reported as a "need more data" outcome and an
 * unrecognized message decodes to no packet.
 */
enum class ErrorCode : uint32_t {
    // General errors (0-99)
    Success = 0,
    Unknown = 1,
    InvalidArgument = 2,
    InvalidState = 3,

    // Transport errors (200-299)
    ConnectionClosed = 200,
    SendFailed = 201,
    ReceiveFailed = 202,

    // Protocol errors (300-399)
    ProtocolViolation = 300,
    HandshakeFailed = 301,
    InvalidHandshakeVersion = 302,
    InvalidChunkSize = 303,
    MessageTooLarge = 304,

    // Codec errors (400-499)
    CodecError = 400,
};

/**
 * @brief Convert error code to human-readable string.
 */
inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::Unknown: return "Unknown error";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::ConnectionClosed: return "Connection closed";
        case ErrorCode::SendFailed: return "Send failed";
        case ErrorCode::ReceiveFailed: return "Receive failed";
        case ErrorCode::ProtocolViolation: return "Protocol violation";
        case ErrorCode::HandshakeFailed: return "Handshake failed";
        case ErrorCode::InvalidHandshakeVersion: return "Invalid handshake version";
        case ErrorCode::InvalidChunkSize: return "Invalid chunk size";
        case ErrorCode::MessageTooLarge: return "Message too large";
        case ErrorCode::CodecError: return "Codec error";
        default: return "Unknown error code";
    }
}

/**
 * @brief Error code plus message and optional context.
 *
 * The context usually names where the error surfaced, for example
 * "cid=4" or "ConnectAppPacket".
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error(ErrorCode c = ErrorCode::Unknown,
          std::string msg = "",
          std::string ctx = "")
        : code(c)
        , message(std::move(msg))
        , context(std::move(ctx)) {}

    /**
     * @brief Whether the condition ends the connection.
     *
     * Every code except Success is fatal for the session that produced it;
     * chunk stream state is unreliable once a header was misparsed.
     */
    [[nodiscard]] bool isFatal() const noexcept {
        return code != ErrorCode::Success;
    }

    [[nodiscard]] std::string toString() const {
        std::string result = errorCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        if (!context.empty()) {
            result += " [" + context + "]";
        }
        return result;
    }
};

} // namespace core
} // namespace rtmpframe

#endif // RTMPFRAME_CORE_ERROR_CODES_HPP
