// RtmpFrame - RTMP message framing library
// Window acknowledgement tracker

#ifndef RTMPFRAME_PROTOCOL_ACK_WINDOW_HPP
#define RTMPFRAME_PROTOCOL_ACK_WINDOW_HPP

#include <cstdint>
#include <optional>

namespace rtmpframe {
namespace protocol {

/**
 * @brief Decides when an Acknowledgement is owed to the peer.
 *
 * The peer announces a window with WindowAckSize; once that many bytes
 * arrived since the last acknowledgement, one is due carrying the total
 * received so far (truncated to 32 bits). A window of 0 disables
 * acknowledgements.
 */
class AckWindow {
public:
    AckWindow() = default;

    /**
     * @brief Account for received bytes.
     * @return Sequence number to acknowledge, if one is due now
     */
    std::optional<uint32_t> onBytesReceived(uint64_t count);

    void setWindowSize(uint32_t size) { windowSize_ = size; }
    uint32_t getWindowSize() const { return windowSize_; }

    uint64_t getReceivedTotal() const { return receivedTotal_; }
    uint64_t getAckedTotal() const { return ackedTotal_; }

private:
    uint32_t windowSize_ = 0;
    uint64_t ackedTotal_ = 0;
    uint64_t receivedTotal_ = 0;
};

} // namespace protocol
} // namespace rtmpframe

#endif // RTMPFRAME_PROTOCOL_ACK_WINDOW_HPP
