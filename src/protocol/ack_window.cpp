// RtmpFrame - RTMP message framing library
// Window acknowledgement tracker implementation

#include "rtmpframe/protocol/ack_window.hpp"

namespace rtmpframe {
namespace protocol {

std::optional<uint32_t> AckWindow::onBytesReceived(uint64_t count) {
    receivedTotal_ += count;

    if (windowSize_ == 0 || receivedTotal_ - ackedTotal_ < windowSize_) {
        return std::nullopt;
    }

    ackedTotal_ = receivedTotal_;
    return static_cast<uint32_t>(receivedTotal_ & 0xFFFFFFFF);
}

} // namespace protocol
} // namespace rtmpframe
