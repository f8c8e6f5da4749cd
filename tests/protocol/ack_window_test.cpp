// RtmpFrame - RTMP message framing library
// Tests for the window acknowledgement tracker

#include <gtest/gtest.h>

#include "rtmpframe/protocol/ack_window.hpp"

namespace rtmpframe {
namespace protocol {
namespace test {

TEST(AckWindowTest, ZeroWindowNeverAcknowledges) {
    AckWindow window;

    EXPECT_FALSE(window.onBytesReceived(10000000).has_value());
    EXPECT_EQ(window.getReceivedTotal(), 10000000u);
    EXPECT_EQ(window.getAckedTotal(), 0u);
}

TEST(AckWindowTest, AcknowledgesOnceWindowIsReached) {
    AckWindow window;
    window.setWindowSize(1000);

    EXPECT_FALSE(window.onBytesReceived(600).has_value());
    EXPECT_FALSE(window.onBytesReceived(399).has_value());
    auto ack = window.onBytesReceived(1);

    ASSERT_TRUE(ack.has_value());
    EXPECT_EQ(*ack, 1000u);
    EXPECT_EQ(window.getAckedTotal(), 1000u);
}

TEST(AckWindowTest, SequenceNumberIsTotalReceived) {
    AckWindow window;
    window.setWindowSize(1000);

    auto first = window.onBytesReceived(1500);
    EXPECT_FALSE(window.onBytesReceived(499).has_value());
    auto second = window.onBytesReceived(1);

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, 1500u);
    EXPECT_EQ(*second, 2000u);
}

TEST(AckWindowTest, WindowChangeAppliesToNextCheck) {
    AckWindow window;
    window.setWindowSize(1000);
    EXPECT_FALSE(window.onBytesReceived(500).has_value());

    window.setWindowSize(400);

    auto ack = window.onBytesReceived(1);
    ASSERT_TRUE(ack.has_value());
    EXPECT_EQ(*ack, 501u);
    EXPECT_EQ(window.getWindowSize(), 400u);
}

TEST(AckWindowTest, SequenceNumberWrapsAt32Bits) {
    AckWindow window;
    window.setWindowSize(0x10000000);

    std::optional<uint32_t> last;
    for (int i = 0; i < 17; ++i) {
        last = window.onBytesReceived(0x10000000);
    }

    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(*last, 0x10000000u);
    EXPECT_EQ(window.getReceivedTotal(), 0x110000000ULL);
}

} // namespace test
} // namespace protocol
} // namespace rtmpframe
