// RtmpFrame - RTMP message framing library
// Tests for Result and Error

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "rtmpframe/core/error_codes.hpp"
#include "rtmpframe/core/result.hpp"

namespace rtmpframe {
namespace core {
namespace test {

TEST(ResultTest, SuccessHoldsValue) {
    auto result = Result<int, Error>::success(42);

    EXPECT_TRUE(result.isSuccess());
    EXPECT_FALSE(result.isError());
    EXPECT_EQ(result.value(), 42);
}

TEST(ResultTest, ErrorHoldsError) {
    auto result = Result<int, Error>::error(Error(ErrorCode::ProtocolViolation, "bad fmt", "cid=3"));

    EXPECT_TRUE(result.isError());
    EXPECT_EQ(result.error().code, ErrorCode::ProtocolViolation);
    EXPECT_EQ(result.error().context, "cid=3");
}

TEST(ResultTest, VoidSuccessAndError) {
    auto ok = Result<void, Error>::success();
    auto failed = Result<void, Error>::error(Error(ErrorCode::CodecError));

    EXPECT_TRUE(ok.isSuccess());
    EXPECT_TRUE(failed.isError());
    EXPECT_EQ(failed.error().code, ErrorCode::CodecError);
}

TEST(ResultTest, MoveOnlyValue) {
    auto result = Result<std::unique_ptr<int>, Error>::success(std::make_unique<int>(7));

    std::unique_ptr<int> owned = std::move(result.value());

    ASSERT_NE(owned, nullptr);
    EXPECT_EQ(*owned, 7);
}

TEST(ResultTest, ValueOrFallsBackOnError) {
    auto ok = Result<int, Error>::success(1);
    auto failed = Result<int, Error>::error(Error());

    EXPECT_EQ(ok.valueOr(5), 1);
    EXPECT_EQ(failed.valueOr(5), 5);
}

TEST(ResultTest, MisusedAccessorsThrow) {
    auto ok = Result<int, Error>::success(1);
    auto failed = Result<int, Error>::error(Error());

    EXPECT_THROW(static_cast<void>(ok.error()), std::logic_error);
    EXPECT_THROW(static_cast<void>(failed.value()), std::logic_error);
}

TEST(ErrorTest, ToStringIncludesMessageAndContext) {
    Error error(ErrorCode::MessageTooLarge, "Message length 20 exceeds limit", "cid=4");

    EXPECT_EQ(error.toString(), "Message too large: Message length 20 exceeds limit [cid=4]");
}

TEST(ErrorTest, ToStringWithoutContext) {
    Error error(ErrorCode::InvalidChunkSize);

    EXPECT_EQ(error.toString(), "Invalid chunk size");
}

TEST(ErrorTest, EveryFailureIsFatal) {
    EXPECT_TRUE(Error(ErrorCode::ConnectionClosed).isFatal());
    EXPECT_TRUE(Error(ErrorCode::CodecError).isFatal());
    EXPECT_FALSE(Error(ErrorCode::Success).isFatal());
}

} // namespace test
} // namespace core
} // namespace rtmpframe
