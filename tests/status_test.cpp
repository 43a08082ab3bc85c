#include "bus/status.hpp"

#include <cerrno>

#include <gtest/gtest.h>

namespace sockcan::bus {
namespace {

TEST(StatusTest, FailureKindAndDetailSurviveThePayload) {
    absl::Status st = MakeFailure(Failure::kNotEnoughData, "no byte 3", 3);
    ASSERT_FALSE(st.ok());
    EXPECT_EQ(GetFailure(st), Failure::kNotEnoughData);
    EXPECT_EQ(GetFailureDetail(st), 3u);
    EXPECT_FALSE(GetErrno(st).has_value());
    EXPECT_EQ(st.code(), absl::StatusCode::kOutOfRange);
}

TEST(StatusTest, OsFailureKeepsErrno) {
    absl::Status st = MakeOsFailure(Failure::kIo, EPERM, "bind");
    EXPECT_EQ(GetFailure(st), Failure::kIo);
    EXPECT_EQ(GetErrno(st), EPERM);
    EXPECT_EQ(st.code(), absl::ErrnoToStatusCode(EPERM));
    EXPECT_NE(st.message().find("bind"), std::string_view::npos);
}

TEST(StatusTest, LookupAndIoAreDistinguishable) {
    auto lookup = MakeOsFailure(Failure::kLookup, ENODEV, "can9");
    auto io     = MakeOsFailure(Failure::kIo, ENODEV, "bind");
    EXPECT_EQ(GetFailure(lookup), Failure::kLookup);
    EXPECT_EQ(GetFailure(io), Failure::kIo);
}

TEST(StatusTest, TransientConditionsAreRetryable) {
    EXPECT_TRUE(ShouldRetry(MakeOsFailure(Failure::kIo, EAGAIN, "write")));
    EXPECT_TRUE(ShouldRetry(MakeOsFailure(Failure::kIo, EWOULDBLOCK, "write")));
    EXPECT_TRUE(ShouldRetry(MakeOsFailure(Failure::kIo, EINPROGRESS, "write")));
    EXPECT_TRUE(ShouldRetry(MakeOsFailure(Failure::kIo, EINTR, "read")));
}

TEST(StatusTest, FatalConditionsAreNotRetryable) {
    EXPECT_FALSE(ShouldRetry(absl::OkStatus()));
    EXPECT_FALSE(ShouldRetry(MakeOsFailure(Failure::kIo, ENODEV, "write")));
    EXPECT_FALSE(ShouldRetry(MakeOsFailure(Failure::kIo, EPERM, "write")));
    EXPECT_FALSE(ShouldRetry(MakeFailure(Failure::kIo, "short write")));
    EXPECT_FALSE(ShouldRetry(absl::UnavailableError("no payload")));
}

TEST(StatusTest, StatusOrOverload) {
    absl::StatusOr<int> ok = 5;
    absl::StatusOr<int> busy = MakeOsFailure(Failure::kIo, EAGAIN, "read");
    EXPECT_FALSE(ShouldRetry(ok));
    EXPECT_TRUE(ShouldRetry(busy));
}

TEST(StatusTest, PlainStatusHasNoFailure) {
    EXPECT_FALSE(GetFailure(absl::InternalError("x")).has_value());
    EXPECT_FALSE(GetFailure(absl::OkStatus()).has_value());
}

TEST(StatusTest, FailureNames) {
    EXPECT_EQ(FailureName(Failure::kIdTooLarge), "IDTooLarge");
    EXPECT_EQ(FailureName(Failure::kLookup), "LookupError");
    EXPECT_EQ(FailureName(Failure::kInvalidTransceiverError), "InvalidTransceiverError");
}

}  // namespace
}  // namespace sockcan::bus
