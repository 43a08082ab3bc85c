#include "config/socket_config.hpp"

#include <sys/socket.h>
#include <fcntl.h>
#include <unistd.h>

#include <gtest/gtest.h>

namespace sockcan::config {
namespace {

class SocketConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { loader().Clear(); }
  void TearDown() override { loader().Clear(); }

  static ConfigLoader& loader() { return ConfigLoader::getInstance(); }
};

TEST(ParseFiltersTest, HexPairs) {
  auto filters = ParseFilters("100:7FF, 0x18DAF100:0x1FFFFFFF");
  ASSERT_TRUE(filters.ok()) << filters.status();
  ASSERT_EQ(filters->size(), 2u);
  EXPECT_EQ((*filters)[0].id, 0x100u);
  EXPECT_EQ((*filters)[0].mask, 0x7FFu);
  EXPECT_EQ((*filters)[1].id, 0x18DAF100u);
  EXPECT_EQ((*filters)[1].mask, 0x1FFFFFFFu);
}

TEST(ParseFiltersTest, EmptyTextIsEmptyList) {
  auto filters = ParseFilters("");
  ASSERT_TRUE(filters.ok());
  EXPECT_TRUE(filters->empty());
}

TEST(ParseFiltersTest, MalformedEntries) {
  EXPECT_FALSE(ParseFilters("100").ok());
  EXPECT_FALSE(ParseFilters("100:7FF:1").ok());
  EXPECT_FALSE(ParseFilters("XYZ:7FF").ok());
  EXPECT_FALSE(ParseFilters("100:").ok());
}

TEST_F(SocketConfigTest, DefaultsLeaveKernelSettingsAlone) {
  ASSERT_TRUE(loader().LoadFromString("[can]\nchannel=vcan0\n").ok());
  auto cfg = LoadSocketConfig(loader());
  ASSERT_TRUE(cfg.ok()) << cfg.status();
  EXPECT_EQ(cfg->channel, "vcan0");
  EXPECT_FALSE(cfg->filters.has_value());
  EXPECT_FALSE(cfg->error_mask.has_value());
  EXPECT_FALSE(cfg->loopback.has_value());
  EXPECT_FALSE(cfg->recv_own_msgs.has_value());
  EXPECT_FALSE(cfg->join_filters.has_value());
  EXPECT_FALSE(cfg->nonblocking);
  EXPECT_EQ(cfg->read_timeout.count(), 0);
  EXPECT_EQ(cfg->write_timeout.count(), 0);
}

TEST_F(SocketConfigTest, ReadsEveryKey) {
  ASSERT_TRUE(loader().LoadFromString(
      "[can]\n"
      "channel=can0\n"
      "filters=123:7FF\n"
      "error_mask=0x1FFFFFFF\n"
      "loopback=false\n"
      "recv_own_msgs=true\n"
      "join_filters=true\n"
      "nonblocking=true\n"
      "read_timeout_ms=250\n"
      "write_timeout_ms=1000\n").ok());

  auto cfg = LoadSocketConfig(loader());
  ASSERT_TRUE(cfg.ok()) << cfg.status();
  EXPECT_EQ(cfg->channel, "can0");
  ASSERT_TRUE(cfg->filters.has_value());
  ASSERT_EQ(cfg->filters->size(), 1u);
  EXPECT_EQ(cfg->filters->front().id, 0x123u);
  EXPECT_EQ(cfg->error_mask, 0x1FFFFFFFu);
  EXPECT_EQ(cfg->loopback, false);
  EXPECT_EQ(cfg->recv_own_msgs, true);
  EXPECT_EQ(cfg->join_filters, true);
  EXPECT_TRUE(cfg->nonblocking);
  EXPECT_EQ(cfg->read_timeout.count(), 250);
  EXPECT_EQ(cfg->write_timeout.count(), 1000);
}

TEST_F(SocketConfigTest, EmptyFiltersKeyMeansReceiveNothing) {
  ASSERT_TRUE(loader().LoadFromString("[can]\nfilters=\n").ok());
  auto cfg = LoadSocketConfig(loader());
  ASSERT_TRUE(cfg.ok());
  ASSERT_TRUE(cfg->filters.has_value());
  EXPECT_TRUE(cfg->filters->empty());
}

TEST_F(SocketConfigTest, BadValuesAreReported) {
  ASSERT_TRUE(loader().LoadFromString("[can]\nloopback=maybe\n").ok());
  EXPECT_EQ(LoadSocketConfig(loader()).status().code(), absl::StatusCode::kInvalidArgument);

  loader().Clear();
  ASSERT_TRUE(loader().LoadFromString("[can]\nread_timeout_ms=-1\n").ok());
  EXPECT_EQ(LoadSocketConfig(loader()).status().code(), absl::StatusCode::kInvalidArgument);

  loader().Clear();
  ASSERT_TRUE(loader().LoadFromString("[can]\nfilters=zz\n").ok());
  EXPECT_FALSE(LoadSocketConfig(loader()).ok());
}

class ApplySocketConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_SEQPACKET, 0, fds), 0);
    sock_ = bus::CanSocket::FromFd(fds[0]);
    peer_ = fds[1];
  }
  void TearDown() override { ::close(peer_); }

  bus::CanSocket sock_ = bus::CanSocket::FromFd(-1);
  int peer_ = -1;
};

TEST_F(ApplySocketConfigTest, GenericOptionsOnly) {
  SocketConfig cfg;
  cfg.nonblocking   = true;
  cfg.read_timeout  = std::chrono::milliseconds(100);
  cfg.write_timeout = std::chrono::milliseconds(100);
  ASSERT_TRUE(ApplySocketConfig(sock_, cfg).ok());
  EXPECT_NE(::fcntl(sock_.fd(), F_GETFL) & O_NONBLOCK, 0);
}

TEST_F(ApplySocketConfigTest, CanOptionFailureStopsApply) {
  SocketConfig cfg;
  cfg.loopback    = false;
  cfg.nonblocking = true;
  auto st = ApplySocketConfig(sock_, cfg);
  ASSERT_FALSE(st.ok());
  EXPECT_EQ(bus::GetFailure(st), bus::Failure::kIo);
  // nothing after the failing option was applied
  EXPECT_EQ(::fcntl(sock_.fd(), F_GETFL) & O_NONBLOCK, 0);
}

}  // namespace
}  // namespace sockcan::config
