#include "util/json_utils.hpp"

#include <array>
#include <chrono>

#include <gtest/gtest.h>

namespace sockcan::util::json {
namespace {

TEST(JsonUtilsTest, HexDump) {
  const std::array<uint8_t, 4> bytes{0xDE, 0xAD, 0x0B, 0xEF};
  EXPECT_EQ(ToHex(bytes.data(), bytes.size()), "DE AD 0B EF");
  EXPECT_EQ(ToHex(bytes.data(), 0), "");
}

TEST(JsonUtilsTest, DataFrame) {
  auto frame = bus::Frame::Create(0x18DAF110, std::array<uint8_t, 2>{0x02, 0x10});
  ASSERT_TRUE(frame.ok());
  const bus::Timestamp ts{std::chrono::microseconds(1700000000123456)};

  const sockcan_json j = BuildJson(*frame, ts, "vcan0");
  EXPECT_EQ(j["ts"].get<int64_t>(), 1700000000123456);
  EXPECT_EQ(j["bus"], "vcan0");
  EXPECT_EQ(j["id"].get<uint32_t>(), 0x18DAF110u);
  EXPECT_EQ(j["extended"], true);
  EXPECT_EQ(j["rtr"], false);
  EXPECT_EQ(j["dlc"], 2);
  EXPECT_EQ(j["raw"], "02 10");
  EXPECT_FALSE(j.contains("error"));
  EXPECT_FALSE(j.contains("decode_failure"));
}

TEST(JsonUtilsTest, DecodedErrorFrame) {
  auto frame = bus::Frame::Create(0x002, std::array<uint8_t, 1>{7}, false, true);
  ASSERT_TRUE(frame.ok());
  const sockcan_json j = BuildJson(*frame, bus::Timestamp{}, "can0");
  EXPECT_EQ(j["error"], "arbitration lost after 7 bits");
}

TEST(JsonUtilsTest, UndecodableErrorFrame) {
  auto frame = bus::Frame::Create(0x004, {}, false, true);
  ASSERT_TRUE(frame.ok());
  const sockcan_json j = BuildJson(*frame, bus::Timestamp{}, "can0");
  EXPECT_FALSE(j.contains("error"));
  EXPECT_EQ(j["decode_failure"], "NotEnoughData");
}

}  // namespace
}  // namespace sockcan::util::json
