#include "bus/filter.hpp"

#include <vector>

#include <gtest/gtest.h>

namespace sockcan::bus {
namespace {

Frame frameWithId(uint32_t id, bool rtr = false) {
    auto frame = Frame::Create(id, {}, rtr, false);
    EXPECT_TRUE(frame.ok()) << frame.status();
    return *frame;
}

TEST(FilterTest, IdAndMaskMatching) {
    const Filter f{0x100, 0x7FF};
    EXPECT_TRUE(f.Matches(frameWithId(0x100)));
    EXPECT_FALSE(f.Matches(frameWithId(0x200)));
    EXPECT_FALSE(f.Matches(frameWithId(0x101)));
}

TEST(FilterTest, MaskSelectsBits) {
    const Filter group{0x120, 0x7F0};
    EXPECT_TRUE(group.Matches(frameWithId(0x120)));
    EXPECT_TRUE(group.Matches(frameWithId(0x12F)));
    EXPECT_FALSE(group.Matches(frameWithId(0x130)));

    const Filter everything{0, 0};
    EXPECT_TRUE(everything.Matches(frameWithId(0x1FFFFFFF)));
}

TEST(FilterTest, AnyFilterAcceptsByDefault) {
    const std::vector<Filter> filters{{0x100, 0x7FF}, {0x200, 0x7FF}};
    EXPECT_TRUE(Accepts(filters, frameWithId(0x100)));
    EXPECT_TRUE(Accepts(filters, frameWithId(0x200)));
    EXPECT_FALSE(Accepts(filters, frameWithId(0x300)));
}

TEST(FilterTest, JoinedFiltersMustAllMatch) {
    const std::vector<Filter> contradictory{{0x100, 0x7FF}, {0x200, 0x7FF}};
    EXPECT_FALSE(Accepts(contradictory, frameWithId(0x100), true));
    EXPECT_FALSE(Accepts(contradictory, frameWithId(0x200), true));

    const std::vector<Filter> narrowing{{0x100, 0x700}, {0x023, 0x0FF}};
    EXPECT_TRUE(Accepts(narrowing, frameWithId(0x123), true));
    EXPECT_FALSE(Accepts(narrowing, frameWithId(0x223), true));
}

TEST(FilterTest, EmptyListAcceptsNothing) {
    EXPECT_FALSE(Accepts({}, frameWithId(0x100)));
    EXPECT_FALSE(Accepts({}, frameWithId(0x100), true));
}

TEST(FilterTest, ExactStandardId) {
    const Filter f = Filter::Exact(0x123);
    EXPECT_TRUE(f.Matches(frameWithId(0x123)));
    EXPECT_FALSE(f.Matches(frameWithId(0x124)));
    EXPECT_FALSE(f.Matches(frameWithId(0x123, true)));

    // same numeric id in extended format is a different identifier
    auto extended = Frame::Parse("00000123#");
    ASSERT_TRUE(extended.ok());
    EXPECT_FALSE(f.Matches(*extended));
}

TEST(FilterTest, ExactExtendedId) {
    const Filter f = Filter::Exact(0x18DAF110);
    EXPECT_TRUE(f.Matches(frameWithId(0x18DAF110)));
    EXPECT_FALSE(f.Matches(frameWithId(0x18DAF111)));
    EXPECT_FALSE(f.Matches(frameWithId(0x110)));
}

TEST(FilterTest, KernelLayout) {
    const can_filter raw = Filter{0x100, 0x7FF}.ToKernel();
    EXPECT_EQ(raw.can_id, 0x100u);
    EXPECT_EQ(raw.can_mask, 0x7FFu);
}

}  // namespace
}  // namespace sockcan::bus
