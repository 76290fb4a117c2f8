#include "register_map.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

TEST(ScaleTest, ParsesDecimalLiterals) {
    EXPECT_EQ(Scale::parse("0.1"), (Scale{1, 1}));
    EXPECT_EQ(Scale::parse("0.01"), (Scale{1, 2}));
    EXPECT_EQ(Scale::parse("10"), (Scale{10, 0}));
    EXPECT_EQ(Scale::parse("2.5"), (Scale{25, 1}));
    EXPECT_EQ(Scale::parse(".5"), (Scale{5, 1}));
    EXPECT_TRUE(Scale::parse("1").isUnit());
}

TEST(ScaleTest, RejectsNonPositiveOrMalformed) {
    EXPECT_THROW(Scale::parse("0"), std::invalid_argument);
    EXPECT_THROW(Scale::parse("-0.1"), std::invalid_argument);
    EXPECT_THROW(Scale::parse("1e-1"), std::invalid_argument);
    EXPECT_THROW(Scale::parse(""), std::invalid_argument);
    EXPECT_THROW(Scale::parse("."), std::invalid_argument);
}

TEST(GroupIntoRequestsTest, AdjacentRegistersShareOneRequest) {
    auto groups = groupIntoRequests({makeRegister("a", 10, DecodeRule::U16),
                                     makeRegister("b", 11, DecodeRule::S32),
                                     makeRegister("c", 13, DecodeRule::S16)});
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].start, 10);
    EXPECT_EQ(groups[0].count, 4);
    EXPECT_EQ(groups[0].registers.size(), 3u);
}

TEST(GroupIntoRequestsTest, OverlappingRegistersShareOneRequest) {
    auto groups = groupIntoRequests({makeRegister("wide", 20, DecodeRule::U32),
                                     makeRegister("low_word", 21, DecodeRule::U16)});
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].start, 20);
    EXPECT_EQ(groups[0].count, 2);
}

TEST(GroupIntoRequestsTest, GapSplitsUnlessTolerated) {
    std::vector<RegisterDescriptor> regs{makeRegister("a", 100, DecodeRule::U16),
                                         makeRegister("b", 105, DecodeRule::U16)};
    EXPECT_EQ(groupIntoRequests(regs).size(), 2u);

    auto merged = groupIntoRequests(regs, MAX_READ_REGISTERS, 4);
    ASSERT_EQ(merged.size(), 1u);
    EXPECT_EQ(merged[0].count, 6);

    EXPECT_EQ(groupIntoRequests(regs, MAX_READ_REGISTERS, 3).size(), 2u);
}

TEST(GroupIntoRequestsTest, SpanNeverExceedsMaximumCount) {
    std::vector<RegisterDescriptor> regs;
    for (uint16_t i = 0; i < 10; ++i) {
        regs.push_back(makeRegister("r" + std::to_string(i), i, DecodeRule::U16));
    }
    auto groups = groupIntoRequests(regs, 4);
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].count, 4);
    EXPECT_EQ(groups[1].start, 4);
    EXPECT_EQ(groups[2].count, 2);
}

TEST(GroupIntoRequestsTest, TwoWordRegisterIsNeverSplit) {
    auto groups = groupIntoRequests({makeRegister("a", 0, DecodeRule::U16),
                                     makeRegister("b", 1, DecodeRule::U16),
                                     makeRegister("c", 2, DecodeRule::S32)},
                                    3);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[1].start, 2);
    EXPECT_EQ(groups[1].count, 2);
}

TEST(GroupIntoRequestsTest, OrdersByAddress) {
    auto groups = groupIntoRequests({makeRegister("late", 500, DecodeRule::U16),
                                     makeRegister("early", 5, DecodeRule::U16)});
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].registers[0].key, "early");
    EXPECT_EQ(groups[1].registers[0].key, "late");
}

TEST(GroupIntoRequestsTest, EmptyPlanForNoRegisters) {
    EXPECT_TRUE(groupIntoRequests({}).empty());
}

TEST(RegisterMapTest, DescribeEnabledKeepsMapOrder) {
    auto hidden = makeRegister("hidden", 2, DecodeRule::U16);
    hidden.enabled = false;
    RegisterMap map({makeRegister("z", 9, DecodeRule::U16), hidden, makeRegister("a", 1, DecodeRule::U16)});

    auto enabled = map.describeEnabled();
    ASSERT_EQ(enabled.size(), 2u);
    EXPECT_EQ(enabled[0].key, "z");
    EXPECT_EQ(enabled[1].key, "a");
    EXPECT_EQ(map.size(), 3u);
    ASSERT_NE(map.find("hidden"), nullptr);
    EXPECT_EQ(map.find("missing"), nullptr);
}

TEST(RegisterMapTest, RejectsDuplicateKeys) {
    EXPECT_THROW(RegisterMap({makeRegister("a", 1, DecodeRule::U16), makeRegister("a", 2, DecodeRule::U16)}),
                 std::invalid_argument);
}

TEST(RegisterMapTest, RejectsWordCountNotMatchingRule) {
    auto reg = makeRegister("energy", 1, DecodeRule::S32);
    reg.words = 1;
    EXPECT_THROW(RegisterMap({reg}), std::invalid_argument);

    reg = makeRegister("temp", 1, DecodeRule::S16);
    reg.words = 3;
    EXPECT_THROW(RegisterMap({reg}), std::invalid_argument);
}

TEST(RegisterMapTest, RejectsAddressSpanPastEnd) {
    EXPECT_THROW(RegisterMap({makeRegister("edge", 0xFFFF, DecodeRule::S32)}), std::invalid_argument);
    EXPECT_NO_THROW(RegisterMap({makeRegister("edge", 0xFFFF, DecodeRule::U16)}));
}

TEST(RegisterMapTest, RejectsEnumWithoutTable) {
    EXPECT_THROW(RegisterMap({makeRegister("status", 1, DecodeRule::ENUM)}), std::invalid_argument);
}

TEST(RegisterMapTest, RejectsEmptyValidRange) {
    auto reg = makeRegister("temp", 1, DecodeRule::S16);
    reg.valid_min = 10;
    reg.valid_max = 5;
    EXPECT_THROW(RegisterMap({reg}), std::invalid_argument);
}

TEST(RegisterMapTest, OverridesFlipEnabledFlags) {
    auto hidden = makeRegister("hidden", 2, DecodeRule::U16);
    hidden.enabled = false;
    RegisterMap map({makeRegister("shown", 1, DecodeRule::U16), hidden});

    RegisterMap flipped = map.withOverrides({"hidden"}, {"shown"});
    auto enabled = flipped.describeEnabled();
    ASSERT_EQ(enabled.size(), 1u);
    EXPECT_EQ(enabled[0].key, "hidden");

    EXPECT_THROW(map.withOverrides({"nope"}, {}), std::invalid_argument);
    EXPECT_THROW(map.withOverrides({"shown"}, {"shown"}), std::invalid_argument);
}

TEST(RegisterMapTest, RejectsScaleThatCanOverflow) {
    EXPECT_THROW(RegisterMap({makeRegister("counter", 1, DecodeRule::U32, "10000000000")}), std::invalid_argument);
    EXPECT_THROW(RegisterMap({makeRegister("energy", 1, DecodeRule::S32, "10")}), std::invalid_argument);
    EXPECT_THROW(RegisterMap({makeRegister("power", 1, DecodeRule::U16, "1000000")}), std::invalid_argument);

    EXPECT_NO_THROW(RegisterMap({makeRegister("counter", 1, DecodeRule::U32, "0.001")}));
    EXPECT_NO_THROW(RegisterMap({makeRegister("counter", 1, DecodeRule::U32, "2")}));
    EXPECT_NO_THROW(RegisterMap({makeRegister("power", 1, DecodeRule::U16, "10000")}));
}
