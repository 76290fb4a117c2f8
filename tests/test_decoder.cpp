#include "decoder.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace {

const auto kReadTime = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));

DecodedValue decodeOk(const RegisterDescriptor& reg, const std::vector<uint16_t>& words) {
    DecodeResult result = Decoder::decode(reg, words, kReadTime);
    EXPECT_TRUE(std::holds_alternative<DecodedValue>(result))
        << describe(std::get<PollError>(result));
    return std::get<DecodedValue>(result);
}

} // namespace

TEST(DecoderTest, S32HighWordContributesUpperBits) {
    auto reg = makeRegister("energy", 0x200, DecodeRule::S32);
    EXPECT_EQ(decodeOk(reg, {0x0001, 0x0000}).raw, 65536);
}

TEST(DecoderTest, S32SignAppliesToComposedValue) {
    auto reg = makeRegister("energy", 0x200, DecodeRule::S32);
    EXPECT_EQ(decodeOk(reg, {0xFFFF, 0xFFFE}).raw, -2);
    // A low word with its top bit set is not negative on its own.
    EXPECT_EQ(decodeOk(reg, {0x0000, 0x8000}).raw, 32768);
}

TEST(DecoderTest, U32ComposesWithoutSign) {
    auto reg = makeRegister("counter", 10, DecodeRule::U32);
    EXPECT_EQ(decodeOk(reg, {0xFFFF, 0xFFFF}).raw, 4294967295LL);
}

TEST(DecoderTest, S16IsTwosComplement) {
    auto reg = makeRegister("temp", 1, DecodeRule::S16);
    EXPECT_EQ(decodeOk(reg, {0xFFFF}).raw, -1);
    EXPECT_EQ(decodeOk(reg, {0x8000}).raw, -32768);
    EXPECT_EQ(decodeOk(reg, {0x7FFF}).raw, 32767);
}

TEST(DecoderTest, U16IsDirect) {
    auto reg = makeRegister("hours", 1, DecodeRule::U16);
    EXPECT_EQ(decodeOk(reg, {0xFFFF}).raw, 65535);
}

TEST(DecoderTest, ScaleAppliedAfterSignIsDecimalExact) {
    auto reg = makeRegister("temp", 1, DecodeRule::S16, "0.1", "°C");
    DecodedValue value = decodeOk(reg, {static_cast<uint16_t>(-15)});
    ASSERT_NE(value.number(), nullptr);
    EXPECT_EQ(value.number()->toString(), "-1.5");
    EXPECT_EQ(value.number()->toDouble(), -1.5);
    EXPECT_EQ(*value.number(), (DecimalValue{-15, 1}));
}

TEST(DecoderTest, ScaleKeepsConfiguredDecimals) {
    auto reg = makeRegister("energy_total", 0x200, DecodeRule::S32, "0.01", "kWh");
    DecodedValue value = decodeOk(reg, {0x0000, 0x2710});
    EXPECT_EQ(value.number()->toString(), "100.00");
    EXPECT_EQ(value.number()->toDouble(), 100.0);
    EXPECT_EQ(value.text(), "100.00 kWh");
}

TEST(DecoderTest, IntegerMultiplierScale) {
    auto reg = makeRegister("power", 78, DecodeRule::U16, "10", "W");
    EXPECT_EQ(decodeOk(reg, {123}).number()->toString(), "1230");
}

TEST(DecoderTest, SmallFractionsArePadded) {
    EXPECT_EQ((DecimalValue{5, 2}).toString(), "0.05");
    EXPECT_EQ((DecimalValue{-5, 2}).toString(), "-0.05");
    EXPECT_EQ((DecimalValue{0, 1}).toString(), "0.0");
    EXPECT_EQ((DecimalValue{235, 1}).toDouble(), 23.5);
}

TEST(DecoderTest, DecodingIsIdempotent) {
    auto reg = makeRegister("energy", 0x200, DecodeRule::S32, "0.01");
    EXPECT_EQ(decodeOk(reg, {0x1234, 0x5678}), decodeOk(reg, {0x1234, 0x5678}));
}

TEST(DecoderTest, WordCountMismatchIsMalformedPayload) {
    auto reg = makeRegister("energy", 0x200, DecodeRule::S32);
    DecodeResult result = Decoder::decode(reg, {0x0001}, kReadTime);
    ASSERT_TRUE(std::holds_alternative<PollError>(result));
    EXPECT_EQ(std::get<PollError>(result).kind, ErrorKind::MalformedPayload);

    result = Decoder::decode(makeRegister("temp", 1, DecodeRule::S16), {}, kReadTime);
    ASSERT_TRUE(std::holds_alternative<PollError>(result));
    EXPECT_EQ(std::get<PollError>(result).kind, ErrorKind::MalformedPayload);
}

TEST(DecoderTest, StatusCodeMapsToLabel) {
    auto reg = makeStatusRegister("wp_status", 1999, {{1, "Bereit"}, {8, "Heizbetrieb"}});
    DecodedValue value = decodeOk(reg, {8});
    ASSERT_NE(value.label(), nullptr);
    EXPECT_EQ(*value.label(), "Heizbetrieb");
    EXPECT_EQ(value.raw, 8);
    EXPECT_FALSE(value.last_error.has_value());
}

TEST(DecoderTest, UnmappedStatusCodeYieldsPlaceholder) {
    StatusTable table;
    for (int code = 1; code <= 10; ++code) {
        table[code] = "state " + std::to_string(code);
    }
    auto reg = makeStatusRegister("wp_status", 1999, table);
    DecodedValue value = decodeOk(reg, {99});
    EXPECT_EQ(*value.label(), "unknown (code 99)");
    ASSERT_TRUE(value.last_error.has_value());
    EXPECT_EQ(value.last_error->kind, ErrorKind::UnknownStatusCode);
    EXPECT_EQ(value.last_error->code, 99);
    EXPECT_FALSE(value.stale);
}

TEST(DecoderTest, ValueOutsideValidRangeIsRejected) {
    auto reg = makeRegister("pump", 203, DecodeRule::U16, "0.01", "%");
    reg.valid_min = 0;
    reg.valid_max = 10000;
    EXPECT_TRUE(std::holds_alternative<DecodedValue>(Decoder::decode(reg, {10000}, kReadTime)));

    DecodeResult result = Decoder::decode(reg, {10001}, kReadTime);
    ASSERT_TRUE(std::holds_alternative<PollError>(result));
    EXPECT_EQ(std::get<PollError>(result).kind, ErrorKind::InvalidValue);
}

TEST(DecoderTest, SliceWordsPicksDescriptorOffset) {
    auto first = makeRegister("a", 100, DecodeRule::U16);
    auto second = makeRegister("b", 102, DecodeRule::S32);
    RequestGroup group{100, 4, {first, second}};
    std::vector<uint16_t> words{1, 2, 3, 4};

    EXPECT_EQ(Decoder::sliceWords(group, words, first), (std::vector<uint16_t>{1}));
    EXPECT_EQ(Decoder::sliceWords(group, words, second), (std::vector<uint16_t>{3, 4}));

    std::vector<uint16_t> short_response{1, 2, 3};
    EXPECT_EQ(Decoder::sliceWords(group, short_response, second), (std::vector<uint16_t>{3}));
}
