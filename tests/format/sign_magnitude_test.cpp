// =============================================================================
// bsr - Sign-Magnitude Codec Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <limits>

#include "bsr/format/sign_magnitude.h"

namespace bsr::format::test {

TEST(SignMagnitudeTest, DecodesPositiveValues) {
    EXPECT_EQ(decodeSignMagnitude(0).value(), 0);
    EXPECT_EQ(decodeSignMagnitude(7).value(), 7);
    EXPECT_EQ(decodeSignMagnitude(kMagnitudeMask).value(),
              std::numeric_limits<std::int64_t>::max());
}

TEST(SignMagnitudeTest, DecodesNegativeValues) {
    EXPECT_EQ(decodeSignMagnitude(kSignBit | 7).value(), -7);
    EXPECT_EQ(decodeSignMagnitude(kSignBit | kMagnitudeMask).value(),
              -std::numeric_limits<std::int64_t>::max());
}

TEST(SignMagnitudeTest, NegativeZeroDecodesToZero) {
    EXPECT_EQ(decodeSignMagnitude(kSignBit).value(), 0);
    EXPECT_EQ(decodeSignMagnitude(kSignBit).value(), decodeSignMagnitude(0).value());
}

TEST(SignMagnitudeTest, IsNotTwosComplement) {
    // All-ones is -(2^63 - 1) here, not -1
    EXPECT_EQ(decodeSignMagnitude(~0ULL).value(), -std::numeric_limits<std::int64_t>::max());
}

TEST(SignMagnitudeTest, EncodeRejectsInt64Min) {
    auto raw = encodeSignMagnitude(std::numeric_limits<std::int64_t>::min());
    ASSERT_FALSE(raw.has_value());
    EXPECT_EQ(raw.error().code(), ErrorCode::kIntegerOverflow);
}

TEST(SignMagnitudeTest, EncodesZeroWithoutSignBit) {
    EXPECT_EQ(encodeSignMagnitude(0).value(), 0U);
    EXPECT_EQ(encodeSignMagnitude(-7).value(), kSignBit | 7);
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(SignMagnitudeProperty, EncodeThenDecodeIsIdentity, (std::int64_t value)) {
    RC_PRE(value != std::numeric_limits<std::int64_t>::min());
    auto raw = encodeSignMagnitude(value);
    RC_ASSERT(raw.has_value());
    RC_ASSERT(decodeSignMagnitude(*raw).value() == value);
}

RC_GTEST_PROP(SignMagnitudeProperty, SignBitNegatesMagnitude, (std::uint64_t raw)) {
    const std::uint64_t magnitude = raw & kMagnitudeMask;
    const auto positive = decodeSignMagnitude(magnitude).value();
    const auto negative = decodeSignMagnitude(magnitude | kSignBit).value();
    RC_ASSERT(positive == static_cast<std::int64_t>(magnitude));
    RC_ASSERT(negative == -positive);
}

}  // namespace bsr::format::test
