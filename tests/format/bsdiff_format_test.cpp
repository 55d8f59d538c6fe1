// =============================================================================
// bsr - Magic and Header Parsing Tests
// =============================================================================
// Covers the three accepted magic patterns, compressor id extraction and
// rejection of corrupted magics.
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <vector>

#include "bsr/format/bsdiff_format.h"
#include "support/patch_builder.h"

namespace bsr::format::test {

using bsr::test::buildHeader;
using bsr::test::bytesOf;
using bsr::test::v2Magic;
using bsr::test::v3Magic;

namespace gen {

[[nodiscard]] rc::Gen<CompressorId> compressorId() {
    return rc::gen::element(CompressorId::kBzip2, CompressorId::kBrotli);
}

}  // namespace gen

// =============================================================================
// Magic Decoding
// =============================================================================

TEST(DecodeMagicTest, AcceptsLegacyMagic) {
    auto info = decodeMagic(bytesOf("BSDIFF40"));
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->variant, FormatVariant::kLegacy);
    EXPECT_EQ(info->controlCompressor, CompressorId::kBzip2);
    EXPECT_EQ(info->diffCompressor, CompressorId::kBzip2);
    EXPECT_EQ(info->extraCompressor, CompressorId::kBzip2);
}

TEST(DecodeMagicTest, ExtractsV2Compressors) {
    const std::vector<std::uint8_t> magic = {'B', 'S', 'D', 'F', '2', 0x01, 0x02, 0x01};
    auto info = decodeMagic(ByteSpan(magic));
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->variant, FormatVariant::kV2);
    EXPECT_EQ(info->controlCompressor, CompressorId::kBzip2);
    EXPECT_EQ(info->diffCompressor, CompressorId::kBrotli);
    EXPECT_EQ(info->extraCompressor, CompressorId::kBzip2);
    EXPECT_EQ(info->compressorFor(StreamKind::kDiff), CompressorId::kBrotli);
}

TEST(DecodeMagicTest, AcceptsV3WithAnyByteFour) {
    for (unsigned byte4 : {0x00U, 0x41U, 0xFFU}) {
        auto info = decodeMagic(v3Magic(static_cast<std::uint8_t>(byte4), CompressorId::kBrotli,
                                         CompressorId::kBrotli, CompressorId::kBzip2));
        ASSERT_TRUE(info.has_value()) << "byte4=" << byte4;
        EXPECT_EQ(info->variant, FormatVariant::kV3);
        EXPECT_EQ(info->controlCompressor, CompressorId::kBrotli);
        EXPECT_EQ(info->extraCompressor, CompressorId::kBzip2);
    }
}

TEST(DecodeMagicTest, RejectsUnknownCompressorId) {
    const std::vector<std::uint8_t> magic = {'B', 'S', 'D', 'F', '2', 0x01, 0x03, 0x01};
    auto info = decodeMagic(ByteSpan(magic));
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().code(), ErrorCode::kInvalidCompressorId);
}

TEST(DecodeMagicTest, RejectsZeroCompressorId) {
    const std::vector<std::uint8_t> magic = {'B', 'S', 'D', 'F', '2', 0x00, 0x01, 0x01};
    auto info = decodeMagic(ByteSpan(magic));
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().code(), ErrorCode::kInvalidCompressorId);
}

TEST(DecodeMagicTest, RejectsUnrelatedMagic) {
    auto info = decodeMagic(bytesOf("ENDSLEY/"));
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().code(), ErrorCode::kMalformedMagic);
}

TEST(DecodeMagicTest, RejectsShortBuffer) {
    auto info = decodeMagic(bytesOf("BSDIF"));
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().code(), ErrorCode::kHeaderTooShort);
}

// =============================================================================
// Header Parsing
// =============================================================================

TEST(ParseHeaderTest, ReadsLittleEndianSizes) {
    auto bytes = buildHeader(kLegacyMagic, 0x0102, 0x0304, 0x0506070809ULL);
    auto header = parseHeader(bytes);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->magic, kLegacyMagic);
    EXPECT_EQ(header->compressedControlSize, 0x0102U);
    EXPECT_EQ(header->compressedDiffSize, 0x0304U);
    EXPECT_EQ(header->newFileSize, 0x0506070809ULL);
    EXPECT_EQ(header->variant(), FormatVariant::kLegacy);

    auto magicBytes = header->magicBytes();
    EXPECT_EQ(ByteBuffer(magicBytes.begin(), magicBytes.end()), bytesOf("BSDIFF40"));
}

TEST(ParseHeaderTest, RejectsThirtyOneBytes) {
    auto bytes = buildHeader(kLegacyMagic, 1, 1, 1);
    bytes.pop_back();
    auto header = parseHeader(bytes);
    ASSERT_FALSE(header.has_value());
    EXPECT_EQ(header.error().code(), ErrorCode::kHeaderTooShort);
}

TEST(ParseHeaderTest, PropagatesMagicErrors) {
    auto bytes = buildHeader(magicFromLiteral("BSDIFF41"), 1, 1, 1);
    auto header = parseHeader(bytes);
    ASSERT_FALSE(header.has_value());
    EXPECT_EQ(header.error().code(), ErrorCode::kMalformedMagic);
    EXPECT_TRUE(isCorruptInput(header.error().code()));
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(DecodeMagicProperty, SingleBitFlipOfLegacyIsRejected, ()) {
    const auto bit = *rc::gen::inRange(0, 64);
    RC_ASSERT(!decodeMagic(kLegacyMagic ^ (1ULL << bit)).has_value());
}

RC_GTEST_PROP(DecodeMagicProperty, SingleBitFlipOfV2IsRejected, ()) {
    const auto magic = v2Magic(*gen::compressorId(), *gen::compressorId(),
                               *gen::compressorId());
    RC_ASSERT(decodeMagic(magic).has_value());

    const auto bit = *rc::gen::inRange(0, 64);
    RC_ASSERT(!decodeMagic(magic ^ (1ULL << bit)).has_value());
}

RC_GTEST_PROP(DecodeMagicProperty, SingleBitFlipOfV3OutsideByteFourIsRejected, ()) {
    const auto byte4 = *rc::gen::arbitrary<std::uint8_t>();
    const auto magic = v3Magic(byte4, *gen::compressorId(), *gen::compressorId(),
                               *gen::compressorId());
    RC_ASSERT(decodeMagic(magic).has_value());

    // Byte 4 occupies bits 24..31 of the big-endian value
    const auto bit = *rc::gen::suchThat(rc::gen::inRange(0, 64),
                                        [](int b) { return b < 24 || b >= 32; });
    RC_ASSERT(!decodeMagic(magic ^ (1ULL << bit)).has_value());
}

RC_GTEST_PROP(DecodeMagicProperty, V3ByteFourIsIgnored, (std::uint8_t byte4)) {
    const auto control = *gen::compressorId();
    const auto diff = *gen::compressorId();
    const auto extra = *gen::compressorId();
    auto info = decodeMagic(v3Magic(byte4, control, diff, extra));
    RC_ASSERT(info.has_value());
    RC_ASSERT(info->variant == FormatVariant::kV3);
    RC_ASSERT(info->controlCompressor == control);
    RC_ASSERT(info->diffCompressor == diff);
    RC_ASSERT(info->extraCompressor == extra);
}

}  // namespace bsr::format::test
