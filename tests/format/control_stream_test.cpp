// =============================================================================
// bsr - Control Stream Decoder Tests
// =============================================================================

#include <gtest/gtest.h>
#include <rapidcheck.h>
#include <rapidcheck/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "bsr/format/control_stream.h"
#include "bsr/format/sign_magnitude.h"
#include "support/patch_builder.h"

namespace bsr::format::test {

using bsr::test::encodeControlRecords;

TEST(ControlStreamTest, RejectsLengthNotMultipleOfRecordSize) {
    ByteBuffer bytes(23, 0);
    auto stream = ControlStream::create(bytes);
    ASSERT_FALSE(stream.has_value());
    EXPECT_EQ(stream.error().code(), ErrorCode::kTruncatedControlStream);
    EXPECT_NE(stream.error().message().find("23"), std::string::npos);
}

TEST(ControlStreamTest, EmptyStreamHasNoRecords) {
    ByteBuffer bytes;
    auto stream = ControlStream::create(bytes);
    ASSERT_TRUE(stream.has_value());
    EXPECT_TRUE(stream->empty());
    EXPECT_EQ(stream->size(), 0U);
    EXPECT_TRUE(stream->cursor().atEnd());
    EXPECT_EQ(stream->begin(), stream->end());
}

TEST(ControlStreamTest, DecodesFieldsInOrder) {
    ByteBuffer bytes(kControlRecordSize, 0);
    storeLE64(5, bytes.data());
    storeLE64(0, bytes.data() + 8);
    storeLE64(kSignBit | 7, bytes.data() + 16);

    auto record = decodeControlRecord(bytes);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->diffLength, 5U);
    EXPECT_EQ(record->extraLength, 0U);
    EXPECT_EQ(record->offsetDelta, -7);
}

TEST(ControlStreamTest, DecodeRecordRejectsShortInput) {
    ByteBuffer bytes(kControlRecordSize - 1, 0);
    auto record = decodeControlRecord(bytes);
    ASSERT_FALSE(record.has_value());
    EXPECT_EQ(record.error().code(), ErrorCode::kTruncatedControlStream);
}

TEST(ControlStreamTest, YieldsTwoRecordsFromFortyEightBytes) {
    const std::vector<ControlRecord> expected = {{10, 2, 3}, {0, 4, -100}};
    auto bytes = encodeControlRecords(expected);
    ASSERT_EQ(bytes.size(), 48U);

    auto stream = ControlStream::create(bytes);
    ASSERT_TRUE(stream.has_value());
    EXPECT_EQ(stream->size(), 2U);

    auto cursor = stream->cursor();
    EXPECT_EQ(cursor.remaining(), 2U);
    EXPECT_EQ(cursor.next().value(), expected[0]);
    EXPECT_EQ(cursor.recordIndex(), 1U);
    EXPECT_EQ(cursor.next().value(), expected[1]);
    EXPECT_TRUE(cursor.atEnd());
    EXPECT_EQ(cursor.remaining(), 0U);
}

TEST(ControlStreamTest, ExhaustedCursorReportsInvalidState) {
    auto bytes = encodeControlRecords({{1, 1, 1}});
    auto stream = ControlStream::create(bytes);
    ASSERT_TRUE(stream.has_value());

    auto cursor = stream->cursor();
    ASSERT_TRUE(cursor.next().has_value());
    auto extra = cursor.next();
    ASSERT_FALSE(extra.has_value());
    EXPECT_EQ(extra.error().code(), ErrorCode::kInvalidState);
}

TEST(ControlStreamTest, SequenceIsRestartable) {
    const std::vector<ControlRecord> expected = {{1, 2, 3}, {4, 5, -6}, {7, 8, 0}};
    auto bytes = encodeControlRecords(expected);
    auto stream = ControlStream::create(bytes);
    ASSERT_TRUE(stream.has_value());

    // Abandon the first pass midway
    auto partial = stream->cursor();
    ASSERT_TRUE(partial.next().has_value());

    std::vector<ControlRecord> firstPass;
    for (const auto& record : *stream) {
        firstPass.push_back(record);
    }
    std::vector<ControlRecord> secondPass;
    for (const auto& record : *stream) {
        secondPass.push_back(record);
    }
    EXPECT_EQ(firstPass, expected);
    EXPECT_EQ(secondPass, expected);
}

TEST(ControlStreamTest, DecodeAllCollectsEveryRecord) {
    const std::vector<ControlRecord> expected = {{0, 0, 0}, {1U << 20, 0, -1}};
    auto bytes = encodeControlRecords(expected);
    auto stream = ControlStream::create(bytes);
    ASSERT_TRUE(stream.has_value());

    auto records = stream->decodeAll();
    ASSERT_TRUE(records.has_value());
    EXPECT_EQ(*records, expected);
}

TEST(ControlStreamTest, DefaultConstructedStreamIsEmpty) {
    ControlStream stream;
    EXPECT_TRUE(stream.empty());
    EXPECT_EQ(stream.byteLength(), 0U);
    EXPECT_TRUE(stream.decodeAll().value().empty());
}

TEST(ControlStreamTest, IteratorThrowsWithRecordContext) {
    // A bare iterator over a partial record bypasses ControlStream validation
    ByteBuffer bytes = encodeControlRecords({{1, 2, 3}});
    bytes.resize(bytes.size() + kControlRecordSize - 1, 0);
    ControlStream::Iterator second(bytes, kControlRecordSize);

    try {
        static_cast<void>(*second);
        FAIL() << "expected FormatError";
    } catch (const FormatError& ex) {
        EXPECT_EQ(ex.code(), ErrorCode::kTruncatedControlStream);
        ASSERT_TRUE(ex.context().has_value());
        EXPECT_EQ(ex.context()->streamName, "control");
        EXPECT_EQ(ex.context()->recordIndex, std::optional<std::uint64_t>(1));
        EXPECT_EQ(ex.context()->byteOffset, std::optional<std::uint64_t>(kControlRecordSize));
    }
}

// =============================================================================
// Properties
// =============================================================================

RC_GTEST_PROP(ControlStreamProperty, RecordCountIsLengthOverRecordSize, ()) {
    const auto length = *rc::gen::inRange<std::size_t>(0, 24 * 16);
    ByteBuffer bytes(length, 0xAB);
    auto stream = ControlStream::create(bytes);
    if (length % kControlRecordSize == 0) {
        RC_ASSERT(stream.has_value());
        RC_ASSERT(stream->size() == length / kControlRecordSize);
    } else {
        RC_ASSERT(!stream.has_value());
        RC_ASSERT(stream.error().code() == ErrorCode::kTruncatedControlStream);
    }
}

RC_GTEST_PROP(ControlStreamProperty, CursorAndIteratorAgree, ()) {
    const auto records = *rc::gen::container<std::vector<ControlRecord>>(rc::gen::build<ControlRecord>(
        rc::gen::set(&ControlRecord::diffLength),
        rc::gen::set(&ControlRecord::extraLength),
        rc::gen::set(&ControlRecord::offsetDelta,
                     rc::gen::inRange<std::int64_t>(-(1LL << 40), 1LL << 40))));
    auto bytes = encodeControlRecords(records);
    auto stream = ControlStream::create(bytes);
    RC_ASSERT(stream.has_value());

    std::vector<ControlRecord> viaIterator(stream->begin(), stream->end());
    RC_ASSERT(viaIterator == records);
    RC_ASSERT(stream->decodeAll().value() == records);
}

}  // namespace bsr::format::test
