// =============================================================================
// bsr - Control Stream Decoder
// =============================================================================
// Decodes the decompressed control stream of a bsdiff patch.
//
// This module provides:
// - ControlRecord: one copy/skip operation
// - ControlRecordCursor: explicit forward cursor (position + borrowed buffer)
// - ControlStream: validated view with restartable iteration
//
// Record layout (24 bytes, all little-endian u64):
//   [0..8)   diff length
//   [8..16)  extra length
//   [16..24) offset delta (sign-magnitude)
//
// Usage:
//   auto stream = ControlStream::create(decompressedBytes);
//   if (!stream) { ... }
//   for (const ControlRecord& record : *stream) {
//       // apply record...
//   }
//
// Thread Safety:
// - ControlStream is an immutable view and may be shared
// - Each cursor/iterator holds its own position
// =============================================================================

#ifndef BSR_FORMAT_CONTROL_STREAM_H
#define BSR_FORMAT_CONTROL_STREAM_H

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <vector>

#include "bsr/common/error.h"
#include "bsr/common/types.h"

namespace bsr::format {

/// @brief Size of one encoded control record.
inline constexpr std::size_t kControlRecordSize = 24;

// =============================================================================
// ControlRecord Structure
// =============================================================================

/// @brief One decoded control record.
struct ControlRecord {
    /// @brief Bytes to produce by adding old-file bytes and diff-stream bytes.
    std::uint64_t diffLength = 0;

    /// @brief Bytes to copy verbatim from the extra stream.
    std::uint64_t extraLength = 0;

    /// @brief Adjustment applied to the old-file read position afterwards.
    std::int64_t offsetDelta = 0;

    [[nodiscard]] constexpr bool operator==(const ControlRecord&) const noexcept = default;
};

/// @brief Decode a single record from the first 24 bytes of a buffer.
/// @return Decoded record, kTruncatedControlStream if fewer than 24 bytes,
///         or kIntegerOverflow from the offset field.
[[nodiscard]] Result<ControlRecord> decodeControlRecord(ByteSpan bytes);

/// @brief Validate that a decompressed control stream holds whole records.
/// @return Success, or kTruncatedControlStream naming the length and multiple.
[[nodiscard]] VoidResult validateControlStreamLength(std::size_t byteLength);

// =============================================================================
// ControlRecordCursor Class
// =============================================================================

/// @brief Forward-only cursor over a validated control stream.
/// @note Borrows the buffer; the owner must outlive the cursor.
class ControlRecordCursor {
public:
    /// @brief Construct a cursor positioned at the first record.
    /// @param stream Buffer whose length is a multiple of kControlRecordSize.
    explicit ControlRecordCursor(ByteSpan stream) noexcept : stream_(stream) {}

    /// @brief Check if every record has been consumed.
    [[nodiscard]] bool atEnd() const noexcept { return position_ >= stream_.size(); }

    /// @brief Byte offset of the next record.
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

    /// @brief Index of the next record.
    [[nodiscard]] std::size_t recordIndex() const noexcept {
        return position_ / kControlRecordSize;
    }

    /// @brief Number of records not yet consumed.
    [[nodiscard]] std::size_t remaining() const noexcept {
        return atEnd() ? 0 : (stream_.size() - position_) / kControlRecordSize;
    }

    /// @brief Decode the next record and advance.
    /// @return Record, kInvalidState when already at end, or a decode error.
    [[nodiscard]] Result<ControlRecord> next();

private:
    ByteSpan stream_;
    std::size_t position_ = 0;
};

// =============================================================================
// ControlStream Class
// =============================================================================

/// @brief Validated, read-only view of a decompressed control stream.
/// @note Finite, restartable: every begin()/cursor() starts from record 0.
class ControlStream {
public:
    /// @brief Input iterator yielding decoded records.
    /// @note Dereferencing throws FormatError if a record fails to decode.
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using iterator_concept = std::input_iterator_tag;
        using value_type = ControlRecord;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = ControlRecord;

        Iterator() = default;

        Iterator(ByteSpan stream, std::size_t position) noexcept
            : stream_(stream), position_(position) {}

        [[nodiscard]] ControlRecord operator*() const;

        Iterator& operator++() noexcept {
            position_ += kControlRecordSize;
            return *this;
        }

        Iterator operator++(int) noexcept {
            Iterator previous = *this;
            ++*this;
            return previous;
        }

        [[nodiscard]] bool operator==(const Iterator& other) const noexcept {
            return position_ == other.position_;
        }

    private:
        ByteSpan stream_;
        std::size_t position_ = 0;
    };

    /// @brief Empty stream with no records.
    ControlStream() = default;

    /// @brief Validate a decompressed control stream and wrap it.
    /// @param decompressed Decompressed control bytes (borrowed).
    /// @return View, or kTruncatedControlStream if the length is not a
    ///         multiple of kControlRecordSize.
    [[nodiscard]] static Result<ControlStream> create(ByteSpan decompressed);

    /// @brief Number of records.
    [[nodiscard]] std::size_t size() const noexcept { return data_.size() / kControlRecordSize; }

    /// @brief Check if the stream holds no records.
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    /// @brief Length of the underlying decompressed bytes.
    [[nodiscard]] std::size_t byteLength() const noexcept { return data_.size(); }

    /// @brief Fresh cursor positioned at the first record.
    [[nodiscard]] ControlRecordCursor cursor() const noexcept { return ControlRecordCursor(data_); }

    [[nodiscard]] Iterator begin() const noexcept { return Iterator(data_, 0); }
    [[nodiscard]] Iterator end() const noexcept { return Iterator(data_, data_.size()); }

    /// @brief Decode every record into a vector.
    [[nodiscard]] Result<std::vector<ControlRecord>> decodeAll() const;

private:
    explicit ControlStream(ByteSpan data) noexcept : data_(data) {}

    ByteSpan data_;
};

}  // namespace bsr::format

#endif  // BSR_FORMAT_CONTROL_STREAM_H
