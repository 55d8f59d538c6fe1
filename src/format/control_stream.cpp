// =============================================================================
// bsr - Control Stream Decoder Implementation
// =============================================================================

#include "bsr/format/control_stream.h"

#include <fmt/format.h>

#include "bsr/format/bsdiff_format.h"
#include "bsr/format/sign_magnitude.h"

namespace bsr::format {

Result<ControlRecord> decodeControlRecord(ByteSpan bytes) {
    if (bytes.size() < kControlRecordSize) {
        return makeError<ControlRecord>(
            ErrorCode::kTruncatedControlStream,
            fmt::format("control record needs {} bytes, got {}", kControlRecordSize,
                        bytes.size()));
    }

    auto offsetDelta = decodeSignMagnitude(loadLE64(bytes.data() + 16));
    if (!offsetDelta) {
        return std::unexpected(std::move(offsetDelta.error()));
    }

    ControlRecord record;
    record.diffLength = loadLE64(bytes.data());
    record.extraLength = loadLE64(bytes.data() + 8);
    record.offsetDelta = *offsetDelta;
    return record;
}

VoidResult validateControlStreamLength(std::size_t byteLength) {
    if (byteLength % kControlRecordSize != 0) {
        return makeVoidError(
            ErrorCode::kTruncatedControlStream,
            fmt::format("decompressed control stream has length {}, which is not a multiple of {}",
                        byteLength, kControlRecordSize));
    }
    return makeVoidSuccess();
}

// =============================================================================
// ControlRecordCursor Implementation
// =============================================================================

Result<ControlRecord> ControlRecordCursor::next() {
    if (atEnd()) {
        return makeError<ControlRecord>(ErrorCode::kInvalidState,
                                        "control record cursor is exhausted");
    }

    auto record = decodeControlRecord(stream_.subspan(position_));
    if (!record) {
        return makeError<ControlRecord>(
            record.error().code(),
            fmt::format("record {}: {}", recordIndex(), record.error().message()));
    }
    position_ += kControlRecordSize;
    return record;
}

// =============================================================================
// ControlStream Implementation
// =============================================================================

ControlRecord ControlStream::Iterator::operator*() const {
    auto record = decodeControlRecord(stream_.subspan(position_));
    if (!record) {
        record.error().throwException(ErrorContext("control")
                                          .withOffset(position_)
                                          .withRecord(position_ / kControlRecordSize));
    }
    return *record;
}

Result<ControlStream> ControlStream::create(ByteSpan decompressed) {
    auto valid = validateControlStreamLength(decompressed.size());
    if (!valid) {
        return std::unexpected(std::move(valid.error()));
    }
    return ControlStream(decompressed);
}

Result<std::vector<ControlRecord>> ControlStream::decodeAll() const {
    std::vector<ControlRecord> records;
    records.reserve(size());

    ControlRecordCursor recordCursor = cursor();
    while (!recordCursor.atEnd()) {
        auto record = recordCursor.next();
        if (!record) {
            return std::unexpected(std::move(record.error()));
        }
        records.push_back(*record);
    }
    return records;
}

}  // namespace bsr::format
