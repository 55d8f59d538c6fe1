// =============================================================================
// bsr - Patch Reader Implementation
// =============================================================================

#include "bsr/format/patch_reader.h"

#include <string>
#include <utility>

#include <fmt/format.h>

#include "bsr/common/logger.h"
#include "bsr/io/stream_decompressor.h"

namespace bsr::format {

namespace {

/// @brief Locate [offset, offset + length) inside a buffer of `available` bytes.
Result<ByteRange> sliceSegment(StreamKind kind, std::uint64_t offset, std::uint64_t length,
                               std::size_t available) {
    if (length > std::numeric_limits<std::uint64_t>::max() - offset) {
        return makeError<ByteRange>(
            ErrorCode::kTruncatedInput,
            fmt::format("{} segment at offset {} with length {} overflows",
                        streamKindToString(kind), offset, length));
    }
    ByteRange range{offset, length};
    if (range.end() > available) {
        return makeError<ByteRange>(
            ErrorCode::kTruncatedInput,
            fmt::format("{} segment [{}, {}) extends past end of input ({} bytes)",
                        streamKindToString(kind), range.offset, range.end(), available));
    }
    return range;
}

ByteSpan segmentBytes(ByteSpan data, const ByteRange& range) noexcept {
    return data.subspan(static_cast<std::size_t>(range.offset),
                        static_cast<std::size_t>(range.length));
}

Result<ByteBuffer> decompressSegment(ByteSpan data, const ByteRange& range, StreamKind kind,
                                     CompressorId compressor, std::size_t maxOutputSize,
                                     PatchObserver* observer) {
    io::DecompressOptions options;
    options.maxOutputSize = maxOutputSize;

    auto bytes = io::decompress(segmentBytes(data, range), compressor, options);
    if (!bytes) {
        return makeError<ByteBuffer>(
            bytes.error().code(),
            fmt::format("{} segment at offset {}: {}", streamKindToString(kind), range.offset,
                        bytes.error().message()));
    }

    BSR_LOG_DEBUG("Decompressed {} stream ({}): {} -> {} bytes",
                  std::string(streamKindToString(kind)),
                  std::string(compressorIdToString(compressor)), range.length, bytes->size());
    if (observer != nullptr) {
        observer->onStreamDecompressed(kind, range.length, bytes->size());
    }
    return bytes;
}

/// @brief Report a V3 patch and build the unsupported error.
Error rejectMaskVariant(ByteSpan data, const Header& header, PatchObserver* observer) {
    std::optional<std::uint64_t> maskSize;
    if (data.size() >= kHeaderSize + kMaskSizeFieldSize) {
        maskSize = loadLE64(data.data() + kHeaderSize);
    }

    BSR_LOG_WARNING("V3 patch with mask stream is not supported (mask size field: {})",
                    maskSize ? std::to_string(*maskSize) : std::string("absent"));
    if (observer != nullptr) {
        observer->onUnsupportedVariant(header, maskSize);
    }
    return Error(ErrorCode::kUnsupportedFormatVariant,
                 "BDF3 patches carry a mask stream, which this reader does not support");
}

}  // namespace

// =============================================================================
// PatchReader Implementation
// =============================================================================

PatchReader::PatchReader(ByteSpan data, const Header& header, std::size_t maxDecompressedSize)
    : data_(data), header_(header), maxDecompressedSize_(maxDecompressedSize) {}

Result<PatchReader> PatchReader::open(ByteSpan data, const ReaderOptions& options) {
    auto header = parseHeader(data);
    if (!header) {
        return std::unexpected(std::move(header.error()));
    }

    BSR_LOG_DEBUG("Opening {} patch: {} bytes, ctrl={}, diff={}, newSize={}",
                  std::string(formatVariantToString(header->variant())), data.size(),
                  header->compressedControlSize, header->compressedDiffSize,
                  header->newFileSize);
    if (options.observer != nullptr) {
        options.observer->onHeaderParsed(*header);
    }

    if (header->variant() == FormatVariant::kV3) {
        return std::unexpected(rejectMaskVariant(data, *header, options.observer));
    }

    PatchReader reader(data, *header, options.maxDecompressedSize);

    auto control = sliceSegment(StreamKind::kControl, kHeaderSize,
                                header->compressedControlSize, data.size());
    if (!control) {
        return std::unexpected(std::move(control.error()));
    }
    auto diff = sliceSegment(StreamKind::kDiff, control->end(), header->compressedDiffSize,
                             data.size());
    if (!diff) {
        return std::unexpected(std::move(diff.error()));
    }
    reader.controlSegment_ = *control;
    reader.diffSegment_ = *diff;
    reader.extraSegment_ = ByteRange{diff->end(), data.size() - diff->end()};

    const MagicInfo& info = header->magicInfo;

    auto controlBytes =
        decompressSegment(data, reader.controlSegment_, StreamKind::kControl,
                          info.controlCompressor, options.maxDecompressedSize, options.observer);
    if (!controlBytes) {
        return std::unexpected(std::move(controlBytes.error()));
    }
    reader.controlBytes_ = std::move(*controlBytes);

    auto diffBytes =
        decompressSegment(data, reader.diffSegment_, StreamKind::kDiff, info.diffCompressor,
                          options.maxDecompressedSize, options.observer);
    if (!diffBytes) {
        return std::unexpected(std::move(diffBytes.error()));
    }
    reader.diffBytes_ = std::move(*diffBytes);

    auto controlStream = ControlStream::create(reader.controlBytes_);
    if (!controlStream) {
        return std::unexpected(std::move(controlStream.error()));
    }
    reader.controlStream_ = *controlStream;

    if (options.collectDiffStatistics) {
        reader.diffStatistics_ = computeDiffStatistics(reader.diffBytes_);
        if (options.observer != nullptr) {
            options.observer->onDiffStatistics(*reader.diffStatistics_);
        }
    }

    BSR_LOG_DEBUG("Patch opened: {} control records, {} diff bytes, extra segment {} bytes",
                  reader.controlStream_.size(), reader.diffBytes_.size(),
                  reader.extraSegment_.length);
    return reader;
}

Result<ByteBuffer> PatchReader::readExtraStream() const {
    return decompressSegment(data_, extraSegment_, StreamKind::kExtra,
                             header_.magicInfo.extraCompressor, maxDecompressedSize_, nullptr);
}

}  // namespace bsr::format
