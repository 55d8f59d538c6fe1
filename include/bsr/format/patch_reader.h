// =============================================================================
// bsr - Patch Reader
// =============================================================================
// Opens an in-memory bsdiff patch and exposes its decoded streams.
//
// Opening a patch:
// 1. Parses the 32-byte header and validates the magic
// 2. Rejects the V3 (mask stream) variant as unsupported
// 3. Slices and decompresses the control and diff streams
// 4. Validates the control stream length
//
// The extra segment is located but left compressed until readExtraStream().
//
// Usage:
//   auto reader = bsr::format::PatchReader::open(bytes);
//   if (!reader) { return reader.error(); }
//   for (const auto& record : reader->controlStream()) { ... }
// =============================================================================

#ifndef BSR_FORMAT_PATCH_READER_H
#define BSR_FORMAT_PATCH_READER_H

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>

#include "bsr/common/error.h"
#include "bsr/common/types.h"
#include "bsr/format/bsdiff_format.h"
#include "bsr/format/control_stream.h"
#include "bsr/format/patch_observer.h"

namespace bsr::format {

// =============================================================================
// ReaderOptions Structure
// =============================================================================

/// @brief Options for PatchReader::open().
struct ReaderOptions {
    /// @brief Upper bound on the decompressed size of any single stream.
    std::size_t maxDecompressedSize = std::numeric_limits<std::size_t>::max();

    /// @brief Compute DiffStatistics for the diff stream.
    bool collectDiffStatistics = false;

    /// @brief Optional observer (not owned, must outlive the reader).
    PatchObserver* observer = nullptr;
};

// =============================================================================
// PatchReader Class
// =============================================================================

/// @brief Decoded view of a bsdiff patch held in memory.
/// @note The input buffer is borrowed and must outlive the reader. Control and
///       diff streams are decompressed once, in open().
class PatchReader {
public:
    /// @brief Parse and decompress a patch.
    /// @param data Entire patch file.
    /// @param options Limits and observer.
    /// @return Reader, or the first error encountered.
    [[nodiscard]] static Result<PatchReader> open(ByteSpan data,
                                                  const ReaderOptions& options = {});

    PatchReader(const PatchReader&) = delete;
    PatchReader& operator=(const PatchReader&) = delete;
    PatchReader(PatchReader&&) noexcept = default;
    PatchReader& operator=(PatchReader&&) noexcept = default;
    ~PatchReader() = default;

    // =========================================================================
    // Header Accessors
    // =========================================================================

    [[nodiscard]] const Header& header() const noexcept { return header_; }

    [[nodiscard]] const MagicInfo& magicInfo() const noexcept { return header_.magicInfo; }

    [[nodiscard]] FormatVariant variant() const noexcept { return header_.variant(); }

    /// @brief Size of the file the patch produces.
    [[nodiscard]] std::uint64_t newFileSize() const noexcept { return header_.newFileSize; }

    // =========================================================================
    // Segment Accessors
    // =========================================================================

    /// @brief Compressed control segment, relative to the start of the patch.
    [[nodiscard]] ByteRange controlSegment() const noexcept { return controlSegment_; }

    /// @brief Compressed diff segment.
    [[nodiscard]] ByteRange diffSegment() const noexcept { return diffSegment_; }

    /// @brief Compressed extra segment (runs to the end of the buffer).
    [[nodiscard]] ByteRange extraSegment() const noexcept { return extraSegment_; }

    // =========================================================================
    // Decoded Streams
    // =========================================================================

    /// @brief Decompressed diff bytes.
    [[nodiscard]] ByteSpan diffStream() const noexcept { return diffBytes_; }

    /// @brief Fresh record sequence over the decompressed control stream.
    [[nodiscard]] ControlStream controlStream() const noexcept { return controlStream_; }

    [[nodiscard]] std::size_t controlRecordCount() const noexcept {
        return controlStream_.size();
    }

    /// @brief Diff statistics, if ReaderOptions::collectDiffStatistics was set.
    [[nodiscard]] const std::optional<DiffStatistics>& diffStatistics() const noexcept {
        return diffStatistics_;
    }

    /// @brief Decompress the extra segment with the extra compressor.
    /// @note Not cached; each call decompresses again.
    [[nodiscard]] Result<ByteBuffer> readExtraStream() const;

private:
    PatchReader(ByteSpan data, const Header& header, std::size_t maxDecompressedSize);

    ByteSpan data_;
    Header header_;
    std::size_t maxDecompressedSize_;
    ByteRange controlSegment_;
    ByteRange diffSegment_;
    ByteRange extraSegment_;
    ByteBuffer controlBytes_;
    ByteBuffer diffBytes_;
    ControlStream controlStream_;
    std::optional<DiffStatistics> diffStatistics_;
};

}  // namespace bsr::format

#endif  // BSR_FORMAT_PATCH_READER_H
