// =============================================================================
// bsr - Patch Observer Hooks
// =============================================================================
// Optional telemetry callbacks invoked while a patch is opened.
//
// This module provides:
// - DiffStatistics: zero-byte share of the decompressed diff stream
// - PatchObserver: interface with no-op defaults
// - LoggingObserver: forwards every hook to the bsr logger
//
// Observers are borrowed by the reader and called synchronously on the
// opening thread. Ignoring them never changes what the reader returns.
// =============================================================================

#ifndef BSR_FORMAT_PATCH_OBSERVER_H
#define BSR_FORMAT_PATCH_OBSERVER_H

#include <cstdint>
#include <optional>

#include "bsr/common/types.h"
#include "bsr/format/bsdiff_format.h"

namespace bsr::format {

// =============================================================================
// DiffStatistics Structure
// =============================================================================

/// @brief Byte statistics of a decompressed diff stream.
/// @note A mostly-zero diff stream means old and new files share most bytes.
struct DiffStatistics {
    /// @brief Number of zero bytes.
    std::uint64_t zeroBytes = 0;

    /// @brief Total number of bytes.
    std::uint64_t totalBytes = 0;

    /// @brief Share of zero bytes in percent (0 for an empty stream).
    [[nodiscard]] double zeroPercent() const noexcept {
        return totalBytes == 0 ? 0.0
                               : static_cast<double>(zeroBytes) /
                                     static_cast<double>(totalBytes) * 100.0;
    }
};

/// @brief Count the zero bytes of a buffer.
[[nodiscard]] DiffStatistics computeDiffStatistics(ByteSpan diff) noexcept;

// =============================================================================
// PatchObserver Interface
// =============================================================================

/// @brief Receives progress notifications from PatchReader::open().
class PatchObserver {
public:
    virtual ~PatchObserver() = default;

    /// @brief The header was parsed and its magic validated.
    virtual void onHeaderParsed(const Header& /*header*/) {}

    /// @brief One embedded stream was decompressed.
    virtual void onStreamDecompressed(StreamKind /*kind*/, std::uint64_t /*compressedSize*/,
                                      std::uint64_t /*decompressedSize*/) {}

    /// @brief Diff statistics were computed (only when requested).
    virtual void onDiffStatistics(const DiffStatistics& /*stats*/) {}

    /// @brief The patch uses a variant the reader rejects.
    /// @param maskSize Compressed mask size field, if the buffer holds one.
    virtual void onUnsupportedVariant(const Header& /*header*/,
                                      std::optional<std::uint64_t> /*maskSize*/) {}
};

// =============================================================================
// LoggingObserver Class
// =============================================================================

/// @brief Observer that reports every notification through BSR_LOG_INFO.
class LoggingObserver final : public PatchObserver {
public:
    void onHeaderParsed(const Header& header) override;
    void onStreamDecompressed(StreamKind kind, std::uint64_t compressedSize,
                              std::uint64_t decompressedSize) override;
    void onDiffStatistics(const DiffStatistics& stats) override;
    void onUnsupportedVariant(const Header& header,
                              std::optional<std::uint64_t> maskSize) override;
};

}  // namespace bsr::format

#endif  // BSR_FORMAT_PATCH_OBSERVER_H
