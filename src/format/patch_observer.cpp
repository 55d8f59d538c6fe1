// =============================================================================
// bsr - Patch Observer Hooks Implementation
// =============================================================================

#include "bsr/format/patch_observer.h"

#include <algorithm>
#include <string>

#include "bsr/common/logger.h"

namespace bsr::format {

DiffStatistics computeDiffStatistics(ByteSpan diff) noexcept {
    DiffStatistics stats;
    stats.totalBytes = diff.size();
    stats.zeroBytes = static_cast<std::uint64_t>(
        std::count(diff.begin(), diff.end(), static_cast<std::uint8_t>(0)));
    return stats;
}

// =============================================================================
// LoggingObserver Implementation
// =============================================================================

void LoggingObserver::onHeaderParsed(const Header& header) {
    const MagicInfo& info = header.magicInfo;
    BSR_LOG_INFO("Patch header: variant={}, ctrl={}/{}, diff={}/{}, extra={}, newSize={}",
                 std::string(formatVariantToString(info.variant)),
                 std::string(compressorIdToString(info.controlCompressor)),
                 header.compressedControlSize,
                 std::string(compressorIdToString(info.diffCompressor)),
                 header.compressedDiffSize,
                 std::string(compressorIdToString(info.extraCompressor)),
                 header.newFileSize);
}

void LoggingObserver::onStreamDecompressed(StreamKind kind, std::uint64_t compressedSize,
                                           std::uint64_t decompressedSize) {
    BSR_LOG_INFO("{} stream: {} -> {} bytes", std::string(streamKindToString(kind)),
                 compressedSize, decompressedSize);
}

void LoggingObserver::onDiffStatistics(const DiffStatistics& stats) {
    BSR_LOG_INFO("Diff stream has {}/{} = {:.2f}% zeros", stats.zeroBytes, stats.totalBytes,
                 stats.zeroPercent());
}

void LoggingObserver::onUnsupportedVariant(const Header& header,
                                           std::optional<std::uint64_t> maskSize) {
    if (maskSize.has_value()) {
        BSR_LOG_INFO("Unsupported {} patch: compressed mask stream of {} bytes",
                     std::string(formatVariantToString(header.variant())), *maskSize);
    } else {
        BSR_LOG_INFO("Unsupported {} patch: mask size field missing",
                     std::string(formatVariantToString(header.variant())));
    }
}

}  // namespace bsr::format
