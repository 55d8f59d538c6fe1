// =============================================================================
// bsr - Common Type Definitions
// =============================================================================
// Core type definitions for the bsdiff patch reader library.
//
// This module defines:
// - ByteSpan / ByteBuffer: borrowed and owned byte sequences
// - FormatVariant: which of the three container layouts a patch uses
// - CompressorId: per-stream compression algorithm
// - StreamKind: control / diff / extra
// - ByteRange: offset + length of a segment inside the patch buffer
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef BSR_COMMON_TYPES_H
#define BSR_COMMON_TYPES_H

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace bsr {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Borrowed, read-only view of patch bytes.
using ByteSpan = std::span<const std::uint8_t>;

/// @brief Owned byte buffer (decompressed stream contents).
using ByteBuffer = std::vector<std::uint8_t>;

// =============================================================================
// Format Variant Enumeration
// =============================================================================

/// @brief Container variant, determined solely from the magic field.
enum class FormatVariant : std::uint8_t {
    /// @brief Original "BSDIFF40" container, bzip2 for every stream.
    kLegacy = 0,

    /// @brief "BSDF2" container with per-stream compressor ids.
    kV2 = 1,

    /// @brief "BDF3" container, adds an auxiliary mask stream.
    kV3 = 2
};

/// @brief Convert FormatVariant to string representation.
[[nodiscard]] constexpr std::string_view formatVariantToString(FormatVariant variant) noexcept {
    switch (variant) {
        case FormatVariant::kLegacy:
            return "legacy";
        case FormatVariant::kV2:
            return "v2";
        case FormatVariant::kV3:
            return "v3";
    }
    return "unknown";
}

// =============================================================================
// Compressor Id Enumeration
// =============================================================================

/// @brief Compression algorithm of one embedded stream.
/// @note Values are the on-disk byte values stored in the magic field.
enum class CompressorId : std::uint8_t {
    kBzip2 = 1,
    kBrotli = 2
};

/// @brief Convert CompressorId to string representation.
[[nodiscard]] constexpr std::string_view compressorIdToString(CompressorId id) noexcept {
    switch (id) {
        case CompressorId::kBzip2:
            return "bzip2";
        case CompressorId::kBrotli:
            return "brotli";
    }
    return "unknown";
}

/// @brief Check whether a raw magic byte names a known compressor.
[[nodiscard]] constexpr bool isValidCompressorId(std::uint8_t value) noexcept {
    return value == static_cast<std::uint8_t>(CompressorId::kBzip2) ||
           value == static_cast<std::uint8_t>(CompressorId::kBrotli);
}

// =============================================================================
// Stream Kind Enumeration
// =============================================================================

/// @brief The three logical streams packaged in a patch.
enum class StreamKind : std::uint8_t {
    kControl = 0,
    kDiff = 1,
    kExtra = 2
};

/// @brief Convert StreamKind to string representation.
[[nodiscard]] constexpr std::string_view streamKindToString(StreamKind kind) noexcept {
    switch (kind) {
        case StreamKind::kControl:
            return "control";
        case StreamKind::kDiff:
            return "diff";
        case StreamKind::kExtra:
            return "extra";
    }
    return "unknown";
}

// =============================================================================
// Byte Range
// =============================================================================

/// @brief Location of a segment within the patch buffer.
struct ByteRange {
    /// @brief Absolute offset from the start of the patch.
    std::uint64_t offset = 0;

    /// @brief Segment length in bytes.
    std::uint64_t length = 0;

    /// @brief One past the last byte of the segment.
    [[nodiscard]] constexpr std::uint64_t end() const noexcept { return offset + length; }

    [[nodiscard]] constexpr bool operator==(const ByteRange&) const noexcept = default;
};

}  // namespace bsr

#endif  // BSR_COMMON_TYPES_H
