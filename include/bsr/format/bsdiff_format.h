// =============================================================================
// bsr - bsdiff Container Format Definitions
// =============================================================================
// Binary format definitions for bsdiff patch containers.
//
// This module defines:
// - Magic constants for the three container variants
// - Byte order helpers (magic is big-endian, everything else little-endian)
// - MagicInfo: variant tag plus the three per-stream compressor ids
// - Header: the fixed 32-byte patch header
// - decodeMagic() / parseHeader()
//
// File Layout:
// +---------------------------+
// |  Magic (8, big-endian)    |  offset 0
// +---------------------------+
// |  Compressed control size  |  offset 8  (u64 LE)
// +---------------------------+
// |  Compressed diff size     |  offset 16 (u64 LE)
// +---------------------------+
// |  New file size            |  offset 24 (u64 LE)
// +---------------------------+
// |  Control stream           |  offset 32
// +---------------------------+
// |  Diff stream              |
// +---------------------------+
// |  Extra stream (+trailers) |
// +---------------------------+
// =============================================================================

#ifndef BSR_FORMAT_BSDIFF_FORMAT_H
#define BSR_FORMAT_BSDIFF_FORMAT_H

#include <array>
#include <cstddef>
#include <cstdint>

#include "bsr/common/error.h"
#include "bsr/common/types.h"

namespace bsr::format {

// =============================================================================
// Byte Order Helpers
// =============================================================================

/// @brief Load a little-endian u64 from 8 bytes.
[[nodiscard]] constexpr std::uint64_t loadLE64(const std::uint8_t* data) noexcept {
    std::uint64_t value = 0;
    for (std::size_t i = 8; i > 0; --i) {
        value = (value << 8) | data[i - 1];
    }
    return value;
}

/// @brief Load a big-endian u64 from 8 bytes.
[[nodiscard]] constexpr std::uint64_t loadBE64(const std::uint8_t* data) noexcept {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

/// @brief Store a u64 as 8 little-endian bytes.
constexpr void storeLE64(std::uint64_t value, std::uint8_t* out) noexcept {
    for (std::size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
}

/// @brief Store a u64 as 8 big-endian bytes.
constexpr void storeBE64(std::uint64_t value, std::uint8_t* out) noexcept {
    for (std::size_t i = 0; i < 8; ++i) {
        out[i] = static_cast<std::uint8_t>(value >> (8 * (7 - i)));
    }
}

/// @brief Big-endian u64 value of an 8-character literal.
[[nodiscard]] constexpr std::uint64_t magicFromLiteral(const char (&literal)[9]) noexcept {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<std::uint8_t>(literal[i]);
    }
    return value;
}

// =============================================================================
// Layout Constants
// =============================================================================

/// @brief Size of the magic field.
inline constexpr std::size_t kMagicSize = 8;

/// @brief Fixed header size: magic + three u64 size fields.
inline constexpr std::size_t kHeaderSize = 32;

/// @brief Offset of the compressed control size field.
inline constexpr std::size_t kControlSizeOffset = 8;

/// @brief Offset of the compressed diff size field.
inline constexpr std::size_t kDiffSizeOffset = 16;

/// @brief Offset of the new file size field.
inline constexpr std::size_t kNewFileSizeOffset = 24;

/// @brief Size of the V3 mask-size field that follows the header.
inline constexpr std::size_t kMaskSizeFieldSize = 8;

// =============================================================================
// Magic Constants
// =============================================================================

/// @brief Legacy magic "BSDIFF40" (matched exactly).
inline constexpr std::uint64_t kLegacyMagic = magicFromLiteral("BSDIFF40");

/// @brief V2 template "BSDF2" followed by three compressor id bytes.
inline constexpr std::uint64_t kV2MagicTemplate = magicFromLiteral("BSDF2\0\0\0");

/// @brief Bytes of the V2 template that must match (bytes 0-4).
inline constexpr std::uint64_t kV2MagicMask = 0xFFFFFFFFFF000000ULL;

/// @brief V3 template "BDF3", one unconstrained byte, three compressor id bytes.
inline constexpr std::uint64_t kV3MagicTemplate = magicFromLiteral("BDF3\0\0\0\0");

/// @brief Bytes of the V3 template that must match (bytes 0-3).
/// @note Byte 4 is outside the mask and accepts any value.
inline constexpr std::uint64_t kV3MagicMask = 0xFFFFFFFF00000000ULL;

/// @brief Magic byte positions of the control / diff / extra compressor ids.
inline constexpr std::size_t kControlCompressorByte = 5;
inline constexpr std::size_t kDiffCompressorByte = 6;
inline constexpr std::size_t kExtraCompressorByte = 7;

// =============================================================================
// MagicInfo Structure
// =============================================================================

/// @brief Decoded magic field: variant plus per-stream compressors.
/// @note For kLegacy every compressor is kBzip2.
struct MagicInfo {
    FormatVariant variant = FormatVariant::kLegacy;
    CompressorId controlCompressor = CompressorId::kBzip2;
    CompressorId diffCompressor = CompressorId::kBzip2;
    CompressorId extraCompressor = CompressorId::kBzip2;

    /// @brief Compressor used by the given stream.
    [[nodiscard]] constexpr CompressorId compressorFor(StreamKind kind) const noexcept {
        switch (kind) {
            case StreamKind::kControl:
                return controlCompressor;
            case StreamKind::kDiff:
                return diffCompressor;
            case StreamKind::kExtra:
                return extraCompressor;
        }
        return controlCompressor;
    }

    [[nodiscard]] constexpr bool operator==(const MagicInfo&) const noexcept = default;
};

// =============================================================================
// Header Structure
// =============================================================================

/// @brief The fixed 32-byte patch header.
struct Header {
    /// @brief Magic field as a big-endian u64.
    std::uint64_t magic = 0;

    /// @brief Size of the compressed control stream.
    std::uint64_t compressedControlSize = 0;

    /// @brief Size of the compressed diff stream.
    std::uint64_t compressedDiffSize = 0;

    /// @brief Size of the file the patch reconstructs.
    std::uint64_t newFileSize = 0;

    /// @brief Structured view of the magic, decoded once during parsing.
    MagicInfo magicInfo;

    /// @brief Magic field as its 8 on-disk bytes.
    [[nodiscard]] std::array<std::uint8_t, kMagicSize> magicBytes() const noexcept {
        std::array<std::uint8_t, kMagicSize> bytes{};
        storeBE64(magic, bytes.data());
        return bytes;
    }

    [[nodiscard]] FormatVariant variant() const noexcept { return magicInfo.variant; }
};

// =============================================================================
// Parsing Functions
// =============================================================================

/// @brief Check whether a magic value matches a masked template.
[[nodiscard]] constexpr bool matchesTemplate(std::uint64_t magic, std::uint64_t templ,
                                             std::uint64_t mask) noexcept {
    return (magic & mask) == templ;
}

/// @brief Validate an 8-byte magic and extract its compressor ids.
/// @param magic Magic field as a big-endian u64.
/// @return MagicInfo, or kMalformedMagic / kInvalidCompressorId.
[[nodiscard]] Result<MagicInfo> decodeMagic(std::uint64_t magic);

/// @brief Validate the first 8 bytes of a buffer as a magic field.
/// @return MagicInfo, or kHeaderTooShort if fewer than 8 bytes are given.
[[nodiscard]] Result<MagicInfo> decodeMagic(ByteSpan bytes);

/// @brief Parse the fixed header at the start of a patch.
/// @param data Patch buffer (only the first 32 bytes are read).
/// @return Header, or kHeaderTooShort / any decodeMagic() error.
[[nodiscard]] Result<Header> parseHeader(ByteSpan data);

}  // namespace bsr::format

#endif  // BSR_FORMAT_BSDIFF_FORMAT_H
