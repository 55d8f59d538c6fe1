// =============================================================================
// bsr - bsdiff Container Format Implementation
// =============================================================================
// Magic decoding and fixed header parsing.
// =============================================================================

#include "bsr/format/bsdiff_format.h"

#include <fmt/format.h>

namespace bsr::format {

namespace {

/// @brief Extract byte `index` (0 = most significant) of a big-endian magic.
constexpr std::uint8_t magicByte(std::uint64_t magic, std::size_t index) noexcept {
    return static_cast<std::uint8_t>(magic >> (8 * (7 - index)));
}

/// @brief Decode the three compressor id bytes shared by V2 and V3.
Result<MagicInfo> decodeCompressors(std::uint64_t magic, FormatVariant variant) {
    constexpr std::size_t kPositions[] = {kControlCompressorByte, kDiffCompressorByte,
                                          kExtraCompressorByte};
    for (std::size_t position : kPositions) {
        const std::uint8_t value = magicByte(magic, position);
        if (!isValidCompressorId(value)) {
            return makeError<MagicInfo>(
                ErrorCode::kInvalidCompressorId,
                fmt::format("{} magic byte {} holds unknown compressor id 0x{:02x}",
                            formatVariantToString(variant), position, value));
        }
    }

    MagicInfo info;
    info.variant = variant;
    info.controlCompressor = static_cast<CompressorId>(magicByte(magic, kControlCompressorByte));
    info.diffCompressor = static_cast<CompressorId>(magicByte(magic, kDiffCompressorByte));
    info.extraCompressor = static_cast<CompressorId>(magicByte(magic, kExtraCompressorByte));
    return info;
}

}  // namespace

Result<MagicInfo> decodeMagic(std::uint64_t magic) {
    if (magic == kLegacyMagic) {
        return MagicInfo{};
    }

    if (matchesTemplate(magic, kV2MagicTemplate, kV2MagicMask)) {
        return decodeCompressors(magic, FormatVariant::kV2);
    }

    // Byte 4 of V3 is not validated
    if (matchesTemplate(magic, kV3MagicTemplate, kV3MagicMask)) {
        return decodeCompressors(magic, FormatVariant::kV3);
    }

    return makeError<MagicInfo>(ErrorCode::kMalformedMagic,
                                fmt::format("unrecognized patch magic 0x{:016x}", magic));
}

Result<MagicInfo> decodeMagic(ByteSpan bytes) {
    if (bytes.size() < kMagicSize) {
        return makeError<MagicInfo>(
            ErrorCode::kHeaderTooShort,
            fmt::format("magic needs {} bytes, got {}", kMagicSize, bytes.size()));
    }
    return decodeMagic(loadBE64(bytes.data()));
}

Result<Header> parseHeader(ByteSpan data) {
    if (data.size() < kHeaderSize) {
        return makeError<Header>(
            ErrorCode::kHeaderTooShort,
            fmt::format("patch header needs {} bytes, got {}", kHeaderSize, data.size()));
    }

    Header header;
    header.magic = loadBE64(data.data());
    header.compressedControlSize = loadLE64(data.data() + kControlSizeOffset);
    header.compressedDiffSize = loadLE64(data.data() + kDiffSizeOffset);
    header.newFileSize = loadLE64(data.data() + kNewFileSizeOffset);

    auto info = decodeMagic(header.magic);
    if (!info) {
        return std::unexpected(std::move(info.error()));
    }
    header.magicInfo = *info;
    return header;
}

}  // namespace bsr::format
