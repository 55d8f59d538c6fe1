// =============================================================================
// bsr - Stream Decompressor
// =============================================================================
// Whole-buffer decompression of the streams embedded in a patch.
//
// This module provides:
// - decompressBzip2(): libbz2 streaming decoder
// - decompressBrotli(): libbrotlidec streaming decoder
// - decompress(): dispatch on CompressorId
//
// Each call consumes exactly one compressed stream and returns every
// decompressed byte. Bytes after the end-of-stream marker are ignored.
// Failures carry the library's own diagnostic.
//
// Usage:
//   auto bytes = bsr::io::decompress(segment, CompressorId::kBzip2);
//   if (!bytes) { /* bytes.error().code() == kDecompressionFailure */ }
// =============================================================================

#ifndef BSR_IO_STREAM_DECOMPRESSOR_H
#define BSR_IO_STREAM_DECOMPRESSOR_H

#include <cstddef>
#include <limits>
#include <string_view>

#include "bsr/common/error.h"
#include "bsr/common/types.h"

namespace bsr::io {

// =============================================================================
// Decompression Options
// =============================================================================

/// @brief Limits applied while decompressing one stream.
struct DecompressOptions {
    /// @brief Largest decompressed size accepted; exceeding it is a failure.
    std::size_t maxOutputSize = std::numeric_limits<std::size_t>::max();

    /// @brief Output growth step in bytes.
    std::size_t chunkSize = 64 * 1024;
};

// =============================================================================
// Decompression Functions
// =============================================================================

/// @brief Decompress a single bzip2 stream.
/// @return Decompressed bytes, or kDecompressionFailure.
[[nodiscard]] Result<ByteBuffer> decompressBzip2(ByteSpan input,
                                                 const DecompressOptions& options = {});

/// @brief Decompress a single Brotli stream.
/// @return Decompressed bytes, or kDecompressionFailure.
[[nodiscard]] Result<ByteBuffer> decompressBrotli(ByteSpan input,
                                                  const DecompressOptions& options = {});

/// @brief Decompress a stream with the given compressor.
/// @return Decompressed bytes, kDecompressionFailure, or kInvalidState for an
///         id that header validation should already have rejected.
[[nodiscard]] Result<ByteBuffer> decompress(ByteSpan input, CompressorId compressor,
                                            const DecompressOptions& options = {});

}  // namespace bsr::io

#endif  // BSR_IO_STREAM_DECOMPRESSOR_H
