// =============================================================================
// bsr - Stream Decompressor Implementation
// =============================================================================
// bzip2 via libbz2, Brotli via libbrotlidec.
// =============================================================================

#include "bsr/io/stream_decompressor.h"

#include <bzlib.h>
#include <brotli/decode.h>

#include <algorithm>
#include <climits>
#include <memory>

#include <fmt/format.h>

#include "bsr/common/logger.h"

namespace bsr::io {

namespace {

// =============================================================================
// Helpers
// =============================================================================

Result<ByteBuffer> decompressionFailure(std::string_view compressor, std::string_view detail) {
    return makeError<ByteBuffer>(ErrorCode::kDecompressionFailure,
                                 fmt::format("{} stream: {}", compressor, detail));
}

Result<ByteBuffer> outputLimitExceeded(std::string_view compressor, std::size_t limit) {
    return decompressionFailure(compressor,
                                fmt::format("decompressed size exceeds limit of {} bytes", limit));
}

/// @brief Output growth step, clamped to what a single libbz2 call accepts.
std::size_t growthStep(const DecompressOptions& options) {
    return std::clamp<std::size_t>(options.chunkSize, 1, UINT_MAX);
}

std::string_view bzipErrorName(int code) {
    switch (code) {
        case BZ_OK:
            return "BZ_OK";
        case BZ_STREAM_END:
            return "BZ_STREAM_END";
        case BZ_SEQUENCE_ERROR:
            return "BZ_SEQUENCE_ERROR";
        case BZ_PARAM_ERROR:
            return "BZ_PARAM_ERROR";
        case BZ_MEM_ERROR:
            return "BZ_MEM_ERROR";
        case BZ_DATA_ERROR:
            return "BZ_DATA_ERROR";
        case BZ_DATA_ERROR_MAGIC:
            return "BZ_DATA_ERROR_MAGIC";
        case BZ_IO_ERROR:
            return "BZ_IO_ERROR";
        case BZ_UNEXPECTED_EOF:
            return "BZ_UNEXPECTED_EOF";
        case BZ_OUTBUFF_FULL:
            return "BZ_OUTBUFF_FULL";
        case BZ_CONFIG_ERROR:
            return "BZ_CONFIG_ERROR";
        default:
            return "unknown bzip2 error";
    }
}

/// @brief Owns an initialized bz_stream decoder.
class Bzip2Decoder {
public:
    Bzip2Decoder() = default;

    ~Bzip2Decoder() {
        if (initialized_) {
            BZ2_bzDecompressEnd(&stream_);
        }
    }

    Bzip2Decoder(const Bzip2Decoder&) = delete;
    Bzip2Decoder& operator=(const Bzip2Decoder&) = delete;

    int init() {
        int ret = BZ2_bzDecompressInit(&stream_, 0, 0);
        initialized_ = (ret == BZ_OK);
        return ret;
    }

    bz_stream& stream() noexcept { return stream_; }

private:
    bz_stream stream_{};
    bool initialized_ = false;
};

struct BrotliDecoderDeleter {
    void operator()(BrotliDecoderState* state) const noexcept {
        BrotliDecoderDestroyInstance(state);
    }
};

using BrotliDecoderPtr = std::unique_ptr<BrotliDecoderState, BrotliDecoderDeleter>;

}  // namespace

// =============================================================================
// bzip2
// =============================================================================

Result<ByteBuffer> decompressBzip2(ByteSpan input, const DecompressOptions& options) {
    constexpr std::string_view kName = "bzip2";

    Bzip2Decoder decoder;
    int ret = decoder.init();
    if (ret != BZ_OK) {
        return decompressionFailure(kName,
                                    fmt::format("decoder init failed ({})", bzipErrorName(ret)));
    }

    bz_stream& stream = decoder.stream();
    const std::size_t step = growthStep(options);
    std::size_t fed = 0;
    ByteBuffer output;

    while (true) {
        // libbz2 counts input in unsigned int, so feed large segments piecewise
        if (stream.avail_in == 0 && fed < input.size()) {
            const auto chunk = std::min<std::size_t>(input.size() - fed, UINT_MAX);
            stream.next_in = const_cast<char*>(reinterpret_cast<const char*>(input.data() + fed));
            stream.avail_in = static_cast<unsigned int>(chunk);
            fed += chunk;
        }

        const std::size_t produced = output.size();
        output.resize(produced + step);
        stream.next_out = reinterpret_cast<char*>(output.data() + produced);
        stream.avail_out = static_cast<unsigned int>(step);

        ret = BZ2_bzDecompress(&stream);
        output.resize(produced + (step - stream.avail_out));

        if (output.size() > options.maxOutputSize) {
            return outputLimitExceeded(kName, options.maxOutputSize);
        }
        if (ret == BZ_STREAM_END) {
            break;
        }
        if (ret != BZ_OK) {
            return decompressionFailure(kName, bzipErrorName(ret));
        }
        if (stream.avail_in == 0 && fed == input.size() && stream.avail_out != 0) {
            return decompressionFailure(
                kName, fmt::format("unexpected end of input after {} bytes", input.size()));
        }
    }

    const std::size_t trailing = stream.avail_in + (input.size() - fed);
    if (trailing > 0) {
        BSR_LOG_TRACE("Ignoring {} bytes after end of bzip2 stream", trailing);
    }
    return output;
}

// =============================================================================
// Brotli
// =============================================================================

Result<ByteBuffer> decompressBrotli(ByteSpan input, const DecompressOptions& options) {
    constexpr std::string_view kName = "brotli";

    BrotliDecoderPtr state(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr));
    if (!state) {
        return decompressionFailure(kName, "decoder init failed");
    }

    const std::size_t step = growthStep(options);
    std::size_t availIn = input.size();
    const std::uint8_t* nextIn = input.data();
    ByteBuffer output;

    while (true) {
        const std::size_t produced = output.size();
        output.resize(produced + step);
        std::size_t availOut = step;
        std::uint8_t* nextOut = output.data() + produced;

        const BrotliDecoderResult result = BrotliDecoderDecompressStream(
            state.get(), &availIn, &nextIn, &availOut, &nextOut, nullptr);
        output.resize(produced + (step - availOut));

        if (output.size() > options.maxOutputSize) {
            return outputLimitExceeded(kName, options.maxOutputSize);
        }

        switch (result) {
            case BROTLI_DECODER_RESULT_SUCCESS:
                if (availIn > 0) {
                    BSR_LOG_TRACE("Ignoring {} bytes after end of brotli stream", availIn);
                }
                return output;
            case BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT:
                break;
            case BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT:
                return decompressionFailure(
                    kName, fmt::format("unexpected end of input after {} bytes", input.size()));
            case BROTLI_DECODER_RESULT_ERROR:
            default:
                return decompressionFailure(
                    kName, BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get())));
        }
    }
}

// =============================================================================
// Dispatch
// =============================================================================

Result<ByteBuffer> decompress(ByteSpan input, CompressorId compressor,
                              const DecompressOptions& options) {
    switch (compressor) {
        case CompressorId::kBzip2:
            return decompressBzip2(input, options);
        case CompressorId::kBrotli:
            return decompressBrotli(input, options);
    }
    return makeError<ByteBuffer>(
        ErrorCode::kInvalidState,
        fmt::format("compressor id {} reached dispatch without validation",
                    static_cast<unsigned>(compressor)));
}

}  // namespace bsr::io
