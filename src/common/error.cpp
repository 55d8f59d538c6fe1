// =============================================================================
// bsr - Error Handling Framework Implementation
// =============================================================================

#include "bsr/common/error.h"

#include <sstream>

namespace bsr {

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    oss << "stream: " << streamName;

    if (byteOffset.has_value()) {
        oss << ", offset: 0x" << std::hex << *byteOffset << std::dec;
    }
    if (recordIndex.has_value()) {
        oss << ", record: " << *recordIndex;
    }

#ifndef NDEBUG
    oss << " (at " << location.file_name() << ":" << location.line() << ")";
#endif

    return oss.str();
}

// =============================================================================
// BSRException Implementation
// =============================================================================

void BSRException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;
    if (context_.has_value()) {
        oss << " (" << context_->format() << ")";
    }
    what_ = oss.str();
}

// =============================================================================
// Error Implementation
// =============================================================================

[[noreturn]] void Error::throwException(ErrorContext context) const {
    if (isCorruptInput(code_) && code_ != ErrorCode::kDecompressionFailure) {
        throw FormatError(code_, message_, std::move(context));
    }
    switch (code_) {
        case ErrorCode::kUnsupportedFormatVariant:
            throw UnsupportedFormatError(message_, std::move(context));
        case ErrorCode::kDecompressionFailure:
            throw DecompressionError(message_, std::move(context));
        default:
            throw BSRException(code_, message_, std::move(context));
    }
}

}  // namespace bsr
