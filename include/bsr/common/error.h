// =============================================================================
// bsr - Error Handling Framework
// =============================================================================
// Error handling for the bsdiff patch reader library.
//
// This module provides:
// - ErrorCode enum covering every way a patch can be rejected
// - BSRException hierarchy for callers that prefer exceptions
// - Result<T, E> type for functional error handling (using std::expected)
// - ErrorContext attached to thrown exceptions
//
// Error categories:
// - Corrupt input: header too short, bad magic, bad compressor id, truncated
//   segments, truncated control stream, failed decompression, overflow
// - Unsupported feature: the V3 container with its mask stream
//
// Library functions return Result<T>. Exceptions are only thrown where an
// interface cannot return one (ControlStream iteration), or when the caller
// asks for it through Error::throwException().
// =============================================================================

#ifndef BSR_COMMON_ERROR_H
#define BSR_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace bsr {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes for every failure the reader can report.
enum class ErrorCode : std::uint8_t {
    /// @brief Operation completed successfully.
    kSuccess = 0,

    /// @brief Fewer than 32 bytes available for the header.
    kHeaderTooShort = 1,

    /// @brief Magic field matches none of the known patterns.
    kMalformedMagic = 2,

    /// @brief A compressor id byte in the magic is not a known identifier.
    kInvalidCompressorId = 3,

    /// @brief The container variant is recognised but not supported.
    /// @note Currently the V3 container with its auxiliary mask stream.
    kUnsupportedFormatVariant = 4,

    /// @brief A segment declared by the header extends past the input.
    kTruncatedInput = 5,

    /// @brief Decompressed control stream is not a multiple of the record size.
    kTruncatedControlStream = 6,

    /// @brief bzip2 or Brotli rejected the compressed bytes.
    kDecompressionFailure = 7,

    /// @brief A sign-magnitude value is outside the representable range.
    kIntegerOverflow = 8,

    /// @brief Invalid state for operation (internal invariant violated).
    kInvalidState = 9
};

/// @brief Convert ErrorCode to string representation.
/// @param code The error code.
/// @return Human-readable string describing the error category.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kHeaderTooShort:
            return "header too short";
        case ErrorCode::kMalformedMagic:
            return "malformed magic";
        case ErrorCode::kInvalidCompressorId:
            return "invalid compressor id";
        case ErrorCode::kUnsupportedFormatVariant:
            return "unsupported format variant";
        case ErrorCode::kTruncatedInput:
            return "truncated input";
        case ErrorCode::kTruncatedControlStream:
            return "truncated control stream";
        case ErrorCode::kDecompressionFailure:
            return "decompression failure";
        case ErrorCode::kIntegerOverflow:
            return "integer overflow";
        case ErrorCode::kInvalidState:
            return "invalid state";
    }
    return "unknown error";
}

/// @brief Check if an error code means "known but not implemented".
/// @note Callers use this to tell a valid-but-unsupported patch from a corrupt one.
[[nodiscard]] constexpr bool isUnsupportedFeature(ErrorCode code) noexcept {
    return code == ErrorCode::kUnsupportedFormatVariant;
}

/// @brief Check if an error code means the patch bytes are malformed.
[[nodiscard]] constexpr bool isCorruptInput(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kHeaderTooShort:
        case ErrorCode::kMalformedMagic:
        case ErrorCode::kInvalidCompressorId:
        case ErrorCode::kTruncatedInput:
        case ErrorCode::kTruncatedControlStream:
        case ErrorCode::kDecompressionFailure:
        case ErrorCode::kIntegerOverflow:
            return true;
        default:
            return false;
    }
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Where in a patch an exception was raised.
struct ErrorContext {
    /// @brief Name of the stream being processed (if applicable).
    std::string streamName;

    /// @brief Byte offset within that stream (if applicable).
    std::optional<std::uint64_t> byteOffset;

    /// @brief Index of the control record being decoded (if applicable).
    std::optional<std::uint64_t> recordIndex;

    /// @brief Source location where the context was created.
    std::source_location location;

    /// @brief Construct with stream name.
    explicit ErrorContext(std::string stream,
                          std::source_location loc = std::source_location::current())
        : streamName(std::move(stream)), location(loc) {}

    /// @brief Set the byte offset.
    /// @return Reference to this for method chaining.
    ErrorContext& withOffset(std::uint64_t offset) {
        byteOffset = offset;
        return *this;
    }

    /// @brief Set the control record index.
    /// @return Reference to this for method chaining.
    ErrorContext& withRecord(std::uint64_t index) {
        recordIndex = index;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all bsr errors.
class BSRException : public std::exception {
public:
    /// @brief Construct with error code and message.
    BSRException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    /// @brief Construct with error code, message, and context.
    BSRException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~BSRException() override = default;

    BSRException(const BSRException&) = default;
    BSRException(BSRException&&) noexcept = default;
    BSRException& operator=(const BSRException&) = default;
    BSRException& operator=(BSRException&&) noexcept = default;

    /// @brief Get the formatted error message.
    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief Get the error context.
    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

protected:
    /// @brief Format the what() string from message and context.
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Exception for malformed patch data.
/// @note Carries any of the corrupt-input codes (bad magic, truncation, ...).
class FormatError : public BSRException {
public:
    FormatError(ErrorCode code, std::string message, ErrorContext context)
        : BSRException(code, std::move(message), std::move(context)) {}
};

/// @brief Exception for recognised but unsupported container variants.
class UnsupportedFormatError : public BSRException {
public:
    UnsupportedFormatError(std::string message, ErrorContext context)
        : BSRException(ErrorCode::kUnsupportedFormatVariant, std::move(message),
                       std::move(context)) {}
};

/// @brief Exception for bzip2/Brotli failures.
class DecompressionError : public BSRException {
public:
    DecompressionError(std::string message, ErrorContext context)
        : BSRException(ErrorCode::kDecompressionFailure, std::move(message), std::move(context)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    /// @brief Get the error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the error message.
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    /// @brief True when the failure is a known-unsupported feature.
    [[nodiscard]] bool isUnsupported() const noexcept { return isUnsupportedFeature(code_); }

    /// @brief Throw the exception type matching the code, with context.
    [[noreturn]] void throwException(ErrorContext context) const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

/// @brief Create an error result.
template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

}  // namespace bsr

#endif  // BSR_COMMON_ERROR_H
