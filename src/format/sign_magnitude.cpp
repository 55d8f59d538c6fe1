// =============================================================================
// bsr - Sign-Magnitude Integer Codec Implementation
// =============================================================================

#include "bsr/format/sign_magnitude.h"

#include <limits>

#include <fmt/format.h>

namespace bsr::format {

Result<std::int64_t> decodeSignMagnitude(std::uint64_t raw) {
    if ((raw & kSignBit) == 0) {
        // Unreachable: a clear sign bit already bounds raw by INT64_MAX
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return makeError<std::int64_t>(
                ErrorCode::kIntegerOverflow,
                fmt::format("sign-magnitude value 0x{:016x} does not fit in int64", raw));
        }
        return static_cast<std::int64_t>(raw);
    }

    // 63-bit magnitude always fits, so negation cannot overflow
    return -static_cast<std::int64_t>(raw & kMagnitudeMask);
}

Result<std::uint64_t> encodeSignMagnitude(std::int64_t value) {
    if (value >= 0) {
        return static_cast<std::uint64_t>(value);
    }
    if (value == std::numeric_limits<std::int64_t>::min()) {
        return makeError<std::uint64_t>(
            ErrorCode::kIntegerOverflow,
            fmt::format("magnitude of {} does not fit in 63 bits", value));
    }
    return kSignBit | static_cast<std::uint64_t>(-value);
}

}  // namespace bsr::format
