// =============================================================================
// bsr - Sign-Magnitude Integer Codec
// =============================================================================
// bsdiff control records store signed offsets as sign-magnitude 64-bit
// integers: bit 63 is the sign (1 = negative), bits 0-62 the absolute value.
// This is not two's complement; raw 0 and raw 1<<63 both decode to 0.
// =============================================================================

#ifndef BSR_FORMAT_SIGN_MAGNITUDE_H
#define BSR_FORMAT_SIGN_MAGNITUDE_H

#include <cstdint>

#include "bsr/common/error.h"

namespace bsr::format {

/// @brief Sign bit of a sign-magnitude value.
inline constexpr std::uint64_t kSignBit = 1ULL << 63;

/// @brief Mask of the 63 magnitude bits.
inline constexpr std::uint64_t kMagnitudeMask = kSignBit - 1;

/// @brief Decode a raw sign-magnitude value.
/// @param raw Raw 64-bit field as read from the control stream.
/// @return Signed value, or kIntegerOverflow if it cannot be represented.
[[nodiscard]] Result<std::int64_t> decodeSignMagnitude(std::uint64_t raw);

/// @brief Encode a signed value in sign-magnitude form.
/// @return Raw 64-bit field, or kIntegerOverflow for INT64_MIN.
[[nodiscard]] Result<std::uint64_t> encodeSignMagnitude(std::int64_t value);

}  // namespace bsr::format

#endif  // BSR_FORMAT_SIGN_MAGNITUDE_H
