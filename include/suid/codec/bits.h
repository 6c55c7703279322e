#pragma once

#include <cstdint>

#include <absl/types/span.h>

namespace suid::codec {

/// Bit offsets in this file count from the most significant bit of byte 0.
/// Fields may straddle any number of byte boundaries.

/// Write the low `width` bits of `value` at `msb_offset`.
/// Bits outside the target range are left untouched.
void WriteBits(absl::Span<uint8_t> bytes, int msb_offset, int width, uint64_t value);

/// Read `width` bits (<= 64) starting at `msb_offset`.
uint64_t ReadBits(absl::Span<const uint8_t> bytes, int msb_offset, int width);

/// Mask with the low `width` bits set
constexpr uint64_t LowMask(int width) {
    return width >= 64 ? ~uint64_t{0} : (uint64_t{1} << width) - 1;
}

}  // namespace suid::codec
