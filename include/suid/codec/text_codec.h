#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/types/span.h>

namespace suid::codec {

/// Number of symbols needed for `bits` bits: ceil(bits / 5)
constexpr size_t EncodedLength(int bits) {
    return static_cast<size_t>((bits + 4) / 5);
}

/// Encode a big-endian value of `bits` bits (bytes.size() * 8 >= bits, value
/// right-aligned) into EncodedLength(bits) symbols, MSB first. Zero padding
/// bits are prepended so the text sorts like the value.
std::string EncodeText(absl::Span<const uint8_t> bytes, int bits);

/// Reverse of EncodeText. Checks the length, every symbol and the padding
/// bits before touching `out`; on error `out` is left unchanged.
absl::Status DecodeText(std::string_view text, int bits, absl::Span<uint8_t> out);

}  // namespace suid::codec
