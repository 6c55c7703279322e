#include "suid/codec/bits.h"

#include <algorithm>

namespace suid::codec {

void WriteBits(absl::Span<uint8_t> bytes, int msb_offset, int width, uint64_t value) {
    int pos = msb_offset;
    int remaining = width;
    while (remaining > 0) {
        const int bit_in_byte = pos % 8;
        const int take = std::min(8 - bit_in_byte, remaining);
        const int shift = 8 - bit_in_byte - take;

        const auto chunk = static_cast<uint8_t>((value >> (remaining - take)) & LowMask(take));
        const auto mask = static_cast<uint8_t>(LowMask(take) << shift);

        uint8_t& target = bytes[pos / 8];
        target = static_cast<uint8_t>((target & ~mask) | (chunk << shift));

        pos += take;
        remaining -= take;
    }
}

uint64_t ReadBits(absl::Span<const uint8_t> bytes, int msb_offset, int width) {
    uint64_t value = 0;
    int pos = msb_offset;
    int remaining = width;
    while (remaining > 0) {
        const int bit_in_byte = pos % 8;
        const int take = std::min(8 - bit_in_byte, remaining);
        const int shift = 8 - bit_in_byte - take;

        const uint64_t chunk = (bytes[pos / 8] >> shift) & LowMask(take);
        value = (value << take) | chunk;

        pos += take;
        remaining -= take;
    }
    return value;
}

}  // namespace suid::codec
