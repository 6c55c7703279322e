#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <absl/status/statusor.h>

namespace suid::codec {

/// 32-symbol printable alphabet in ascending ASCII order, so that comparing
/// encoded text byte by byte gives the same order as the encoded values.
class Alphabet {
public:
    static constexpr std::string_view kSymbols = "123456abcdefghijklmnopqrstuvwxyz";
    static constexpr size_t kSize = 32;

    /// Symbol for the low five bits of `value`
    static char Encode(uint8_t value) {
        return kSymbols[value & 0x1f];
    }

    /// 5-bit value of `symbol`, or InvalidArgument for any byte outside the alphabet
    static absl::StatusOr<uint8_t> Decode(char symbol);

    /// Table lookup: the symbol's value, -1 if it is not in the alphabet
    static int Lookup(char symbol);

    static bool Contains(char symbol);
};

}  // namespace suid::codec
