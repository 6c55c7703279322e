#include "suid/codec/alphabet.h"

#include <array>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

namespace suid::codec {

namespace {

constexpr int8_t kInvalid = -1;

using DecodeTable = std::array<int8_t, 256>;

const DecodeTable& GetDecodeTable() {
    static const DecodeTable table = [] {
        DecodeTable t;
        t.fill(kInvalid);
        for (size_t i = 0; i < Alphabet::kSize; ++i) {
            t[static_cast<unsigned char>(Alphabet::kSymbols[i])] = static_cast<int8_t>(i);
        }
        return t;
    }();
    return table;
}

}  // namespace

int Alphabet::Lookup(char symbol) {
    return GetDecodeTable()[static_cast<unsigned char>(symbol)];
}

absl::StatusOr<uint8_t> Alphabet::Decode(char symbol) {
    const int value = Lookup(symbol);
    if (value == kInvalid) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Invalid character 0x", absl::Hex(static_cast<unsigned char>(symbol), absl::kZeroPad2)));
    }
    return static_cast<uint8_t>(value);
}

bool Alphabet::Contains(char symbol) {
    return Lookup(symbol) != kInvalid;
}

}  // namespace suid::codec
