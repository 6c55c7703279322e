#include "suid/codec/text_codec.h"

#include <algorithm>

#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>

#include "suid/codec/alphabet.h"
#include "suid/codec/bits.h"

namespace suid::codec {

namespace {

// Container bit position of the first symbol's MSB. Negative when the
// symbols carry padding above the value.
int FirstSymbolOffset(size_t container_bytes, size_t symbols) {
    return static_cast<int>(container_bytes * 8) - static_cast<int>(symbols * 5);
}

}  // namespace

std::string EncodeText(absl::Span<const uint8_t> bytes, int bits) {
    const size_t length = EncodedLength(bits);
    const int base = FirstSymbolOffset(bytes.size(), length);

    std::string text(length, Alphabet::Encode(0));
    for (size_t i = 0; i < length; ++i) {
        const int pos = base + static_cast<int>(i) * 5;
        uint64_t value = 0;
        if (pos >= 0) {
            value = ReadBits(bytes, pos, 5);
        } else if (pos > -5) {
            value = ReadBits(bytes, 0, 5 + pos);
        }
        text[i] = Alphabet::Encode(static_cast<uint8_t>(value));
    }
    return text;
}

absl::Status DecodeText(std::string_view text, int bits, absl::Span<uint8_t> out) {
    if (out.size() * 8 < static_cast<size_t>(bits)) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Output buffer of ", out.size(), " bytes cannot hold ", bits, " bits"));
    }

    const size_t length = EncodedLength(bits);
    if (text.size() != length) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Invalid text length: got ", text.size(), ", want ", length));
    }

    for (size_t i = 0; i < text.size(); ++i) {
        if (Alphabet::Lookup(text[i]) < 0) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Invalid character '", absl::CEscape(text.substr(i, 1)), "' at position ", i));
        }
    }

    const int padding = static_cast<int>(length * 5) - bits;
    if (padding > 0) {
        const int first = Alphabet::Lookup(text[0]);
        if ((first >> (5 - padding)) != 0) {
            return absl::InvalidArgumentError(
                absl::StrCat("Text value exceeds ", bits, " bits"));
        }
    }

    std::fill(out.begin(), out.end(), uint8_t{0});
    const int base = FirstSymbolOffset(out.size(), length);
    for (size_t i = 0; i < length; ++i) {
        const auto value = static_cast<uint64_t>(Alphabet::Lookup(text[i]));
        const int pos = base + static_cast<int>(i) * 5;
        if (pos >= 0) {
            WriteBits(out, pos, 5, value);
        } else if (pos > -5) {
            WriteBits(out, 0, 5 + pos, value);
        }
    }
    return absl::OkStatus();
}

}  // namespace suid::codec
