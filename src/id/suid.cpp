#include "suid/id/suid.h"

#include <absl/status/status.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>

#include "suid/codec/bit_layout.h"
#include "suid/codec/text_codec.h"

namespace suid {

namespace {

using codec::Field;
using codec::SuidLayout;

std::array<uint8_t, Suid::kBinaryLength> ToBigEndian(uint64_t value) {
    std::array<uint8_t, Suid::kBinaryLength> bytes{};
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * (bytes.size() - 1 - i)));
    }
    return bytes;
}

uint64_t FromBigEndian(absl::Span<const uint8_t> bytes) {
    uint64_t value = 0;
    for (uint8_t b : bytes) {
        value = (value << 8) | b;
    }
    return value;
}

}  // namespace

absl::StatusOr<Suid> Suid::FromFields(uint64_t time, uint64_t sequence, uint64_t host) {
    codec::FieldValues values;
    values.time = time;
    values.sequence = sequence;
    values.host = host;

    auto word = SuidLayout().PackWord(values);
    if (!word.ok()) {
        return word.status();
    }
    return Suid(*word);
}

absl::StatusOr<Suid> Suid::FromText(std::string_view text) {
    std::array<uint8_t, kBinaryLength> bytes{};
    if (auto status = codec::DecodeText(text, kBits, absl::MakeSpan(bytes)); !status.ok()) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid SUID text: ", status.message()));
    }
    return Suid(FromBigEndian(bytes));
}

absl::StatusOr<Suid> Suid::FromBinary(absl::Span<const uint8_t> bytes) {
    if (bytes.size() != kBinaryLength) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Invalid SUID binary length: got ", bytes.size(), ", want ", kBinaryLength));
    }
    return Suid(FromBigEndian(bytes));
}

absl::StatusOr<Suid> Suid::FromDecimal(std::string_view text) {
    int64_t raw = 0;
    if (!absl::SimpleAtoi(text, &raw)) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid SUID decimal: ", text));
    }
    return FromRaw(raw);
}

absl::StatusOr<Suid> Suid::FromHex(std::string_view text) {
    uint64_t raw = 0;
    if (!absl::SimpleHexAtoi(text, &raw)) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid SUID hex: ", text));
    }
    return Suid(raw);
}

std::string Suid::ToText() const {
    const auto bytes = ToBigEndian(value_);
    return codec::EncodeText(bytes, kBits);
}

std::array<uint8_t, Suid::kBinaryLength> Suid::ToBinary() const {
    return ToBigEndian(value_);
}

std::string Suid::ToDecimal() const {
    return absl::StrCat(ToRaw());
}

std::string Suid::ToHex() const {
    return absl::StrCat(absl::Hex(value_));
}

uint64_t Suid::Reserved() const {
    return SuidLayout().UnpackWord(value_, Field::kReserved);
}

uint64_t Suid::Time() const {
    return SuidLayout().UnpackWord(value_, Field::kTime);
}

uint64_t Suid::Sequence() const {
    return SuidLayout().UnpackWord(value_, Field::kSequence);
}

uint64_t Suid::Host() const {
    return SuidLayout().UnpackWord(value_, Field::kHost);
}

absl::Time Suid::Timestamp() const {
    return absl::FromUnixSeconds(static_cast<int64_t>(Time()));
}

bool Suid::Verify() const {
    return Reserved() == 0 && Time() > kTimeFloor;
}

std::string Suid::Description() const {
    return absl::StrCat("time: ", absl::FormatTime(absl::RFC3339_sec, Timestamp(), absl::UTCTimeZone()),
                        ", seq: ", Sequence(), ", host: ", Host(), ", text: ", ToText());
}

std::ostream& operator<<(std::ostream& os, const Suid& id) {
    return os << id.ToText();
}

}  // namespace suid
