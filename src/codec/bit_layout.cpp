#include "suid/codec/bit_layout.h"

#include <algorithm>
#include <utility>

#include <absl/strings/str_cat.h>

#include "suid/codec/bits.h"

namespace suid::codec {

std::string_view FieldName(Field field) {
    switch (field) {
    case Field::kReserved: return "reserved";
    case Field::kGroup: return "group";
    case Field::kTime: return "time";
    case Field::kSequence: return "sequence";
    case Field::kHost: return "host";
    }
    return "unknown";
}

uint64_t FieldValues::Get(Field field) const {
    switch (field) {
    case Field::kReserved: return reserved;
    case Field::kGroup: return group;
    case Field::kTime: return time;
    case Field::kSequence: return sequence;
    case Field::kHost: return host;
    }
    return 0;
}

void FieldValues::Set(Field field, uint64_t value) {
    switch (field) {
    case Field::kReserved: reserved = value; break;
    case Field::kGroup: group = value; break;
    case Field::kTime: time = value; break;
    case Field::kSequence: sequence = value; break;
    case Field::kHost: host = value; break;
    }
}

absl::StatusOr<BitLayout> BitLayout::Create(std::string name,
                                            int version,
                                            int container_bits,
                                            std::vector<FieldSpec> fields) {
    if (container_bits <= 0 || container_bits % 8 != 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Container width must be a positive multiple of 8, got ", container_bits));
    }

    int total = 0;
    for (size_t i = 0; i < fields.size(); ++i) {
        const FieldSpec& entry = fields[i];
        if (entry.width < 1 || entry.width > 64) {
            return absl::InvalidArgumentError(absl::StrCat(
                "Field ", FieldName(entry.field), " has invalid width ", entry.width));
        }
        for (size_t j = 0; j < i; ++j) {
            if (fields[j].field == entry.field) {
                return absl::InvalidArgumentError(
                    absl::StrCat("Duplicate field ", FieldName(entry.field)));
            }
        }
        total += entry.width;
    }

    if (total > container_bits) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Fields need ", total, " bits but the container holds ", container_bits));
    }

    return BitLayout(std::move(name), version, container_bits, std::move(fields));
}

BitLayout::BitLayout(std::string name, int version, int container_bits,
                     std::vector<FieldSpec> fields)
    : name_(std::move(name)),
      version_(version),
      container_bits_(container_bits),
      fields_(std::move(fields)),
      used_bits_(0) {
    for (const auto& entry : fields_) {
        used_bits_ += entry.width;
    }
}

const FieldSpec* BitLayout::Find(Field field) const {
    for (const auto& entry : fields_) {
        if (entry.field == field) {
            return &entry;
        }
    }
    return nullptr;
}

bool BitLayout::Contains(Field field) const {
    return Find(field) != nullptr;
}

int BitLayout::Width(Field field) const {
    const FieldSpec* entry = Find(field);
    return entry ? entry->width : 0;
}

uint64_t BitLayout::MaxValue(Field field) const {
    const FieldSpec* entry = Find(field);
    return entry ? LowMask(entry->width) : 0;
}

int BitLayout::MsbOffset(Field field) const {
    // Fields are right-aligned; any spare bits sit above the first field.
    int offset = container_bits_ - used_bits_;
    for (const auto& entry : fields_) {
        if (entry.field == field) {
            return offset;
        }
        offset += entry.width;
    }
    return container_bits_;
}

int BitLayout::Shift(Field field) const {
    return container_bits_ - MsbOffset(field) - Width(field);
}

absl::Status BitLayout::Validate(const FieldValues& values) const {
    for (Field field : {Field::kReserved, Field::kGroup, Field::kTime,
                        Field::kSequence, Field::kHost}) {
        const uint64_t value = values.Get(field);
        const FieldSpec* entry = Find(field);
        if (entry == nullptr) {
            if (value != 0) {
                return absl::InvalidArgumentError(absl::StrCat(
                    "Layout ", name_, " has no ", FieldName(field), " field, got value ", value));
            }
            continue;
        }
        if (value > LowMask(entry->width)) {
            return absl::InvalidArgumentError(absl::StrCat(
                FieldName(field), " value ", value, " exceeds ", entry->width,
                "-bit field maximum ", LowMask(entry->width)));
        }
    }
    return absl::OkStatus();
}

absl::StatusOr<uint64_t> BitLayout::PackWord(const FieldValues& values) const {
    if (container_bits_ > 64) {
        return absl::FailedPreconditionError(
            absl::StrCat("Layout ", name_, " does not fit in a 64-bit word"));
    }
    if (auto status = Validate(values); !status.ok()) {
        return status;
    }

    uint64_t word = 0;
    for (const auto& entry : fields_) {
        word |= values.Get(entry.field) << Shift(entry.field);
    }
    return word;
}

uint64_t BitLayout::UnpackWord(uint64_t word, Field field) const {
    const FieldSpec* entry = Find(field);
    if (entry == nullptr) {
        return 0;
    }
    const int shift = Shift(field);
    return shift >= 64 ? 0 : (word >> shift) & LowMask(entry->width);
}

FieldValues BitLayout::UnpackWord(uint64_t word) const {
    FieldValues values;
    for (const auto& entry : fields_) {
        values.Set(entry.field, UnpackWord(word, entry.field));
    }
    return values;
}

absl::Status BitLayout::PackBytes(const FieldValues& values, absl::Span<uint8_t> out) const {
    if (out.size() * 8 != static_cast<size_t>(container_bits_)) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Layout ", name_, " needs ", container_bits_ / 8, " bytes, got ", out.size()));
    }
    if (auto status = Validate(values); !status.ok()) {
        return status;
    }

    std::fill(out.begin(), out.end(), uint8_t{0});
    for (const auto& entry : fields_) {
        WriteBits(out, MsbOffset(entry.field), entry.width, values.Get(entry.field));
    }
    return absl::OkStatus();
}

uint64_t BitLayout::UnpackBytes(absl::Span<const uint8_t> bytes, Field field) const {
    const FieldSpec* entry = Find(field);
    if (entry == nullptr || bytes.size() * 8 < static_cast<size_t>(container_bits_)) {
        return 0;
    }
    return ReadBits(bytes, MsbOffset(field), entry->width);
}

FieldValues BitLayout::UnpackBytes(absl::Span<const uint8_t> bytes) const {
    FieldValues values;
    for (const auto& entry : fields_) {
        values.Set(entry.field, UnpackBytes(bytes, entry.field));
    }
    return values;
}

const BitLayout& SuidLayout() {
    static const BitLayout* const layout = new BitLayout(
        "suid.v1", 1, 64,
        {{Field::kReserved, 1}, {Field::kTime, 33}, {Field::kSequence, 22}, {Field::kHost, 8}});
    return *layout;
}

const BitLayout& GuidLayout() {
    static const BitLayout* const layout = new BitLayout(
        "guid.v1", 1, 80,
        {{Field::kGroup, 3}, {Field::kTime, 53}, {Field::kSequence, 17}, {Field::kHost, 7}});
    return *layout;
}

}  // namespace suid::codec
