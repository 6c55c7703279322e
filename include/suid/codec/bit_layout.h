#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/types/span.h>

namespace suid::codec {

enum class Field : uint8_t {
    kReserved,
    kGroup,
    kTime,
    kSequence,
    kHost
};

std::string_view FieldName(Field field);

struct FieldSpec {
    Field field;
    int width;
};

/// Values for every field kind. Fields a layout does not carry must stay zero.
struct FieldValues {
    uint64_t reserved = 0;
    uint64_t group = 0;
    uint64_t time = 0;
    uint64_t sequence = 0;
    uint64_t host = 0;

    uint64_t Get(Field field) const;
    void Set(Field field, uint64_t value);
};

/// Ordered (field, width) list, most significant field first, packed into a
/// fixed-width container. The container is either a 64-bit word or a
/// big-endian byte sequence of container_bits / 8 bytes.
///
/// Packing never truncates: a value wider than its field is rejected.
class BitLayout {
public:
    /// Build a layout, checking that fields are unique, each width is in
    /// [1, 64] and the widths fit in the container.
    static absl::StatusOr<BitLayout> Create(std::string name,
                                            int version,
                                            int container_bits,
                                            std::vector<FieldSpec> fields);

    const std::string& name() const { return name_; }
    int version() const { return version_; }
    int container_bits() const { return container_bits_; }
    const std::vector<FieldSpec>& fields() const { return fields_; }

    bool Contains(Field field) const;

    /// Width of the field, 0 if the layout does not carry it
    int Width(Field field) const;

    /// Largest value the field can hold, 0 if absent
    uint64_t MaxValue(Field field) const;

    /// Distance in bits from the container's LSB to the field's LSB
    int Shift(Field field) const;

    /// Distance in bits from the container's MSB to the field's MSB
    int MsbOffset(Field field) const;

    absl::Status Validate(const FieldValues& values) const;

    // Word container (container_bits <= 64)
    absl::StatusOr<uint64_t> PackWord(const FieldValues& values) const;
    uint64_t UnpackWord(uint64_t word, Field field) const;
    FieldValues UnpackWord(uint64_t word) const;

    // Byte container, out.size() * 8 must equal container_bits
    absl::Status PackBytes(const FieldValues& values, absl::Span<uint8_t> out) const;
    uint64_t UnpackBytes(absl::Span<const uint8_t> bytes, Field field) const;
    FieldValues UnpackBytes(absl::Span<const uint8_t> bytes) const;

private:
    BitLayout(std::string name, int version, int container_bits, std::vector<FieldSpec> fields);

    const FieldSpec* Find(Field field) const;

    std::string name_;
    int version_;
    int container_bits_;
    std::vector<FieldSpec> fields_;
    int used_bits_;

    friend const BitLayout& SuidLayout();
    friend const BitLayout& GuidLayout();
};

/// suid.v1: reserved(1) time(33) sequence(22) host(8) in a 64-bit word
const BitLayout& SuidLayout();

/// guid.v1: group(3) time(53) sequence(17) host(7) in 10 bytes
const BitLayout& GuidLayout();

}  // namespace suid::codec
