#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <absl/time/time.h>
#include <absl/types/span.h>

namespace suid {

/// 64-bit sortable identifier, layout suid.v1:
///   reserved(1) | time(33, seconds since epoch) | sequence(22) | host(8)
///
/// The reserved bit keeps the value positive as an int64 until 2242, so a
/// SUID fits a signed BIGINT column.
class Suid {
public:
    static constexpr int kBits = 64;
    static constexpr size_t kTextLength = 13;
    static constexpr size_t kBinaryLength = 8;

    /// Seconds; a verified SUID was created after this (2025-04-23 09:20:00 UTC)
    static constexpr uint64_t kTimeFloor = 1745400000;

    constexpr Suid() = default;

    /// Validating packer. Fails if any value exceeds its field width.
    static absl::StatusOr<Suid> FromFields(uint64_t time, uint64_t sequence, uint64_t host);

    /// Wrap a raw integer as read from storage; no checks, see Verify()
    static Suid FromRaw(int64_t raw) { return Suid(static_cast<uint64_t>(raw)); }

    static absl::StatusOr<Suid> FromText(std::string_view text);
    static absl::StatusOr<Suid> FromBinary(absl::Span<const uint8_t> bytes);
    static absl::StatusOr<Suid> FromDecimal(std::string_view text);
    static absl::StatusOr<Suid> FromHex(std::string_view text);

    int64_t ToRaw() const { return static_cast<int64_t>(value_); }
    uint64_t value() const { return value_; }

    std::string ToText() const;
    std::array<uint8_t, kBinaryLength> ToBinary() const;
    std::string ToDecimal() const;
    std::string ToHex() const;

    uint64_t Reserved() const;
    uint64_t Time() const;
    uint64_t Sequence() const;
    uint64_t Host() const;
    absl::Time Timestamp() const;

    /// Sanity check only: reserved bit clear and time after kTimeFloor.
    /// Says nothing about collisions.
    bool Verify() const;

    std::string Description() const;

    friend bool operator==(const Suid& a, const Suid& b) { return a.value_ == b.value_; }
    friend bool operator!=(const Suid& a, const Suid& b) { return a.value_ != b.value_; }
    friend bool operator<(const Suid& a, const Suid& b) { return a.value_ < b.value_; }
    friend bool operator>(const Suid& a, const Suid& b) { return a.value_ > b.value_; }
    friend bool operator<=(const Suid& a, const Suid& b) { return a.value_ <= b.value_; }
    friend bool operator>=(const Suid& a, const Suid& b) { return a.value_ >= b.value_; }

private:
    explicit constexpr Suid(uint64_t value) : value_(value) {}

    uint64_t value_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Suid& id);

}  // namespace suid
