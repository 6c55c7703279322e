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

/// 80-bit sortable identifier stored as 10 big-endian bytes, layout guid.v1:
///   group(3) | time(53, microseconds since epoch) | sequence(17) | host(7)
///
/// Not an RFC 4122 UUID. The group is a caller tag; it does not partition
/// the sequence space.
class Guid {
public:
    static constexpr int kBits = 80;
    static constexpr size_t kTextLength = 16;
    static constexpr size_t kBinaryLength = 10;
    static constexpr uint64_t kMaxGroup = 0x7;

    /// Microseconds; a verified GUID was created after this (2026-02-12)
    static constexpr uint64_t kTimeFloor = 1770904743122773;

    using Bytes = std::array<uint8_t, kBinaryLength>;

    constexpr Guid() = default;

    /// Validating packer. Fails if any value exceeds its field width.
    static absl::StatusOr<Guid> FromFields(uint64_t group, uint64_t time,
                                           uint64_t sequence, uint64_t host);

    static absl::StatusOr<Guid> FromText(std::string_view text);
    static absl::StatusOr<Guid> FromBinary(absl::Span<const uint8_t> bytes);

    const Bytes& ToRaw() const { return bytes_; }
    Bytes ToBinary() const { return bytes_; }
    std::string ToText() const;

    uint64_t Group() const;
    uint64_t Time() const;
    uint64_t Sequence() const;
    uint64_t Host() const;
    absl::Time Timestamp() const;

    /// Sanity check only: time at or after kTimeFloor
    bool Verify() const;

    std::string Description() const;

    friend bool operator==(const Guid& a, const Guid& b) { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const Guid& a, const Guid& b) { return a.bytes_ != b.bytes_; }
    friend bool operator<(const Guid& a, const Guid& b) { return a.bytes_ < b.bytes_; }
    friend bool operator>(const Guid& a, const Guid& b) { return a.bytes_ > b.bytes_; }
    friend bool operator<=(const Guid& a, const Guid& b) { return a.bytes_ <= b.bytes_; }
    friend bool operator>=(const Guid& a, const Guid& b) { return a.bytes_ >= b.bytes_; }

private:
    explicit Guid(const Bytes& bytes) : bytes_(bytes) {}

    Bytes bytes_{};
};

std::ostream& operator<<(std::ostream& os, const Guid& id);

}  // namespace suid
