#include "suid/id/guid.h"

#include <algorithm>

#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include "suid/codec/bit_layout.h"
#include "suid/codec/text_codec.h"

namespace suid {

using codec::Field;
using codec::GuidLayout;

absl::StatusOr<Guid> Guid::FromFields(uint64_t group, uint64_t time,
                                      uint64_t sequence, uint64_t host) {
    codec::FieldValues values;
    values.group = group;
    values.time = time;
    values.sequence = sequence;
    values.host = host;

    Bytes bytes{};
    if (auto status = GuidLayout().PackBytes(values, absl::MakeSpan(bytes)); !status.ok()) {
        return status;
    }
    return Guid(bytes);
}

absl::StatusOr<Guid> Guid::FromText(std::string_view text) {
    Bytes bytes{};
    if (auto status = codec::DecodeText(text, kBits, absl::MakeSpan(bytes)); !status.ok()) {
        return absl::InvalidArgumentError(absl::StrCat("Invalid GUID text: ", status.message()));
    }
    return Guid(bytes);
}

absl::StatusOr<Guid> Guid::FromBinary(absl::Span<const uint8_t> bytes) {
    if (bytes.size() != kBinaryLength) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Invalid GUID binary length: got ", bytes.size(), ", want ", kBinaryLength));
    }
    Bytes copy{};
    std::copy(bytes.begin(), bytes.end(), copy.begin());
    return Guid(copy);
}

std::string Guid::ToText() const {
    return codec::EncodeText(bytes_, kBits);
}

uint64_t Guid::Group() const {
    return GuidLayout().UnpackBytes(bytes_, Field::kGroup);
}

uint64_t Guid::Time() const {
    return GuidLayout().UnpackBytes(bytes_, Field::kTime);
}

uint64_t Guid::Sequence() const {
    return GuidLayout().UnpackBytes(bytes_, Field::kSequence);
}

uint64_t Guid::Host() const {
    return GuidLayout().UnpackBytes(bytes_, Field::kHost);
}

absl::Time Guid::Timestamp() const {
    return absl::FromUnixMicros(static_cast<int64_t>(Time()));
}

bool Guid::Verify() const {
    // Every field of guid.v1 fills its width exactly, so only time can be implausible.
    return Time() >= kTimeFloor;
}

std::string Guid::Description() const {
    return absl::StrCat("group: ", Group(), ", host: ", Host(), ", seq: ", Sequence(),
                        ", time: ", absl::FormatTime(absl::RFC3339_full, Timestamp(), absl::UTCTimeZone()),
                        ", text: ", ToText());
}

std::ostream& operator<<(std::ostream& os, const Guid& id) {
    return os << id.ToText();
}

}  // namespace suid
