#include "suid/id/generator.h"

#include <string_view>

#include <absl/log/log.h>
#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

#include "suid/codec/bit_layout.h"

namespace suid {

namespace {

using codec::BitLayout;
using codec::Field;

absl::Status CheckGeneratorArgs(std::string_view kind,
                                const BitLayout& layout,
                                uint64_t host_id,
                                const SequenceAllocator& allocator) {
    if (host_id > layout.MaxValue(Field::kHost)) {
        return absl::InvalidArgumentError(absl::StrCat(
            kind, " host id ", host_id, " exceeds maximum ", layout.MaxValue(Field::kHost)));
    }
    if (allocator.max_sequence() != layout.MaxValue(Field::kSequence)) {
        return absl::InvalidArgumentError(absl::StrCat(
            kind, " allocator range ", allocator.max_sequence(), " does not match sequence field maximum ",
            layout.MaxValue(Field::kSequence)));
    }
    return absl::OkStatus();
}

}  // namespace

// ============================================================================
// SuidGenerator
// ============================================================================

SuidGenerator::SuidGenerator(uint64_t host_id, SequenceAllocator& allocator, const Clock& clock)
    : host_id_(host_id),
      time_mask_(codec::SuidLayout().MaxValue(Field::kTime)),
      allocator_(allocator),
      clock_(clock) {
}

absl::StatusOr<std::unique_ptr<SuidGenerator>> SuidGenerator::Create(
    uint64_t host_id, SequenceAllocator& allocator, const Clock& clock) {
    const BitLayout& layout = codec::SuidLayout();
    if (auto status = CheckGeneratorArgs("SUID", layout, host_id, allocator); !status.ok()) {
        return status;
    }
    LOG(INFO) << "[Generator] SUID generator ready: layout=" << layout.name()
              << " host=" << host_id;
    return std::unique_ptr<SuidGenerator>(new SuidGenerator(host_id, allocator, clock));
}

absl::StatusOr<std::unique_ptr<SuidGenerator>> SuidGenerator::Create(
    const host::HostIdResolver& resolver, SequenceAllocator& allocator, const Clock& clock) {
    const host::ResolvedHostId resolved = resolver.Resolve(MaxHost());
    LOG(INFO) << "[Generator] Host id " << resolved.host_id << " from "
              << host::HostIdSourceName(resolved.source);
    return Create(resolved.host_id, allocator, clock);
}

absl::StatusOr<Suid> SuidGenerator::New() {
    // Seconds past the 33-bit range wrap around.
    const auto seconds = static_cast<uint64_t>(absl::ToUnixSeconds(clock_.Now()));
    return Suid::FromFields(seconds & time_mask_, allocator_.Next(), host_id_);
}

uint64_t SuidGenerator::MaxSequence() {
    return codec::SuidLayout().MaxValue(Field::kSequence);
}

uint64_t SuidGenerator::MaxHost() {
    return codec::SuidLayout().MaxValue(Field::kHost);
}

// ============================================================================
// GuidGenerator
// ============================================================================

GuidGenerator::GuidGenerator(uint64_t host_id, SequenceAllocator& allocator, const Clock& clock)
    : host_id_(host_id),
      time_mask_(codec::GuidLayout().MaxValue(Field::kTime)),
      allocator_(allocator),
      clock_(clock) {
}

absl::StatusOr<std::unique_ptr<GuidGenerator>> GuidGenerator::Create(
    uint64_t host_id, SequenceAllocator& allocator, const Clock& clock) {
    const BitLayout& layout = codec::GuidLayout();
    if (auto status = CheckGeneratorArgs("GUID", layout, host_id, allocator); !status.ok()) {
        return status;
    }
    LOG(INFO) << "[Generator] GUID generator ready: layout=" << layout.name()
              << " host=" << host_id;
    return std::unique_ptr<GuidGenerator>(new GuidGenerator(host_id, allocator, clock));
}

absl::StatusOr<std::unique_ptr<GuidGenerator>> GuidGenerator::Create(
    const host::HostIdResolver& resolver, SequenceAllocator& allocator, const Clock& clock) {
    const host::ResolvedHostId resolved = resolver.Resolve(MaxHost());
    LOG(INFO) << "[Generator] Host id " << resolved.host_id << " from "
              << host::HostIdSourceName(resolved.source);
    return Create(resolved.host_id, allocator, clock);
}

absl::StatusOr<Guid> GuidGenerator::New(uint64_t group) {
    if (group > Guid::kMaxGroup) {
        return absl::InvalidArgumentError(absl::StrCat(
            "Invalid GUID group ", group, ": maximum is ", Guid::kMaxGroup));
    }
    const auto micros = static_cast<uint64_t>(absl::ToUnixMicros(clock_.Now()));
    return Guid::FromFields(group, micros & time_mask_, allocator_.Next(), host_id_);
}

uint64_t GuidGenerator::MaxSequence() {
    return codec::GuidLayout().MaxValue(Field::kSequence);
}

uint64_t GuidGenerator::MaxHost() {
    return codec::GuidLayout().MaxValue(Field::kHost);
}

}  // namespace suid
