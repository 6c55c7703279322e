#pragma once

#include <cstdint>
#include <memory>

#include <absl/status/statusor.h>

#include "suid/host/host_id.h"
#include "suid/id/clock.h"
#include "suid/id/guid.h"
#include "suid/id/sequence_allocator.h"
#include "suid/id/suid.h"

namespace suid {

/// Produces SUIDs from the clock (seconds), a shared allocator and a host id
/// fixed at creation. Safe to call New() from any number of threads; the only
/// shared write is the allocator's fetch_add.
///
/// More than MaxSequence() + 1 calls within one second on one allocator
/// repeat a sequence value and yield duplicate SUIDs.
class SuidGenerator {
public:
    /// Fails if host_id exceeds MaxHost() or the allocator's range differs
    /// from MaxSequence().
    static absl::StatusOr<std::unique_ptr<SuidGenerator>> Create(
        uint64_t host_id,
        SequenceAllocator& allocator,
        const Clock& clock = SystemClock::Instance());

    /// Resolves the host id once and keeps it for the generator's lifetime
    static absl::StatusOr<std::unique_ptr<SuidGenerator>> Create(
        const host::HostIdResolver& resolver,
        SequenceAllocator& allocator,
        const Clock& clock = SystemClock::Instance());

    SuidGenerator(const SuidGenerator&) = delete;
    SuidGenerator& operator=(const SuidGenerator&) = delete;

    absl::StatusOr<Suid> New();

    uint64_t host_id() const { return host_id_; }

    static uint64_t MaxSequence();
    static uint64_t MaxHost();

private:
    SuidGenerator(uint64_t host_id, SequenceAllocator& allocator, const Clock& clock);

    const uint64_t host_id_;
    const uint64_t time_mask_;
    SequenceAllocator& allocator_;
    const Clock& clock_;
};

/// Produces GUIDs from the clock (microseconds), a shared allocator and a
/// host id fixed at creation. All groups share one allocator.
class GuidGenerator {
public:
    static absl::StatusOr<std::unique_ptr<GuidGenerator>> Create(
        uint64_t host_id,
        SequenceAllocator& allocator,
        const Clock& clock = SystemClock::Instance());

    static absl::StatusOr<std::unique_ptr<GuidGenerator>> Create(
        const host::HostIdResolver& resolver,
        SequenceAllocator& allocator,
        const Clock& clock = SystemClock::Instance());

    GuidGenerator(const GuidGenerator&) = delete;
    GuidGenerator& operator=(const GuidGenerator&) = delete;

    /// InvalidArgument if group > Guid::kMaxGroup
    absl::StatusOr<Guid> New(uint64_t group = 0);

    uint64_t host_id() const { return host_id_; }

    static uint64_t MaxSequence();
    static uint64_t MaxHost();

private:
    GuidGenerator(uint64_t host_id, SequenceAllocator& allocator, const Clock& clock);

    const uint64_t host_id_;
    const uint64_t time_mask_;
    SequenceAllocator& allocator_;
    const Clock& clock_;
};

}  // namespace suid
