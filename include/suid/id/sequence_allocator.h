#pragma once

#include <atomic>
#include <cstdint>

namespace suid {

/// Free-running sequence counter shared by every caller of one generator.
///
/// Next() is a single relaxed fetch_add reduced modulo max_sequence + 1. The
/// counter is never reset on a clock tick, so more than max_sequence + 1
/// calls within one tick repeat a sequence value. It never blocks or fails.
class SequenceAllocator {
public:
    explicit SequenceAllocator(uint64_t max_sequence, uint64_t start = 0)
        : max_sequence_(max_sequence), counter_(start) {}

    SequenceAllocator(const SequenceAllocator&) = delete;
    SequenceAllocator& operator=(const SequenceAllocator&) = delete;
    SequenceAllocator(SequenceAllocator&&) = delete;
    SequenceAllocator& operator=(SequenceAllocator&&) = delete;

    uint64_t Next() {
        const uint64_t raw = counter_.fetch_add(1, std::memory_order_relaxed);
        if (max_sequence_ == UINT64_MAX) {
            return raw;
        }
        return raw % (max_sequence_ + 1);
    }

    uint64_t max_sequence() const { return max_sequence_; }

private:
    const uint64_t max_sequence_;
    std::atomic<uint64_t> counter_;
};

}  // namespace suid
