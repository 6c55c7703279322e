#pragma once

#include <absl/time/clock.h>
#include <absl/time/time.h>

namespace suid {

/// Wall-clock source for generators
class Clock {
public:
    virtual ~Clock() = default;
    virtual absl::Time Now() const = 0;
};

class SystemClock final : public Clock {
public:
    static const SystemClock& Instance() {
        static const SystemClock instance{};
        return instance;
    }

    absl::Time Now() const override {
        return absl::Now();
    }

private:
    SystemClock() = default;
};

}  // namespace suid
