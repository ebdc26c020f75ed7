#pragma once

#include <atomic>
#include <cstdint>

namespace securewatch {

// Millisecond wall clock. Window expiry, suppression intervals and alert
// timestamps all read time through this interface.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint64_t NowMs() const = 0;
};

class SystemClock : public Clock {
public:
    uint64_t NowMs() const override;
};

// Externally driven clock for replays and tests.
class ManualClock : public Clock {
public:
    explicit ManualClock(uint64_t start_ms = 0) : now_ms_(start_ms) {}

    uint64_t NowMs() const override { return now_ms_.load(); }
    void Set(uint64_t now_ms) { now_ms_.store(now_ms); }
    void Advance(uint64_t delta_ms) { now_ms_.fetch_add(delta_ms); }

private:
    std::atomic<uint64_t> now_ms_;
};

} // namespace securewatch
