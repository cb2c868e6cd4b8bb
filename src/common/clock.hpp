#pragma once

#include <chrono>

namespace dbsnap {

// ── Clock abstraction ────────────────────────────────────────────────────────
//
// Wall-clock time source for the backup manager.  Retention cutoffs, result
// timestamps and pre-restore snapshot names are all derived from it, so tests
// can pin "now" with MockClock instead of racing the real clock.

class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    [[nodiscard]] virtual time_point now() const = 0;
};

// ── SystemClock ──────────────────────────────────────────────────────────────
//
// Production implementation: delegates to std::chrono::system_clock.

class SystemClock final : public Clock {
public:
    [[nodiscard]] time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

// ── MockClock ────────────────────────────────────────────────────────────────
//
// Test implementation: starts at a fixed instant and only moves on advance().

class MockClock final : public Clock {
public:
    explicit MockClock(time_point start = std::chrono::system_clock::now())
        : now_{start} {}

    [[nodiscard]] time_point now() const override {
        return now_;
    }

    void advance(std::chrono::milliseconds delta) {
        now_ += delta;
    }

private:
    time_point now_;
};

} // namespace dbsnap
