///// Otter: Praezises Schlafen (sleep+spin) und Loop-Uhr; steady_clock only; header-only.
///// Schneefuchs: Grobe OS-Timer schiessen ueber – die letzte Millisekunde wird gespinnt.
///// Maus: Clock ist eine Naht fuer Tests; SteadyClock ist die Produktionsuhr.
///// Datei: src/frame_limiter.hpp

#pragma once

#include <chrono>
#include <cstdint>
#include <thread>

namespace kachel::pace {

class SpinSleeper {
public:
    // Sleeps for d: coarse sleep until kSleepSlack before the deadline, then
    // yield-spin. Keeps jitter low without timeBeginPeriod.
    inline void sleep(std::chrono::nanoseconds d) const noexcept {
        using clock = std::chrono::steady_clock;
        static_assert(clock::is_steady, "steady_clock must be steady");
        if (d <= std::chrono::nanoseconds::zero()) return;

        const auto deadline = clock::now() + d;

        constexpr auto kSpinThreshold = std::chrono::milliseconds(2);
        constexpr auto kSleepSlack    = std::chrono::milliseconds(1);

        if (d > kSpinThreshold) {
            std::this_thread::sleep_for(d - kSleepSlack);
        }

        for (;;) {
            if (clock::now() >= deadline) break;
            std::this_thread::yield();
        }
    }
};

// Monotonic time source for the main loop.
class Clock {
public:
    virtual ~Clock() = default;

    // Milliseconds since the clock was created.
    [[nodiscard]] virtual std::uint64_t elapsedMs() const = 0;
    virtual void sleepFor(std::chrono::milliseconds d) = 0;
};

class SteadyClock final : public Clock {
public:
    SteadyClock() : start_(std::chrono::steady_clock::now()) {}

    [[nodiscard]] std::uint64_t elapsedMs() const override {
        const auto d = std::chrono::steady_clock::now() - start_;
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
    }

    void sleepFor(std::chrono::milliseconds d) override { sleeper_.sleep(d); }

private:
    std::chrono::steady_clock::time_point start_;
    SpinSleeper                           sleeper_;
};

} // namespace kachel::pace
