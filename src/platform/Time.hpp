#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <thread>

namespace screenier {

class IClock {
public:
    using Duration = std::chrono::steady_clock::duration;
    using TimePoint = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;
    virtual TimePoint now() const = 0;
    virtual void sleepFor(Duration duration) = 0;
};

class SteadyClock final : public IClock {
public:
    TimePoint now() const override {
        return std::chrono::steady_clock::now();
    }

    void sleepFor(Duration duration) override {
        if (duration > Duration::zero()) {
            std::this_thread::sleep_for(duration);
        }
    }
};

inline IClock& systemClock() {
    static SteadyClock clock;
    return clock;
}

// Whole milliseconds between two instants, saturated to [0, 65535].
inline std::uint16_t clampedDelayMs(IClock::TimePoint from,
                                    IClock::TimePoint to) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(to - from)
                  .count();
    if (ms <= 0) {
        return 0;
    }
    constexpr auto kMax = std::numeric_limits<std::uint16_t>::max();
    if (ms >= static_cast<decltype(ms)>(kMax)) {
        return kMax;
    }
    return static_cast<std::uint16_t>(ms);
}

}  // namespace screenier
