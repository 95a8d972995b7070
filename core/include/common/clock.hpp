#pragma once

#include <chrono>
#include <memory>

namespace sc {
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    // Monotonic time for cadence and cycle bookkeeping. Tests swap in a manual clock.
    class IClock {
    public:
        virtual ~IClock() = default;
        virtual TimePoint now() const = 0;
    };

    class SteadyClock : public IClock {
    public:
        TimePoint now() const override { return Clock::now(); }
    };

    inline std::shared_ptr<const IClock> default_clock() {
        static const auto clock = std::make_shared<SteadyClock>();
        return clock;
    }

    inline double seconds_between(TimePoint from, TimePoint to) {
        return std::chrono::duration<double>(to - from).count();
    }
}
