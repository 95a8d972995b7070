#pragma once

#include <mutex>

#include <common/clock.hpp>

namespace sc {
    // Admits at most one event per period, measured from the last admitted event.
    class CadenceGate {
    public:
        explicit CadenceGate(double period_s = 0.0) : period_s_(period_s) {}

        void set_period(double period_s) {
            std::lock_guard lk(m_);
            period_s_ = period_s;
        }

        double period() const {
            std::lock_guard lk(m_);
            return period_s_;
        }

        bool admit(TimePoint now) {
            std::lock_guard lk(m_);
            if (has_last_) {
                // producer jitter must not reject a frame that is on schedule
                const double slack = period_s_ * kJitterFraction;
                if (seconds_between(last_, now) + slack < period_s_) return false;
            }
            last_ = now;
            has_last_ = true;
            return true;
        }

        void reset() {
            std::lock_guard lk(m_);
            has_last_ = false;
        }

        double seconds_until_next(TimePoint now) const {
            std::lock_guard lk(m_);
            if (!has_last_) return 0.0;
            const double left = period_s_ - seconds_between(last_, now);
            return left > 0.0 ? left : 0.0;
        }

    private:
        static constexpr double kJitterFraction = 0.05;

        mutable std::mutex m_;
        double period_s_;
        bool has_last_ = false;
        TimePoint last_{};
    };
}
