#pragma once

#include <cstddef>
#include <vector>

#include <opencv2/core.hpp>

#include <common/clock.hpp>
#include <common/config.hpp>
#include <pipeline/cadence_gate.hpp>

namespace sc {
    enum class TimelapseState {
        Idle,
        Capturing,
        Compiling
    };

    const char* to_string(TimelapseState s);

    // Capture/compile bookkeeping of one timelapse. Not thread-safe; the owning
    // module serializes access.
    //
    //   Idle --begin--> Capturing --due--> Compiling --finish--> Idle
    //                       ^                              |
    //                       +------ duration 0 + repeat ---+
    //
    // A cycle with a duration is due once the duration has elapsed; an
    // indefinite one (duration 0) once min_frames are buffered.
    class TimelapseCycle {
    public:
        explicit TimelapseCycle(const TimelapseConfig& cfg);

        // Interval changes apply to the next admission, duration and
        // min_frames to the running cycle.
        void configure(const TimelapseConfig& cfg);

        TimelapseState state() const { return state_; }

        void begin(TimePoint now);
        // Records the admission; false outside Capturing, when the cycle is due,
        // or before the interval has passed.
        bool admit(TimePoint now);
        // Ignored outside Capturing.
        void append(cv::Mat frame);
        bool due(TimePoint now) const;

        // Capturing -> Compiling; hands over the buffer.
        std::vector<cv::Mat> begin_compile();
        // Compiling -> Capturing for indefinite repeating cycles, else Idle.
        TimelapseState finish(TimePoint now);
        // Any -> Idle; returns whatever was buffered.
        std::vector<cv::Mat> reset();

        size_t buffered() const { return frames_.size(); }
        int min_frames() const { return min_frames_; }
        double elapsed(TimePoint now) const;
        double next_capture_in(TimePoint now) const;
        // Negative when the end of the cycle depends on frame count alone.
        double next_video_in(TimePoint now) const;

    private:
        void restart_(TimePoint now);

        double duration_s_;
        int min_frames_;
        bool repeat_;

        TimelapseState state_ = TimelapseState::Idle;
        TimePoint started_{};
        CadenceGate gate_;
        std::vector<cv::Mat> frames_;
    };
}
