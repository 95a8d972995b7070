#include <outputs/timelapse_cycle.hpp>

#include <utility>

namespace sc {
    const char* to_string(TimelapseState s) {
        switch (s) {
            case TimelapseState::Idle: return "idle";
            case TimelapseState::Capturing: return "capturing";
            case TimelapseState::Compiling: return "compiling";
        }
        return "unknown";
    }

    TimelapseCycle::TimelapseCycle(const TimelapseConfig& cfg)
        : duration_s_(cfg.duration_s),
          min_frames_(cfg.min_frames),
          repeat_(cfg.repeat),
          gate_(cfg.interval_s) {}

    void TimelapseCycle::configure(const TimelapseConfig& cfg) {
        duration_s_ = cfg.duration_s;
        min_frames_ = cfg.min_frames;
        repeat_ = cfg.repeat;
        gate_.set_period(cfg.interval_s);
    }

    void TimelapseCycle::begin(TimePoint now) {
        gate_.reset();
        restart_(now);
    }

    bool TimelapseCycle::admit(TimePoint now) {
        if (state_ != TimelapseState::Capturing || due(now)) return false;
        return gate_.admit(now);
    }

    void TimelapseCycle::append(cv::Mat frame) {
        if (state_ != TimelapseState::Capturing || frame.empty()) return;
        frames_.push_back(std::move(frame));
    }

    bool TimelapseCycle::due(TimePoint now) const {
        if (state_ != TimelapseState::Capturing) return false;
        if (duration_s_ > 0.0) return elapsed(now) >= duration_s_;
        return frames_.size() >= static_cast<size_t>(min_frames_);
    }

    std::vector<cv::Mat> TimelapseCycle::begin_compile() {
        state_ = TimelapseState::Compiling;
        return std::exchange(frames_, {});
    }

    TimelapseState TimelapseCycle::finish(TimePoint now) {
        frames_.clear();
        if (duration_s_ == 0.0 && repeat_) {
            // the interval keeps running across cycles
            restart_(now);
        } else {
            state_ = TimelapseState::Idle;
        }
        return state_;
    }

    std::vector<cv::Mat> TimelapseCycle::reset() {
        state_ = TimelapseState::Idle;
        gate_.reset();
        return std::exchange(frames_, {});
    }

    double TimelapseCycle::elapsed(TimePoint now) const {
        if (state_ == TimelapseState::Idle) return 0.0;
        return seconds_between(started_, now);
    }

    double TimelapseCycle::next_capture_in(TimePoint now) const {
        if (state_ != TimelapseState::Capturing) return 0.0;
        return gate_.seconds_until_next(now);
    }

    double TimelapseCycle::next_video_in(TimePoint now) const {
        if (state_ != TimelapseState::Capturing) return 0.0;
        if (duration_s_ > 0.0) {
            const double left = duration_s_ - elapsed(now);
            return left > 0.0 ? left : 0.0;
        }
        return -1.0;
    }

    void TimelapseCycle::restart_(TimePoint now) {
        frames_.clear();
        started_ = now;
        state_ = TimelapseState::Capturing;
    }
}
