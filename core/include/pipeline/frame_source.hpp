#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <common/status.hpp>
#include <ingest/sensor.hpp>
#include <pipeline/output_module.hpp>

namespace sc {
    struct SourceStatus {
        bool running = false;
        double capture_fps = 0.0;
        Resolution resolution;
        uint64_t frames_captured = 0;
        uint64_t read_errors = 0;
        std::string last_error;
    };

    // Single producer. Owns the sensor and the capture thread; output modules
    // are registered by non-owning pointer and must outlive their registration.
    class FrameSource {
    public:
        struct Options {
            Resolution resolution{1920, 1080};
            double initial_fps = 1.0 / 20.0;
            int read_timeout_ms = 100;
            int still_timeout_ms = 3000;
        };

        FrameSource(std::unique_ptr<ISensor> sensor,
                    Options opt,
                    std::shared_ptr<const IClock> clock = default_clock());
        ~FrameSource();

        FrameSource(const FrameSource&) = delete;
        FrameSource& operator=(const FrameSource&) = delete;

        Status start();
        Status stop();
        bool is_running() const { return running_.load(); }

        // Reopens the sensor when running; rejected if fps <= 0.
        Status update_capture_rate(double fps);
        double capture_rate() const { return fps_.load(); }

        bool register_module(IOutputModule& module);
        bool unregister_module(IOutputModule& module);
        size_t module_count() const;

        Status set_resolution(const Resolution& res);
        Resolution resolution() const;
        std::vector<Resolution> list_supported_resolutions();

        Status apply_controls(const CameraControls& controls);

        // One frame at the largest supported resolution; streaming settings are restored afterwards.
        Status capture_still(cv::Mat& out);

        SourceStatus status() const;

    private:
        void capture_loop_();
        bool wait_for_next_slot_(TimePoint last_capture);
        void fan_out_(const FramePtr& frame);
        Status reopen_locked_();
        void apply_controls_locked_();
        void set_error_(std::string reason);

        std::unique_ptr<ISensor> sensor_;
        Options opt_;
        std::shared_ptr<const IClock> clock_;

        // guards sensor_, modules_ and resolution_
        mutable std::mutex mtx_;
        std::vector<IOutputModule*> modules_;
        Resolution resolution_;
        CameraControls controls_;
        bool controls_set_ = false;

        std::mutex lifecycle_mtx_;
        std::thread capture_thr_;
        std::atomic<bool> running_{false};
        std::atomic<double> fps_;

        std::mutex pace_mtx_;
        std::condition_variable pace_cv_;

        std::atomic<int64_t> next_frame_id_{0};
        std::atomic<uint64_t> frames_captured_{0};
        std::atomic<uint64_t> read_errors_{0};

        mutable std::mutex err_mtx_;
        std::string last_error_;
    };
}
