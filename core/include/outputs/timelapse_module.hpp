#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <common/clock.hpp>
#include <common/config.hpp>
#include <encode/video_writer.hpp>
#include <outputs/timelapse_cycle.hpp>
#include <pipeline/module_worker.hpp>
#include <pipeline/output_module.hpp>

namespace sc {
    struct TimelapseStatus {
        TimelapseState state = TimelapseState::Idle;
        size_t buffered = 0;
        double next_capture_in = 0.0;
        double next_video_in = 0.0; // < 0 when the cycle ends on frame count
        double elapsed = 0.0;
        uint64_t videos_created = 0;
        std::string last_video;
    };

    // Buffers one frame per interval and compiles each finished cycle into a video.
    class TimelapseModule : public IOutputModule {
    public:
        TimelapseModule(TimelapseConfig cfg,
                        std::shared_ptr<IVideoWriterFactory> writers,
                        std::shared_ptr<const IClock> clock = default_clock());
        ~TimelapseModule() override;

        const std::string& name() const override { return worker_.name(); }

        Status start() override;
        // Compiles what was captured when it reaches min_frames, otherwise discards it.
        // A failed compile is returned with the number of frames lost.
        Status stop() override;
        bool is_running() const override { return worker_.running(); }

        bool add_frame(FramePtr frame) override { return worker_.push(std::move(frame)); }
        bool should_process_frame() override;
        double get_required_camera_fps() const override;

        void set_processing_strategy(Strategy strategy) override;
        Status update_settings(const SettingsPatch& patch) override;

        ModuleStatus status() const override;
        void set_stop_listener(StopListener listener) override { worker_.set_stop_listener(std::move(listener)); }

        TimelapseStatus timelapse_status() const;
        TimelapseConfig config() const;

    private:
        bool handle_frame_(const FramePtr& frame);
        bool check_due_();
        Status compile_(const std::vector<cv::Mat>& frames);

        mutable std::mutex cfg_mtx_;
        TimelapseConfig cfg_;

        std::shared_ptr<IVideoWriterFactory> writers_;
        std::shared_ptr<const IClock> clock_;

        mutable std::mutex cycle_mtx_;
        TimelapseCycle cycle_;

        mutable std::mutex result_mtx_;
        uint64_t videos_created_ = 0;
        std::string last_video_;

        ModuleWorker worker_;
    };
}
