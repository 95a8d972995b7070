#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <common/status.hpp>
#include <pipeline/frame_source.hpp>
#include <pipeline/output_module.hpp>

namespace sc {
    // Serializes every start/stop/settings change and keeps the capture rate at
    // max(required rate of each running module, idle floor).
    class RateCoordinator {
    public:
        RateCoordinator(FrameSource& source, double idle_fps);
        ~RateCoordinator();

        RateCoordinator(const RateCoordinator&) = delete;
        RateCoordinator& operator=(const RateCoordinator&) = delete;

        static double compute_target_fps(const std::vector<double>& required, double idle_fps);

        // Registers with the source. Modules must outlive the coordinator.
        void add_module(IOutputModule& module);
        IOutputModule* find_module(const std::string& name) const;
        std::vector<std::string> module_names() const;

        Status start_source();
        Status stop_source();

        Status start_module(const std::string& name);
        Status stop_module(const std::string& name);
        Status update_settings(const std::string& name, const SettingsPatch& patch);

        Status set_resolution(const Resolution& res);
        Status apply_controls(const CameraControls& controls);
        Status capture_still(cv::Mat& out);

        // Modules first, then the source.
        void stop_all();

        double target_fps() const;
        double idle_fps() const { return idle_fps_; }

    private:
        Status run_(const std::function<Status()>& fn);
        Status recompute_locked_();
        void request_recompute_(const std::string& module);
        void drain_pending_();

        FrameSource& source_;
        const double idle_fps_;

        mutable std::mutex mtx_;
        std::vector<IOutputModule*> modules_;
        double target_fps_;

        std::atomic<bool> pending_{false};
    };
}
