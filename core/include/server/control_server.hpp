#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <common/config.hpp>
#include <encode/frame_encoder.hpp>
#include <outputs/storage_module.hpp>
#include <outputs/stream_module.hpp>
#include <outputs/timelapse_module.hpp>
#include <pipeline/frame_source.hpp>
#include <pipeline/rate_coordinator.hpp>

namespace sc {
    struct ControlTargets {
        RateCoordinator& coordinator;
        FrameSource& source;
        StreamModule& stream;
        StorageModule& storage;
        TimelapseModule& timelapse;
    };

    // HTTP control surface: status, MJPEG preview, stills and start/stop/settings.
    class ControlServer {
    public:
        ControlServer(ServerConfig cfg,
                      ControlTargets targets,
                      const CameraConfig& camera,
                      std::shared_ptr<IFrameEncoder> still_encoder);
        ~ControlServer();

        // Start http server in bg thread
        bool start();
        void stop();

        std::string status_json() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;

        void register_routes_();

        ServerConfig cfg_;
        ControlTargets t_;
        std::shared_ptr<IFrameEncoder> still_encoder_;

        std::thread server_thread_;
        std::atomic<bool> running_{false};

        // last UI control values, applied as a whole
        std::mutex controls_mtx_;
        int brightness_ui_;
        int contrast_ui_;
        int saturation_ui_;
    };
}
