#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <common/status.hpp>
#include <pipeline/types.hpp>
#include <processing/strategy.hpp>

namespace sc {
    // Partial settings update. Every set field must apply to the target module
    // and be valid, otherwise nothing is changed.
    struct SettingsPatch {
        std::optional<double> fps;
        std::optional<int> jpeg_quality;
        std::optional<double> interval_s;
        std::optional<double> duration_s;
        std::optional<int> min_frames;
        std::optional<double> output_fps;
        std::optional<bool> repeat;
        std::optional<std::string> label;
        std::optional<std::string> strategy;
    };

    struct ModuleStatus {
        std::string name;
        bool running = false;
        std::string strategy;
        double required_fps = 0.0;
        size_t queued = 0;
        size_t queue_capacity = 0;
        uint64_t dropped = 0;
        uint64_t processed = 0;
        std::string last_error;
    };

    // Consumer contract the FrameSource and RateCoordinator work against.
    class IOutputModule {
    public:
        // Invoked from the module's own worker thread when it stops itself
        // (failure or a finished cycle). Must not block.
        using StopListener = std::function<void(const std::string& module)>;

        virtual ~IOutputModule() = default;

        virtual const std::string& name() const = 0;

        virtual Status start() = 0;
        // Idempotent; NotRunning when there was nothing to stop. Always releases resources.
        virtual Status stop() = 0;
        virtual bool is_running() const = 0;

        // Never blocks; a full queue evicts its oldest frame.
        virtual bool add_frame(FramePtr frame) = 0;
        // Cadence gate consulted by the producer before add_frame().
        virtual bool should_process_frame() = 0;
        // 0 when not running.
        virtual double get_required_camera_fps() const = 0;

        // Takes effect from the next processed frame.
        virtual void set_processing_strategy(Strategy strategy) = 0;
        virtual Status update_settings(const SettingsPatch& patch) = 0;

        virtual ModuleStatus status() const = 0;
        virtual void set_stop_listener(StopListener listener) = 0;
    };
}
