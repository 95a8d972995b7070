#include <common/config.hpp>

#include <processing/strategy.hpp>

namespace sc {
    namespace {
        std::string check_strategy(const std::string& name) {
            if (!Strategy::from_name(name)) return "unknown processing strategy '" + name + "'";
            return {};
        }

        bool in_ui_range(int v) { return v >= 0 && v <= 100; }
    } // namespace

    std::string validate(const CameraConfig& c) {
        if (c.type != "webcam" && c.type != "test" && c.type != "file") {
            return "unknown camera type '" + c.type + "'";
        }
        if (c.type == "file" && c.path.empty()) return "camera.path is required for file sources";
        if (c.width <= 0 || c.height <= 0) return "camera resolution must be positive";
        if (c.idle_fps <= 0.0) return "camera.idle_fps must be > 0";
        if (!in_ui_range(c.brightness_ui) || !in_ui_range(c.contrast_ui) || !in_ui_range(c.saturation_ui)) {
            return "camera controls must be within 0..100";
        }
        return {};
    }

    std::string validate(const StreamConfig& c) {
        if (c.fps <= 0.0) return "stream.fps must be > 0";
        if (c.jpeg_quality < 1 || c.jpeg_quality > 100) return "stream.jpeg_quality must be within 1..100";
        if (c.queue_capacity == 0) return "stream.queue_capacity must be > 0";
        return check_strategy(c.strategy);
    }

    std::string validate(const StorageConfig& c) {
        if (c.fps <= 0.0) return "storage.fps must be > 0";
        if (c.output_dir.empty()) return "storage.output_dir must not be empty";
        if (c.label.find('/') != std::string::npos) return "storage.label must not contain '/'";
        if (c.queue_capacity == 0) return "storage.queue_capacity must be > 0";
        return check_strategy(c.strategy);
    }

    std::string validate(const TimelapseConfig& c) {
        if (c.interval_s <= 0.0) return "timelapse.interval must be > 0";
        if (c.duration_s < 0.0) return "timelapse.duration must be >= 0";
        if (c.min_frames < 1) return "timelapse.min_frames must be >= 1";
        if (c.output_fps <= 0.0) return "timelapse.output_fps must be > 0";
        if (c.output_dir.empty()) return "timelapse.output_dir must not be empty";
        if (c.queue_capacity == 0) return "timelapse.queue_capacity must be > 0";
        return check_strategy(c.strategy);
    }
}
