#pragma once

#include <algorithm>
#include <string>
#include <vector>

#include <pipeline/types.hpp>

namespace sc {
    // Internal image controls: brightness -1..1, contrast 0..4, saturation 0..4.
    struct CameraControls {
        double brightness = 0.0;
        double contrast = 1.0;
        double saturation = 1.0;
    };

    // Maps the 0..100 UI scale onto the internal control ranges.
    inline CameraControls controls_from_ui(int brightness_ui, int contrast_ui, int saturation_ui) {
        auto clamp_ui = [](int v) { return std::clamp(v, 0, 100); };
        CameraControls c;
        c.brightness = clamp_ui(brightness_ui) / 50.0 - 1.0;
        c.contrast = clamp_ui(contrast_ui) / 25.0;
        c.saturation = clamp_ui(saturation_ui) / 25.0;
        return c;
    }

    enum class ReadResult {
        Frame,
        Timeout,
        Error
    };

    // Capture device seen by the FrameSource. Not thread-safe; the FrameSource
    // serializes every call under its own lock.
    struct ISensor {
        virtual ~ISensor() = default;
        virtual bool open(const Resolution& res, double fps) = 0;
        virtual void close() = 0;
        virtual bool is_open() const = 0;
        virtual ReadResult read(Frame& out, int timeout_ms) = 0;
        virtual std::vector<Resolution> list_supported_resolutions() = 0;
        virtual bool apply_controls(const CameraControls& controls) = 0;
        virtual const std::string& id() const = 0;
    };
}
