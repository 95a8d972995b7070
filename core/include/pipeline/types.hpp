#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <memory>
#include <string>

#include <common/clock.hpp>

namespace sc {
    struct Resolution {
        int width = 0;
        int height = 0;

        long area() const { return static_cast<long>(width) * height; }
        bool valid() const { return width > 0 && height > 0; }

        bool operator==(const Resolution& o) const { return width == o.width && height == o.height; }
        bool operator!=(const Resolution& o) const { return !(*this == o); }
    };

    inline std::string to_string(const Resolution& r) {
        return std::to_string(r.width) + "x" + std::to_string(r.height);
    }

    // Never mutated after the producer hands it off; consumers share it read-only.
    struct Frame {
        cv::Mat bgr;
        int64_t frame_id = 0;
        int64_t pts_ns = 0;
        TimePoint captured_at{};
        int width = 0;
        int height = 0;
    };

    using FramePtr = std::shared_ptr<const Frame>;
}
