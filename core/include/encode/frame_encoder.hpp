#pragma once

#include <cstdint>
#include <vector>

#include <opencv2/core.hpp>

namespace sc {
    // Single-frame compression.
    class IFrameEncoder {
    public:
        virtual ~IFrameEncoder() = default;
        virtual bool encode(const cv::Mat& bgr, int quality, std::vector<uint8_t>& out) = 0;
    };

    class JpegEncoder : public IFrameEncoder {
    public:
        bool encode(const cv::Mat& bgr, int quality, std::vector<uint8_t>& out) override;
    };
}
