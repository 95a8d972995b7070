#include <encode/frame_encoder.hpp>

#include <opencv2/imgcodecs.hpp>

namespace sc {
    bool JpegEncoder::encode(const cv::Mat& bgr, int quality, std::vector<uint8_t>& out) {
        if (bgr.empty()) return false;
        std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
        try {
            return cv::imencode(".jpg", bgr, out, params);
        } catch (const cv::Exception&) {
            return false;
        }
    }
}
