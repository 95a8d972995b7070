#pragma once

#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace sc {
    // Fits src into target keeping aspect ratio; the border is black.
    inline cv::Mat letterbox(const cv::Mat& src, cv::Size target, int interp = cv::INTER_LINEAR) {
        if (src.empty() || target.width <= 0 || target.height <= 0) return src;
        if (src.size() == target) return src;

        float sx = float(target.width) / float(src.cols);
        float sy = float(target.height) / float(src.rows);
        float s = std::min(sx, sy);

        int new_w = std::max(1, int(src.cols * s));
        int new_h = std::max(1, int(src.rows * s));

        cv::Mat resized;
        cv::resize(src, resized, {new_w, new_h}, 0, 0, interp);

        cv::Mat out(target, src.type(), cv::Scalar::all(0));
        int x = (target.width - new_w) / 2;
        int y = (target.height - new_h) / 2;
        resized.copyTo(out(cv::Rect(x, y, new_w, new_h)));
        return out;
    }
}
