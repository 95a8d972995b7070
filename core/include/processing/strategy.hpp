#pragma once

#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace sc {
    // Closed set of stateless per-frame transforms, selected by name.
    // apply() never mutates its input; the result may share the input buffer for "none".
    class Strategy {
    public:
        enum class Kind {
            None,
            Edges,
            Grayscale,
            Threshold,
            Contrast
        };

        Strategy() = default;
        explicit Strategy(Kind kind) : kind_(kind) {}

        // Case-insensitive; nullopt for unknown names.
        static std::optional<Strategy> from_name(const std::string& name);
        static const std::vector<std::string>& names();

        Kind kind() const { return kind_; }
        const char* name() const;

        cv::Mat apply(const cv::Mat& bgr) const;

        bool operator==(const Strategy& o) const { return kind_ == o.kind_; }
        bool operator!=(const Strategy& o) const { return kind_ != o.kind_; }

    private:
        // Canny thresholds
        static constexpr double kEdgeLow = 50.0;
        static constexpr double kEdgeHigh = 150.0;
        // Binary threshold
        static constexpr double kThreshold = 128.0;
        static constexpr double kThresholdMax = 255.0;
        // CLAHE on the L channel
        static constexpr double kClaheClip = 2.0;
        static constexpr int kClaheTiles = 8;

        cv::Mat apply_edges_(const cv::Mat& bgr) const;
        cv::Mat apply_grayscale_(const cv::Mat& bgr) const;
        cv::Mat apply_threshold_(const cv::Mat& bgr) const;
        cv::Mat apply_contrast_(const cv::Mat& bgr) const;

        Kind kind_ = Kind::None;
    };
}
