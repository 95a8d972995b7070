#include <processing/strategy.hpp>

#include <algorithm>
#include <cctype>

#include <opencv2/imgproc.hpp>

namespace sc {
    namespace {
        std::string normalize_name(std::string s) {
            std::transform(s.begin(),
                           s.end(),
                           s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        // Strategies expect BGR; tolerate gray or BGRA input from unusual sensors.
        cv::Mat to_bgr(const cv::Mat& in) {
            if (in.channels() == 3) return in;
            cv::Mat out;
            if (in.channels() == 1) {
                cv::cvtColor(in, out, cv::COLOR_GRAY2BGR);
            } else {
                cv::cvtColor(in, out, cv::COLOR_BGRA2BGR);
            }
            return out;
        }

        cv::Mat to_gray(const cv::Mat& bgr) {
            cv::Mat gray;
            cv::cvtColor(bgr, gray, cv::COLOR_BGR2GRAY);
            return gray;
        }
    } // namespace

    std::optional<Strategy> Strategy::from_name(const std::string& name) {
        const std::string n = normalize_name(name);
        if (n == "none" || n.empty()) return Strategy(Kind::None);
        if (n == "edges") return Strategy(Kind::Edges);
        if (n == "grayscale") return Strategy(Kind::Grayscale);
        if (n == "threshold") return Strategy(Kind::Threshold);
        if (n == "contrast") return Strategy(Kind::Contrast);
        return std::nullopt;
    }

    const std::vector<std::string>& Strategy::names() {
        static const std::vector<std::string> all = {"none", "edges", "grayscale", "threshold", "contrast"};
        return all;
    }

    const char* Strategy::name() const {
        switch (kind_) {
            case Kind::None: return "none";
            case Kind::Edges: return "edges";
            case Kind::Grayscale: return "grayscale";
            case Kind::Threshold: return "threshold";
            case Kind::Contrast: return "contrast";
        }
        return "none";
    }

    cv::Mat Strategy::apply(const cv::Mat& bgr) const {
        if (bgr.empty() || kind_ == Kind::None) return bgr;

        const cv::Mat in = to_bgr(bgr);
        switch (kind_) {
            case Kind::Edges: return apply_edges_(in);
            case Kind::Grayscale: return apply_grayscale_(in);
            case Kind::Threshold: return apply_threshold_(in);
            case Kind::Contrast: return apply_contrast_(in);
            case Kind::None: break;
        }
        return bgr;
    }

    cv::Mat Strategy::apply_edges_(const cv::Mat& bgr) const {
        cv::Mat edges;
        cv::Canny(to_gray(bgr), edges, kEdgeLow, kEdgeHigh);
        cv::Mat out;
        cv::cvtColor(edges, out, cv::COLOR_GRAY2BGR);
        return out;
    }

    cv::Mat Strategy::apply_grayscale_(const cv::Mat& bgr) const {
        cv::Mat out;
        cv::cvtColor(to_gray(bgr), out, cv::COLOR_GRAY2BGR);
        return out;
    }

    cv::Mat Strategy::apply_threshold_(const cv::Mat& bgr) const {
        cv::Mat bin;
        cv::threshold(to_gray(bgr), bin, kThreshold, kThresholdMax, cv::THRESH_BINARY);
        cv::Mat out;
        cv::cvtColor(bin, out, cv::COLOR_GRAY2BGR);
        return out;
    }

    cv::Mat Strategy::apply_contrast_(const cv::Mat& bgr) const {
        cv::Mat lab;
        cv::cvtColor(bgr, lab, cv::COLOR_BGR2Lab);

        std::vector<cv::Mat> ch;
        cv::split(lab, ch);

        // cv::CLAHE is not thread-safe, one per call
        auto clahe = cv::createCLAHE(kClaheClip, cv::Size(kClaheTiles, kClaheTiles));
        cv::Mat l;
        clahe->apply(ch[0], l);
        ch[0] = l;

        cv::merge(ch, lab);
        cv::Mat out;
        cv::cvtColor(lab, out, cv::COLOR_Lab2BGR);
        return out;
    }
}
