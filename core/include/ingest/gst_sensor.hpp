#pragma once

#include <string>
#include <vector>

#include <ingest/sensor.hpp>

struct _GstElement;
using GstElement = _GstElement;

namespace sc {
    // appsink-backed sensor; the pipeline is rebuilt on every open().
    class GstSensor : public ISensor {
    public:
        enum class Kind {
            Webcam,
            Test,
            File
        };

        struct Options {
            Kind kind = Kind::Webcam;
            std::string device = "/dev/video0";
            std::string path;
            bool mjpg = true;
        };

        GstSensor(Options opt, std::string id);
        ~GstSensor() override;

        GstSensor(const GstSensor&) = delete;
        GstSensor& operator=(const GstSensor&) = delete;

        bool open(const Resolution& res, double fps) override;
        void close() override;
        bool is_open() const override { return pipeline_ != nullptr; }
        ReadResult read(Frame& out, int timeout_ms) override;
        std::vector<Resolution> list_supported_resolutions() override;
        bool apply_controls(const CameraControls& controls) override;
        const std::string& id() const override { return id_; }

        // gst-launch description for the given settings; exposed for logging and tests.
        std::string describe_pipeline(const Resolution& res, double fps) const;

    private:
        std::vector<Resolution> probe_v4l2_resolutions_() const;
        bool check_bus_();

        Options opt_;
        std::string id_;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;
        GstElement* balance_ = nullptr;

        CameraControls controls_;
        std::vector<Resolution> resolutions_;
        bool probed_ = false;
    };
}
