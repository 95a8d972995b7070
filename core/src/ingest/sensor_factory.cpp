#include <ingest/sensor_factory.hpp>

#include <stdexcept>

#include <ingest/gst_sensor.hpp>

namespace sc {
    std::unique_ptr<ISensor> make_sensor(const CameraConfig& cfg) {
        GstSensor::Options opt;
        opt.device = cfg.device;
        opt.path = cfg.path;
        opt.mjpg = cfg.mjpg;

        if (cfg.type == "webcam") {
            opt.kind = GstSensor::Kind::Webcam;
            return std::make_unique<GstSensor>(opt, "webcam:" + cfg.device);
        }
        if (cfg.type == "test") {
            opt.kind = GstSensor::Kind::Test;
            return std::make_unique<GstSensor>(opt, "test");
        }
        if (cfg.type == "file") {
            opt.kind = GstSensor::Kind::File;
            return std::make_unique<GstSensor>(opt, "file:" + cfg.path);
        }
        throw std::runtime_error("[Config] Unknown camera type: " + cfg.type);
    }
}
