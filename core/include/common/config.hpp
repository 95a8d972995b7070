#pragma once

#include <cstddef>
#include <string>

namespace sc {
    struct ServerConfig {
        std::string host = "0.0.0.0";
        int port = 8080;
    };

    struct CameraConfig {
        std::string type = "webcam"; // webcam|test|file
        std::string device = "/dev/video0";
        std::string path;            // file source only
        int width = 1920;
        int height = 1080;
        bool mjpg = true;
        double idle_fps = 1.0 / 20.0;

        // UI scale 0..100
        int brightness_ui = 50;
        int contrast_ui = 25;
        int saturation_ui = 25;
    };

    struct StreamConfig {
        double fps = 10.0;
        int jpeg_quality = 90;
        std::string strategy = "none";
        size_t queue_capacity = 2;
    };

    struct StorageConfig {
        double fps = 1.0;
        std::string output_dir = "recordings";
        std::string label;
        std::string strategy = "none";
        size_t queue_capacity = 30;
    };

    struct TimelapseConfig {
        double interval_s = 5.0;
        double duration_s = 300.0; // 0 = indefinite
        int min_frames = 10;
        double output_fps = 25.0;
        bool repeat = true;        // only with duration 0
        std::string output_dir = "timelapses";
        std::string strategy = "none";
        size_t queue_capacity = 4;
    };

    struct AppConfig {
        ServerConfig server;
        CameraConfig camera;
        StreamConfig stream;
        StorageConfig storage;
        TimelapseConfig timelapse;
    };

    // Each returns an empty string when valid, otherwise the first problem found.
    std::string validate(const CameraConfig& c);
    std::string validate(const StreamConfig& c);
    std::string validate(const StorageConfig& c);
    std::string validate(const TimelapseConfig& c);
}
