#include <common/config_yaml.hpp>

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace sc {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static double get_double(
        const YAML::Node& n, const char* key, double def) {
        return (n && n[key]) ? n[key].as<double>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static size_t get_capacity(
        const YAML::Node& n, const char* key, size_t def) {
        const int v = get_int(n, key, static_cast<int>(def));
        if (v <= 0) {
            throw std::runtime_error(std::string("[Config] ") + key + " must be > 0!");
        }
        return static_cast<size_t>(v);
    }

    static void require_valid(const std::string& problem) {
        if (!problem.empty()) throw std::runtime_error("[Config] " + problem + "!");
    }

    static CameraConfig parse_camera_config(const YAML::Node& cc) {
        CameraConfig c;
        if (!cc) return c;
        c.type = get_str(cc, "type", c.type);
        c.device = get_str(cc, "device", c.device);
        c.path = get_str(cc, "path", c.path);
        c.width = get_int(cc, "width", c.width);
        c.height = get_int(cc, "height", c.height);
        c.mjpg = get_bool(cc, "mjpg", get_bool(cc, "mjpeg", c.mjpg));
        c.idle_fps = get_double(cc, "idle_fps", c.idle_fps);
        c.brightness_ui = get_int(cc, "brightness_ui", c.brightness_ui);
        c.contrast_ui = get_int(cc, "contrast_ui", c.contrast_ui);
        c.saturation_ui = get_int(cc, "saturation_ui", c.saturation_ui);
        return c;
    }

    static StreamConfig parse_stream_config(const YAML::Node& sm) {
        StreamConfig c;
        if (!sm) return c;
        c.fps = get_double(sm, "fps", c.fps);
        c.jpeg_quality = get_int(sm, "jpeg_quality", c.jpeg_quality);
        c.strategy = get_str(sm, "strategy", c.strategy);
        c.queue_capacity = get_capacity(sm, "queue_capacity", c.queue_capacity);
        return c;
    }

    static StorageConfig parse_storage_config(const YAML::Node& st) {
        StorageConfig c;
        if (!st) return c;
        c.fps = get_double(st, "fps", c.fps);
        c.output_dir = get_str(st, "output_dir", c.output_dir);
        c.label = get_str(st, "label", c.label);
        c.strategy = get_str(st, "strategy", c.strategy);
        c.queue_capacity = get_capacity(st, "queue_capacity", c.queue_capacity);
        return c;
    }

    static TimelapseConfig parse_timelapse_config(const YAML::Node& tl) {
        TimelapseConfig c;
        if (!tl) return c;
        c.interval_s = get_double(tl, "interval", c.interval_s);
        c.duration_s = get_double(tl, "duration", c.duration_s);
        c.min_frames = get_int(tl, "min_frames", c.min_frames);
        c.output_fps = get_double(tl, "output_fps", c.output_fps);
        c.repeat = get_bool(tl, "repeat", c.repeat);
        c.output_dir = get_str(tl, "output_dir", c.output_dir);
        c.strategy = get_str(tl, "strategy", c.strategy);
        c.queue_capacity = get_capacity(tl, "queue_capacity", c.queue_capacity);
        return c;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);
        if (!root.IsMap()) {
            throw std::runtime_error("[Config] top level must be a map!");
        }

        const YAML::Node srv = root["server"];
        cfg.server.host = get_str(srv, "host", cfg.server.host);
        cfg.server.port = get_int(srv, "port", cfg.server.port);
        if (cfg.server.port <= 0 || cfg.server.port > 65535) {
            throw std::runtime_error("[Config] server.port out of range!");
        }

        cfg.camera = parse_camera_config(root["camera"]);
        cfg.stream = parse_stream_config(root["stream"]);
        cfg.storage = parse_storage_config(root["storage"]);
        cfg.timelapse = parse_timelapse_config(root["timelapse"]);

        require_valid(validate(cfg.camera));
        require_valid(validate(cfg.stream));
        require_valid(validate(cfg.storage));
        require_valid(validate(cfg.timelapse));
        return cfg;
    }
}
