#include <common/config.hpp>
#include <common/config_yaml.hpp>
#include <ingest/sensor.hpp>

#include "test_support.hpp"

#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

using sc_test::check;

namespace {
    std::string write_yaml_file(const std::string& prefix, const std::string& body) {
        namespace fs = std::filesystem;
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        const fs::path path = fs::temp_directory_path() /
                              (prefix + "_" + std::to_string(stamp) + ".yaml");

        std::ofstream out(path);
        if (!out.is_open()) {
            throw std::runtime_error("failed to open temp config file: " + path.string());
        }
        out << body;
        out.close();
        return path.string();
    }

    bool load_throws(const std::string& yaml) {
        const std::string path = write_yaml_file("sc_cfg", yaml);
        try {
            (void)sc::load_config_yaml(path);
            std::filesystem::remove(path);
            return false;
        } catch (const std::exception&) {
            std::filesystem::remove(path);
            return true;
        }
    }

    bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

    void test_full_config_loads() {
        const std::string yaml =
            "server:\n"
            "  host: \"127.0.0.1\"\n"
            "  port: 9090\n"
            "camera:\n"
            "  type: \"test\"\n"
            "  width: 1280\n"
            "  height: 720\n"
            "  idle_fps: 0.1\n"
            "  brightness_ui: 60\n"
            "stream:\n"
            "  fps: 15\n"
            "  jpeg_quality: 80\n"
            "  strategy: \"Edges\"\n"
            "storage:\n"
            "  fps: 2\n"
            "  label: \"A1\"\n"
            "  output_dir: \"/tmp/rec\"\n"
            "timelapse:\n"
            "  interval: 2\n"
            "  duration: 0\n"
            "  min_frames: 3\n"
            "  repeat: false\n"
            "  queue_capacity: 8\n";

        const std::string path = write_yaml_file("sc_cfg_ok", yaml);
        const auto cfg = sc::load_config_yaml(path);
        std::filesystem::remove(path);

        check(cfg.server.host == "127.0.0.1" && cfg.server.port == 9090, "server section should be read");
        check(cfg.camera.type == "test", "camera.type should be read");
        check(cfg.camera.width == 1280 && cfg.camera.height == 720, "camera resolution should be read");
        check(near(cfg.camera.idle_fps, 0.1), "camera.idle_fps should be read");
        check(cfg.camera.brightness_ui == 60, "camera.brightness_ui should be read");
        check(cfg.camera.contrast_ui == 25, "camera.contrast_ui should keep its default");
        check(near(cfg.stream.fps, 15.0) && cfg.stream.jpeg_quality == 80, "stream section should be read");
        check(cfg.stream.strategy == "Edges", "strategy names are kept as written");
        check(cfg.stream.queue_capacity == 2, "stream.queue_capacity should keep its default");
        check(cfg.storage.label == "A1" && cfg.storage.output_dir == "/tmp/rec", "storage section should be read");
        check(near(cfg.timelapse.interval_s, 2.0), "timelapse.interval should be read");
        check(near(cfg.timelapse.duration_s, 0.0), "timelapse.duration 0 should be accepted");
        check(cfg.timelapse.min_frames == 3 && !cfg.timelapse.repeat, "timelapse counters should be read");
        check(cfg.timelapse.queue_capacity == 8, "timelapse.queue_capacity should be read");
        check(near(cfg.timelapse.output_fps, 25.0), "timelapse.output_fps should default to 25");
    }

    void test_empty_sections_use_defaults() {
        const std::string path = write_yaml_file("sc_cfg_min", "server:\n  port: 8081\n");
        const auto cfg = sc::load_config_yaml(path);
        std::filesystem::remove(path);

        check(cfg.server.port == 8081, "port should be read");
        check(cfg.camera.type == "webcam", "camera should default to webcam");
        check(near(cfg.camera.idle_fps, 1.0 / 20.0), "idle floor should default to one frame per 20 s");
        check(near(cfg.stream.fps, 10.0), "stream fps should default to 10");
        check(near(cfg.timelapse.duration_s, 300.0), "timelapse duration should default to 300 s");
    }

    void test_invalid_values_rejected() {
        check(load_throws("stream:\n  strategy: \"sepia\"\n"), "unknown strategy should be rejected");
        check(load_throws("stream:\n  jpeg_quality: 0\n"), "jpeg quality 0 should be rejected");
        check(load_throws("stream:\n  jpeg_quality: 101\n"), "jpeg quality 101 should be rejected");
        check(load_throws("stream:\n  fps: 0\n"), "stream fps 0 should be rejected");
        check(load_throws("storage:\n  fps: -1\n"), "negative storage fps should be rejected");
        check(load_throws("timelapse:\n  interval: 0\n"), "timelapse interval 0 should be rejected");
        check(load_throws("timelapse:\n  duration: -5\n"), "negative duration should be rejected");
        check(load_throws("timelapse:\n  min_frames: 0\n"), "min_frames 0 should be rejected");
        check(load_throws("timelapse:\n  queue_capacity: 0\n"), "queue capacity 0 should be rejected");
        check(load_throws("camera:\n  type: \"rtsp\"\n"), "unknown camera type should be rejected");
        check(load_throws("camera:\n  type: \"file\"\n"), "file camera without path should be rejected");
        check(load_throws("camera:\n  brightness_ui: 150\n"), "UI control above 100 should be rejected");
        check(load_throws("server:\n  port: 70000\n"), "port out of range should be rejected");
        check(load_throws("- just\n- a list\n"), "non-map root should be rejected");
    }

    void test_config_error_prefix() {
        const std::string path = write_yaml_file("sc_cfg_bad", "stream:\n  strategy: \"sepia\"\n");
        std::string msg;
        try {
            (void)sc::load_config_yaml(path);
        } catch (const std::runtime_error& e) {
            msg = e.what();
        }
        std::filesystem::remove(path);
        check(msg.rfind("[Config]", 0) == 0, "config errors should carry the [Config] prefix");
        check(msg.find("sepia") != std::string::npos, "config errors should name the bad value");
    }

    void test_ui_controls_mapping() {
        const auto mid = sc::controls_from_ui(50, 25, 25);
        check(near(mid.brightness, 0.0) && near(mid.contrast, 1.0) && near(mid.saturation, 1.0),
              "UI defaults should map to neutral controls");

        const auto lo = sc::controls_from_ui(0, 0, 0);
        check(near(lo.brightness, -1.0) && near(lo.contrast, 0.0) && near(lo.saturation, 0.0),
              "UI 0 should map to the bottom of each range");

        const auto hi = sc::controls_from_ui(100, 100, 100);
        check(near(hi.brightness, 1.0) && near(hi.contrast, 4.0) && near(hi.saturation, 4.0),
              "UI 100 should map to the top of each range");

        const auto clamped = sc::controls_from_ui(-20, 400, 50);
        check(near(clamped.brightness, -1.0) && near(clamped.contrast, 4.0), "UI values should be clamped");
    }
}

int main() {
    test_full_config_loads();
    test_empty_sections_use_defaults();
    test_invalid_values_rejected();
    test_config_error_prefix();
    test_ui_controls_mapping();

    return sc_test::finish("config");
}
