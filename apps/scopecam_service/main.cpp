#include <common/config.hpp>
#include <common/config_yaml.hpp>
#include <encode/frame_encoder.hpp>
#include <encode/video_writer.hpp>
#include <ingest/sensor_factory.hpp>
#include <outputs/storage_module.hpp>
#include <outputs/stream_module.hpp>
#include <outputs/timelapse_module.hpp>
#include <pipeline/frame_source.hpp>
#include <pipeline/rate_coordinator.hpp>
#include <server/control_server.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_signal(int) { g_running = false; }

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    std::string cfg_path = "configs/scopecam.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    sc::AppConfig cfg;
    try {
        cfg = sc::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    sc::FrameSource::Options src_opt;
    src_opt.resolution = {cfg.camera.width, cfg.camera.height};
    src_opt.initial_fps = cfg.camera.idle_fps;
    sc::FrameSource source(sc::make_sensor(cfg.camera), src_opt);

    const sc::Status ctl = source.apply_controls(
        sc::controls_from_ui(cfg.camera.brightness_ui, cfg.camera.contrast_ui, cfg.camera.saturation_ui));
    if (!ctl.ok()) std::cerr << "[main] camera controls: " << ctl.reason << "\n";

    auto writers = std::make_shared<sc::OpenCvVideoWriterFactory>();
    auto jpeg = std::make_shared<sc::JpegEncoder>();

    sc::StreamModule stream(cfg.stream, jpeg);
    sc::StorageModule storage(cfg.storage, writers);
    sc::TimelapseModule timelapse(cfg.timelapse, writers);

    sc::RateCoordinator coordinator(source, cfg.camera.idle_fps);
    coordinator.add_module(stream);
    coordinator.add_module(storage);
    coordinator.add_module(timelapse);

    const sc::Status src_st = coordinator.start_source();
    if (!src_st.ok()) {
        std::cerr << "[main] camera unavailable: " << src_st.reason << "\n";
        return 1;
    }

    // preview is on by default, recording and timelapse are started over HTTP
    const sc::Status stream_st = coordinator.start_module(stream.name());
    if (!stream_st.ok()) std::cerr << "[main] preview: " << stream_st.reason << "\n";

    sc::ControlServer server(cfg.server, {coordinator, source, stream, storage, timelapse}, cfg.camera, jpeg);
    if (!server.start()) {
        coordinator.stop_all();
        return 1;
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "Shutting down...\n";
    server.stop();
    coordinator.stop_all();

    return 0;
}
