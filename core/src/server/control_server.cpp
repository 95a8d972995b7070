#include <server/control_server.hpp>

#include <chrono>
#include <iostream>
#include <sstream>

#include <httplib.h>

#include <server/http_api.hpp>

namespace sc {
    namespace {
        constexpr int kStillJpegQuality = 95;
        constexpr std::chrono::milliseconds kVideoWait{500};

        QueryParams params_of(const httplib::Request& req) {
            return QueryParams(req.params.begin(), req.params.end());
        }

        void reply(httplib::Response& res, const Status& st) {
            res.status = http_status(st.code);
            res.set_content(to_json(st), "application/json");
        }

        void no_cache(httplib::Response& res) {
            res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
            res.set_header("Pragma", "no-cache");
        }
    } // namespace

    struct ControlServer::Impl {
        httplib::Server svr;
    };

    ControlServer::ControlServer(ServerConfig cfg,
                                 ControlTargets targets,
                                 const CameraConfig& camera,
                                 std::shared_ptr<IFrameEncoder> still_encoder)
        : impl_(std::make_unique<Impl>()),
          cfg_(std::move(cfg)),
          t_(targets),
          still_encoder_(std::move(still_encoder)),
          brightness_ui_(camera.brightness_ui),
          contrast_ui_(camera.contrast_ui),
          saturation_ui_(camera.saturation_ui) {}

    ControlServer::~ControlServer() {
        stop();
    }

    std::string ControlServer::status_json() const {
        std::ostringstream oss;
        oss << "{\"source\":" << to_json(t_.source.status())
            << ",\"target_fps\":" << t_.coordinator.target_fps()
            << ",\"idle_fps\":" << t_.coordinator.idle_fps()
            << ",\"stream\":{\"module\":" << to_json(t_.stream.status())
            << ",\"stats\":" << to_json(t_.stream.stream_status()) << "}"
            << ",\"storage\":{\"module\":" << to_json(t_.storage.status())
            << ",\"output\":" << to_json(t_.storage.storage_status()) << "}"
            << ",\"timelapse\":{\"module\":" << to_json(t_.timelapse.status())
            << ",\"cycle\":" << to_json(t_.timelapse.timelapse_status()) << "}"
            << "}";
        return oss.str();
    }

    bool ControlServer::start() {
        if (running_) return true;
        running_ = true;

        register_routes_();

        if (!impl_->svr.bind_to_port(cfg_.host.c_str(), cfg_.port)) {
            std::cerr << "[HTTP] cannot bind " << cfg_.host << ":" << cfg_.port << "\n";
            running_ = false;
            return false;
        }

        server_thread_ = std::thread([this] {
            std::cout << "[HTTP] Status: http://" << cfg_.host << ":" << cfg_.port << "/status\n";
            std::cout << "[HTTP] Video: http://" << cfg_.host << ":" << cfg_.port << "/video\n";
            impl_->svr.listen_after_bind();
        });
        return true;
    }

    void ControlServer::stop() {
        if (!running_) return;
        running_ = false;

        if (impl_) impl_->svr.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }

    void ControlServer::register_routes_() {
        auto& svr = impl_->svr;

        svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });

        svr.Get("/status", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(status_json(), "application/json");
            no_cache(res);
        });

        svr.Get("/strategies", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(to_json(Strategy::names()), "application/json");
        });

        svr.Get("/camera/resolutions", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(to_json(t_.source.list_supported_resolutions()), "application/json");
        });

        svr.Post("/camera/resolution", [this](const httplib::Request& req, httplib::Response& res) {
            Resolution r;
            try {
                r.width = std::stoi(req.get_param_value("width"));
                r.height = std::stoi(req.get_param_value("height"));
            } catch (const std::exception&) {
                reply(res, Status::error(ErrorCode::ConfigurationError, "width and height are required"));
                return;
            }
            reply(res, t_.coordinator.set_resolution(r));
        });

        svr.Post("/camera/controls", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard lk(controls_mtx_);
            int b = brightness_ui_, c = contrast_ui_, s = saturation_ui_;
            Status st = parse_ui_controls(params_of(req), b, c, s);
            if (st.ok()) st = t_.coordinator.apply_controls(controls_from_ui(b, c, s));
            if (st.ok()) {
                brightness_ui_ = b;
                contrast_ui_ = c;
                saturation_ui_ = s;
            }
            reply(res, st);
        });

        // latest preview frame once
        svr.Get("/snapshot", [this](const httplib::Request&, httplib::Response& res) {
            auto jpeg = t_.stream.get_frame();
            if (!jpeg || jpeg->empty()) { res.status = 204; return; }
            res.set_content(reinterpret_cast<const char*>(jpeg->data()), jpeg->size(), "image/jpeg");
            no_cache(res);
        });

        // full-resolution still, bypasses the preview pipeline
        svr.Get("/still", [this](const httplib::Request&, httplib::Response& res) {
            cv::Mat img;
            Status st = t_.coordinator.capture_still(img);
            std::vector<uint8_t> jpeg;
            if (st.ok() && !still_encoder_->encode(img, kStillJpegQuality, jpeg)) {
                st = Status::error(ErrorCode::ResourceUnavailable, "still encoding failed");
            }
            if (!st.ok()) {
                reply(res, st);
                return;
            }
            res.set_content(reinterpret_cast<const char*>(jpeg.data()), jpeg.size(), "image/jpeg");
            no_cache(res);
        });

        svr.Get("/video", [this](const httplib::Request&, httplib::Response& res) {
            no_cache(res);
            res.set_header("Connection", "close");

            const std::string boundary = "frame";
            res.set_chunked_content_provider(
                "multipart/x-mixed-replace; boundary=" + boundary,
                [this, boundary](size_t /*offset*/, httplib::DataSink& sink) {
                    uint64_t last_sent = 0;
                    while (running_) {
                        StreamModule::JpegPtr jpeg;
                        uint64_t seq = 0;
                        if (!t_.stream.wait_frame(last_sent, jpeg, seq, kVideoWait)) continue;
                        last_sent = seq;

                        std::string header =
                            "--" + boundary + "\r\n"
                            "Content-Type: image/jpeg\r\n"
                            "Content-Length: " + std::to_string(jpeg->size()) + "\r\n\r\n";

                        if (!sink.write(header.data(), header.size())) return false;
                        if (!sink.write(reinterpret_cast<const char*>(jpeg->data()), jpeg->size())) return false;
                        if (!sink.write("\r\n", 2)) return false;
                    }

                    sink.done();
                    return true;
                }
            );
        });

        // /control/<source|stream|storage|timelapse>/<start|stop>
        svr.Post(R"(/control/(\w+)/(start|stop))", [this](const httplib::Request& req, httplib::Response& res) {
            const std::string target = req.matches[1];
            const bool start = req.matches[2] == "start";

            Status st;
            if (target == "source") {
                st = start ? t_.coordinator.start_source() : t_.coordinator.stop_source();
            } else {
                st = start ? t_.coordinator.start_module(target) : t_.coordinator.stop_module(target);
            }
            std::cout << "[HTTP] " << target << " " << req.matches[2] << ": " << to_string(st.code) << "\n";
            reply(res, st);
        });

        // /settings/<stream|storage|timelapse>?field=value
        svr.Post(R"(/settings/(\w+))", [this](const httplib::Request& req, httplib::Response& res) {
            const std::string target = req.matches[1];
            SettingsPatch patch;
            Status st = parse_settings_patch(params_of(req), patch);
            if (st.ok()) st = t_.coordinator.update_settings(target, patch);
            reply(res, st);
        });
    }
}
