#include <outputs/stream_module.hpp>

#include <iostream>
#include <stdexcept>

namespace sc {
    StreamModule::StreamModule(StreamConfig cfg,
                               std::shared_ptr<IFrameEncoder> encoder,
                               std::shared_ptr<const IClock> clock)
        : cfg_(std::move(cfg)),
          encoder_(std::move(encoder)),
          clock_(std::move(clock)),
          gate_(1.0 / cfg_.fps),
          worker_("stream", cfg_.queue_capacity) {
        const std::string problem = validate(cfg_);
        if (!problem.empty()) throw std::runtime_error("[Stream] " + problem);
        if (!encoder_) throw std::invalid_argument("[Stream] encoder is required");
        worker_.set_strategy(*Strategy::from_name(cfg_.strategy));
    }

    StreamModule::~StreamModule() {
        stop();
    }

    Status StreamModule::start() {
        if (worker_.running()) {
            return Status::error(ErrorCode::AlreadyRunning, "stream is already running");
        }
        gate_.reset();
        encode_failures_ = 0;
        {
            std::lock_guard lk(frame_mtx_);
            window_frames_ = 0;
            window_start_ = clock_->now();
            actual_fps_ = 0.0;
        }

        Status st = worker_.start([this](const FramePtr& f) { return handle_frame_(f); });
        if (st.ok()) {
            std::cout << "[Stream] started at " << config().fps << " fps, strategy "
                      << worker_.strategy().name() << "\n";
        }
        return st;
    }

    Status StreamModule::stop() {
        Status st = worker_.stop();
        publish_(nullptr);
        if (st.ok()) std::cout << "[Stream] stopped\n";
        return st;
    }

    bool StreamModule::should_process_frame() {
        return gate_.admit(clock_->now());
    }

    double StreamModule::get_required_camera_fps() const {
        if (!worker_.running()) return 0.0;
        return config().fps;
    }

    void StreamModule::set_processing_strategy(Strategy strategy) {
        {
            std::lock_guard lk(cfg_mtx_);
            cfg_.strategy = strategy.name();
        }
        worker_.set_strategy(strategy);
    }

    Status StreamModule::update_settings(const SettingsPatch& patch) {
        if (patch.interval_s || patch.duration_s || patch.min_frames || patch.output_fps ||
            patch.repeat || patch.label) {
            return Status::error(ErrorCode::ConfigurationError,
                                 "stream accepts only fps, jpeg_quality and strategy");
        }

        std::lock_guard lk(cfg_mtx_);
        StreamConfig next = cfg_;
        if (patch.fps) next.fps = *patch.fps;
        if (patch.jpeg_quality) next.jpeg_quality = *patch.jpeg_quality;
        if (patch.strategy) next.strategy = *patch.strategy;

        const std::string problem = validate(next);
        if (!problem.empty()) return Status::error(ErrorCode::ConfigurationError, problem);

        cfg_ = next;
        gate_.set_period(1.0 / cfg_.fps);
        worker_.set_strategy(*Strategy::from_name(cfg_.strategy));
        return Status::success();
    }

    ModuleStatus StreamModule::status() const {
        ModuleStatus s = worker_.status();
        s.required_fps = get_required_camera_fps();
        return s;
    }

    StreamModule::JpegPtr StreamModule::get_frame() const {
        std::lock_guard lk(frame_mtx_);
        return last_jpeg_;
    }

    bool StreamModule::wait_frame(uint64_t after_seq, JpegPtr& out, uint64_t& seq,
                                  std::chrono::milliseconds timeout) const {
        std::unique_lock lk(frame_mtx_);
        const bool ready = frame_cv_.wait_for(lk, timeout, [&] {
            return last_jpeg_ && seq_ > after_seq;
        });
        if (!ready) return false;
        out = last_jpeg_;
        seq = seq_;
        return true;
    }

    StreamStats StreamModule::stream_status() const {
        StreamStats s;
        s.processed = worker_.status().processed;
        s.encode_failures = encode_failures_.load();
        std::lock_guard lk(frame_mtx_);
        s.actual_fps = actual_fps_;
        s.seq = seq_;
        return s;
    }

    StreamConfig StreamModule::config() const {
        std::lock_guard lk(cfg_mtx_);
        return cfg_;
    }

    bool StreamModule::handle_frame_(const FramePtr& frame) {
        int quality;
        {
            std::lock_guard lk(cfg_mtx_);
            quality = cfg_.jpeg_quality;
        }

        std::vector<uint8_t> buf;
        if (!encoder_->encode(frame->bgr, quality, buf)) {
            const uint64_t n = ++encode_failures_;
            if (n == 1 || n % 100 == 0) {
                std::cerr << "[Stream](encode) failed on frame " << frame->frame_id
                          << " (" << n << " total)\n";
            }
            return true;
        }

        publish_(std::make_shared<const std::vector<uint8_t>>(std::move(buf)));
        return true;
    }

    void StreamModule::publish_(JpegPtr jpeg) {
        {
            std::lock_guard lk(frame_mtx_);
            if (jpeg) {
                ++seq_;
                ++window_frames_;
                const TimePoint now = clock_->now();
                const double elapsed = seconds_between(window_start_, now);
                if (elapsed >= 1.0) {
                    actual_fps_ = window_frames_ / elapsed;
                    window_frames_ = 0;
                    window_start_ = now;
                }
            }
            last_jpeg_ = std::move(jpeg);
        }
        frame_cv_.notify_all();
    }
}
