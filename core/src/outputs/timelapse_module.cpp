#include <outputs/timelapse_module.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <common/output_paths.hpp>
#include <common/resize.hpp>

namespace sc {
    TimelapseModule::TimelapseModule(TimelapseConfig cfg,
                                     std::shared_ptr<IVideoWriterFactory> writers,
                                     std::shared_ptr<const IClock> clock)
        : cfg_(std::move(cfg)),
          writers_(std::move(writers)),
          clock_(std::move(clock)),
          cycle_(cfg_),
          worker_("timelapse", cfg_.queue_capacity) {
        const std::string problem = validate(cfg_);
        if (!problem.empty()) throw std::runtime_error("[Timelapse] " + problem);
        if (!writers_) throw std::invalid_argument("[Timelapse] writer factory is required");
        worker_.set_strategy(*Strategy::from_name(cfg_.strategy));
    }

    TimelapseModule::~TimelapseModule() {
        stop();
    }

    Status TimelapseModule::start() {
        if (worker_.running()) {
            return Status::error(ErrorCode::AlreadyRunning, "timelapse is already running");
        }
        {
            std::lock_guard lk(cycle_mtx_);
            cycle_.begin(clock_->now());
        }

        Status st = worker_.start([this](const FramePtr& f) { return handle_frame_(f); },
                                  [this] { return check_due_(); });
        if (!st.ok()) {
            std::lock_guard lk(cycle_mtx_);
            cycle_.reset();
            return st;
        }

        const TimelapseConfig cfg = config();
        std::cout << "[Timelapse] started: every " << cfg.interval_s << " s, ";
        if (cfg.duration_s > 0.0) {
            std::cout << "for " << cfg.duration_s << " s\n";
        } else {
            std::cout << "video every " << cfg.min_frames << " frames"
                      << (cfg.repeat ? ", repeating" : "") << "\n";
        }
        return st;
    }

    Status TimelapseModule::stop() {
        Status st = worker_.stop();

        std::vector<cv::Mat> frames;
        size_t min_frames = 0;
        {
            std::lock_guard lk(cycle_mtx_);
            if (cycle_.state() == TimelapseState::Idle) return st;
            min_frames = static_cast<size_t>(cycle_.min_frames());
            frames = cycle_.reset();
        }

        if (frames.size() >= min_frames) {
            const Status cs = compile_(frames);
            if (!cs.ok()) {
                std::cerr << "[Timelapse](stop) " << cs.reason << "\n";
                worker_.set_error(cs.code, cs.reason);
                return cs;
            }
        } else {
            std::cout << "[Timelapse] discarded " << frames.size() << " frames (need "
                      << min_frames << " for a video)\n";
        }
        return st;
    }

    bool TimelapseModule::should_process_frame() {
        std::lock_guard lk(cycle_mtx_);
        return cycle_.admit(clock_->now());
    }

    double TimelapseModule::get_required_camera_fps() const {
        if (!worker_.running()) return 0.0;
        return 1.0 / config().interval_s;
    }

    void TimelapseModule::set_processing_strategy(Strategy strategy) {
        {
            std::lock_guard lk(cfg_mtx_);
            cfg_.strategy = strategy.name();
        }
        worker_.set_strategy(strategy);
    }

    Status TimelapseModule::update_settings(const SettingsPatch& patch) {
        if (patch.fps || patch.jpeg_quality || patch.label) {
            return Status::error(ErrorCode::ConfigurationError,
                                 "timelapse accepts only interval, duration, min_frames, output_fps, repeat and strategy");
        }

        std::lock_guard lk(cfg_mtx_);
        TimelapseConfig next = cfg_;
        if (patch.interval_s) next.interval_s = *patch.interval_s;
        if (patch.duration_s) next.duration_s = *patch.duration_s;
        if (patch.min_frames) next.min_frames = *patch.min_frames;
        if (patch.output_fps) next.output_fps = *patch.output_fps;
        if (patch.repeat) next.repeat = *patch.repeat;
        if (patch.strategy) next.strategy = *patch.strategy;

        const std::string problem = validate(next);
        if (!problem.empty()) return Status::error(ErrorCode::ConfigurationError, problem);

        cfg_ = next;
        {
            std::lock_guard clk(cycle_mtx_);
            cycle_.configure(cfg_);
        }
        worker_.set_strategy(*Strategy::from_name(cfg_.strategy));
        return Status::success();
    }

    ModuleStatus TimelapseModule::status() const {
        ModuleStatus s = worker_.status();
        s.required_fps = get_required_camera_fps();
        return s;
    }

    TimelapseStatus TimelapseModule::timelapse_status() const {
        TimelapseStatus s;
        const TimePoint now = clock_->now();
        {
            std::lock_guard lk(cycle_mtx_);
            s.state = cycle_.state();
            s.buffered = cycle_.buffered();
            s.next_capture_in = cycle_.next_capture_in(now);
            s.next_video_in = cycle_.next_video_in(now);
            s.elapsed = cycle_.elapsed(now);
        }
        std::lock_guard lk(result_mtx_);
        s.videos_created = videos_created_;
        s.last_video = last_video_;
        return s;
    }

    TimelapseConfig TimelapseModule::config() const {
        std::lock_guard lk(cfg_mtx_);
        return cfg_;
    }

    bool TimelapseModule::handle_frame_(const FramePtr& frame) {
        {
            std::lock_guard lk(cycle_mtx_);
            cycle_.append(frame->bgr);
        }
        return check_due_();
    }

    bool TimelapseModule::check_due_() {
        std::vector<cv::Mat> frames;
        size_t min_frames = 0;
        {
            std::lock_guard lk(cycle_mtx_);
            if (!cycle_.due(clock_->now())) return true;
            min_frames = static_cast<size_t>(cycle_.min_frames());
            frames = cycle_.begin_compile();
        }

        // the cycle lock is not held while compiling
        Status st;
        if (frames.size() < min_frames) {
            std::cout << "[Timelapse] cycle ended with " << frames.size() << " frames (need "
                      << min_frames << "), no video\n";
        } else {
            st = compile_(frames);
        }

        TimelapseState next;
        {
            std::lock_guard lk(cycle_mtx_);
            if (st.ok()) {
                next = cycle_.finish(clock_->now());
            } else {
                cycle_.reset();
                next = TimelapseState::Idle;
            }
        }
        if (!st.ok()) throw StatusError(st.code, st.reason);

        if (next == TimelapseState::Idle) std::cout << "[Timelapse] cycle complete\n";
        return next != TimelapseState::Idle;
    }

    Status TimelapseModule::compile_(const std::vector<cv::Mat>& frames) {
        const TimelapseConfig cfg = config();
        const std::string lost = std::to_string(frames.size()) + " frames lost";

        std::error_code ec;
        std::filesystem::create_directories(cfg.output_dir, ec);
        if (ec) {
            return Status::error(ErrorCode::ResourceUnavailable,
                                 "cannot create " + cfg.output_dir + ": " + ec.message() + ", " + lost);
        }

        const std::string path = make_output_path(cfg.output_dir, "timelapse", "", ".mp4");
        const cv::Size size = frames.front().size();
        auto writer = writers_->open(path, cfg.output_fps, size);
        if (!writer) {
            return Status::error(ErrorCode::ResourceUnavailable,
                                 "failed to open video writer for " + path + ", " + lost);
        }

        uint64_t written = 0;
        for (const cv::Mat& f : frames) {
            const cv::Mat img = f.size() == size ? f : letterbox(f, size);
            if (writer->write(img)) ++written;
        }
        writer->close();

        if (written == 0) {
            std::filesystem::remove(path, ec);
            return Status::error(ErrorCode::ResourceUnavailable, "writer rejected every frame, " + lost);
        }

        {
            std::lock_guard lk(result_mtx_);
            ++videos_created_;
            last_video_ = path;
        }
        std::cout << "[Timelapse] compiled " << written << " frames at " << cfg.output_fps
                  << " fps -> " << path << "\n";
        return Status::success();
    }
}
