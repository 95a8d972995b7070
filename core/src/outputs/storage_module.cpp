#include <outputs/storage_module.hpp>

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <common/output_paths.hpp>
#include <common/resize.hpp>

namespace sc {
    StorageModule::StorageModule(StorageConfig cfg,
                                 std::shared_ptr<IVideoWriterFactory> writers,
                                 std::shared_ptr<const IClock> clock)
        : cfg_(std::move(cfg)),
          writers_(std::move(writers)),
          clock_(std::move(clock)),
          gate_(1.0 / cfg_.fps),
          worker_("storage", cfg_.queue_capacity) {
        const std::string problem = validate(cfg_);
        if (!problem.empty()) throw std::runtime_error("[Storage] " + problem);
        if (!writers_) throw std::invalid_argument("[Storage] writer factory is required");
        worker_.set_strategy(*Strategy::from_name(cfg_.strategy));
    }

    StorageModule::~StorageModule() {
        stop();
    }

    Status StorageModule::start() {
        if (worker_.running()) {
            return Status::error(ErrorCode::AlreadyRunning, "storage is already running");
        }

        const StorageConfig cfg = config();
        std::error_code ec;
        std::filesystem::create_directories(cfg.output_dir, ec);
        if (ec) {
            const std::string why = "cannot create " + cfg.output_dir + ": " + ec.message();
            std::cerr << "[Storage](start) " << why << "\n";
            worker_.set_error(ErrorCode::ResourceUnavailable, why);
            return Status::error(ErrorCode::ResourceUnavailable, why);
        }

        {
            std::lock_guard lk(out_mtx_);
            current_file_ = make_output_path(cfg.output_dir, "video", cfg.label, ".mp4");
            session_fps_ = cfg.fps;
            writer_.reset();
            frames_written_ = 0;
            write_failures_ = 0;
        }
        gate_.reset();

        Status st = worker_.start([this](const FramePtr& f) { return handle_frame_(f); });
        if (st.ok()) {
            std::cout << "[Storage] recording to " << storage_status().current_file << " at "
                      << cfg.fps << " fps\n";
        }
        return st;
    }

    Status StorageModule::stop() {
        Status st = worker_.stop();
        close_writer_();
        return st;
    }

    bool StorageModule::should_process_frame() {
        return gate_.admit(clock_->now());
    }

    double StorageModule::get_required_camera_fps() const {
        if (!worker_.running()) return 0.0;
        return config().fps;
    }

    void StorageModule::set_processing_strategy(Strategy strategy) {
        {
            std::lock_guard lk(cfg_mtx_);
            cfg_.strategy = strategy.name();
        }
        worker_.set_strategy(strategy);
    }

    Status StorageModule::update_settings(const SettingsPatch& patch) {
        if (patch.jpeg_quality || patch.interval_s || patch.duration_s || patch.min_frames ||
            patch.output_fps || patch.repeat) {
            return Status::error(ErrorCode::ConfigurationError,
                                 "storage accepts only fps, label and strategy");
        }

        std::lock_guard lk(cfg_mtx_);
        StorageConfig next = cfg_;
        if (patch.fps) next.fps = *patch.fps;
        if (patch.label) next.label = *patch.label;
        if (patch.strategy) next.strategy = *patch.strategy;

        const std::string problem = validate(next);
        if (!problem.empty()) return Status::error(ErrorCode::ConfigurationError, problem);

        cfg_ = next;
        gate_.set_period(1.0 / cfg_.fps);
        worker_.set_strategy(*Strategy::from_name(cfg_.strategy));
        return Status::success();
    }

    ModuleStatus StorageModule::status() const {
        ModuleStatus s = worker_.status();
        s.required_fps = get_required_camera_fps();
        return s;
    }

    StorageStatus StorageModule::storage_status() const {
        std::lock_guard lk(out_mtx_);
        StorageStatus s;
        s.current_file = current_file_;
        s.frames_written = frames_written_;
        s.writer_open = writer_ != nullptr;
        return s;
    }

    StorageConfig StorageModule::config() const {
        std::lock_guard lk(cfg_mtx_);
        return cfg_;
    }

    bool StorageModule::handle_frame_(const FramePtr& frame) {
        if (frame->bgr.empty()) return true;

        std::lock_guard lk(out_mtx_);
        if (!writer_) {
            writer_ = writers_->open(current_file_, session_fps_, frame->bgr.size());
            if (!writer_) {
                throw StatusError(ErrorCode::ResourceUnavailable,
                                  "failed to open video writer for " + current_file_);
            }
            std::cout << "[Storage] writer opened " << frame->bgr.cols << "x" << frame->bgr.rows
                      << " -> " << current_file_ << "\n";
        }

        const cv::Size size = writer_->frame_size();
        const cv::Mat img = frame->bgr.size() == size ? frame->bgr : letterbox(frame->bgr, size);
        if (!writer_->write(img)) {
            if (++write_failures_ == 1 || write_failures_ % 100 == 0) {
                std::cerr << "[Storage](write) frame " << frame->frame_id << " rejected ("
                          << write_failures_ << " total)\n";
            }
            return true;
        }
        ++frames_written_;
        return true;
    }

    void StorageModule::close_writer_() {
        std::lock_guard lk(out_mtx_);
        if (writer_) {
            writer_->close();
            std::cout << "[Storage] saved " << writer_->frames_written() << " frames to " << current_file_ << "\n";
            writer_.reset();
        }

        if (frames_written_ == 0 && !current_file_.empty()) {
            std::error_code ec;
            if (std::filesystem::remove(current_file_, ec)) {
                std::cout << "[Storage] removed empty recording " << current_file_ << "\n";
            } else if (ec) {
                std::cerr << "[Storage](stop) cannot remove " << current_file_ << ": " << ec.message() << "\n";
            }
        }
    }
}
