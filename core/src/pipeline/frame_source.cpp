#include <pipeline/frame_source.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace sc {
    FrameSource::FrameSource(std::unique_ptr<ISensor> sensor,
                             Options opt,
                             std::shared_ptr<const IClock> clock)
        : sensor_(std::move(sensor)),
          opt_(opt),
          clock_(std::move(clock)),
          resolution_(opt.resolution),
          fps_(opt.initial_fps > 0.0 ? opt.initial_fps : 1.0) {
        if (!sensor_) throw std::invalid_argument("FrameSource requires a sensor");
    }

    FrameSource::~FrameSource() {
        stop();
    }

    Status FrameSource::start() {
        std::lock_guard lk(lifecycle_mtx_);
        if (running_) {
            return Status::error(ErrorCode::AlreadyRunning, "frame source is already running");
        }
        if (capture_thr_.joinable()) capture_thr_.join();

        {
            std::lock_guard slk(mtx_);
            if (!sensor_->open(resolution_, fps_.load())) {
                const std::string why = "failed to open sensor " + sensor_->id() +
                                        " at " + to_string(resolution_);
                set_error_(why);
                std::cerr << "[FrameSource](start) " << why << "\n";
                return Status::error(ErrorCode::ResourceUnavailable, why);
            }
            apply_controls_locked_();
            running_ = true;
        }
        set_error_({});

        capture_thr_ = std::thread([this] { capture_loop_(); });
        std::cout << "[FrameSource] started " << sensor_->id() << " at " << to_string(resolution_)
                  << ", " << fps_.load() << " fps\n";
        return Status::success();
    }

    Status FrameSource::stop() {
        std::lock_guard lk(lifecycle_mtx_);
        const bool was_running = running_.exchange(false);
        {
            std::lock_guard plk(pace_mtx_);
        }
        pace_cv_.notify_all();
        if (capture_thr_.joinable()) capture_thr_.join();

        {
            std::lock_guard slk(mtx_);
            sensor_->close();
        }
        if (!was_running) {
            return Status::error(ErrorCode::NotRunning, "frame source is not running");
        }
        std::cout << "[FrameSource] stopped after " << frames_captured_.load() << " frames\n";
        return Status::success();
    }

    Status FrameSource::update_capture_rate(double fps) {
        if (!(fps > 0.0)) {
            return Status::error(ErrorCode::ConfigurationError,
                                 "capture rate must be > 0, got " + std::to_string(fps));
        }

        Status st;
        {
            std::lock_guard lk(mtx_);
            const double prev = fps_.exchange(fps);
            if (prev == fps) return Status::success();
            // the sensor handle is swapped under the same lock the capture loop reads and fans out under
            if (running_) st = reopen_locked_();
            if (!st.ok()) fps_ = prev;
        }
        {
            std::lock_guard plk(pace_mtx_);
        }
        pace_cv_.notify_all();

        if (st.ok()) std::cout << "[FrameSource] capture rate -> " << fps << " fps\n";
        return st;
    }

    bool FrameSource::register_module(IOutputModule& module) {
        std::lock_guard lk(mtx_);
        if (std::find(modules_.begin(), modules_.end(), &module) != modules_.end()) return false;
        modules_.push_back(&module);
        return true;
    }

    bool FrameSource::unregister_module(IOutputModule& module) {
        std::lock_guard lk(mtx_);
        auto it = std::find(modules_.begin(), modules_.end(), &module);
        if (it == modules_.end()) return false;
        modules_.erase(it);
        return true;
    }

    size_t FrameSource::module_count() const {
        std::lock_guard lk(mtx_);
        return modules_.size();
    }

    Status FrameSource::set_resolution(const Resolution& res) {
        if (!res.valid()) {
            return Status::error(ErrorCode::ConfigurationError, "invalid resolution " + to_string(res));
        }

        std::lock_guard lk(mtx_);
        const auto supported = sensor_->list_supported_resolutions();
        if (!supported.empty() &&
            std::find(supported.begin(), supported.end(), res) == supported.end()) {
            return Status::error(ErrorCode::ConfigurationError,
                                 "resolution " + to_string(res) + " is not supported by " + sensor_->id());
        }
        if (res == resolution_) return Status::success();

        const Resolution prev = resolution_;
        resolution_ = res;
        if (!running_) return Status::success();

        const Status st = reopen_locked_();
        if (!st.ok()) resolution_ = prev;
        return st;
    }

    Resolution FrameSource::resolution() const {
        std::lock_guard lk(mtx_);
        return resolution_;
    }

    std::vector<Resolution> FrameSource::list_supported_resolutions() {
        std::lock_guard lk(mtx_);
        return sensor_->list_supported_resolutions();
    }

    Status FrameSource::apply_controls(const CameraControls& controls) {
        std::lock_guard lk(mtx_);
        controls_ = controls;
        controls_set_ = true;
        if (sensor_->is_open() && !sensor_->apply_controls(controls)) {
            return Status::error(ErrorCode::ResourceUnavailable, "sensor rejected image controls");
        }
        return Status::success();
    }

    Status FrameSource::capture_still(cv::Mat& out) {
        std::lock_guard lk(mtx_);

        Resolution target = resolution_;
        for (const auto& r : sensor_->list_supported_resolutions()) {
            if (r.area() > target.area()) target = r;
        }

        sensor_->close();
        Status st;
        if (!sensor_->open(target, std::max(1.0, fps_.load()))) {
            st = Status::error(ErrorCode::ResourceUnavailable,
                               "failed to open sensor at " + to_string(target) + " for still capture");
        } else {
            apply_controls_locked_();

            Frame f;
            ReadResult r = ReadResult::Timeout;
            const auto deadline = Clock::now() + std::chrono::milliseconds(opt_.still_timeout_ms);
            while (r == ReadResult::Timeout && Clock::now() < deadline) {
                r = sensor_->read(f, opt_.read_timeout_ms);
            }
            if (r == ReadResult::Frame && !f.bgr.empty()) {
                out = f.bgr;
            } else {
                st = Status::error(ErrorCode::TransientCaptureError,
                                   "no frame received at " + to_string(target));
            }
            sensor_->close();
        }

        if (running_) {
            const Status restored = reopen_locked_();
            if (!restored.ok()) return restored;
        }
        if (st.ok()) {
            std::cout << "[FrameSource] still captured at " << out.cols << "x" << out.rows << "\n";
        }
        return st;
    }

    SourceStatus FrameSource::status() const {
        SourceStatus s;
        s.running = running_.load();
        s.capture_fps = fps_.load();
        s.resolution = resolution();
        s.frames_captured = frames_captured_.load();
        s.read_errors = read_errors_.load();
        std::lock_guard lk(err_mtx_);
        s.last_error = last_error_;
        return s;
    }

    // loop

    void FrameSource::capture_loop_() {
        bool has_last = false;
        TimePoint last_capture{};

        while (running_.load(std::memory_order_relaxed)) {
            if (has_last && !wait_for_next_slot_(last_capture)) break;

            Frame frame;
            ReadResult r;
            {
                std::lock_guard lk(mtx_);
                r = sensor_->read(frame, opt_.read_timeout_ms);
            }

            if (r == ReadResult::Timeout) continue;
            if (r == ReadResult::Error || frame.bgr.empty()) {
                if (!running_.load()) break;
                const uint64_t n = ++read_errors_;
                if (n == 1 || n % 100 == 0) {
                    std::cerr << "[FrameSource](capture_loop_) frame read failed (" << n << " total)\n";
                }
                std::unique_lock plk(pace_mtx_);
                pace_cv_.wait_for(plk, std::chrono::milliseconds(100), [&] { return !running_.load(); });
                continue;
            }

            has_last = true;
            last_capture = Clock::now();

            frame.frame_id = next_frame_id_++;
            frame.captured_at = clock_->now();
            frame.width = frame.bgr.cols;
            frame.height = frame.bgr.rows;
            ++frames_captured_;

            fan_out_(std::make_shared<const Frame>(std::move(frame)));
        }
    }

    bool FrameSource::wait_for_next_slot_(TimePoint last_capture) {
        std::unique_lock lk(pace_mtx_);
        while (running_.load()) {
            const auto period = std::chrono::duration_cast<Clock::duration>(
                std::chrono::duration<double>(1.0 / fps_.load()));
            const TimePoint due = last_capture + period;
            if (Clock::now() >= due) return true;
            // woken early by stop() or a rate change; the period is re-read
            pace_cv_.wait_until(lk, due);
        }
        return false;
    }

    void FrameSource::fan_out_(const FramePtr& frame) {
        std::lock_guard lk(mtx_);
        for (IOutputModule* m : modules_) {
            if (m->is_running() && m->should_process_frame()) {
                m->add_frame(frame);
            }
        }
    }

    // A failed reopen ends the capture session; the thread exits on its own and is
    // joined by the next start() or stop().
    Status FrameSource::reopen_locked_() {
        sensor_->close();
        if (!sensor_->open(resolution_, fps_.load())) {
            const std::string why = "failed to reopen sensor " + sensor_->id() + " at " +
                                    to_string(resolution_) + ", " + std::to_string(fps_.load()) + " fps";
            set_error_(why);
            std::cerr << "[FrameSource](reopen) " << why << ", capture stopped\n";
            running_ = false;
            {
                std::lock_guard plk(pace_mtx_);
            }
            pace_cv_.notify_all();
            return Status::error(ErrorCode::ResourceUnavailable, why);
        }
        apply_controls_locked_();
        return Status::success();
    }

    void FrameSource::apply_controls_locked_() {
        if (!controls_set_) return;
        if (!sensor_->apply_controls(controls_)) {
            std::cerr << "[FrameSource](apply_controls) sensor " << sensor_->id() << " rejected image controls\n";
        }
    }

    void FrameSource::set_error_(std::string reason) {
        std::lock_guard lk(err_mtx_);
        last_error_ = std::move(reason);
    }
}
