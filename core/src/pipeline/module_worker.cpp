#include <pipeline/module_worker.hpp>

#include <iostream>
#include <utility>

namespace sc {
    ModuleWorker::ModuleWorker(std::string name, size_t queue_capacity)
        : name_(std::move(name)),
          queue_(queue_capacity) {}

    ModuleWorker::~ModuleWorker() {
        stop();
    }

    Status ModuleWorker::start(FrameHandler on_frame, IdleHandler on_idle) {
        std::lock_guard lk(lifecycle_mtx_);
        if (running_) {
            return Status::error(ErrorCode::AlreadyRunning, name_ + " is already running");
        }
        // a worker that ended itself is still joinable
        if (thr_.joinable()) thr_.join();

        queue_.reset();
        {
            std::lock_guard elk(err_mtx_);
            err_code_ = ErrorCode::Ok;
            last_error_.clear();
        }
        on_frame_ = std::move(on_frame);
        on_idle_ = std::move(on_idle);
        processed_ = 0;

        running_ = true;
        thr_ = std::thread([this] { loop_(); });
        return Status::success();
    }

    Status ModuleWorker::stop() {
        std::lock_guard lk(lifecycle_mtx_);
        const bool was_running = running_.exchange(false);

        queue_.stop();
        if (thr_.joinable()) thr_.join();
        queue_.reset();

        if (!was_running) {
            return Status::error(ErrorCode::NotRunning, name_ + " is not running");
        }
        return Status::success();
    }

    bool ModuleWorker::push(FramePtr frame) {
        if (!running_.load(std::memory_order_relaxed) || !frame) return false;
        return queue_.push_drop_oldest(std::move(frame));
    }

    void ModuleWorker::set_strategy(Strategy s) {
        std::lock_guard lk(strategy_mtx_);
        strategy_ = s;
    }

    Strategy ModuleWorker::strategy() const {
        std::lock_guard lk(strategy_mtx_);
        return strategy_;
    }

    void ModuleWorker::set_stop_listener(IOutputModule::StopListener l) {
        std::lock_guard lk(listener_mtx_);
        stop_listener_ = std::move(l);
    }

    std::string ModuleWorker::last_error() const {
        std::lock_guard lk(err_mtx_);
        return last_error_;
    }

    ErrorCode ModuleWorker::last_error_code() const {
        std::lock_guard lk(err_mtx_);
        return err_code_;
    }

    void ModuleWorker::set_error(ErrorCode code, std::string reason) {
        std::lock_guard lk(err_mtx_);
        err_code_ = code;
        last_error_ = std::move(reason);
    }

    ModuleStatus ModuleWorker::status() const {
        ModuleStatus s;
        s.name = name_;
        s.running = running_.load();
        s.strategy = strategy().name();
        s.queued = queue_.size();
        s.queue_capacity = queue_.capacity();
        s.dropped = queue_.dropped();
        s.processed = processed_.load();
        s.last_error = last_error();
        return s;
    }

    void ModuleWorker::loop_() {
        while (running_.load(std::memory_order_relaxed)) {
            bool keep_running = true;
            try {
                FramePtr frame;
                if (queue_.pop_for(frame, kPopTimeout) && frame) {
                    keep_running = on_frame_(apply_strategy_(frame));
                    ++processed_;
                } else if (on_idle_) {
                    keep_running = on_idle_();
                }
            } catch (const StatusError& e) {
                std::cerr << "[" << name_ << "](worker) " << e.what() << "\n";
                set_error(e.code(), e.what());
                keep_running = false;
            } catch (const std::exception& e) {
                std::cerr << "[" << name_ << "](worker) unexpected failure: " << e.what() << "\n";
                set_error(ErrorCode::ResourceUnavailable, e.what());
                keep_running = false;
            }

            if (!keep_running) {
                finish_from_worker_();
                return;
            }
        }
    }

    FramePtr ModuleWorker::apply_strategy_(const FramePtr& in) const {
        const Strategy s = strategy();
        if (s.kind() == Strategy::Kind::None) return in;

        auto out = std::make_shared<Frame>(*in);
        out->bgr = s.apply(in->bgr);
        out->width = out->bgr.cols;
        out->height = out->bgr.rows;
        return out;
    }

    void ModuleWorker::finish_from_worker_() {
        // stop() may have raced us; then it owns the transition
        if (!running_.exchange(false)) return;
        queue_.stop();

        IOutputModule::StopListener l;
        {
            std::lock_guard lk(listener_mtx_);
            l = stop_listener_;
        }
        if (l) l(name_);
    }
}
