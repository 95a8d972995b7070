#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include <pipeline/bounded_queue.hpp>
#include <pipeline/output_module.hpp>

namespace sc {
    // Queue + thread lifecycle shared by the concrete output modules.
    // The worker pops with a bounded wait, applies the current strategy and
    // hands the processed frame to the module. Handlers return false to end
    // the worker from inside; an exception ends it with an error.
    class ModuleWorker {
    public:
        using FrameHandler = std::function<bool(const FramePtr&)>;
        using IdleHandler = std::function<bool()>;

        static constexpr std::chrono::milliseconds kPopTimeout{200};

        ModuleWorker(std::string name, size_t queue_capacity);
        ~ModuleWorker();

        ModuleWorker(const ModuleWorker&) = delete;
        ModuleWorker& operator=(const ModuleWorker&) = delete;

        Status start(FrameHandler on_frame, IdleHandler on_idle = {});
        Status stop();

        bool running() const { return running_.load(); }
        bool push(FramePtr frame);

        void set_strategy(Strategy s);
        Strategy strategy() const;

        void set_stop_listener(IOutputModule::StopListener l);

        std::string last_error() const;
        ErrorCode last_error_code() const;
        void set_error(ErrorCode code, std::string reason);

        const std::string& name() const { return name_; }

        // Common fields of ModuleStatus; the caller fills required_fps.
        ModuleStatus status() const;

    private:
        void loop_();
        FramePtr apply_strategy_(const FramePtr& in) const;
        void finish_from_worker_();

        std::string name_;
        BoundedQueue<FramePtr> queue_;

        std::mutex lifecycle_mtx_;
        std::thread thr_;
        std::atomic<bool> running_{false};

        FrameHandler on_frame_;
        IdleHandler on_idle_;

        mutable std::mutex strategy_mtx_;
        Strategy strategy_;

        mutable std::mutex err_mtx_;
        ErrorCode err_code_ = ErrorCode::Ok;
        std::string last_error_;

        mutable std::mutex listener_mtx_;
        IOutputModule::StopListener stop_listener_;

        std::atomic<uint64_t> processed_{0};
    };
}
