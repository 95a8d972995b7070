#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <common/clock.hpp>
#include <common/config.hpp>
#include <encode/video_writer.hpp>
#include <pipeline/cadence_gate.hpp>
#include <pipeline/module_worker.hpp>
#include <pipeline/output_module.hpp>

namespace sc {
    struct StorageStatus {
        std::string current_file;
        uint64_t frames_written = 0;
        bool writer_open = false;
    };

    // Records admitted frames into one video file per start()/stop() session.
    class StorageModule : public IOutputModule {
    public:
        StorageModule(StorageConfig cfg,
                      std::shared_ptr<IVideoWriterFactory> writers,
                      std::shared_ptr<const IClock> clock = default_clock());
        ~StorageModule() override;

        const std::string& name() const override { return worker_.name(); }

        // Fixes the output file name; the writer itself opens on the first frame.
        Status start() override;
        // Closes the writer. A session without frames leaves no file behind.
        Status stop() override;
        bool is_running() const override { return worker_.running(); }

        bool add_frame(FramePtr frame) override { return worker_.push(std::move(frame)); }
        bool should_process_frame() override;
        double get_required_camera_fps() const override;

        void set_processing_strategy(Strategy strategy) override;
        // fps applies to admission immediately and to the container from the next file; label from the next start().
        Status update_settings(const SettingsPatch& patch) override;

        ModuleStatus status() const override;
        void set_stop_listener(StopListener listener) override { worker_.set_stop_listener(std::move(listener)); }

        StorageStatus storage_status() const;
        StorageConfig config() const;

    private:
        bool handle_frame_(const FramePtr& frame);
        void close_writer_();

        mutable std::mutex cfg_mtx_;
        StorageConfig cfg_;

        std::shared_ptr<IVideoWriterFactory> writers_;
        std::shared_ptr<const IClock> clock_;
        CadenceGate gate_;

        // guards the session output
        mutable std::mutex out_mtx_;
        std::string current_file_;
        double session_fps_ = 0.0;
        std::unique_ptr<IVideoWriter> writer_;
        uint64_t frames_written_ = 0;
        uint64_t write_failures_ = 0;

        ModuleWorker worker_;
    };
}
