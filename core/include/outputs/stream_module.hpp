#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <common/clock.hpp>
#include <common/config.hpp>
#include <encode/frame_encoder.hpp>
#include <pipeline/cadence_gate.hpp>
#include <pipeline/module_worker.hpp>
#include <pipeline/output_module.hpp>

namespace sc {
    struct StreamStats {
        uint64_t processed = 0;
        uint64_t encode_failures = 0;
        double actual_fps = 0.0;
        uint64_t seq = 0;
    };

    // Live preview: keeps only the latest encoded JPEG.
    class StreamModule : public IOutputModule {
    public:
        using JpegPtr = std::shared_ptr<const std::vector<uint8_t>>;

        StreamModule(StreamConfig cfg,
                     std::shared_ptr<IFrameEncoder> encoder,
                     std::shared_ptr<const IClock> clock = default_clock());
        ~StreamModule() override;

        const std::string& name() const override { return worker_.name(); }

        Status start() override;
        Status stop() override;
        bool is_running() const override { return worker_.running(); }

        bool add_frame(FramePtr frame) override { return worker_.push(std::move(frame)); }
        bool should_process_frame() override;
        double get_required_camera_fps() const override;

        void set_processing_strategy(Strategy strategy) override;
        Status update_settings(const SettingsPatch& patch) override;

        ModuleStatus status() const override;
        void set_stop_listener(StopListener listener) override { worker_.set_stop_listener(std::move(listener)); }

        // Latest encoded frame, nullptr before the first one or after stop().
        JpegPtr get_frame() const;

        // Blocks until a frame newer than after_seq is available or the timeout passes.
        bool wait_frame(uint64_t after_seq, JpegPtr& out, uint64_t& seq, std::chrono::milliseconds timeout) const;

        StreamStats stream_status() const;
        StreamConfig config() const;

    private:
        bool handle_frame_(const FramePtr& frame);
        void publish_(JpegPtr jpeg);

        mutable std::mutex cfg_mtx_;
        StreamConfig cfg_;

        std::shared_ptr<IFrameEncoder> encoder_;
        std::shared_ptr<const IClock> clock_;
        CadenceGate gate_;

        mutable std::mutex frame_mtx_;
        mutable std::condition_variable frame_cv_;
        JpegPtr last_jpeg_;
        uint64_t seq_ = 0;
        TimePoint window_start_{};
        uint64_t window_frames_ = 0;
        double actual_fps_ = 0.0;

        std::atomic<uint64_t> encode_failures_{0};

        // declared last: joined before the state above is destroyed
        ModuleWorker worker_;
    };
}
