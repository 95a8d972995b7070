#include <outputs/stream_module.hpp>

#include "test_support.hpp"

#include <opencv2/core.hpp>

using sc_test::check;
using sc_test::wait_until;

namespace {
    sc::StreamConfig stream_cfg() {
        sc::StreamConfig c;
        c.fps = 10.0;
        c.jpeg_quality = 90;
        c.queue_capacity = 2;
        return c;
    }

    bool channels_equal(const cv::Mat& bgr) {
        std::vector<cv::Mat> ch;
        cv::split(bgr, ch);
        return cv::countNonZero(ch[0] != ch[1]) == 0 && cv::countNonZero(ch[1] != ch[2]) == 0;
    }

    void test_lifecycle_and_latest_frame() {
        auto enc = std::make_shared<sc_test::RecordingEncoder>();
        sc::StreamModule m(stream_cfg(), enc);

        check(m.stop().code == sc::ErrorCode::NotRunning, "stop before start should be NotRunning");
        check(m.get_frame() == nullptr, "no frame before start");
        check(m.get_required_camera_fps() == 0.0, "stopped module should require 0 fps");

        check(m.start().ok(), "start should succeed");
        check(m.start().code == sc::ErrorCode::AlreadyRunning, "second start should be AlreadyRunning");
        check(m.get_required_camera_fps() == 10.0, "running module should require its fps");

        m.add_frame(sc_test::make_frame(1));
        check(wait_until([&] { return m.get_frame() != nullptr; }), "encoded frame should be published");
        check(wait_until([&] { return m.stream_status().processed == 1; }), "one frame should be processed");

        check(m.stop().ok(), "stop should succeed");
        check(m.get_frame() == nullptr, "stop should clear the latest frame");
        check(m.stop().code == sc::ErrorCode::NotRunning, "stop should be idempotent");
        check(!m.add_frame(sc_test::make_frame(2)), "stopped module should refuse frames");
    }

    void test_cadence_gate() {
        auto clock = std::make_shared<sc_test::ManualClock>();
        sc::StreamModule m(stream_cfg(), std::make_shared<sc_test::RecordingEncoder>(), clock);
        m.start();

        check(m.should_process_frame(), "first frame should be admitted");
        clock->advance(0.05);
        check(!m.should_process_frame(), "frame half a period later should be rejected");
        clock->advance(0.05);
        check(m.should_process_frame(), "frame one period later should be admitted");
        m.stop();
    }

    void test_settings_validation() {
        auto enc = std::make_shared<sc_test::RecordingEncoder>();
        sc::StreamModule m(stream_cfg(), enc);

        sc::SettingsPatch foreign;
        foreign.interval_s = 3.0;
        check(m.update_settings(foreign).code == sc::ErrorCode::ConfigurationError,
              "timelapse fields should not apply to stream");

        sc::SettingsPatch bad;
        bad.fps = 20.0;
        bad.jpeg_quality = 0;
        check(m.update_settings(bad).code == sc::ErrorCode::ConfigurationError, "quality 0 should be rejected");
        check(m.config().fps == 10.0, "a rejected patch should change nothing");

        sc::SettingsPatch strategy;
        strategy.strategy = "sepia";
        check(!m.update_settings(strategy).ok(), "unknown strategy should be rejected");

        sc::SettingsPatch good;
        good.fps = 5.0;
        good.jpeg_quality = 50;
        check(m.update_settings(good).ok(), "valid patch should be accepted");
        check(m.config().fps == 5.0 && m.config().jpeg_quality == 50, "valid patch should apply");

        m.start();
        check(m.get_required_camera_fps() == 5.0, "required fps should follow the setting");
        m.add_frame(sc_test::make_frame(1));
        check(wait_until([&] { return m.get_frame() != nullptr; }), "frame should be encoded");
        check(enc->last_quality() == 50, "encoder should get the new quality");
        m.stop();
    }

    void test_strategy_applies_to_later_frames() {
        auto enc = std::make_shared<sc_test::RecordingEncoder>();
        sc::StreamModule m(stream_cfg(), enc);
        m.start();

        m.add_frame(sc_test::make_frame(1));
        check(wait_until([&] { return m.stream_status().processed == 1; }), "first frame should be processed");

        m.set_processing_strategy(sc::Strategy(sc::Strategy::Kind::Grayscale));
        m.add_frame(sc_test::make_frame(2));
        check(wait_until([&] { return m.stream_status().processed == 2; }), "second frame should be processed");
        m.stop();

        const auto in = enc->inputs();
        check(in.size() == 2, "encoder should see two frames");
        if (in.size() == 2) {
            check(!channels_equal(in[0]), "frame before the change should be untouched");
            check(channels_equal(in[1]), "frame after the change should be grayscale");
        }
        check(m.status().strategy == "grayscale", "status should report the new strategy");
    }

    void test_overflow_drops_oldest() {
        auto enc = std::make_shared<sc_test::RecordingEncoder>();
        sc::StreamModule m(stream_cfg(), enc);
        m.start();

        enc->hold();
        m.add_frame(sc_test::make_frame(0, 8, 8, 0));
        check(wait_until([&] { return m.status().queued == 0; }), "worker should pick up the first frame");

        for (int i = 1; i <= 5; ++i) {
            m.add_frame(sc_test::make_frame(i, 8, 8, i * 10));
            check(m.status().queued <= 2, "queue should stay within its bound");
        }
        check(m.status().dropped == 3, "three oldest frames should have been dropped");

        enc->release();
        check(wait_until([&] { return m.stream_status().processed == 3; }), "remaining frames should be processed");
        m.stop();

        const auto in = enc->inputs();
        check(in.size() == 3, "encoder should see the held frame plus the two newest");
        if (in.size() == 3) {
            check(in[1].at<cv::Vec3b>(0, 0)[0] == 40, "frame 4 should survive");
            check(in[2].at<cv::Vec3b>(0, 0)[0] == 50, "frame 5 should survive");
        }
    }

    void test_encode_failures_are_counted() {
        auto enc = std::make_shared<sc_test::RecordingEncoder>();
        enc->set_fail(true);
        sc::StreamModule m(stream_cfg(), enc);
        m.start();

        m.add_frame(sc_test::make_frame(1));
        check(wait_until([&] { return m.stream_status().encode_failures == 1; }), "failure should be counted");
        check(m.is_running(), "encode failures should not stop the module");
        check(m.get_frame() == nullptr, "failed frames should not be published");
        m.stop();
    }

    void test_rejected_start_keeps_stats() {
        auto clock = std::make_shared<sc_test::ManualClock>();
        auto enc = std::make_shared<sc_test::RecordingEncoder>();
        enc->set_fail(true);
        sc::StreamModule m(stream_cfg(), enc, clock);
        m.start();

        check(m.should_process_frame(), "first frame should be admitted");
        m.add_frame(sc_test::make_frame(1));
        check(wait_until([&] { return m.stream_status().encode_failures == 1; }), "failure should be counted");

        check(m.start().code == sc::ErrorCode::AlreadyRunning, "second start should be rejected");
        check(m.stream_status().encode_failures == 1, "rejected start should keep the failure count");
        check(!m.should_process_frame(), "rejected start should not reset the cadence gate");
        m.stop();
    }

    void test_wait_frame() {
        sc::StreamModule m(stream_cfg(), std::make_shared<sc_test::RecordingEncoder>());
        m.start();

        sc::StreamModule::JpegPtr jpeg;
        uint64_t seq = 0;
        check(!m.wait_frame(0, jpeg, seq, std::chrono::milliseconds(20)), "wait should time out without frames");

        std::thread producer([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            m.add_frame(sc_test::make_frame(1));
        });
        const bool got = m.wait_frame(0, jpeg, seq, std::chrono::milliseconds(2000));
        producer.join();
        check(got && jpeg && seq == 1, "wait should return the new frame");
        check(!m.wait_frame(seq, jpeg, seq, std::chrono::milliseconds(20)), "no newer frame should time out");
        m.stop();
    }
}

int main() {
    test_lifecycle_and_latest_frame();
    test_cadence_gate();
    test_settings_validation();
    test_strategy_applies_to_later_frames();
    test_overflow_drops_oldest();
    test_encode_failures_are_counted();
    test_rejected_start_keeps_stats();
    test_wait_frame();

    return sc_test::finish("stream module");
}
