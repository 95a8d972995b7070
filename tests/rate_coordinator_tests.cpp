#include <pipeline/frame_source.hpp>
#include <pipeline/rate_coordinator.hpp>

#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

using sc_test::check;

namespace {
    constexpr double kIdle = 1.0 / 20.0;

    bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

    struct Rig {
        std::shared_ptr<sc_test::FakeSensorState> sensor = std::make_shared<sc_test::FakeSensorState>();
        std::unique_ptr<sc::FrameSource> source;
        sc_test::CountingModule stream{"stream", 10.0};
        sc_test::CountingModule storage{"storage", 1.0};
        sc_test::CountingModule timelapse{"timelapse", 0.2};
        std::unique_ptr<sc::RateCoordinator> coord;

        Rig() {
            sc::FrameSource::Options opt;
            opt.resolution = {64, 48};
            opt.initial_fps = kIdle;
            opt.read_timeout_ms = 10;
            source = std::make_unique<sc::FrameSource>(std::make_unique<sc_test::FakeSensor>(sensor), opt);
            coord = std::make_unique<sc::RateCoordinator>(*source, kIdle);
            coord->add_module(stream);
            coord->add_module(storage);
            coord->add_module(timelapse);
        }

        ~Rig() {
            coord->stop_all();
            coord.reset();
        }

        double expected() const {
            double r = kIdle;
            for (const sc_test::CountingModule* m : {&stream, &storage, &timelapse}) {
                r = std::max(r, m->get_required_camera_fps());
            }
            return r;
        }

        bool consistent() const {
            return near(source->capture_rate(), expected()) && near(coord->target_fps(), expected());
        }
    };

    void test_compute_target_fps() {
        check(near(sc::RateCoordinator::compute_target_fps({}, kIdle), kIdle), "no modules should give the idle floor");
        check(near(sc::RateCoordinator::compute_target_fps({0.0, 10.0, 1.0}, kIdle), 10.0), "fastest module should win");
        check(near(sc::RateCoordinator::compute_target_fps({0.01}, kIdle), kIdle), "the floor should bound slow modules");
    }

    void test_registration() {
        Rig rig;
        check(rig.source->module_count() == 3, "add_module should register with the source");
        check(rig.coord->find_module("storage") == &rig.storage, "modules should be found by name");
        check(rig.coord->find_module("lighting") == nullptr, "unknown names should not resolve");
        check(rig.coord->start_module("lighting").code == sc::ErrorCode::ConfigurationError,
              "starting an unknown module should be a ConfigurationError");
    }

    void test_rate_follows_start_stop() {
        Rig rig;
        check(rig.coord->start_source().ok(), "source should start");
        check(rig.consistent() && near(rig.source->capture_rate(), kIdle), "idle source should run at the floor");

        rig.coord->start_module("storage");
        check(near(rig.source->capture_rate(), 1.0), "storage alone should need 1 fps");

        rig.coord->start_module("stream");
        check(near(rig.source->capture_rate(), 10.0), "stream should raise the rate to 10 fps");

        check(rig.coord->start_module("stream").code == sc::ErrorCode::AlreadyRunning,
              "double start should be reported");
        check(near(rig.source->capture_rate(), 10.0), "a failed start should not change the rate");

        rig.coord->stop_module("stream");
        check(near(rig.source->capture_rate(), 1.0), "rate should drop back when stream stops");

        rig.coord->stop_module("storage");
        check(near(rig.source->capture_rate(), kIdle), "rate should return to the idle floor");
        check(rig.coord->stop_module("storage").code == sc::ErrorCode::NotRunning, "double stop should be reported");
    }

    void test_random_sequences_keep_invariant() {
        Rig rig;
        rig.coord->start_source();

        std::mt19937 rng(1234);
        const std::vector<std::string> names = {"stream", "storage", "timelapse"};
        for (int i = 0; i < 200; ++i) {
            const std::string& n = names[rng() % names.size()];
            if (rng() % 2) {
                rig.coord->start_module(n);
            } else {
                rig.coord->stop_module(n);
            }
            if (!rig.consistent()) {
                check(false, "capture rate should equal max(required, idle) after step " + std::to_string(i));
                break;
            }
        }
    }

    void test_worker_initiated_stop() {
        Rig rig;
        rig.coord->start_source();
        rig.coord->start_module("stream");
        rig.coord->start_module("timelapse");
        check(near(rig.source->capture_rate(), 10.0), "stream should set the rate");

        rig.stream.stop_from_worker();
        check(near(rig.source->capture_rate(), 0.2), "a self-stopped module should release its rate");
        check(rig.consistent(), "rate should stay consistent after a self-stop");
    }

    void test_self_stop_during_coordinated_call() {
        Rig rig;
        rig.coord->start_source();
        rig.coord->start_module("stream");

        // the listener fires while the coordinator lock is held
        rig.storage.on_start = [&] { rig.stream.stop_from_worker(); };
        check(rig.coord->start_module("storage").ok(), "start should complete without deadlock");
        check(!rig.stream.is_running(), "stream should have stopped itself");
        check(near(rig.source->capture_rate(), 1.0), "pending recompute should be applied after release");
    }

    void test_settings_change_recomputes() {
        Rig rig;
        rig.coord->start_source();
        rig.coord->start_module("stream");

        sc::SettingsPatch p;
        p.fps = 25.0;
        check(rig.coord->update_settings("stream", p).ok(), "valid settings should be accepted");
        check(near(rig.source->capture_rate(), 25.0), "a faster stream should raise the capture rate");

        sc::SettingsPatch bad;
        bad.jpeg_quality = 50;
        check(rig.coord->update_settings("stream", bad).code == sc::ErrorCode::ConfigurationError,
              "rejected settings should report ConfigurationError");
        check(near(rig.source->capture_rate(), 25.0), "rejected settings should not change the rate");
        check(rig.coord->update_settings("nothing", p).code == sc::ErrorCode::ConfigurationError,
              "unknown module should be rejected");
    }

    void test_source_failure_does_not_fail_module_start() {
        Rig rig;
        rig.coord->start_source();
        {
            std::lock_guard lk(rig.sensor->m);
            rig.sensor->fail_open = true;
        }

        const sc::Status st = rig.coord->start_module("stream");
        check(st.ok(), "module start should report the module's own result");
        check(rig.stream.is_running(), "stream should be running");
        check(!rig.source->status().running, "source that cannot reopen should be stopped");
        check(!rig.source->status().last_error.empty(), "source should keep the reopen failure");

        {
            std::lock_guard lk(rig.sensor->m);
            rig.sensor->fail_open = false;
        }
        check(rig.coord->start_source().ok(), "source should start again");
        check(rig.consistent() && near(rig.source->capture_rate(), 10.0),
              "restarted source should follow the running stream");
    }

    void test_stop_all() {
        Rig rig;
        rig.coord->start_source();
        rig.coord->start_module("stream");
        rig.coord->start_module("storage");
        rig.coord->stop_all();

        check(!rig.stream.is_running() && !rig.storage.is_running(), "stop_all should stop every module");
        check(!rig.source->is_running(), "stop_all should stop the source");
        check(near(rig.coord->target_fps(), kIdle), "nothing running should leave the idle floor");
    }
}

int main() {
    test_compute_target_fps();
    test_registration();
    test_rate_follows_start_stop();
    test_random_sequences_keep_invariant();
    test_worker_initiated_stop();
    test_self_stop_during_coordinated_call();
    test_settings_change_recomputes();
    test_source_failure_does_not_fail_module_start();
    test_stop_all();

    return sc_test::finish("rate coordinator");
}
