#include <pipeline/rate_coordinator.hpp>

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace sc {
    RateCoordinator::RateCoordinator(FrameSource& source, double idle_fps)
        : source_(source),
          idle_fps_(idle_fps),
          target_fps_(idle_fps) {
        if (!(idle_fps > 0.0)) throw std::invalid_argument("idle fps must be > 0");
    }

    RateCoordinator::~RateCoordinator() {
        std::lock_guard lk(mtx_);
        for (IOutputModule* m : modules_) m->set_stop_listener({});
    }

    double RateCoordinator::compute_target_fps(const std::vector<double>& required, double idle_fps) {
        double target = idle_fps;
        for (double r : required) target = std::max(target, r);
        return target;
    }

    void RateCoordinator::add_module(IOutputModule& module) {
        {
            std::lock_guard lk(mtx_);
            if (std::find(modules_.begin(), modules_.end(), &module) != modules_.end()) return;
            modules_.push_back(&module);
        }
        source_.register_module(module);
        module.set_stop_listener([this](const std::string& name) { request_recompute_(name); });
    }

    IOutputModule* RateCoordinator::find_module(const std::string& name) const {
        std::lock_guard lk(mtx_);
        for (IOutputModule* m : modules_) {
            if (m->name() == name) return m;
        }
        return nullptr;
    }

    std::vector<std::string> RateCoordinator::module_names() const {
        std::lock_guard lk(mtx_);
        std::vector<std::string> out;
        for (const IOutputModule* m : modules_) out.push_back(m->name());
        return out;
    }

    Status RateCoordinator::start_source() {
        return run_([this] { return source_.start(); });
    }

    Status RateCoordinator::stop_source() {
        return run_([this] { return source_.stop(); });
    }

    Status RateCoordinator::start_module(const std::string& name) {
        IOutputModule* m = find_module(name);
        if (!m) return Status::error(ErrorCode::ConfigurationError, "unknown module: " + name);
        return run_([m] { return m->start(); });
    }

    Status RateCoordinator::stop_module(const std::string& name) {
        IOutputModule* m = find_module(name);
        if (!m) return Status::error(ErrorCode::ConfigurationError, "unknown module: " + name);
        return run_([m] { return m->stop(); });
    }

    Status RateCoordinator::update_settings(const std::string& name, const SettingsPatch& patch) {
        IOutputModule* m = find_module(name);
        if (!m) return Status::error(ErrorCode::ConfigurationError, "unknown module: " + name);
        return run_([m, &patch] { return m->update_settings(patch); });
    }

    Status RateCoordinator::set_resolution(const Resolution& res) {
        return run_([this, &res] { return source_.set_resolution(res); });
    }

    Status RateCoordinator::apply_controls(const CameraControls& controls) {
        return run_([this, &controls] { return source_.apply_controls(controls); });
    }

    Status RateCoordinator::capture_still(cv::Mat& out) {
        return run_([this, &out] { return source_.capture_still(out); });
    }

    void RateCoordinator::stop_all() {
        run_([this] {
            for (IOutputModule* m : modules_) {
                const Status st = m->stop();
                if (st.ok()) std::cout << "[RateCoordinator] stopped " << m->name() << "\n";
            }
            return Status::success();
        });
        const Status st = stop_source();
        if (!st.ok() && st.code != ErrorCode::NotRunning) {
            std::cerr << "[RateCoordinator](stop_all) " << st.reason << "\n";
        }
    }

    double RateCoordinator::target_fps() const {
        std::lock_guard lk(mtx_);
        return target_fps_;
    }

    Status RateCoordinator::run_(const std::function<Status()>& fn) {
        Status st;
        {
            std::lock_guard lk(mtx_);
            st = fn();
            // a source that cannot follow stops itself and keeps the reason
            const Status rs = recompute_locked_();
            if (!rs.ok()) std::cerr << "[RateCoordinator](recompute) " << rs.reason << "\n";
        }
        drain_pending_();
        return st;
    }

    Status RateCoordinator::recompute_locked_() {
        std::vector<double> required;
        required.reserve(modules_.size());
        for (const IOutputModule* m : modules_) required.push_back(m->get_required_camera_fps());

        const double target = compute_target_fps(required, idle_fps_);
        if (target == target_fps_ && target == source_.capture_rate()) return Status::success();

        target_fps_ = target;
        std::cout << "[RateCoordinator] target fps -> " << target << "\n";
        return source_.update_capture_rate(target);
    }

    void RateCoordinator::request_recompute_(const std::string& module) {
        std::cout << "[RateCoordinator] " << module << " stopped itself\n";
        pending_ = true;
        drain_pending_();
    }

    void RateCoordinator::drain_pending_() {
        // A failed try_lock leaves the flag set; the holder re-checks it after release.
        while (pending_.load()) {
            std::unique_lock lk(mtx_, std::try_to_lock);
            if (!lk.owns_lock()) return;
            if (!pending_.exchange(false)) continue;

            const Status st = recompute_locked_();
            if (!st.ok()) std::cerr << "[RateCoordinator](recompute) " << st.reason << "\n";
        }
    }
}
