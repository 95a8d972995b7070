#include <common/status.hpp>

namespace sc {
    const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::Ok: return "ok";
            case ErrorCode::ConfigurationError: return "configuration_error";
            case ErrorCode::AlreadyRunning: return "already_running";
            case ErrorCode::NotRunning: return "not_running";
            case ErrorCode::ResourceUnavailable: return "resource_unavailable";
            case ErrorCode::TransientCaptureError: return "transient_capture_error";
        }
        return "unknown";
    }
}
