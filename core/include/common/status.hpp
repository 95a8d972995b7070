#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace sc {
    enum class ErrorCode {
        Ok,
        ConfigurationError,    // rejected before any mutation
        AlreadyRunning,
        NotRunning,
        ResourceUnavailable,   // sensor or writer failed to open
        TransientCaptureError  // single failed read, capture continues
    };

    const char* to_string(ErrorCode code);

    struct Status {
        ErrorCode code = ErrorCode::Ok;
        std::string reason;

        bool ok() const { return code == ErrorCode::Ok; }

        static Status success() { return {}; }
        static Status error(ErrorCode code, std::string reason) {
            return Status{code, std::move(reason)};
        }
    };

    // Thrown from worker loop bodies; the worker records it as the module's error state.
    class StatusError : public std::runtime_error {
    public:
        StatusError(ErrorCode code, const std::string& what)
            : std::runtime_error(what), code_(code) {}

        ErrorCode code() const { return code_; }
    private:
        ErrorCode code_;
    };
}
