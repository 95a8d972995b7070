#pragma once

#include <memory>

#include <common/config.hpp>
#include <ingest/sensor.hpp>

namespace sc {
    std::unique_ptr<ISensor> make_sensor(const CameraConfig& cfg);
}
