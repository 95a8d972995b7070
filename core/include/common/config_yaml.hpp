#pragma once

#include <common/config.hpp>

#include <string>

namespace sc {
    // Throws std::runtime_error ("[Config] ...") or YAML::Exception on invalid input.
    AppConfig load_config_yaml(const std::string& path);
}
