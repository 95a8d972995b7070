#pragma once

#include <string>
#include <utility>
#include <vector>

#include <common/status.hpp>
#include <outputs/storage_module.hpp>
#include <outputs/stream_module.hpp>
#include <outputs/timelapse_module.hpp>
#include <pipeline/frame_source.hpp>

namespace sc {
    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    std::string json_escape(const std::string& s);

    std::string to_json(const Status& st);
    std::string to_json(const SourceStatus& s);
    std::string to_json(const ModuleStatus& s);
    std::string to_json(const StreamStats& s);
    std::string to_json(const StorageStatus& s);
    std::string to_json(const TimelapseStatus& s);
    std::string to_json(const std::vector<Resolution>& resolutions);
    std::string to_json(const std::vector<std::string>& names);

    int http_status(ErrorCode code);

    // Query parameters -> SettingsPatch. Unknown keys and unparsable values are
    // a ConfigurationError and leave out untouched.
    Status parse_settings_patch(const QueryParams& params, SettingsPatch& out);

    // brightness/contrast/saturation on the 0..100 UI scale; absent keys keep the given values.
    Status parse_ui_controls(const QueryParams& params, int& brightness, int& contrast, int& saturation);
}
