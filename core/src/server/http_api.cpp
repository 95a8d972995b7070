#include <server/http_api.hpp>

#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace sc {
    namespace {
        bool parse_double(const std::string& s, double& out) {
            try {
                size_t pos = 0;
                out = std::stod(s, &pos);
                return pos == s.size();
            } catch (const std::invalid_argument&) {
                return false;
            } catch (const std::out_of_range&) {
                return false;
            }
        }

        bool parse_int(const std::string& s, int& out) {
            try {
                size_t pos = 0;
                out = std::stoi(s, &pos);
                return pos == s.size();
            } catch (const std::invalid_argument&) {
                return false;
            } catch (const std::out_of_range&) {
                return false;
            }
        }

        bool parse_bool(const std::string& s, bool& out) {
            if (s == "true" || s == "1" || s == "yes" || s == "on") { out = true; return true; }
            if (s == "false" || s == "0" || s == "no" || s == "off") { out = false; return true; }
            return false;
        }

        Status bad_value(const std::string& key, const std::string& value) {
            return Status::error(ErrorCode::ConfigurationError, "invalid value for " + key + ": '" + value + "'");
        }

        std::string quoted(const std::string& s) {
            return "\"" + json_escape(s) + "\"";
        }
    } // namespace

    std::string json_escape(const std::string& s) {
        std::string out;
        out.reserve(s.size() + 8);
        for (char c : s) {
            switch (c) {
                case '"': out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (static_cast<unsigned char>(c) < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                        out += buf;
                    } else {
                        out += c;
                    }
            }
        }
        return out;
    }

    std::string to_json(const Status& st) {
        std::ostringstream oss;
        oss << "{\"ok\":" << (st.ok() ? "true" : "false")
            << ",\"code\":" << quoted(to_string(st.code))
            << ",\"reason\":" << quoted(st.reason) << "}";
        return oss.str();
    }

    std::string to_json(const SourceStatus& s) {
        std::ostringstream oss;
        oss << "{\"running\":" << (s.running ? "true" : "false")
            << ",\"capture_fps\":" << s.capture_fps
            << ",\"resolution\":" << quoted(to_string(s.resolution))
            << ",\"frames_captured\":" << s.frames_captured
            << ",\"read_errors\":" << s.read_errors
            << ",\"last_error\":" << quoted(s.last_error) << "}";
        return oss.str();
    }

    std::string to_json(const ModuleStatus& s) {
        std::ostringstream oss;
        oss << "{\"name\":" << quoted(s.name)
            << ",\"running\":" << (s.running ? "true" : "false")
            << ",\"strategy\":" << quoted(s.strategy)
            << ",\"required_fps\":" << s.required_fps
            << ",\"queued\":" << s.queued
            << ",\"queue_capacity\":" << s.queue_capacity
            << ",\"dropped\":" << s.dropped
            << ",\"processed\":" << s.processed
            << ",\"last_error\":" << quoted(s.last_error) << "}";
        return oss.str();
    }

    std::string to_json(const StreamStats& s) {
        std::ostringstream oss;
        oss << "{\"processed\":" << s.processed
            << ",\"encode_failures\":" << s.encode_failures
            << ",\"actual_fps\":" << s.actual_fps
            << ",\"seq\":" << s.seq << "}";
        return oss.str();
    }

    std::string to_json(const StorageStatus& s) {
        std::ostringstream oss;
        oss << "{\"current_file\":" << quoted(s.current_file)
            << ",\"frames_written\":" << s.frames_written
            << ",\"writer_open\":" << (s.writer_open ? "true" : "false") << "}";
        return oss.str();
    }

    std::string to_json(const TimelapseStatus& s) {
        std::ostringstream oss;
        oss << "{\"state\":" << quoted(to_string(s.state))
            << ",\"buffered\":" << s.buffered
            << ",\"next_capture_in\":" << s.next_capture_in;
        if (s.next_video_in < 0.0) {
            oss << ",\"next_video_in\":null";
        } else {
            oss << ",\"next_video_in\":" << s.next_video_in;
        }
        oss << ",\"elapsed\":" << s.elapsed
            << ",\"videos_created\":" << s.videos_created
            << ",\"last_video\":" << quoted(s.last_video) << "}";
        return oss.str();
    }

    std::string to_json(const std::vector<Resolution>& resolutions) {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < resolutions.size(); ++i) {
            oss << "{\"width\":" << resolutions[i].width << ",\"height\":" << resolutions[i].height << "}";
            if (i + 1 < resolutions.size()) oss << ",";
        }
        oss << "]";
        return oss.str();
    }

    std::string to_json(const std::vector<std::string>& names) {
        std::ostringstream oss;
        oss << "[";
        for (size_t i = 0; i < names.size(); ++i) {
            oss << quoted(names[i]);
            if (i + 1 < names.size()) oss << ",";
        }
        oss << "]";
        return oss.str();
    }

    int http_status(ErrorCode code) {
        switch (code) {
            case ErrorCode::Ok: return 200;
            case ErrorCode::ConfigurationError: return 400;
            case ErrorCode::AlreadyRunning:
            case ErrorCode::NotRunning: return 409;
            case ErrorCode::ResourceUnavailable:
            case ErrorCode::TransientCaptureError: return 503;
        }
        return 500;
    }

    Status parse_settings_patch(const QueryParams& params, SettingsPatch& out) {
        SettingsPatch p;
        for (const auto& [key, value] : params) {
            double d = 0.0;
            int i = 0;
            bool b = false;
            if (key == "fps") {
                if (!parse_double(value, d)) return bad_value(key, value);
                p.fps = d;
            } else if (key == "jpeg_quality") {
                if (!parse_int(value, i)) return bad_value(key, value);
                p.jpeg_quality = i;
            } else if (key == "interval") {
                if (!parse_double(value, d)) return bad_value(key, value);
                p.interval_s = d;
            } else if (key == "duration") {
                if (!parse_double(value, d)) return bad_value(key, value);
                p.duration_s = d;
            } else if (key == "min_frames") {
                if (!parse_int(value, i)) return bad_value(key, value);
                p.min_frames = i;
            } else if (key == "output_fps") {
                if (!parse_double(value, d)) return bad_value(key, value);
                p.output_fps = d;
            } else if (key == "repeat") {
                if (!parse_bool(value, b)) return bad_value(key, value);
                p.repeat = b;
            } else if (key == "label") {
                p.label = value;
            } else if (key == "strategy") {
                p.strategy = value;
            } else {
                return Status::error(ErrorCode::ConfigurationError, "unknown setting: " + key);
            }
        }
        out = p;
        return Status::success();
    }

    Status parse_ui_controls(const QueryParams& params, int& brightness, int& contrast, int& saturation) {
        int b = brightness, c = contrast, s = saturation;
        for (const auto& [key, value] : params) {
            int* target = nullptr;
            if (key == "brightness") target = &b;
            else if (key == "contrast") target = &c;
            else if (key == "saturation") target = &s;
            else return Status::error(ErrorCode::ConfigurationError, "unknown control: " + key);

            if (!parse_int(value, *target) || *target < 0 || *target > 100) return bad_value(key, value);
        }
        brightness = b;
        contrast = c;
        saturation = s;
        return Status::success();
    }
}
