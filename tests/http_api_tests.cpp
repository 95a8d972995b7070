#include <server/http_api.hpp>

#include "test_support.hpp"

using sc_test::check;

namespace {
    void test_settings_patch() {
        sc::SettingsPatch p;
        const sc::Status st = sc::parse_settings_patch(
            {{"interval", "2.5"}, {"duration", "0"}, {"min_frames", "12"}, {"repeat", "off"}, {"label", "plate 3"}}, p);
        check(st.ok(), "valid timelapse settings should parse");
        check(p.interval_s && *p.interval_s == 2.5, "interval should parse");
        check(p.duration_s && *p.duration_s == 0.0, "duration 0 should parse");
        check(p.min_frames && *p.min_frames == 12, "min_frames should parse");
        check(p.repeat && !*p.repeat, "off should mean false");
        check(p.label && *p.label == "plate 3", "label should be taken verbatim");
        check(!p.fps && !p.jpeg_quality && !p.strategy, "absent keys should stay unset");

        sc::SettingsPatch q;
        check(sc::parse_settings_patch({{"fps", "15"}, {"jpeg_quality", "70"}, {"strategy", "grayscale"}}, q).ok(),
              "valid stream settings should parse");
        check(q.fps && *q.fps == 15.0 && q.jpeg_quality && *q.jpeg_quality == 70, "stream values should parse");
    }

    void test_settings_patch_rejects() {
        sc::SettingsPatch p;
        p.fps = 3.0;

        sc::Status st = sc::parse_settings_patch({{"fps", "10"}, {"shutter", "1"}}, p);
        check(st.code == sc::ErrorCode::ConfigurationError, "unknown key should be a ConfigurationError");
        check(st.reason.find("shutter") != std::string::npos, "reason should name the key");
        check(p.fps && *p.fps == 3.0, "a rejected patch should leave the output untouched");

        st = sc::parse_settings_patch({{"fps", "fast"}}, p);
        check(st.code == sc::ErrorCode::ConfigurationError, "non-numeric fps should be rejected");
        st = sc::parse_settings_patch({{"jpeg_quality", "7.5"}}, p);
        check(!st.ok(), "fractional quality should be rejected");
        st = sc::parse_settings_patch({{"repeat", "maybe"}}, p);
        check(!st.ok(), "unknown boolean spelling should be rejected");
        check(p.fps && *p.fps == 3.0, "output should still be untouched");
    }

    void test_ui_controls() {
        int b = 50, c = 25, s = 25;
        check(sc::parse_ui_controls({{"brightness", "80"}}, b, c, s).ok(), "brightness alone should parse");
        check(b == 80 && c == 25 && s == 25, "absent controls should keep their values");

        check(!sc::parse_ui_controls({{"contrast", "101"}}, b, c, s).ok(), "values above 100 should be rejected");
        check(!sc::parse_ui_controls({{"saturation", "-1"}}, b, c, s).ok(), "negative values should be rejected");
        check(!sc::parse_ui_controls({{"contrast", "40"}, {"gamma", "3"}}, b, c, s).ok(), "unknown control should be rejected");
        check(c == 25, "a rejected request should change nothing");
    }

    void test_json() {
        check(sc::json_escape("a\"b\\c\nd") == "a\\\"b\\\\c\\nd", "quotes, backslashes and newlines should be escaped");
        check(sc::json_escape(std::string(1, '\x01')) == "\\u0001", "control characters should use \\u escapes");

        const std::string ok = sc::to_json(sc::Status::success());
        check(ok == "{\"ok\":true,\"code\":\"ok\",\"reason\":\"\"}", "success should serialize compactly: " + ok);

        const std::string err = sc::to_json(sc::Status::error(sc::ErrorCode::NotRunning, "storage is not running"));
        check(err.find("\"ok\":false") != std::string::npos, "errors should report ok false");
        check(err.find("\"not_running\"") != std::string::npos, "error code should be named");

        sc::TimelapseStatus tl;
        tl.next_video_in = -1.0;
        check(sc::to_json(tl).find("\"next_video_in\":null") != std::string::npos,
              "an indefinite cycle should report no video deadline");

        check(sc::to_json(std::vector<sc::Resolution>{{640, 480}, {1280, 720}}) ==
                  "[{\"width\":640,\"height\":480},{\"width\":1280,\"height\":720}]",
              "resolutions should serialize as objects");
        check(sc::to_json(std::vector<std::string>{"none", "grayscale"}) == "[\"none\",\"grayscale\"]",
              "names should serialize as a string array");
    }

    void test_http_status() {
        check(sc::http_status(sc::ErrorCode::Ok) == 200, "ok is 200");
        check(sc::http_status(sc::ErrorCode::ConfigurationError) == 400, "configuration errors are 400");
        check(sc::http_status(sc::ErrorCode::AlreadyRunning) == 409, "already running is 409");
        check(sc::http_status(sc::ErrorCode::NotRunning) == 409, "not running is 409");
        check(sc::http_status(sc::ErrorCode::ResourceUnavailable) == 503, "resource failures are 503");
    }
}

int main() {
    test_settings_patch();
    test_settings_patch_rejects();
    test_ui_controls();
    test_json();
    test_http_status();

    return sc_test::finish("http api");
}
