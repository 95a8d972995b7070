#include <ingest/gst_sensor.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <opencv2/core.hpp>

#include <algorithm>
#include <iostream>
#include <mutex>
#include <sstream>

namespace sc {
    namespace {
        constexpr const char* kSinkName = "sink";
        constexpr const char* kBalanceName = "balance";

        void ensure_gst_init() {
            static std::once_flag gst_init_flag;
            std::call_once(gst_init_flag, [] { gst_init(nullptr, nullptr); });
        }

        // videobalance accepts contrast and saturation within 0..2
        double clamp_balance(double v) { return std::clamp(v, 0.0, 2.0); }
    } // namespace

    GstSensor::GstSensor(Options opt, std::string id)
        : opt_(std::move(opt)), id_(std::move(id)) {}

    GstSensor::~GstSensor() {
        close();
    }

    std::string GstSensor::describe_pipeline(const Resolution& res, double fps) const {
        int fps_n = 1, fps_d = 1;
        gst_util_double_to_fraction(fps, &fps_n, &fps_d);

        std::ostringstream p;
        switch (opt_.kind) {
            case Kind::Webcam:
                p << "v4l2src device=" << opt_.device << " ! ";
                if (opt_.mjpg) {
                    p << "image/jpeg,width=" << res.width << ",height=" << res.height << " ! jpegdec ! ";
                } else {
                    p << "video/x-raw,width=" << res.width << ",height=" << res.height << " ! ";
                }
                break;
            case Kind::Test:
                p << "videotestsrc is-live=true pattern=smpte ! video/x-raw,width=" << res.width
                  << ",height=" << res.height << " ! ";
                break;
            case Kind::File:
                p << "filesrc location=\"" << opt_.path << "\" ! decodebin ! videoconvert ! videoscale ! "
                  << "video/x-raw,width=" << res.width << ",height=" << res.height << " ! ";
                break;
        }
        p << "videoconvert ! videobalance name=" << kBalanceName << " ! videoconvert ! videorate ! "
          << "video/x-raw,format=BGR,framerate=" << fps_n << "/" << fps_d << " ! "
          << "appsink name=" << kSinkName << " sync=false";
        return p.str();
    }

    bool GstSensor::open(const Resolution& res, double fps) {
        ensure_gst_init();
        close();

        const std::string desc = describe_pipeline(res, fps);
        GError* err = nullptr;
        pipeline_ = gst_parse_launch(desc.c_str(), &err);
        if (!pipeline_) {
            if (err) {
                std::cerr << "[GStreamer] parse_launch error: " << err->message << "\n";
                g_error_free(err);
            } else {
                std::cerr << "[GStreamer] parse_launch failed (unk error)\n";
            }
            return false;
        }
        if (err) {
            // recoverable parse warning, pipeline is still usable
            std::cerr << "[GStreamer] parse_launch: " << err->message << "\n";
            g_error_free(err);
        }

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), kSinkName);
        balance_ = gst_bin_get_by_name(GST_BIN(pipeline_), kBalanceName);
        if (!sink_) {
            std::cerr << "[GStreamer] appsink named " << kSinkName << " not found.\n";
            close();
            return false;
        }

        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_drop(appsink, TRUE);
        gst_app_sink_set_max_buffers(appsink, 1);
        gst_app_sink_set_emit_signals(appsink, FALSE);

        apply_controls(controls_);

        GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer] failed to set " << id_ << " to PLAYING\n";
            check_bus_();
            close();
            return false;
        }
        return true;
    }

    void GstSensor::close() {
        if (!pipeline_) return;
        gst_element_set_state(pipeline_, GST_STATE_NULL);
        if (balance_) {
            gst_object_unref(balance_);
            balance_ = nullptr;
        }
        if (sink_) {
            gst_object_unref(sink_);
            sink_ = nullptr;
        }
        gst_object_unref(pipeline_);
        pipeline_ = nullptr;
    }

    ReadResult GstSensor::read(Frame& out, int timeout_ms) {
        if (!sink_) return ReadResult::Error;
        if (!check_bus_()) return ReadResult::Error;

        GstSample* sample = gst_app_sink_try_pull_sample(
            GST_APP_SINK(sink_), static_cast<GstClockTime>(timeout_ms) * GST_MSECOND);
        if (!sample) {
            return gst_app_sink_is_eos(GST_APP_SINK(sink_)) ? ReadResult::Error : ReadResult::Timeout;
        }

        GstBuffer* buffer = gst_sample_get_buffer(sample);
        GstCaps* caps = gst_sample_get_caps(sample);
        if (!buffer || !caps) {
            gst_sample_unref(sample);
            return ReadResult::Error;
        }

        GstVideoInfo vinfo;
        if (!gst_video_info_from_caps(&vinfo, caps)) {
            gst_sample_unref(sample);
            return ReadResult::Error;
        }
        const int width = GST_VIDEO_INFO_WIDTH(&vinfo);
        const int height = GST_VIDEO_INFO_HEIGHT(&vinfo);
        int stride = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
        if (stride <= 0) stride = width * 3;
        if (width <= 0 || height <= 0) {
            gst_sample_unref(sample);
            return ReadResult::Error;
        }

        GstMapInfo map;
        if (!gst_buffer_map(buffer, &map, GST_MAP_READ) || !map.data || map.size == 0) {
            gst_sample_unref(sample);
            return ReadResult::Error;
        }

        const size_t min_bytes = static_cast<size_t>(stride) * static_cast<size_t>(height);
        if (map.size < min_bytes) {
            gst_buffer_unmap(buffer, &map);
            gst_sample_unref(sample);
            return ReadResult::Error;
        }

        cv::Mat tmp(height, width, CV_8UC3, (void*)map.data, stride);
        out.bgr = tmp.clone();
        out.width = width;
        out.height = height;
        out.pts_ns = (GST_BUFFER_PTS(buffer) == GST_CLOCK_TIME_NONE) ? 0 : static_cast<int64_t>(GST_BUFFER_PTS(buffer));

        gst_buffer_unmap(buffer, &map);
        gst_sample_unref(sample);
        return ReadResult::Frame;
    }

    std::vector<Resolution> GstSensor::list_supported_resolutions() {
        switch (opt_.kind) {
            case Kind::Test:
                return {{2592, 1944}, {1920, 1080}, {1280, 720}, {640, 480}};
            case Kind::File:
                return {};
            case Kind::Webcam:
                break;
        }
        if (!probed_) {
            resolutions_ = probe_v4l2_resolutions_();
            probed_ = !resolutions_.empty();
        }
        return resolutions_;
    }

    bool GstSensor::apply_controls(const CameraControls& controls) {
        controls_ = controls;
        if (!balance_) return true;
        g_object_set(G_OBJECT(balance_),
                     "brightness", std::clamp(controls.brightness, -1.0, 1.0),
                     "contrast", clamp_balance(controls.contrast),
                     "saturation", clamp_balance(controls.saturation),
                     nullptr);
        return true;
    }

    std::vector<Resolution> GstSensor::probe_v4l2_resolutions_() const {
        ensure_gst_init();

        std::vector<Resolution> out;
        GstElement* src = gst_element_factory_make("v4l2src", nullptr);
        if (!src) {
            std::cerr << "[GStreamer] v4l2src is not available\n";
            return out;
        }
        g_object_set(G_OBJECT(src), "device", opt_.device.c_str(), nullptr);

        if (gst_element_set_state(src, GST_STATE_READY) == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[GStreamer] cannot query " << opt_.device << "\n";
            gst_object_unref(src);
            return out;
        }

        GstPad* pad = gst_element_get_static_pad(src, "src");
        GstCaps* caps = pad ? gst_pad_query_caps(pad, nullptr) : nullptr;
        if (caps) {
            const char* wanted = opt_.mjpg ? "image/jpeg" : "video/x-raw";
            for (guint i = 0; i < gst_caps_get_size(caps); ++i) {
                const GstStructure* st = gst_caps_get_structure(caps, i);
                if (!gst_structure_has_name(st, wanted)) continue;
                int w = 0, h = 0;
                // ranges are skipped, only discrete sizes are listed
                if (!gst_structure_get_int(st, "width", &w) || !gst_structure_get_int(st, "height", &h)) continue;
                const Resolution r{w, h};
                if (std::find(out.begin(), out.end(), r) == out.end()) out.push_back(r);
            }
            gst_caps_unref(caps);
        }
        if (pad) gst_object_unref(pad);

        gst_element_set_state(src, GST_STATE_NULL);
        gst_object_unref(src);

        std::sort(out.begin(), out.end(), [](const Resolution& a, const Resolution& b) {
            return a.area() > b.area();
        });
        return out;
    }

    bool GstSensor::check_bus_() {
        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return true;

        bool healthy = true;
        GstMessage* msg = gst_bus_pop_filtered(bus, static_cast<GstMessageType>(GST_MESSAGE_ERROR | GST_MESSAGE_EOS));
        if (msg) {
            if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
                GError* err = nullptr;
                gchar* dbg = nullptr;
                gst_message_parse_error(msg, &err, &dbg);
                std::cerr << "[GStreamer] " << id_ << ": " << (err ? err->message : "unknown error") << "\n";
                if (err) g_error_free(err);
                g_free(dbg);
            } else {
                std::cerr << "[GStreamer] " << id_ << ": end of stream\n";
            }
            gst_message_unref(msg);
            healthy = false;
        }
        gst_object_unref(bus);
        return healthy;
    }
}
