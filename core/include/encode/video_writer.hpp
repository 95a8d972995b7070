#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

namespace sc {
    class IVideoWriter {
    public:
        virtual ~IVideoWriter() = default;
        // Frames must match frame_size().
        virtual bool write(const cv::Mat& bgr) = 0;
        // Finalizes the file. Idempotent.
        virtual void close() = 0;
        virtual cv::Size frame_size() const = 0;
        virtual uint64_t frames_written() const = 0;
    };

    class IVideoWriterFactory {
    public:
        virtual ~IVideoWriterFactory() = default;
        // nullptr if the output cannot be opened
        virtual std::unique_ptr<IVideoWriter> open(const std::string& path, double fps, cv::Size size) = 0;
    };

    class OpenCvVideoWriterFactory : public IVideoWriterFactory {
    public:
        explicit OpenCvVideoWriterFactory(std::string fourcc = "mp4v");

        std::unique_ptr<IVideoWriter> open(const std::string& path, double fps, cv::Size size) override;
    private:
        std::string fourcc_;
    };
}
