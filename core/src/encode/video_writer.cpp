#include <encode/video_writer.hpp>

#include <iostream>
#include <stdexcept>

#include <opencv2/videoio.hpp>

namespace sc {
    namespace {
        class OpenCvVideoWriter : public IVideoWriter {
        public:
            ~OpenCvVideoWriter() override { close(); }

            // cv::VideoWriter releases on destruction, so it is opened in place
            bool open(const std::string& path, int fourcc, double fps, cv::Size size) {
                size_ = size;
                return writer_.open(path, fourcc, fps, size, true);
            }

            bool write(const cv::Mat& bgr) override {
                if (!writer_.isOpened() || bgr.size() != size_ || bgr.type() != CV_8UC3) return false;
                writer_.write(bgr);
                ++frames_;
                return true;
            }

            void close() override {
                if (writer_.isOpened()) writer_.release();
            }

            cv::Size frame_size() const override { return size_; }
            uint64_t frames_written() const override { return frames_; }

        private:
            cv::VideoWriter writer_;
            cv::Size size_;
            uint64_t frames_ = 0;
        };
    } // namespace

    OpenCvVideoWriterFactory::OpenCvVideoWriterFactory(std::string fourcc)
        : fourcc_(std::move(fourcc)) {
        if (fourcc_.size() != 4) throw std::invalid_argument("fourcc must be 4 characters: " + fourcc_);
    }

    std::unique_ptr<IVideoWriter> OpenCvVideoWriterFactory::open(const std::string& path,
                                                                 double fps,
                                                                 cv::Size size) {
        if (size.width <= 0 || size.height <= 0 || fps <= 0.0) return nullptr;

        const int cc = cv::VideoWriter::fourcc(fourcc_[0], fourcc_[1], fourcc_[2], fourcc_[3]);
        auto w = std::make_unique<OpenCvVideoWriter>();
        try {
            if (!w->open(path, cc, fps, size)) {
                std::cerr << "[VideoWriter](open) failed to open " << path << "\n";
                return nullptr;
            }
        } catch (const cv::Exception& e) {
            std::cerr << "[VideoWriter](open) " << path << ": " << e.what() << "\n";
            return nullptr;
        }
        return w;
    }
}
