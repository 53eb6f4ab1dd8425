#include "framevid/io/video_sink.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace framevid {
namespace io {

cv_video_sink::cv_video_sink() {
    spdlog::debug("CONSTRUCT: io::cv_video_sink");
}

cv_video_sink::~cv_video_sink() {
    writer_.release();
    spdlog::debug("DESTRUCT: io::cv_video_sink");
}

bool cv_video_sink::open(const std::string& video_path, const std::string& fourcc, const double fps, const cv::Size& frame_size) {
    if (fourcc.size() != 4) {
        throw std::runtime_error("invalid fourcc: " + fourcc);
    }
    const auto fourcc_code = cv::VideoWriter::fourcc(fourcc.at(0), fourcc.at(1), fourcc.at(2), fourcc.at(3));
    writer_.open(video_path, fourcc_code, fps, frame_size, true);
    return writer_.isOpened();
}

void cv_video_sink::write(const cv::Mat& frame) {
    writer_.write(frame);
}

void cv_video_sink::release() {
    writer_.release();
}

bool cv_video_sink::is_opened() const {
    return writer_.isOpened();
}

} // namespace io
} // namespace framevid
