#include "framevid/io/frame_decoder.h"

#include <opencv2/imgcodecs.hpp>

namespace framevid {
namespace io {

cv::Mat imread_decoder::decode(const std::string& img_path) const {
    return cv::imread(img_path, cv::IMREAD_COLOR);
}

} // namespace io
} // namespace framevid
