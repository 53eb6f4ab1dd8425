#ifndef FRAMEVID_IO_FRAME_DECODER_H
#define FRAMEVID_IO_FRAME_DECODER_H

#include <string>

#include <opencv2/core.hpp>

namespace framevid {
namespace io {

class frame_decoder {
public:
    //! Constructor
    frame_decoder() = default;

    //! Destructor
    virtual ~frame_decoder() = default;

    /**
     * Decode the image file
     * @param img_path
     * @return decoded image, empty if the file cannot be read
     */
    virtual cv::Mat decode(const std::string& img_path) const = 0;
};

//! Decoder using cv::imread, images are loaded as 3-channel BGR
class imread_decoder final : public frame_decoder {
public:
    imread_decoder() = default;

    ~imread_decoder() override = default;

    cv::Mat decode(const std::string& img_path) const override;
};

} // namespace io
} // namespace framevid

#endif // FRAMEVID_IO_FRAME_DECODER_H
