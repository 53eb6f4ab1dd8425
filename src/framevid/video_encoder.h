#ifndef FRAMEVID_VIDEO_ENCODER_H
#define FRAMEVID_VIDEO_ENCODER_H

#include <array>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

namespace framevid {

namespace io {
class frame_decoder;
class video_sink;
} // namespace io

enum class conversion_status_t {
    Success = 0,
    NoFramesFound = 1,
    UnreadableFrame = 2,
    ResolutionMismatch = 3,
    WriterOpenFailed = 4
};

const std::array<std::string, 5> conversion_status_to_string = {{"Success", "NoFramesFound", "UnreadableFrame", "ResolutionMismatch", "WriterOpenFailed"}};

struct conversion_result {
    //! outcome of the conversion
    conversion_status_t status_ = conversion_status_t::Success;

    //! path to the output video
    std::string video_path_;

    //! path to the frame which caused the failure
    std::string frame_path_;
    //! position of the frame which caused the failure in the sorted sequence
    unsigned int frame_idx_ = 0;

    //! resolution of the output video (the first frame)
    cv::Size expected_size_;
    //! resolution of the frame which caused the failure
    cv::Size actual_size_;

    //! number of frames written to the output video
    unsigned int num_frames_ = 0;

    bool succeeded() const { return status_ == conversion_status_t::Success; }

    std::string get_status_string() const { return conversion_status_to_string.at(static_cast<unsigned int>(status_)); }

    //! Get a human-readable description of the outcome
    std::string describe() const;
};

class video_encoder {
public:
    /**
     * Constructor
     * @param decoder image decoder used for every frame
     * @param sink video sink reopened for every conversion
     * @param fourcc four-character code of the codec
     * @param progress_interval number of frames between progress logs
     */
    video_encoder(const std::shared_ptr<io::frame_decoder>& decoder, const std::shared_ptr<io::video_sink>& sink,
                  const std::string& fourcc = "mp4v", const unsigned int progress_interval = 100);

    //! Destructor
    ~video_encoder();

    /**
     * Encode the frames in the directory into a video without altering their resolution
     * The output file is removed if the conversion fails after it was opened
     * @param img_dir_path
     * @param video_path
     * @param fps
     * @param img_ext file extension of the frames without the leading dot
     * @return outcome of the conversion
     */
    conversion_result convert(const std::string& img_dir_path, const std::string& video_path,
                              const double fps, const std::string& img_ext);

    //! Get the fourcc of the output videos
    const std::string& get_fourcc() const { return fourcc_; }

private:
    //! image decoder
    const std::shared_ptr<io::frame_decoder> decoder_;
    //! video sink
    const std::shared_ptr<io::video_sink> sink_;

    //! four-character code of the codec
    const std::string fourcc_;
    //! number of frames between progress logs
    const unsigned int progress_interval_;
};

} // namespace framevid

#endif // FRAMEVID_VIDEO_ENCODER_H
