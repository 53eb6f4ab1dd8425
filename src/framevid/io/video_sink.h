#ifndef FRAMEVID_IO_VIDEO_SINK_H
#define FRAMEVID_IO_VIDEO_SINK_H

#include <string>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace framevid {
namespace io {

class video_sink {
public:
    //! Constructor
    video_sink() = default;

    //! Destructor
    virtual ~video_sink() = default;

    /**
     * Open a video file for writing, any existing file at the path is overwritten
     * @param video_path
     * @param fourcc four-character code of the codec
     * @param fps
     * @param frame_size
     * @return true if the sink is ready to accept frames
     */
    virtual bool open(const std::string& video_path, const std::string& fourcc, const double fps, const cv::Size& frame_size) = 0;

    //! Append a frame
    virtual void write(const cv::Mat& frame) = 0;

    //! Flush and close the file, no-op if not opened
    virtual void release() = 0;

    //! Check whether the sink is opened
    virtual bool is_opened() const = 0;
};

//! Sink writing through cv::VideoWriter
class cv_video_sink final : public video_sink {
public:
    cv_video_sink();

    ~cv_video_sink() override;

    bool open(const std::string& video_path, const std::string& fourcc, const double fps, const cv::Size& frame_size) override;

    void write(const cv::Mat& frame) override;

    void release() override;

    bool is_opened() const override;

private:
    cv::VideoWriter writer_;
};

} // namespace io
} // namespace framevid

#endif // FRAMEVID_IO_VIDEO_SINK_H
