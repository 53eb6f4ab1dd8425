#include "framevid/video_encoder.h"
#include "framevid/data/frame_sequence.h"
#include "framevid/io/frame_decoder.h"
#include "framevid/io/video_sink.h"
#include "framevid/util/filesystem.h"

#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace framevid {

namespace {

std::string size_to_string(const cv::Size& size) {
    return std::to_string(size.width) + "x" + std::to_string(size.height);
}

/**
 * Releases the sink when leaving the scope,
 * and removes the output file unless the video was completed
 */
class output_file_guard {
public:
    output_file_guard(io::video_sink& sink, const std::string& video_path)
        : sink_(sink), video_path_(video_path) {}

    ~output_file_guard() {
        sink_.release();
        if (completed_) {
            return;
        }
        if (!util::is_regular_file(video_path_)) {
            return;
        }
        if (util::remove_file(video_path_)) {
            spdlog::info("removed the incomplete video file {}", video_path_);
        }
        else {
            spdlog::warn("cannot remove the incomplete video file {}", video_path_);
        }
    }

    output_file_guard(const output_file_guard&) = delete;
    output_file_guard& operator=(const output_file_guard&) = delete;

    //! Mark the output as complete and flush it
    void complete() {
        completed_ = true;
        sink_.release();
    }

private:
    io::video_sink& sink_;
    const std::string video_path_;
    bool completed_ = false;
};

} // namespace

std::string conversion_result::describe() const {
    std::stringstream ss;
    switch (status_) {
        case conversion_status_t::Success: {
            ss << "saved " << num_frames_ << " frames (" << size_to_string(expected_size_) << ") to " << video_path_;
            break;
        }
        case conversion_status_t::NoFramesFound: {
            ss << "no image frames found";
            break;
        }
        case conversion_status_t::UnreadableFrame: {
            ss << "could not read frame " << frame_idx_ + 1 << ": " << frame_path_;
            break;
        }
        case conversion_status_t::ResolutionMismatch: {
            ss << "frame " << frame_idx_ + 1 << " (" << frame_path_ << ") has a different resolution: expected "
               << size_to_string(expected_size_) << ", but got " << size_to_string(actual_size_);
            break;
        }
        case conversion_status_t::WriterOpenFailed: {
            ss << "could not open a video writer at " << video_path_;
            break;
        }
    }
    return ss.str();
}

video_encoder::video_encoder(const std::shared_ptr<io::frame_decoder>& decoder, const std::shared_ptr<io::video_sink>& sink,
                             const std::string& fourcc, const unsigned int progress_interval)
    : decoder_(decoder), sink_(sink), fourcc_(fourcc), progress_interval_(progress_interval) {
    spdlog::debug("CONSTRUCT: video_encoder");
    if (progress_interval_ == 0) {
        throw std::runtime_error("Invalid progress interval: 0");
    }
    if (fourcc_.size() != 4) {
        throw std::runtime_error("Invalid fourcc: " + fourcc_);
    }
}

video_encoder::~video_encoder() {
    spdlog::debug("DESTRUCT: video_encoder");
}

conversion_result video_encoder::convert(const std::string& img_dir_path, const std::string& video_path,
                                         const double fps, const std::string& img_ext) {
    spdlog::info("input folder: {}", img_dir_path);
    spdlog::info("output video: {}", video_path);
    spdlog::info("frame rate: {} FPS, image type: .{}", fps, img_ext);

    conversion_result result;
    result.video_path_ = video_path;

    // 1. find and sort the frames

    const data::frame_sequence sequence(img_dir_path, img_ext);
    if (sequence.empty()) {
        result.status_ = conversion_status_t::NoFramesFound;
        spdlog::critical("no images with extension .{} found in {}", img_ext, img_dir_path);
        return result;
    }
    const auto& frame_paths = sequence.get_frame_paths();

    // 2. determine the resolution from the first frame

    cv::Mat frame = decoder_->decode(frame_paths.front());
    if (frame.empty()) {
        result.status_ = conversion_status_t::UnreadableFrame;
        result.frame_path_ = frame_paths.front();
        spdlog::critical("could not read the first image: {}", frame_paths.front());
        return result;
    }
    result.expected_size_ = frame.size();
    spdlog::info("video dimensions will be {}", size_to_string(result.expected_size_));

    // 3. open the output

    output_file_guard guard(*sink_, video_path);
    if (!sink_->open(video_path, fourcc_, fps, result.expected_size_)) {
        result.status_ = conversion_status_t::WriterOpenFailed;
        spdlog::critical("cannot open a video writer at {} (fourcc: {})", video_path, fourcc_);
        return result;
    }

    // 4. validate and write the frames

    const auto num_frames = sequence.size();
    for (unsigned int idx = 0; idx < num_frames; ++idx) {
        if (0 < idx) {
            frame = decoder_->decode(frame_paths.at(idx));
        }

        if (frame.empty()) {
            result.status_ = conversion_status_t::UnreadableFrame;
            result.frame_idx_ = idx;
            result.frame_path_ = frame_paths.at(idx);
            spdlog::critical("could not read {}, aborting", frame_paths.at(idx));
            return result;
        }

        if (frame.size() != result.expected_size_) {
            result.status_ = conversion_status_t::ResolutionMismatch;
            result.frame_idx_ = idx;
            result.frame_path_ = frame_paths.at(idx);
            result.actual_size_ = frame.size();
            spdlog::critical("image {} has a different resolution", util::get_basename(frame_paths.at(idx)));
            spdlog::critical("expected {}, but got {}, aborting to prevent a corrupted video",
                             size_to_string(result.expected_size_), size_to_string(result.actual_size_));
            return result;
        }

        sink_->write(frame);
        ++result.num_frames_;

        if ((idx + 1) % progress_interval_ == 0 || idx + 1 == num_frames) {
            spdlog::info("wrote {}/{} frames", idx + 1, num_frames);
        }
    }

    // 5. finalize

    guard.complete();
    spdlog::info("successfully saved the video to {}", video_path);
    return result;
}

} // namespace framevid
