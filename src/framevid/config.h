#ifndef FRAMEVID_CONFIG_H
#define FRAMEVID_CONFIG_H

#include <string>
#include <ostream>

#include <yaml-cpp/yaml.h>

namespace framevid {

class config {
public:
    //! Constructor with default parameters
    config();

    //! Constructor
    explicit config(const std::string& config_file_path);
    explicit config(const YAML::Node& yaml_node, const std::string& config_file_path = "");

    //! Destructor
    ~config();

    friend std::ostream& operator<<(std::ostream& os, const config& cfg);

    //! Check validness of the parameters, throws std::runtime_error if invalid
    void validate() const;

    //! path to config YAML file (empty if the defaults are used)
    std::string config_file_path_;

    //! frame rate of the output videos
    double fps_ = 10.0;
    //! four-character code of the video codec
    std::string fourcc_ = "mp4v";
    //! file extension of the output videos
    std::string video_extension_ = "mp4";
    //! file extension of the input frames
    std::string frame_extension_ = "png";

    //! subdirectory of the KITTI root which contains the drives
    std::string split_dir_name_ = "train_copy";
    //! subdirectory of each drive which contains the RGB frames
    std::string image_dir_name_ = "image_02/data";

    //! number of frames between progress logs
    unsigned int progress_interval_ = 100;
};

} // namespace framevid

#endif // FRAMEVID_CONFIG_H
