#include "framevid/config.h"
#include "framevid/util/string.h"

#include <stdexcept>

#include <spdlog/spdlog.h>

namespace framevid {

config::config() {
    spdlog::debug("CONSTRUCT: config (default)");
}

config::config(const std::string& config_file_path)
    : config(YAML::LoadFile(config_file_path), config_file_path) {}

config::config(const YAML::Node& yaml_node, const std::string& config_file_path)
    : config_file_path_(config_file_path),
      fps_(yaml_node["Video.fps"].as<double>(10.0)),
      fourcc_(yaml_node["Video.fourcc"].as<std::string>("mp4v")),
      video_extension_(yaml_node["Video.extension"].as<std::string>("mp4")),
      frame_extension_(yaml_node["Frame.extension"].as<std::string>("png")),
      split_dir_name_(yaml_node["KITTI.split_directory"].as<std::string>("train_copy")),
      image_dir_name_(yaml_node["KITTI.image_directory"].as<std::string>("image_02/data")),
      progress_interval_(yaml_node["Log.progress_interval"].as<unsigned int>(100)) {
    spdlog::debug("CONSTRUCT: config");

    if (!config_file_path_.empty()) {
        spdlog::info("config file loaded: {}", config_file_path_);
    }

    validate();
}

config::~config() {
    spdlog::debug("DESTRUCT: config");
}

void config::validate() const {
    if (fps_ <= 0.0) {
        throw std::runtime_error("Invalid frame rate: " + std::to_string(fps_));
    }
    if (fourcc_.size() != 4) {
        throw std::runtime_error("Invalid fourcc: " + fourcc_);
    }
    if (video_extension_.empty() || util::string_startswith(video_extension_, ".")) {
        throw std::runtime_error("Invalid video extension: " + video_extension_);
    }
    if (frame_extension_.empty() || util::string_startswith(frame_extension_, ".")) {
        throw std::runtime_error("Invalid frame extension: " + frame_extension_);
    }
    if (split_dir_name_.empty()) {
        throw std::runtime_error("Invalid split directory: (empty)");
    }
    if (image_dir_name_.empty()) {
        throw std::runtime_error("Invalid image directory: (empty)");
    }
    if (progress_interval_ == 0) {
        throw std::runtime_error("Invalid progress interval: 0");
    }
}

std::ostream& operator<<(std::ostream& os, const config& cfg) {
    os << "Video Configuration:" << std::endl;
    os << "- fps: " << cfg.fps_ << std::endl;
    os << "- fourcc: " << cfg.fourcc_ << std::endl;
    os << "- video extension: " << cfg.video_extension_ << std::endl;
    os << "- frame extension: " << cfg.frame_extension_ << std::endl;
    os << "KITTI Configuration:" << std::endl;
    os << "- split directory: " << cfg.split_dir_name_ << std::endl;
    os << "- image directory: " << cfg.image_dir_name_ << std::endl;
    return os;
}

} // namespace framevid
