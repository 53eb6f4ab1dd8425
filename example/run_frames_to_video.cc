#include "framevid/config.h"
#include "framevid/video_encoder.h"
#include "framevid/io/frame_decoder.h"
#include "framevid/io/video_sink.h"

#include <iostream>
#include <memory>

#include <popl.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    // create options
    popl::OptionParser op("Convert a set of image frames into a video without altering resolution");
    auto help = op.add<popl::Switch>("h", "help", "produce help message");
    auto img_dir_path = op.add<popl::Value<std::string>>("i", "image_folder", "path to the folder containing the image frames");
    auto video_path = op.add<popl::Value<std::string>>("o", "output_video", "path and filename of the output video", "output.mp4");
    auto fps = op.add<popl::Value<double>>("", "fps", "frames per second of the output video", 10.0);
    auto img_ext = op.add<popl::Value<std::string>>("", "ext", "file extension of the images (e.g. png, jpg)", "png");
    auto config_file_path = op.add<popl::Value<std::string>>("c", "config", "config file path");
    auto debug_mode = op.add<popl::Switch>("", "debug", "debug mode");
    try {
        op.parse(argc, argv);
    }
    catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << std::endl;
        std::cerr << op << std::endl;
        return EXIT_FAILURE;
    }

    // check validness of options
    if (help->is_set()) {
        std::cerr << op << std::endl;
        return EXIT_FAILURE;
    }
    if (!img_dir_path->is_set()) {
        std::cerr << "invalid arguments" << std::endl;
        std::cerr << std::endl;
        std::cerr << op << std::endl;
        return EXIT_FAILURE;
    }

    // setup logger
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] %^[%L] %v%$");
    if (debug_mode->is_set()) {
        spdlog::set_level(spdlog::level::debug);
    }
    else {
        spdlog::set_level(spdlog::level::info);
    }

    // load configuration, the command line options take precedence
    std::shared_ptr<framevid::config> cfg;
    try {
        cfg = config_file_path->is_set()
                  ? std::make_shared<framevid::config>(config_file_path->value())
                  : std::make_shared<framevid::config>();
        if (fps->is_set() || !config_file_path->is_set()) {
            cfg->fps_ = fps->value();
        }
        if (img_ext->is_set() || !config_file_path->is_set()) {
            cfg->frame_extension_ = img_ext->value();
        }
        cfg->validate();
    }
    catch (const std::exception& e) {
        spdlog::critical("invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    if (debug_mode->is_set()) {
        std::cout << *cfg << std::endl;
    }

    framevid::video_encoder encoder(std::make_shared<framevid::io::imread_decoder>(),
                                    std::make_shared<framevid::io::cv_video_sink>(),
                                    cfg->fourcc_, cfg->progress_interval_);

    spdlog::info("starting video creation");
    framevid::conversion_result result;
    try {
        result = encoder.convert(img_dir_path->value(), video_path->value(), cfg->fps_, cfg->frame_extension_);
    }
    catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }
    if (!result.succeeded()) {
        spdlog::critical("video creation failed ({}): {}", result.get_status_string(), result.describe());
        return EXIT_FAILURE;
    }

    spdlog::info("video creation complete: {}", result.describe());
    return EXIT_SUCCESS;
}
