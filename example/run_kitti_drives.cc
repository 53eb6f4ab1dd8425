#include "framevid/config.h"
#include "framevid/drive_batch.h"
#include "framevid/video_encoder.h"
#include "framevid/io/frame_decoder.h"
#include "framevid/io/video_sink.h"
#include "framevid/util/filesystem.h"

#include <iostream>
#include <memory>

#include <popl.hpp>
#include <spdlog/spdlog.h>

int main(int argc, char* argv[]) {
    // create options
    popl::OptionParser op("Process KITTI dataset drives into individual videos");
    auto help = op.add<popl::Switch>("h", "help", "produce help message");
    auto kitti_root = op.add<popl::Value<std::string>>("r", "kitti_root", "path to the root of the KITTI dataset (the folder containing the split)");
    auto output_dir = op.add<popl::Value<std::string>>("o", "output_dir", "directory to save the generated videos", "kitti_videos");
    auto fps = op.add<popl::Value<double>>("", "fps", "frames per second of the output videos", 10.0);
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
    if (!kitti_root->is_set()) {
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
        cfg->validate();
    }
    catch (const std::exception& e) {
        spdlog::critical("invalid configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    if (debug_mode->is_set()) {
        std::cout << *cfg << std::endl;
    }

    // the drives are searched in the split directory under the root
    const auto split_dir_path = framevid::util::join_path(kitti_root->value(), cfg->split_dir_name_);
    if (!framevid::util::is_directory(split_dir_path)) {
        spdlog::critical("the '{}' directory was not found inside {}", cfg->split_dir_name_, kitti_root->value());
        return EXIT_FAILURE;
    }

    auto encoder = std::make_shared<framevid::video_encoder>(std::make_shared<framevid::io::imread_decoder>(),
                                                             std::make_shared<framevid::io::cv_video_sink>(),
                                                             cfg->fourcc_, cfg->progress_interval_);
    framevid::drive_batch batch(cfg, encoder);

    framevid::batch_summary summary;
    try {
        summary = batch.process_all(split_dir_path, output_dir->value(), cfg->fps_);
    }
    catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return EXIT_FAILURE;
    }
    summary.show();

    if (summary.status_ == framevid::batch_status_t::NoDrivesFound
        || 0 < summary.count(framevid::drive_status_t::Failed)) {
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
