#include "framevid/drive_batch.h"
#include "framevid/config.h"
#include "framevid/util/filesystem.h"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace framevid {

unsigned int batch_summary::count(const drive_status_t status) const {
    return static_cast<unsigned int>(std::count_if(outcomes_.begin(), outcomes_.end(), [status](const drive_outcome& outcome) {
        return outcome.status_ == status;
    }));
}

std::vector<drive_outcome> batch_summary::get_failures() const {
    std::vector<drive_outcome> failures;
    for (const auto& outcome : outcomes_) {
        if (outcome.status_ == drive_status_t::Failed) {
            failures.push_back(outcome);
        }
    }
    return failures;
}

void batch_summary::show() const {
    if (status_ == batch_status_t::NoDrivesFound) {
        return;
    }

    spdlog::info("processed {} drives: {} succeeded, {} skipped, {} failed",
                 get_num_drives(), count(drive_status_t::Succeeded), count(drive_status_t::Skipped), count(drive_status_t::Failed));
    for (const auto& outcome : outcomes_) {
        if (outcome.status_ == drive_status_t::Skipped) {
            spdlog::warn("skipped {}: {}", outcome.drive_.name_, outcome.reason_);
        }
    }
    for (const auto& outcome : get_failures()) {
        spdlog::critical("failed {}: {}", outcome.drive_.name_, outcome.reason_);
    }
}

drive_batch::drive_batch(const std::shared_ptr<config>& cfg, const std::shared_ptr<video_encoder>& encoder)
    : cfg_(cfg), encoder_(encoder) {
    spdlog::debug("CONSTRUCT: drive_batch");
}

drive_batch::~drive_batch() {
    spdlog::debug("DESTRUCT: drive_batch");
}

batch_summary drive_batch::process_all(const std::string& dataset_root, const std::string& output_dir, const double fps) {
    spdlog::info("searching for drives in {}", dataset_root);

    batch_summary summary;

    // 1. discover the drives

    const auto drives = data::drive::find_drives(dataset_root, cfg_->image_dir_name_);
    if (drives.empty()) {
        summary.status_ = batch_status_t::NoDrivesFound;
        spdlog::critical("no drives (e.g. *_sync directories) found in {}", dataset_root);
        return summary;
    }
    spdlog::info("found {} drives to process", drives.size());

    util::create_directories(output_dir);
    spdlog::info("videos will be saved in {}", output_dir);

    // 2. process each drive individually

    for (unsigned int i = 0; i < drives.size(); ++i) {
        spdlog::info("processing drive {} ({}/{})", drives.at(i).name_, i + 1, drives.size());
        summary.outcomes_.push_back(process_drive(drives.at(i), output_dir, fps));
    }

    spdlog::info("all drives have been processed");
    return summary;
}

std::string drive_batch::get_video_path(const data::drive& drv, const std::string& output_dir) const {
    return util::join_path(output_dir, drv.name_ + "." + cfg_->video_extension_);
}

drive_outcome drive_batch::process_drive(const data::drive& drv, const std::string& output_dir, const double fps) {
    if (!util::is_directory(drv.image_dir_path_)) {
        spdlog::warn("RGB image folder not found for drive {}, skipping", drv.name_);
        spdlog::warn("(expected at {})", drv.image_dir_path_);
        return drive_outcome(drv, drive_status_t::Skipped, "MissingImageFolder: " + drv.image_dir_path_);
    }

    const auto video_path = get_video_path(drv, output_dir);
    conversion_result result;
    try {
        result = encoder_->convert(drv.image_dir_path_, video_path, fps, cfg_->frame_extension_);
    }
    catch (const std::exception& e) {
        spdlog::critical("conversion of drive {} aborted: {}", drv.name_, e.what());
        return drive_outcome(drv, drive_status_t::Failed, e.what());
    }
    if (!result.succeeded()) {
        return drive_outcome(drv, drive_status_t::Failed, result.get_status_string() + ": " + result.describe(), result);
    }
    return drive_outcome(drv, drive_status_t::Succeeded, video_path, result);
}

} // namespace framevid
