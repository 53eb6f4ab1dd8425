#include "framevid/data/drive.h"
#include "framevid/util/filesystem.h"
#include "framevid/util/string.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace framevid {
namespace data {

std::vector<drive> drive::find_drives(const std::string& dataset_root, const std::string& image_dir_name) {
    std::vector<drive> drives;

    for (const auto& date : util::list_directory(dataset_root, true)) {
        const auto date_dir_path = util::join_path(dataset_root, date);
        for (const auto& sync_dir_name : util::list_directory(date_dir_path, true)) {
            if (sync_dir_name.size() <= sync_dir_suffix.size() || !util::string_endswith(sync_dir_name, sync_dir_suffix)) {
                continue;
            }
            const auto sync_dir_path = util::join_path(date_dir_path, sync_dir_name);
            drives.emplace_back(date, util::strip_suffix(sync_dir_name, sync_dir_suffix),
                                sync_dir_path, util::join_path(sync_dir_path, image_dir_name));
        }
    }

    std::sort(drives.begin(), drives.end(), [](const drive& lhs, const drive& rhs) {
        return lhs.sync_dir_path_ < rhs.sync_dir_path_;
    });

    spdlog::debug("found {} drives in {}", drives.size(), dataset_root);
    return drives;
}

} // namespace data
} // namespace framevid
