#include "framevid/data/frame_sequence.h"
#include "framevid/util/filesystem.h"
#include "framevid/util/string.h"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace framevid {
namespace data {

frame_sequence::frame_sequence(const std::string& img_dir_path, const std::string& img_ext)
    : img_dir_path_(img_dir_path), img_ext_(img_ext) {
    const std::string suffix = "." + img_ext_;
    for (const auto& file_name : util::list_directory(img_dir_path_, false)) {
        // a file named only ".<ext>" is hidden and already skipped
        if (util::string_endswith(file_name, suffix)) {
            img_file_paths_.push_back(util::join_path(img_dir_path_, file_name));
        }
    }

    if (img_file_paths_.empty()) {
        return;
    }

    sorted_numerically_ = sort_frame_paths(img_file_paths_);
    if (sorted_numerically_) {
        spdlog::info("found and sorted {} image frames", img_file_paths_.size());
    }
    else {
        spdlog::warn("could not sort the {} image frames numerically, falling back to alphabetical order", img_file_paths_.size());
        spdlog::warn("use zero-padded file names (e.g. frame_0001.{}) for reliable ordering", img_ext_);
    }
}

bool frame_sequence::sort_frame_paths(std::vector<std::string>& img_file_paths) {
    // lexical order first, so frames with the same number keep a deterministic order
    std::sort(img_file_paths.begin(), img_file_paths.end());

    std::vector<std::pair<std::string, std::string>> keyed_paths;
    keyed_paths.reserve(img_file_paths.size());
    for (const auto& img_file_path : img_file_paths) {
        std::string digits;
        if (!util::find_first_digit_run(util::get_basename(img_file_path), digits)) {
            spdlog::debug("no number found in {}", img_file_path);
            return false;
        }
        keyed_paths.emplace_back(digits, img_file_path);
    }

    std::stable_sort(keyed_paths.begin(), keyed_paths.end(),
                     [](const std::pair<std::string, std::string>& lhs, const std::pair<std::string, std::string>& rhs) {
                         return util::compare_digit_strings(lhs.first, rhs.first) < 0;
                     });

    for (unsigned int i = 0; i < keyed_paths.size(); ++i) {
        img_file_paths.at(i) = keyed_paths.at(i).second;
    }
    return true;
}

} // namespace data
} // namespace framevid
