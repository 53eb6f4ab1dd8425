#ifndef FRAMEVID_DATA_DRIVE_H
#define FRAMEVID_DATA_DRIVE_H

#include <string>
#include <vector>

namespace framevid {
namespace data {

//! Suffix of the directory of a synchronized KITTI drive
const std::string sync_dir_suffix = "_sync";

struct drive {
    //! Constructor
    drive(const std::string& date, const std::string& name, const std::string& sync_dir_path, const std::string& image_dir_path)
        : date_(date), name_(name), sync_dir_path_(sync_dir_path), image_dir_path_(image_dir_path) {}

    //! date of the capture session (e.g. 2011_09_26)
    std::string date_;
    //! drive name, the sync directory name without its suffix (e.g. 2011_09_26_drive_0002)
    std::string name_;
    //! path to <date>/<name>_sync
    std::string sync_dir_path_;
    //! path to the RGB frames of the drive (which might not exist)
    std::string image_dir_path_;

    /**
     * Find the drives located at <dataset_root>/<date>/<name>_sync, sorted by path
     * @param dataset_root
     * @param image_dir_name path of the image directory relative to each sync directory
     */
    static std::vector<drive> find_drives(const std::string& dataset_root, const std::string& image_dir_name);
};

} // namespace data
} // namespace framevid

#endif // FRAMEVID_DATA_DRIVE_H
