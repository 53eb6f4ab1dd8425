#ifndef FRAMEVID_DRIVE_BATCH_H
#define FRAMEVID_DRIVE_BATCH_H

#include "framevid/video_encoder.h"
#include "framevid/data/drive.h"

#include <array>
#include <memory>
#include <string>
#include <vector>

namespace framevid {

class config;

enum class drive_status_t {
    Succeeded = 0,
    Skipped = 1,
    Failed = 2
};

const std::array<std::string, 3> drive_status_to_string = {{"Succeeded", "Skipped", "Failed"}};

enum class batch_status_t {
    Completed = 0,
    NoDrivesFound = 1
};

const std::array<std::string, 2> batch_status_to_string = {{"Completed", "NoDrivesFound"}};

struct drive_outcome {
    //! Constructor
    drive_outcome(const data::drive& drv, const drive_status_t status, const std::string& reason,
                  const conversion_result& conversion = conversion_result())
        : drive_(drv), status_(status), reason_(reason), conversion_(conversion) {}

    //! processed drive
    data::drive drive_;
    //! outcome of the drive
    drive_status_t status_;
    //! human-readable reason of skip or failure (the output path on success)
    std::string reason_;
    //! result of the conversion (default-constructed if skipped)
    conversion_result conversion_;

    std::string get_status_string() const { return drive_status_to_string.at(static_cast<unsigned int>(status_)); }
};

struct batch_summary {
    batch_status_t status_ = batch_status_t::Completed;

    //! outcomes in the processing order
    std::vector<drive_outcome> outcomes_;

    //! Get the number of discovered drives
    unsigned int get_num_drives() const { return static_cast<unsigned int>(outcomes_.size()); }

    //! Count the drives with the status
    unsigned int count(const drive_status_t status) const;

    //! Get the outcomes of the failed drives
    std::vector<drive_outcome> get_failures() const;

    //! Log the summary
    void show() const;
};

class drive_batch {
public:
    //! Constructor
    drive_batch(const std::shared_ptr<config>& cfg, const std::shared_ptr<video_encoder>& encoder);

    //! Destructor
    ~drive_batch();

    /**
     * Convert the frames of every drive found under dataset_root into <output_dir>/<drive name>.<video extension>
     * A drive which cannot be converted never stops the processing of the others
     * @param dataset_root directory containing <date>/<name>_sync directories
     * @param output_dir created if it does not exist
     * @param fps
     * @return outcomes of all the drives
     */
    batch_summary process_all(const std::string& dataset_root, const std::string& output_dir, const double fps);

    //! Get the output path of the drive
    std::string get_video_path(const data::drive& drv, const std::string& output_dir) const;

private:
    //! Convert a single drive
    drive_outcome process_drive(const data::drive& drv, const std::string& output_dir, const double fps);

    //! config
    const std::shared_ptr<config> cfg_;
    //! encoder shared by all the drives
    const std::shared_ptr<video_encoder> encoder_;
};

} // namespace framevid

#endif // FRAMEVID_DRIVE_BATCH_H
