#ifndef FRAMEVID_DATA_FRAME_SEQUENCE_H
#define FRAMEVID_DATA_FRAME_SEQUENCE_H

#include <string>
#include <vector>

namespace framevid {
namespace data {

class frame_sequence {
public:
    /**
     * Constructor
     * Collect the files directly inside img_dir_path whose names end with ".<img_ext>" and sort them
     * @param img_dir_path
     * @param img_ext file extension without the leading dot (case-sensitive)
     */
    frame_sequence(const std::string& img_dir_path, const std::string& img_ext);

    //! Destructor
    virtual ~frame_sequence() = default;

    //! Get the sorted frame paths
    const std::vector<std::string>& get_frame_paths() const { return img_file_paths_; }

    //! Get the number of frames
    unsigned int size() const { return static_cast<unsigned int>(img_file_paths_.size()); }

    //! Check whether no frame was found
    bool empty() const { return img_file_paths_.empty(); }

    //! Check whether the frames were sorted by their numbers (false if the lexical fallback was used)
    bool is_sorted_numerically() const { return sorted_numerically_; }

    /**
     * Sort the paths by the first digit run of each file name
     * If any file name has no digit run, all of the paths are sorted lexically instead
     * @param img_file_paths
     * @return true if the numerical order was applied
     */
    static bool sort_frame_paths(std::vector<std::string>& img_file_paths);

private:
    const std::string img_dir_path_;
    const std::string img_ext_;

    std::vector<std::string> img_file_paths_;
    bool sorted_numerically_ = false;
};

} // namespace data
} // namespace framevid

#endif // FRAMEVID_DATA_FRAME_SEQUENCE_H
