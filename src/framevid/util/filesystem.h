#ifndef FRAMEVID_UTIL_FILESYSTEM_H
#define FRAMEVID_UTIL_FILESYSTEM_H

#include <string>
#include <vector>

namespace framevid {
namespace util {

//! Join two path components with a separator
std::string join_path(const std::string& parent, const std::string& child);

//! Get the last component of the path
std::string get_basename(const std::string& path);

//! Check whether the path is an existing directory
bool is_directory(const std::string& path);

//! Check whether the path is an existing regular file
bool is_regular_file(const std::string& path);

/**
 * List the names of entries directly inside the directory, sorted lexically
 * Hidden entries (names starting with '.') are skipped
 * @param dir_path
 * @param directories true to list directories, false to list regular files
 * @return entry names, empty if the directory cannot be opened
 */
std::vector<std::string> list_directory(const std::string& dir_path, const bool directories);

//! Create the directory and all of its missing parents, throws std::runtime_error on failure
void create_directories(const std::string& dir_path);

//! Remove the file if it exists, returns false only if an existing file could not be removed
bool remove_file(const std::string& path);

} // namespace util
} // namespace framevid

#endif // FRAMEVID_UTIL_FILESYSTEM_H
