#include "framevid/util/filesystem.h"
#include "framevid/util/string.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>

#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <spdlog/spdlog.h>

namespace framevid {
namespace util {

std::string join_path(const std::string& parent, const std::string& child) {
    if (parent.empty()) {
        return child;
    }
    if (string_endswith(parent, "/")) {
        return parent + child;
    }
    return parent + "/" + child;
}

std::string get_basename(const std::string& path) {
    std::string refined_path = path;
    while (1 < refined_path.size() && string_endswith(refined_path, "/")) {
        refined_path.pop_back();
    }
    const auto pos = refined_path.find_last_of('/');
    if (pos == std::string::npos) {
        return refined_path;
    }
    return refined_path.substr(pos + 1);
}

bool is_directory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool is_regular_file(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

std::vector<std::string> list_directory(const std::string& dir_path, const bool directories) {
    std::vector<std::string> names;

    // sweep the directory
    DIR* dir;
    if ((dir = opendir(dir_path.c_str())) == nullptr) {
        spdlog::debug("cannot open directory {}", dir_path);
        return names;
    }
    dirent* dp;
    for (dp = readdir(dir); dp != nullptr; dp = readdir(dir)) {
        const std::string name = dp->d_name;
        if (string_startswith(name, ".")) {
            continue;
        }
        const auto entry_path = join_path(dir_path, name);
        if (directories ? is_directory(entry_path) : is_regular_file(entry_path)) {
            names.push_back(name);
        }
    }
    closedir(dir);

    std::sort(names.begin(), names.end());
    return names;
}

void create_directories(const std::string& dir_path) {
    if (dir_path.empty() || is_directory(dir_path)) {
        return;
    }

    std::string partial_path = string_startswith(dir_path, "/") ? "/" : "";
    for (const auto& component : split_string(dir_path, '/')) {
        partial_path = join_path(partial_path, component);
        if (is_directory(partial_path)) {
            continue;
        }
        if (mkdir(partial_path.c_str(), 0755) != 0 && errno != EEXIST) {
            throw std::runtime_error("cannot create a directory at " + partial_path + ": " + std::strerror(errno));
        }
    }

    if (!is_directory(dir_path)) {
        throw std::runtime_error("cannot create a directory at " + dir_path);
    }
}

bool remove_file(const std::string& path) {
    if (std::remove(path.c_str()) == 0) {
        return true;
    }
    return errno == ENOENT;
}

} // namespace util
} // namespace framevid
