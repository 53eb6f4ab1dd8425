#ifndef FRAMEVID_UTIL_STRING_H
#define FRAMEVID_UTIL_STRING_H

#include <vector>
#include <string>
#include <sstream>
#include <algorithm>

namespace framevid {
namespace util {

inline std::vector<std::string> split_string(const std::string& str, const char del) {
    std::vector<std::string> splitted_strs;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, del)) {
        if (!item.empty()) {
            splitted_strs.push_back(item);
        }
    }
    return splitted_strs;
}

inline bool string_startswith(const std::string& str, const std::string& qry) {
    return str.size() >= qry.size()
           && std::equal(std::begin(qry), std::end(qry), std::begin(str));
}

inline bool string_endswith(const std::string& str, const std::string& qry) {
    return str.size() >= qry.size()
           && std::equal(std::begin(qry), std::end(qry), std::end(str) - qry.size());
}

//! Remove the suffix from the string if present
inline std::string strip_suffix(const std::string& str, const std::string& suffix) {
    if (!string_endswith(str, suffix)) {
        return str;
    }
    return str.substr(0, str.size() - suffix.size());
}

/**
 * Find the first run of decimal digits in the string
 * @param str
 * @param digits the digit run without leading zeros ("0" if the run consists of zeros only)
 * @return true if a digit run was found
 */
inline bool find_first_digit_run(const std::string& str, std::string& digits) {
    const auto is_digit = [](const char c) {
        return '0' <= c && c <= '9';
    };
    const auto bgn = std::find_if(str.begin(), str.end(), is_digit);
    if (bgn == str.end()) {
        return false;
    }
    const auto end = std::find_if_not(bgn, str.end(), is_digit);
    const auto nonzero = std::find_if(bgn, end, [](const char c) { return c != '0'; });
    digits = (nonzero == end) ? std::string("0") : std::string(nonzero, end);
    return true;
}

/**
 * Compare two digit strings without leading zeros as non-negative integers
 * @return negative, zero or positive as lhs is less than, equal to or greater than rhs
 */
inline int compare_digit_strings(const std::string& lhs, const std::string& rhs) {
    if (lhs.size() != rhs.size()) {
        return lhs.size() < rhs.size() ? -1 : 1;
    }
    return lhs.compare(rhs);
}

} // namespace util
} // namespace framevid

#endif // FRAMEVID_UTIL_STRING_H
