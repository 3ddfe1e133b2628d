#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace GiftSniper {
namespace TimeUtils {

// Time format constants
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* LOG_FILENAME = "%Y%m%d-%H%M%S";

// Common time utility functions
std::string get_current_human_readable_time();
std::string get_current_log_filename_time();

} // namespace TimeUtils
} // namespace GiftSniper

#endif // TIME_UTILS_HPP
