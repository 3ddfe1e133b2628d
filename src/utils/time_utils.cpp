#include "time_utils.hpp"
#include <ctime>

namespace GiftSniper {
namespace TimeUtils {

namespace {
    std::string format_local_time(const char* time_format) {
        auto now = std::chrono::system_clock::now();
        auto in_time_t = std::chrono::system_clock::to_time_t(now);
        std::stringstream ss;

        // Use thread-safe localtime_r instead of localtime
        struct tm timeinfo;
        localtime_r(&in_time_t, &timeinfo);
        ss << std::put_time(&timeinfo, time_format);
        return ss.str();
    }
}

std::string get_current_human_readable_time() {
    return format_local_time(HUMAN_READABLE);
}

std::string get_current_log_filename_time() {
    return format_local_time(LOG_FILENAME);
}

} // namespace TimeUtils
} // namespace GiftSniper
