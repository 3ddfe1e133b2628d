// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace GiftSniper {
namespace Config {

struct LoggingConfig {
    std::string log_file = "gift_sniper.log";
    std::string log_directory = "runtime_logs";
};

} // namespace Config
} // namespace GiftSniper

#endif // LOGGING_CONFIG_HPP
