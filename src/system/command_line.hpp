#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "configs/system_config.hpp"
#include <string>

namespace GiftSniper {
namespace System {

enum class CommandKind {
    RUN,       // Start one acquisition run and wait for it
    BALANCE,   // Independent balance check
    LOGIN      // Interactive login of the configured session
};

struct CommandLineOptions {
    CommandKind command = CommandKind::RUN;
    std::string config_path;

    // Overrides, applied only when given on the command line
    bool has_session = false;
    std::string session;
    bool has_recipient = false;
    std::string recipient;
    bool has_max_price = false;
    int max_price_stars = 0;
    bool has_poll_interval = false;
    int poll_interval_sec = 0;

    std::string phone_number;   // login only; prompted when empty
};

struct CommandLineParseResult {
    bool should_exit = false;   // --help or a parse error
    int exit_code = 0;
    CommandLineOptions options;
};

CommandLineParseResult parse_command_line(int argc, char** argv);

// Command line values win over the CSV file and the environment.
void apply_command_line_overrides(Config::SystemConfig& config, const CommandLineOptions& options);

const char* to_string(CommandKind command);

} // namespace System
} // namespace GiftSniper

#endif // COMMAND_LINE_HPP
