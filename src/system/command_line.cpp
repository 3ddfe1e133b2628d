#include "command_line.hpp"
#include "configs/config_loader.hpp"
#include <CLI/CLI.hpp>

namespace GiftSniper {
namespace System {

CommandLineParseResult parse_command_line(int argc, char** argv) {
    CLI::App app{"gift_sniper - buys the cheapest affordable limited star gift"};
    CommandLineParseResult parse_result;
    CommandLineOptions& options = parse_result.options;
    options.config_path = Config::DEFAULT_CONFIG_PATH;

    app.add_option("-c,--config", options.config_path, "key,value configuration file")->default_val(options.config_path);
    CLI::Option* session_option = app.add_option("--session", options.session, "Session name on the gateway");
    CLI::Option* recipient_option = app.add_option("--recipient", options.recipient, "@username, numeric id or me");
    CLI::Option* max_price_option = app.add_option("--max-price", options.max_price_stars, "Price ceiling in stars (inclusive)")
        ->check(CLI::PositiveNumber);
    CLI::Option* interval_option = app.add_option("--interval", options.poll_interval_sec, "Seconds between catalog polls")
        ->check(CLI::Range(Config::MIN_POLL_INTERVAL_SEC, 86400));
    app.fallthrough();
    app.require_subcommand(0, 1);

    app.add_subcommand("run", "Watch the catalog and buy one gift (default)");
    CLI::App* balance_command = app.add_subcommand("balance", "Print the stars balance of the session");
    CLI::App* login_command = app.add_subcommand("login", "Authorize the session interactively");
    login_command->add_option("--phone", options.phone_number, "Phone number in international format");

    app.footer(
        "Credentials come from api.api_id/api.api_hash or TG_API_ID/TG_API_HASH.\n"
        "Ctrl+C stops an active run after the current request."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& parse_error) {
        parse_result.should_exit = true;
        parse_result.exit_code = app.exit(parse_error);
        return parse_result;
    }

    if (balance_command->parsed()) {
        options.command = CommandKind::BALANCE;
    } else if (login_command->parsed()) {
        options.command = CommandKind::LOGIN;
    } else {
        options.command = CommandKind::RUN;
    }

    options.has_session = session_option->count() > 0;
    options.has_recipient = recipient_option->count() > 0;
    options.has_max_price = max_price_option->count() > 0;
    options.has_poll_interval = interval_option->count() > 0;
    return parse_result;
}

void apply_command_line_overrides(Config::SystemConfig& config, const CommandLineOptions& options) {
    if (options.has_session) {
        config.run.session = options.session;
    }
    if (options.has_recipient) {
        config.run.recipient = options.recipient;
    }
    if (options.has_max_price) {
        config.run.max_price_stars = options.max_price_stars;
    }
    if (options.has_poll_interval) {
        config.run.poll_interval_sec = options.poll_interval_sec;
    }
    config.run = Config::normalize_run_config(config.run);
}

const char* to_string(CommandKind command) {
    switch (command) {
        case CommandKind::RUN: return "run";
        case CommandKind::BALANCE: return "balance";
        case CommandKind::LOGIN: return "login";
    }
    return "unknown";
}

} // namespace System
} // namespace GiftSniper
