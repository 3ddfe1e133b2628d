#include "config_loader.hpp"
#include "logging/logger/async_logger.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <filesystem>
#include <system_error>

using GiftSniper::Logging::log_message;

namespace GiftSniper {
namespace Config {

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(),
                       [](unsigned char value_char) { return static_cast<char>(std::tolower(value_char)); });
        return normalized_value == "1" || normalized_value == "true" || normalized_value == "yes";
    }

    int parse_int(const std::string& key, const std::string& value) {
        try {
            size_t parsed_length = 0;
            int parsed_value = std::stoi(value, &parsed_length);
            if (parsed_length != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return parsed_value;
        } catch (const std::exception& parse_exception_error) {
            throw std::runtime_error("Failed to parse " + key + " from value '" + value + "': " + std::string(parse_exception_error.what()));
        }
    }

    long long parse_long(const std::string& key, const std::string& value) {
        try {
            size_t parsed_length = 0;
            long long parsed_value = std::stoll(value, &parsed_length);
            if (parsed_length != value.size()) {
                throw std::invalid_argument("trailing characters");
            }
            return parsed_value;
        } catch (const std::exception& parse_exception_error) {
            throw std::runtime_error("Failed to parse " + key + " from value '" + value + "': " + std::string(parse_exception_error.what()));
        }
    }

    const char* read_environment(const char* variable_name) {
        const char* variable_value = std::getenv(variable_name);
        if (variable_value == nullptr || trim(variable_value).empty()) {
            return nullptr;
        }
        return variable_value;
    }
}

bool load_config_from_csv(SystemConfig& cfg, const std::string& csv_path) {
    try {
        std::ifstream config_file_stream(csv_path);
        if (!config_file_stream.is_open()) {
            return false;
        }
        std::string config_line_string;
        while (std::getline(config_file_stream, config_line_string)) {
            try {
                config_line_string = trim(config_line_string);
                if (config_line_string.empty() || config_line_string[0] == '#') continue;
                std::stringstream config_line_stream(config_line_string);
                std::string config_key_string, config_value_string;
                if (!std::getline(config_line_stream, config_key_string, ',')) continue;
                if (!std::getline(config_line_stream, config_value_string)) config_value_string.clear();
                config_key_string = trim(config_key_string);
                config_value_string = trim(config_value_string);

                // API
                if (config_key_string == "api.api_id") {
                    cfg.api.api_id = config_value_string.empty() ? 0 : parse_long(config_key_string, config_value_string);
                }
                else if (config_key_string == "api.api_hash") cfg.api.api_hash = config_value_string;
                else if (config_key_string == "api.gateway_url") cfg.api.gateway_url = config_value_string;
                else if (config_key_string == "api.timeout_seconds") cfg.api.timeout_seconds = parse_int(config_key_string, config_value_string);
                else if (config_key_string == "api.retry_count") cfg.api.retry_count = parse_int(config_key_string, config_value_string);
                else if (config_key_string == "api.retry_delay_ms") cfg.api.retry_delay_ms = parse_int(config_key_string, config_value_string);
                else if (config_key_string == "api.enable_ssl_verification") cfg.api.enable_ssl_verification = to_bool(config_value_string);

                // Run
                else if (config_key_string == "run.session") cfg.run.session = config_value_string;
                else if (config_key_string == "run.recipient") cfg.run.recipient = config_value_string;
                else if (config_key_string == "run.max_price_stars") cfg.run.max_price_stars = parse_int(config_key_string, config_value_string);
                else if (config_key_string == "run.poll_interval_sec") cfg.run.poll_interval_sec = parse_int(config_key_string, config_value_string);

                // Timing
                else if (config_key_string == "timing.logging_flush_interval_ms") cfg.timing.logging_flush_interval_ms = parse_int(config_key_string, config_value_string);
                else if (config_key_string == "timing.control_poll_interval_ms") cfg.timing.control_poll_interval_ms = parse_int(config_key_string, config_value_string);

                // Logging
                else if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
                else if (config_key_string == "logging.log_directory") cfg.logging.log_directory = config_value_string;
            } catch (const std::exception& line_exception_error) {
                log_message("CRITICAL: Error parsing config line: " + config_line_string + " - " + std::string(line_exception_error.what()));
                throw;
            }
        }
        return true;
    } catch (const std::exception& exception_error) {
        log_message("Exception in load_config_from_csv: " + std::string(exception_error.what()));
        return false;
    }
}

void apply_environment_overrides(SystemConfig& cfg) {
    if (const char* api_id_value = read_environment("TG_API_ID")) {
        cfg.api.api_id = parse_long("TG_API_ID", trim(api_id_value));
    }
    if (const char* api_hash_value = read_environment("TG_API_HASH")) {
        cfg.api.api_hash = trim(api_hash_value);
    }
    if (const char* gateway_value = read_environment("TG_GATEWAY_URL")) {
        cfg.api.gateway_url = trim(gateway_value);
    }
    if (const char* session_value = read_environment("TG_SESSION")) {
        cfg.run.session = trim(session_value);
    }
    if (const char* recipient_value = read_environment("RECIPIENT")) {
        cfg.run.recipient = trim(recipient_value);
    }
    if (const char* max_price_value = read_environment("MAX_PRICE_STARS")) {
        cfg.run.max_price_stars = parse_int("MAX_PRICE_STARS", trim(max_price_value));
    }
    if (const char* poll_interval_value = read_environment("POLL_INTERVAL")) {
        cfg.run.poll_interval_sec = parse_int("POLL_INTERVAL", trim(poll_interval_value));
    }
}

int load_system_config(SystemConfig& config, const std::string& csv_path) {
    std::error_code exists_error;
    if (!std::filesystem::exists(csv_path, exists_error)) {
        log_message("Config file " + csv_path + " not found, using defaults and environment");
    } else if (!load_config_from_csv(config, csv_path)) {
        log_message("Failed to load config CSV from " + csv_path);
        return 1;
    }

    try {
        apply_environment_overrides(config);
    } catch (const std::exception& environment_exception_error) {
        log_message("Invalid environment override: " + std::string(environment_exception_error.what()));
        return 1;
    }

    config.run = normalize_run_config(config.run);
    return 0;
}

RunConfig normalize_run_config(const RunConfig& run_config) {
    RunConfig normalized_config = run_config;
    normalized_config.session = trim(normalized_config.session);
    normalized_config.recipient = trim(normalized_config.recipient);
    if (normalized_config.session.empty()) {
        normalized_config.session = DEFAULT_SESSION_NAME;
    }
    if (normalized_config.recipient.empty()) {
        normalized_config.recipient = DEFAULT_RECIPIENT;
    }
    return normalized_config;
}

bool has_api_credentials(const ApiConfig& api_config) {
    return api_config.api_id != 0 && !api_config.api_hash.empty();
}

bool validate_run_config(const RunConfig& run_config, std::string& errorMessage) {
    if (run_config.session.empty()) {
        errorMessage = "run.session must not be empty";
        return false;
    }
    if (run_config.recipient.empty()) {
        errorMessage = "run.recipient must not be empty";
        return false;
    }
    if (run_config.max_price_stars <= 0) {
        errorMessage = "run.max_price_stars must be > 0, got: " + std::to_string(run_config.max_price_stars);
        return false;
    }
    if (run_config.poll_interval_sec < MIN_POLL_INTERVAL_SEC) {
        errorMessage = "run.poll_interval_sec must be >= " + std::to_string(MIN_POLL_INTERVAL_SEC) +
                       ", got: " + std::to_string(run_config.poll_interval_sec);
        return false;
    }
    return true;
}

bool validate_config(const SystemConfig& config, std::string& errorMessage) {
    if (config.api.gateway_url.empty()) {
        errorMessage = "Gateway URL missing (provide api.gateway_url or TG_GATEWAY_URL)";
        return false;
    }
    if (config.api.timeout_seconds <= 0) {
        errorMessage = "api.timeout_seconds must be > 0";
        return false;
    }
    if (config.api.retry_count < 1) {
        errorMessage = "api.retry_count must be >= 1";
        return false;
    }
    if (config.api.retry_delay_ms < 0) {
        errorMessage = "api.retry_delay_ms must be >= 0";
        return false;
    }
    if (config.logging.log_file.empty()) {
        errorMessage = "Logging path is empty (provide logging.log_file)";
        return false;
    }
    if (config.timing.logging_flush_interval_ms <= 0 || config.timing.control_poll_interval_ms <= 0) {
        errorMessage = "timing.* milliseconds must be > 0";
        return false;
    }
    return validate_run_config(config.run, errorMessage);
}

} // namespace Config
} // namespace GiftSniper
