#ifndef OPTIONS_HPP
#define OPTIONS_HPP
#include <chrono>
#include <filesystem>
#include <set>
#include <string>
#include "deploy_notification.hpp"
#include "logger.hpp"

struct LoggingOptions {
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;
    size_t max_log_size = 0;
    size_t max_log_files = 3;
    bool json_log = false;
    bool compress_logs = false;
};

struct Options {
    std::string url;
    std::string secret;
    std::string hook_id;
    std::string sha;
    std::string ref = DEFAULT_REF;
    std::string repository = DEFAULT_REPOSITORY;
    std::string sender = DEFAULT_SENDER;
    std::string workflow_run_id;
    std::chrono::seconds timeout{30};
    std::string proxy_url;
    bool dry_run = false;
    std::filesystem::path config_file;
    LoggingOptions logging;
    bool show_help = false;
    bool print_version = false;
};

/**
 * @brief Flags accepted on the command line and as config file keys.
 */
const std::set<std::string>& known_flags();

/**
 * @brief Flags that require a value.
 */
const std::set<std::string>& value_flags();

/**
 * Parse command-line arguments and configuration files to populate an Options
 * instance.
 *
 * Command-line values take precedence over values loaded with
 * `--config-yaml` or `--config-json`, which take precedence over defaults.
 *
 * @param argc Number of command-line arguments.
 * @param argv Argument vector.
 * @return Fully populated Options structure.
 * @throws std::runtime_error on unknown flags, missing values, a wrong number
 *         of positional arguments or out-of-range numbers. `--help` and
 *         `--version` skip the positional check.
 */
Options parse_options(int argc, char* argv[]);

/**
 * @brief Parse a log level name such as `DEBUG` or `error`.
 *
 * @return `false` if @p name is not a recognized level.
 */
bool parse_log_level(const std::string& name, LogLevel& level);

#endif // OPTIONS_HPP
