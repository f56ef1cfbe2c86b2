#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include "arg_parser.hpp"
#include "config_utils.hpp"
#include "options.hpp"
#include "parse_utils.hpp"

const std::set<std::string>& known_flags() {
    static const std::set<std::string> known{
        "--ref",        "--repository", "--sender",         "--workflow-run-id",
        "--timeout",    "--proxy",      "--dry-run",        "--config-yaml",
        "--config-json", "--log-file",  "--log-level",      "--json-log",
        "--max-log-size", "--max-log-files", "--compress-logs", "--help",
        "--version"};
    return known;
}

const std::set<std::string>& value_flags() {
    static const std::set<std::string> values{
        "--ref",         "--repository", "--sender",       "--workflow-run-id",
        "--timeout",     "--proxy",      "--config-yaml",  "--config-json",
        "--log-file",    "--log-level",  "--max-log-size", "--max-log-files"};
    return values;
}

bool parse_log_level(const std::string& name, LogLevel& level) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (v == "DEBUG")
        level = LogLevel::DEBUG;
    else if (v == "INFO")
        level = LogLevel::INFO;
    else if (v == "WARNING" || v == "WARN")
        level = LogLevel::WARNING;
    else if (v == "ERROR" || v == "ERR")
        level = LogLevel::ERR;
    else
        return false;
    return true;
}

static void load_config_files(const ArgParser& parser, std::map<std::string, std::string>& cfg,
                              Options& opts) {
    std::string err;
    if (parser.has_flag("--config-yaml")) {
        std::string file = parser.get_option("--config-yaml");
        if (file.empty())
            throw std::runtime_error("--config-yaml requires a file");
        if (!load_yaml_config(file, cfg, err))
            throw std::runtime_error("Failed to load config " + file + ": " + err);
        opts.config_file = file;
    }
    if (parser.has_flag("--config-json")) {
        std::string file = parser.get_option("--config-json");
        if (file.empty())
            throw std::runtime_error("--config-json requires a file");
        if (!load_json_config(file, cfg, err))
            throw std::runtime_error("Failed to load config " + file + ": " + err);
        opts.config_file = file;
    }
    static const std::set<std::string> cli_only{"--config-yaml", "--config-json", "--help",
                                                "--version"};
    for (const auto& [key, value] : cfg) {
        if (!known_flags().count(key) || cli_only.count(key))
            throw std::runtime_error("Unknown option in config file: " + key.substr(2));
    }
}

Options parse_options(int argc, char* argv[]) {
    const std::map<char, std::string> short_map{{'h', "--help"}, {'V', "--version"}};
    ArgParser parser(argc, argv, known_flags(), value_flags(), short_map);

    if (!parser.unknown_flags().empty())
        throw std::runtime_error("Unknown option: " + parser.unknown_flags().front());
    if (!parser.missing_values().empty())
        throw std::runtime_error(parser.missing_values().front() + " requires a value");

    Options opts;
    opts.show_help = parser.has_flag("--help");
    opts.print_version = parser.has_flag("--version");
    if (opts.show_help || opts.print_version)
        return opts;

    const auto& pos = parser.positional();
    if (pos.size() < 4) {
        static const char* names[] = {"url", "secret", "hook_id", "sha"};
        throw std::runtime_error(std::string("Missing required argument: ") + names[pos.size()]);
    }
    if (pos.size() > 4)
        throw std::runtime_error("Unexpected argument: " + pos[4]);
    opts.url = pos[0];
    opts.secret = pos[1];
    opts.hook_id = pos[2];
    opts.sha = pos[3];

    std::map<std::string, std::string> cfg;
    load_config_files(parser, cfg, opts);

    auto lookup = [&](const std::string& flag, std::string& out) {
        if (parser.has_flag(flag)) {
            out = parser.get_option(flag);
            return true;
        }
        auto it = cfg.find(flag);
        if (it != cfg.end()) {
            out = it->second;
            return true;
        }
        return false;
    };
    // A bare switch on the command line means on; config values must say so.
    auto flag_set = [&](const std::string& flag) {
        if (parser.has_flag(flag) && !parser.options().count(flag))
            return true;
        std::string v;
        if (!lookup(flag, v))
            return false;
        return parse_bool_value(v);
    };

    lookup("--ref", opts.ref);
    lookup("--repository", opts.repository);
    lookup("--sender", opts.sender);
    lookup("--workflow-run-id", opts.workflow_run_id);
    lookup("--proxy", opts.proxy_url);
    opts.dry_run = flag_set("--dry-run");

    std::string value;
    bool ok = false;
    if (lookup("--timeout", value)) {
        unsigned int sec = parse_uint(value, 1, 3600, ok);
        if (!ok)
            throw std::runtime_error("Invalid --timeout value: " + value);
        opts.timeout = std::chrono::seconds(sec);
    }

    lookup("--log-file", opts.logging.log_file);
    if (lookup("--log-level", value) && !parse_log_level(value, opts.logging.log_level))
        throw std::runtime_error("Invalid --log-level value: " + value);
    opts.logging.json_log = flag_set("--json-log");
    opts.logging.compress_logs = flag_set("--compress-logs");
    if (lookup("--max-log-size", value)) {
        opts.logging.max_log_size = parse_bytes(value, ok);
        if (!ok)
            throw std::runtime_error("Invalid --max-log-size value: " + value);
    }
    if (lookup("--max-log-files", value)) {
        opts.logging.max_log_files = parse_size_t(value, 0, 100, ok);
        if (!ok)
            throw std::runtime_error("Invalid --max-log-files value: " + value);
    }
    return opts;
}
