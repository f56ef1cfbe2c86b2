#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Simple command line argument parser.
 *
 * The parser recognizes long style options (e.g. `--flag` or `--opt value`).
 * Options may also be specified using the form `--opt=value`. Flags listed in
 * @a value_flags always expect a value; when none follows they are reported by
 * missing_values(). A list of known flags can be provided so that unknown flags
 * are collected and reported separately. A mapping of short options (like
 * `-h`) to their long counterparts can optionally be supplied. A bare `--`
 * ends option parsing and everything after it is positional.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::vector<std::string> positional_;        ///< Positional arguments in order
    std::vector<std::string> unknown_flags_;     ///< Flags not present in known_flags
    std::vector<std::string> missing_values_;    ///< Value flags given without a value
    std::set<std::string> known_flags_;          ///< List of accepted flags
    std::set<std::string> value_flags_;          ///< Flags that take a value
    std::map<char, std::string> short_map_;      ///< Mapping of short to long flags

    void record(const std::string& key, const std::string* val) {
        if (!known_flags_.empty() && !known_flags_.count(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        if (!val && value_flags_.count(key)) {
            missing_values_.push_back(key);
            return;
        }
        flags_.insert(key);
        if (val)
            options_[key] = *val;
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`.
     * @param known_flags Optional set of flags that are considered valid. If
     *        empty, all flags are treated as known.
     * @param value_flags Flags that consume the following argument as their
     *        value unless it starts with `--`.
     * @param short_map Mapping from single character options (e.g. '-h') to
     *        their long form (e.g. '--help').
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::set<std::string>& value_flags = {},
              const std::map<char, std::string>& short_map = {})
        : known_flags_(known_flags), value_flags_(value_flags), short_map_(short_map) {
        bool options_done = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (options_done) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                options_done = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    std::string val = arg.substr(eq + 1);
                    record(arg.substr(0, eq), &val);
                } else if (value_flags_.count(arg) && i + 1 < argc &&
                           std::string(argv[i + 1]).rfind("--", 0) != 0) {
                    std::string val = argv[++i];
                    record(arg, &val);
                } else {
                    record(arg, nullptr);
                }
            } else if (arg.size() == 2 && arg[0] == '-' && short_map_.count(arg[1])) {
                record(short_map_.at(arg[1]), nullptr);
            } else {
                positional_.push_back(arg);
            }
        }
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     * @return `true` if the flag was present, otherwise `false`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * If the option was not provided, an empty string is returned.
     *
     * @param opt Option name including the leading `--`.
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @return Set of all flags found during parsing. */
    const std::set<std::string>& flags() const { return flags_; }

    /** @return Map of option names to their parsed values. */
    const std::map<std::string, std::string>& options() const { return options_; }

    /** @return Ordered list of positional arguments. */
    const std::vector<std::string>& positional() const { return positional_; }

    /** @return Flags that were not part of @a known_flags. */
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }

    /** @return Value flags that appeared without a value. */
    const std::vector<std::string>& missing_values() const { return missing_values_; }
};

#endif // ARG_PARSER_HPP
