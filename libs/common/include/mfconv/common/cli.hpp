// =============================================================================
// MFCONV - Command Line Argument Parser
// Version: 1.2.0
// =============================================================================

#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <optional>
#include <iostream>
#include <iomanip>

namespace mfconv::cli {

/**
 * @brief Command-line argument parser
 *
 * Supports long options (--name, --name=value), short options (-n, -n value),
 * boolean flags and help generation. Options given on the command line are
 * tracked separately from defaults so callers can layer them over a
 * configuration file.
 */
class ArgParser {
public:
    struct Option {
        std::string long_name;
        char short_name = 0;
        std::string description;
        std::string default_value;
        bool is_flag = false;
    };

    explicit ArgParser(const std::string& program_name = "",
                       const std::string& description = "")
        : program_name_(program_name), description_(description) {}

    /**
     * @brief Add an option that takes a value
     */
    ArgParser& add_option(const std::string& long_name,
                          char short_name = 0,
                          const std::string& description = "",
                          const std::string& default_value = "") {
        Option opt;
        opt.long_name = long_name;
        opt.short_name = short_name;
        opt.description = description;
        opt.default_value = default_value;
        options_.push_back(opt);
        return *this;
    }

    /**
     * @brief Add a boolean flag
     */
    ArgParser& add_flag(const std::string& long_name,
                        char short_name = 0,
                        const std::string& description = "") {
        Option opt;
        opt.long_name = long_name;
        opt.short_name = short_name;
        opt.description = description;
        opt.is_flag = true;
        options_.push_back(opt);
        return *this;
    }

    /**
     * @brief Parse command-line arguments
     * @return true if parsing succeeded; false on error or when help was requested
     */
    bool parse(int argc, const char* const argv[]) {
        if (argc > 0 && program_name_.empty()) {
            program_name_ = argv[0];
        }

        for (const auto& opt : options_) {
            if (!opt.default_value.empty()) {
                values_[opt.long_name] = opt.default_value;
            }
            if (opt.is_flag) {
                flags_[opt.long_name] = false;
            }
        }

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                help_requested_ = true;
                return false;
            }

            if (arg.starts_with("--")) {
                std::string name;
                std::optional<std::string> value;

                auto eq_pos = arg.find('=');
                if (eq_pos != std::string::npos) {
                    name = arg.substr(2, eq_pos - 2);
                    value = arg.substr(eq_pos + 1);
                } else {
                    name = arg.substr(2);
                }

                const auto* opt = find_option(name);
                if (!opt) {
                    error_ = "Unknown option: --" + name;
                    return false;
                }

                if (opt->is_flag) {
                    if (value) {
                        error_ = "Flag --" + name + " does not take a value";
                        return false;
                    }
                    flags_[opt->long_name] = true;
                } else {
                    if (!value) {
                        if (i + 1 >= argc) {
                            error_ = "Option --" + name + " requires a value";
                            return false;
                        }
                        value = argv[++i];
                    }
                    values_[opt->long_name] = *value;
                    supplied_.insert(opt->long_name);
                }
            } else if (arg.starts_with("-") && arg.length() > 1) {
                for (size_t j = 1; j < arg.length(); ++j) {
                    char c = arg[j];
                    const auto* opt = find_option(c);
                    if (!opt) {
                        error_ = std::string("Unknown option: -") + c;
                        return false;
                    }

                    if (opt->is_flag) {
                        flags_[opt->long_name] = true;
                        continue;
                    }

                    std::string value;
                    if (j + 1 < arg.length()) {
                        value = arg.substr(j + 1);
                        j = arg.length();
                    } else if (i + 1 < argc) {
                        value = argv[++i];
                    } else {
                        error_ = std::string("Option -") + c + " requires a value";
                        return false;
                    }
                    values_[opt->long_name] = value;
                    supplied_.insert(opt->long_name);
                }
            } else {
                error_ = "Unexpected argument: " + arg;
                return false;
            }
        }

        return true;
    }

    std::optional<std::string> get(const std::string& name) const {
        auto it = values_.find(name);
        if (it != values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    std::string get(const std::string& name, const std::string& default_val) const {
        return get(name).value_or(default_val);
    }

    /**
     * @brief True only when the option was given explicitly (defaults excluded)
     */
    bool supplied(const std::string& name) const {
        return supplied_.count(name) != 0;
    }

    bool flag(const std::string& name) const {
        auto it = flags_.find(name);
        return it != flags_.end() && it->second;
    }

    bool help_requested() const { return help_requested_; }

    const std::string& error() const { return error_; }

    void show_help(std::ostream& out = std::cout) const {
        out << "Usage: " << program_name_ << " [options]\n\n";

        if (!description_.empty()) {
            out << description_ << "\n\n";
        }

        out << "Options:\n";
        for (const auto& opt : options_) {
            out << "  ";
            if (opt.short_name) {
                out << "-" << opt.short_name << ", ";
            } else {
                out << "    ";
            }
            std::string label = opt.is_flag ? opt.long_name : opt.long_name + " <value>";
            out << "--" << std::left << std::setw(24) << label;
            out << opt.description;
            if (!opt.default_value.empty()) {
                out << " [default: " << opt.default_value << "]";
            }
            out << "\n";
        }

        out << "  -h, --help                    Show this help message\n";
    }

private:
    const Option* find_option(const std::string& name) const {
        for (const auto& opt : options_) {
            if (opt.long_name == name) return &opt;
        }
        return nullptr;
    }

    const Option* find_option(char short_name) const {
        for (const auto& opt : options_) {
            if (opt.short_name == short_name) return &opt;
        }
        return nullptr;
    }

    std::string program_name_;
    std::string description_;
    std::vector<Option> options_;

    std::map<std::string, std::string> values_;
    std::map<std::string, bool> flags_;
    std::set<std::string> supplied_;
    bool help_requested_ = false;
    std::string error_;
};

} // namespace mfconv::cli
