#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace chunkrelay::core {

// Global options of the chunkrelay command line. Values are checked while
// parsing, so a bad --chunk-size fails before any transfer starts.
class CommandLineParser {
public:
    enum class ValueKind {
        NONE,  // flag
        TEXT,
        SIZE,  // bytes, with an optional K/M/G suffix
        COUNT  // non-negative integer
    };

    explicit CommandLineParser(std::string program_name);

    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, ValueKind kind = ValueKind::NONE,
                    const std::string& default_value = "");

    // Options may appear before or after the command. Everything after "--"
    // is positional.
    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;

    // Only meaningful for SIZE and COUNT options, which parse() validated.
    std::optional<uint64_t> get_number_option(const std::string& name) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help(std::ostream& out) const;
    void print_version(std::ostream& out) const;

    // "64K" -> 65536. Suffixes are binary multiples and case insensitive.
    static std::optional<uint64_t> parse_size(const std::string& text);
    static std::optional<uint64_t> parse_count(const std::string& text);

private:
    struct Option {
        std::string short_name;
        std::string description;
        ValueKind kind = ValueKind::NONE;
        std::string default_value;
    };

    std::string program_name_;
    std::map<std::string, Option> options_;
    std::map<char, std::string> short_to_long_;

    std::vector<std::string> positional_args_;
    std::map<std::string, std::string> parsed_options_;
    std::string error_;

    bool store(const std::string& long_name, const std::string& spelled, const std::string& value);
};

}
