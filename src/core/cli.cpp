#include "chunkrelay/core/cli.hpp"
#include <iomanip>
#include <limits>

namespace chunkrelay::core {

CommandLineParser::CommandLineParser(std::string program_name)
    : program_name_(std::move(program_name)) {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", ValueKind::TEXT, "~/.chunkrelay.conf");
    add_option("", "verbose", "Enable debug logging");
    add_option("q", "quiet", "Hide the progress meters");
    add_option("", "chunk-size", "Bytes per ranged request, e.g. 512K or 8M", ValueKind::SIZE);
    add_option("", "buffer-chunks", "Chunks held between reading and saving", ValueKind::COUNT);
    add_option("", "timeout", "Session timeout in seconds, 0 for none", ValueKind::COUNT);
    add_option("", "digest", "Expected BLAKE2b-256 hex digest of the object", ValueKind::TEXT);
    add_option("", "delimiter", "Field delimiter for read, or \"tab\"", ValueKind::TEXT, ",");
    add_option("", "no-header", "The first row of a read file is data");
    add_option("n", "rows", "Rows shown by read and history", ValueKind::COUNT, "20");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, ValueKind kind,
                                   const std::string& default_value) {
    options_[long_name] = Option{short_name, description, kind, default_value};
    if (!short_name.empty()) {
        short_to_long_[short_name[0]] = long_name;
    }
}

bool CommandLineParser::store(const std::string& long_name, const std::string& spelled, const std::string& value) {
    const auto& option = options_.at(long_name);

    if (option.kind == ValueKind::SIZE && !parse_size(value)) {
        error_ = "Option " + spelled + " expects a size such as 4096, 512K or 8M, got '" + value + "'";
        return false;
    }
    if (option.kind == ValueKind::COUNT && !parse_count(value)) {
        error_ = "Option " + spelled + " expects a non-negative integer, got '" + value + "'";
        return false;
    }

    parsed_options_[long_name] = value;
    return true;
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    positional_args_.clear();
    parsed_options_.clear();
    error_.clear();

    bool options_done = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (options_done || arg == "-" || !arg.starts_with("-")) {
            positional_args_.push_back(arg);
            continue;
        }

        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg.starts_with("--")) {
            auto eq_pos = arg.find('=');
            std::string name = arg.substr(2, eq_pos == std::string::npos ? std::string::npos : eq_pos - 2);
            std::string spelled = "--" + name;

            auto it = options_.find(name);
            if (it == options_.end()) {
                error_ = "Unknown option: " + spelled;
                return false;
            }

            if (it->second.kind == ValueKind::NONE) {
                if (eq_pos != std::string::npos) {
                    error_ = "Option " + spelled + " does not take a value";
                    return false;
                }
                parsed_options_[name] = "true";
                continue;
            }

            std::string value;
            if (eq_pos != std::string::npos) {
                value = arg.substr(eq_pos + 1);
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                error_ = "Option " + spelled + " requires a value";
                return false;
            }
            if (!store(name, spelled, value)) {
                return false;
            }
            continue;
        }

        // Bundled short flags; a value option ends the bundle and takes the
        // rest of the word or the next argument.
        for (size_t j = 1; j < arg.length(); ++j) {
            std::string spelled = std::string("-") + arg[j];

            auto long_it = short_to_long_.find(arg[j]);
            if (long_it == short_to_long_.end()) {
                error_ = "Unknown option: " + spelled;
                return false;
            }

            const auto& name = long_it->second;
            if (options_.at(name).kind == ValueKind::NONE) {
                parsed_options_[name] = "true";
                continue;
            }

            std::string value;
            if (j + 1 < arg.length()) {
                value = arg.substr(j + 1);
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                error_ = "Option " + spelled + " requires a value";
                return false;
            }
            if (!store(name, spelled, value)) {
                return false;
            }
            break;
        }
    }

    return true;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return parsed_options_.find(name) != parsed_options_.end();
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    auto it = parsed_options_.find(name);
    if (it != parsed_options_.end()) {
        return it->second;
    }

    auto opt_it = options_.find(name);
    if (opt_it != options_.end() && !opt_it->second.default_value.empty()) {
        return opt_it->second.default_value;
    }

    return default_value;
}

std::optional<uint64_t> CommandLineParser::get_number_option(const std::string& name) const {
    auto opt_it = options_.find(name);
    if (opt_it == options_.end()) {
        return std::nullopt;
    }

    auto value = get_option(name);
    if (value.empty()) {
        return std::nullopt;
    }
    return opt_it->second.kind == ValueKind::SIZE ? parse_size(value) : parse_count(value);
}

std::optional<uint64_t> CommandLineParser::parse_count(const std::string& text) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }

    uint64_t value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return value;
}

std::optional<uint64_t> CommandLineParser::parse_size(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }

    uint64_t multiplier = 1;
    std::string digits = text;
    switch (text.back()) {
        case 'k': case 'K': multiplier = 1ULL << 10; break;
        case 'm': case 'M': multiplier = 1ULL << 20; break;
        case 'g': case 'G': multiplier = 1ULL << 30; break;
        default: break;
    }
    if (multiplier != 1) {
        digits.pop_back();
    }

    auto value = parse_count(digits);
    if (!value || *value > std::numeric_limits<uint64_t>::max() / multiplier) {
        return std::nullopt;
    }
    return *value * multiplier;
}

void CommandLineParser::print_help(std::ostream& out) const {
    out << "Usage: " << program_name_ << " [options] <command> [args...]\n\n";
    out << "Options:\n";

    for (const auto& [name, option] : options_) {
        std::string spelled = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        spelled += "--" + name;
        if (option.kind != ValueKind::NONE) {
            spelled += option.kind == ValueKind::TEXT ? " <text>" : " <n>";
        }

        out << "  " << std::left << std::setw(26) << spelled << option.description;
        if (!option.default_value.empty()) {
            out << " (default: " << option.default_value << ")";
        }
        out << "\n";
    }
    out << "\n";
}

void CommandLineParser::print_version(std::ostream& out) const {
    out << program_name_ << " version 1.0.0\n";
}

}
