#pragma once

#include "command_handler.hpp"
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace chunkrelay::core {

class CommandRegistry {
public:
    explicit CommandRegistry(const CommandContext& context);

    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);

    // args[0] is the command name.
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);

    bool has_command(const std::string& command) const;
    void print_help(std::ostream& out) const;

private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
