#include "chunkrelay/core/command_registry.hpp"
#include "chunkrelay/core/logger.hpp"
#include <iomanip>

namespace chunkrelay::core {

CommandRegistry::CommandRegistry(const CommandContext& context) {
    register_command("fetch", std::make_unique<FetchCommandHandler>(context));
    register_command("get", std::make_unique<GetCommandHandler>(context));
    register_command("ls", std::make_unique<ListCommandHandler>(context));
    register_command("read", std::make_unique<ReadCommandHandler>(context));
    register_command("history", std::make_unique<HistoryCommandHandler>(context));
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }

    LOG_DEBUG("Running {} with {} argument(s)", command, args.size() - 1);
    return it->second->execute(args);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "Commands:\n";

    for (const auto& [name, handler] : handlers_) {
        out << "  " << std::left << std::setw(10) << name << handler->get_description() << "\n";
        out << "  " << std::setw(10) << " " << "usage: " << handler->get_usage() << "\n";
    }
}

}
