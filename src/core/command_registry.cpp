#include "uplink/core/command_registry.hpp"
#include <iostream>
#include <iomanip>

namespace uplink::core {

CommandRegistry::CommandRegistry() {
    register_command("upload", std::make_unique<UploadCommandHandler>());
    register_command("sessions", std::make_unique<SessionsCommandHandler>());
    register_command("cancel", std::make_unique<CancelCommandHandler>());
    register_command("sweep", std::make_unique<SweepCommandHandler>());
    register_command("status", std::make_unique<StatusCommandHandler>());
    register_command("config", std::make_unique<ConfigCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(const std::string& command, const std::vector<std::string>& args,
                                               const CommandLineParser& options) {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + command);
    }
    
    return it->second->execute(args, options);
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help() const {
    std::cout << "\nCommands:\n";
    
    for (const auto& [name, handler] : handlers_) {
        std::cout << "  " << std::left << std::setw(15) << name
                  << handler->get_description() << "\n";
        std::cout << "  " << std::left << std::setw(15) << " "
                  << "Usage: " << handler->get_usage() << "\n\n";
    }
}

}
