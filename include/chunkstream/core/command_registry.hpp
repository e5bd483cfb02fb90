#pragma once

#include "command_handler.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace chunkstream::core {

class CommandRegistry {
public:
    CommandRegistry();

    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);
    CommandResult execute_command(const std::string& command, const std::vector<std::string>& args);
    bool has_command(const std::string& command) const;
    void print_help() const;

private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
