#pragma once

#include <string>
#include <vector>

namespace chunkstream::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& message = "") {
        return CommandResult{true, message, 0};
    }

    static CommandResult error(const std::string& message, int exit_code = 1) {
        return CommandResult{false, message, exit_code};
    }
};

// args[0] is the command name itself
class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class ManifestCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Chunk a file into the local store and print its manifest"; }
    std::string get_usage() const override { return "chunkstream manifest <file> [file_id]"; }
};

class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send a file to a receiving peer"; }
    std::string get_usage() const override { return "chunkstream send <host> <port> <file> [file_id]"; }
};

class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Wait for one incoming transfer and write the file"; }
    std::string get_usage() const override { return "chunkstream receive <port> [output]"; }
};

class ResumableCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List interrupted downloads that can be resumed"; }
    std::string get_usage() const override { return "chunkstream resumable"; }
};

}
