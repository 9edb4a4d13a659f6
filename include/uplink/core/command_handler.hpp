#pragma once

#include "cli.hpp"
#include <string>
#include <vector>

namespace uplink::core {

struct CommandResult {
    bool success = true;
    std::string message;
    int exit_code = 0;
    
    static CommandResult ok(const std::string& message = "") {
        return CommandResult{true, message, 0};
    }
    
    static CommandResult error(const std::string& message, int exit_code = 1) {
        return CommandResult{false, message, exit_code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    
    // args[0] is the command name itself.
    virtual CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) = 0;
    
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class UploadCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) override;
    std::string get_description() const override { return "Upload a file in resumable chunks"; }
    std::string get_usage() const override {
        return "uplink upload <file> [--mime TYPE] [--chunk-size BYTES] [--parallel N] [--owner ID] [--session ID]";
    }
};

class SessionsCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) override;
    std::string get_description() const override { return "List persisted upload sessions"; }
    std::string get_usage() const override { return "uplink sessions [--owner ID]"; }
};

class CancelCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) override;
    std::string get_description() const override { return "Cancel a session and delete its chunks"; }
    std::string get_usage() const override { return "uplink cancel <session-id>"; }
};

class SweepCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) override;
    std::string get_description() const override { return "Expire stale sessions and remove orphaned chunks"; }
    std::string get_usage() const override { return "uplink sweep"; }
};

class StatusCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) override;
    std::string get_description() const override { return "Report session counts and storage health"; }
    std::string get_usage() const override { return "uplink status"; }
};

class ConfigCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args, const CommandLineParser& options) override;
    std::string get_description() const override { return "Print the effective configuration"; }
    std::string get_usage() const override { return "uplink config"; }
};

}
