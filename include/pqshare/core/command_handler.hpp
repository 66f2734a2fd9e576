#pragma once

#include <string>
#include <vector>

namespace pqshare::core {

struct CommandResult {
    bool success;
    std::string message;
    int exit_code;

    static CommandResult ok(const std::string& msg = "") {
        return {true, msg, 0};
    }

    static CommandResult error(const std::string& msg, int code = 1) {
        return {false, msg, code};
    }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;
    virtual CommandResult execute(const std::vector<std::string>& args) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class SendCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send a file to a listening peer"; }
    std::string get_usage() const override { return "pqshare send <file> <host> [port]"; }
};

class ReceiveCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Wait for one incoming file"; }
    std::string get_usage() const override { return "pqshare receive <output_dir> [port]"; }
};

class ResumeCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Resume a paused transfer"; }
    std::string get_usage() const override {
        return "pqshare resume <session_id> connect <host> [port] | pqshare resume <session_id> listen [port]";
    }
};

class ListCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "List transfers that can be resumed"; }
    std::string get_usage() const override { return "pqshare list"; }
};

class SelfTestCommandHandler : public CommandHandler {
public:
    CommandResult execute(const std::vector<std::string>& args) override;
    std::string get_description() const override { return "Send random data to in-memory recipients"; }
    std::string get_usage() const override { return "pqshare selftest [recipients] [bytes] [unreachable]"; }
};

}
