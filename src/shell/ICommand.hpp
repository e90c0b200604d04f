#pragma once
#include <string>

class CommandContext;

// Loop-control value returned by every command.
enum class Signal {
    Continue,
    Stop
};

class ICommand {
public:
    virtual ~ICommand() = default;
    // Returning Signal::Stop is the only way a command ends Shell::run().
    virtual Signal execute(CommandContext& context) = 0;
    virtual std::string help() const { return std::string(); }
};
