#pragma once
#include <memory>

#include "../shell/ICommand.hpp"

class CommandRegistry;

// Ready-made commands. Callers pick the names they register them under.
namespace Builtins {
    std::unique_ptr<ICommand> make_quit();
    // The registry must outlive the returned command.
    std::unique_ptr<ICommand> make_help(const CommandRegistry& registry);
    std::unique_ptr<ICommand> make_echo();
    std::unique_ptr<ICommand> make_touch();
}
