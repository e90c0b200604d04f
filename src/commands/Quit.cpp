#include "Builtins.hpp"
#include "../shell/CommandContext.hpp"

class Quit : public ICommand {
public:
    std::string help() const override {
        return R"(quit: leave the command loop
Synopsis:
  quit
)";
    }
    Signal execute(CommandContext&) override { return Signal::Stop; }
};

namespace Builtins { std::unique_ptr<ICommand> make_quit(){ return std::make_unique<Quit>(); } }
