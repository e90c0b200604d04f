#include "Builtins.hpp"
#include "../shell/CommandContext.hpp"

class Echo : public ICommand {
public:
    std::string help() const override {
        return R"(echo: write arguments to the output
Synopsis:
  echo [args...]
Examples:
  echo hello world
)";
    }
    Signal execute(CommandContext& ctx) override {
        for (size_t i = 0; i < ctx.args.size(); ++i) {
            if (i > 0) ctx.out << ' ';
            ctx.out << ctx.args[i];
        }
        ctx.out << '\n';
        return Signal::Continue;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_echo(){ return std::make_unique<Echo>(); } }
