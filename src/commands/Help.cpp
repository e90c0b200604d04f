#include "Builtins.hpp"
#include "../shell/CommandContext.hpp"
#include "../shell/CommandRegistry.hpp"

class Help : public ICommand {
public:
    explicit Help(const CommandRegistry& registry) : registry_(registry) {}

    std::string help() const override {
        return R"(help: show help for commands
Synopsis:
  help [command]
Notes:
  With no arguments, lists available commands. With a command name,
  shows that command's usage.
Examples:
  help
  help touch
)";
    }
    Signal execute(CommandContext& ctx) override {
        if (ctx.args.empty()) {
            ctx.out << "Commands:\n";
            for (auto& n : registry_.list()) ctx.out << "  " << n << "\n";
            ctx.out << "Use 'help <cmd>' for details.\n";
            return Signal::Continue;
        }
        auto* cmd = registry_.find(ctx.args[0]);
        if (!cmd) { ctx.out << "help: unknown command: " << ctx.args[0] << "\n"; return Signal::Continue; }
        auto text = cmd->help();
        if (text.empty()) ctx.out << ctx.args[0] << ": no help available\n";
        else ctx.out << text;
        return Signal::Continue;
    }
private:
    const CommandRegistry& registry_;
};

namespace Builtins {
    std::unique_ptr<ICommand> make_help(const CommandRegistry& registry){ return std::make_unique<Help>(registry); }
}
