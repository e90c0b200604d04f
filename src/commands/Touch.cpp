#include "Builtins.hpp"
#include "../shell/CommandContext.hpp"

#include <fstream>

class Touch : public ICommand {
public:
    std::string help() const override {
        return R"(touch: create an empty file
Synopsis:
  touch <file>
Notes:
  An existing file is truncated.
Examples:
  touch a.txt
)";
    }
    Signal execute(CommandContext& ctx) override {
        if (ctx.args.empty()) { ctx.out << "Need to specify a filename\n"; return Signal::Continue; }
        const auto& filename = ctx.args[0];
        std::ofstream file(filename, std::ios::out | std::ios::trunc);
        if (file) ctx.out << "Created file: " << filename << "\n";
        else ctx.out << "Could not create file: " << filename << "\n";
        return Signal::Continue;
    }
};

namespace Builtins { std::unique_ptr<ICommand> make_touch(){ return std::make_unique<Touch>(); } }
