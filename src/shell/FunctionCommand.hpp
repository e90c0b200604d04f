#pragma once
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include "ICommand.hpp"
#include "CommandContext.hpp"

// Wraps a callable so lambdas and free functions can be registered as commands.
class FunctionCommand : public ICommand {
public:
    using Function = std::function<Signal(std::ostream&, const std::vector<std::string>&)>;

    explicit FunctionCommand(Function fn, std::string help_text = std::string())
        : fn_(std::move(fn)), help_(std::move(help_text)) {}

    Signal execute(CommandContext& ctx) override { return fn_(ctx.out, ctx.args); }
    std::string help() const override { return help_; }

private:
    Function fn_;
    std::string help_;
};
