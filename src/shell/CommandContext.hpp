#pragma once
#include <ostream>
#include <string>
#include <vector>

class CommandContext {
public:
    CommandContext(const std::vector<std::string>& args, std::ostream& out)
        : args(args), out(out) {}

    const std::vector<std::string>& args; // arguments only, command name excluded
    std::ostream& out;
};
