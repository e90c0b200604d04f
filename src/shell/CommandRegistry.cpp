#include "CommandRegistry.hpp"

#include <stdexcept>

bool CommandRegistry::add(const std::string& name, std::unique_ptr<ICommand> cmd) {
    if (name.empty()) throw std::invalid_argument("command name must not be empty");
    if (!cmd) throw std::invalid_argument("command '" + name + "' has no handler");
    return commands_.emplace(name, std::move(cmd)).second;
}

ICommand* CommandRegistry::find(const std::string& name) const {
    auto it = commands_.find(name);
    if (it == commands_.end()) return nullptr;
    return it->second.get();
}

bool CommandRegistry::contains(const std::string& name) const {
    return commands_.find(name) != commands_.end();
}

std::vector<std::string> CommandRegistry::list() const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (auto& kv : commands_) names.push_back(kv.first);
    return names;
}
