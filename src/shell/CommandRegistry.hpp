#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ICommand.hpp"

class CommandRegistry {
public:
    // Inserts cmd under name. Returns false and keeps the existing command
    // when name is already taken; cmd is destroyed in that case.
    bool add(const std::string& name, std::unique_ptr<ICommand> cmd);
    ICommand* find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<std::string> list() const;
    size_t size() const { return commands_.size(); }
private:
    std::map<std::string, std::unique_ptr<ICommand>> commands_;
};
