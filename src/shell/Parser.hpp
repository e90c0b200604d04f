#pragma once
#include <string>
#include <vector>

struct ParsedLine {
    std::string command;
    std::vector<std::string> args;
};

namespace Parser {
    // Strip leading and trailing whitespace.
    std::string trim(const std::string& s);

    // Split a line on runs of whitespace. The first token is the command, the
    // rest are its arguments. No quoting or escapes: a token is any maximal run
    // of non-whitespace characters. Blank input yields an empty command.
    ParsedLine tokenize(const std::string& line);
}
