#include "Parser.hpp"

#include <cctype>
#include <iterator>
#include <utility>

namespace Parser {

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

std::string trim(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && is_space(s[i])) ++i;
    size_t j = s.size();
    while (j > i && is_space(s[j - 1])) --j;
    return s.substr(i, j - i);
}

static void push_token(std::vector<std::string>& out, std::string& cur) {
    if (!cur.empty()) {
        out.push_back(cur);
        cur.clear();
    }
}

ParsedLine tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::string cur;
    for (char c : line) {
        if (is_space(c)) { push_token(tokens, cur); continue; }
        cur.push_back(c);
    }
    push_token(tokens, cur);

    ParsedLine parsed;
    if (tokens.empty()) return parsed;
    parsed.command = std::move(tokens.front());
    parsed.args.assign(std::make_move_iterator(tokens.begin() + 1),
                       std::make_move_iterator(tokens.end()));
    return parsed;
}

}
