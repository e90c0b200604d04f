#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "commands/Builtins.hpp"
#include "shell/Shell.hpp"

static void print_usage(std::ostream& os, const char* argv0) {
    os << "Usage: " << argv0 << " [--verbose] [--log-level <level>]\n"
       << "  --verbose            log debug messages to stderr\n"
       << "  --log-level <level>  trace, debug, info, warn, error, critical or off (default: warn)\n"
       << "  --help               show this message\n";
}

int main(int argc, char** argv) {
    auto level = spdlog::level::warn;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--verbose") level = spdlog::level::debug;
        else if (a == "--log-level") {
            if (i + 1 >= argc) { std::cerr << "--log-level: missing value" << std::endl; return 2; }
            std::string name = argv[++i];
            level = spdlog::level::from_str(name);
            // from_str maps unknown names to off
            if (level == spdlog::level::off && name != "off") {
                std::cerr << "--log-level: unknown level: " << name << std::endl;
                return 2;
            }
        } else if (a == "--help") { print_usage(std::cout, argv[0]); return 0; }
        else {
            std::cerr << "unknown option: " << a << std::endl;
            print_usage(std::cerr, argv[0]);
            return 2;
        }
    }

    // stdout belongs to the interpreter, keep log lines on stderr.
    auto logger = spdlog::stderr_color_mt("cmdloop");
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);

    try {
        Shell shell(std::cin, std::cout);
        shell.add_command("help", Builtins::make_help(shell.registry()));
        shell.add_command("echo", Builtins::make_echo());
        shell.add_command("touch", Builtins::make_touch());
        shell.add_function("greet", [](std::ostream& out, const std::vector<std::string>&) {
            out << "hello!" << std::endl;
            return Signal::Continue;
        }, "greet: say hello\n");
        shell.add_command("quit", Builtins::make_quit());
        shell.run();
    } catch (const std::exception& e) {
        spdlog::error("cmdloop: {}", e.what());
        return 1;
    }
    return 0;
}
