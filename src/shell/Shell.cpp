#include "Shell.hpp"

#include <spdlog/spdlog.h>

#include "Parser.hpp"
#include "ICommand.hpp"
#include "CommandContext.hpp"

namespace {

// Enables badbit exceptions on a stream and restores the previous mask.
class StreamExceptionGuard {
public:
    explicit StreamExceptionGuard(std::ios& stream)
        : stream_(stream), saved_(stream.exceptions()) {
        stream_.exceptions(saved_ | std::ios::badbit);
    }
    ~StreamExceptionGuard() {
        // exceptions() re-checks the state; skip the restore when it would throw.
        if ((stream_.rdstate() & saved_) == 0) stream_.exceptions(saved_);
    }
    StreamExceptionGuard(const StreamExceptionGuard&) = delete;
    StreamExceptionGuard& operator=(const StreamExceptionGuard&) = delete;
private:
    std::ios& stream_;
    std::ios::iostate saved_;
};

}

Shell::Shell(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

void Shell::add_command(const std::string& name, std::unique_ptr<ICommand> cmd) {
    if (registry_.add(name, std::move(cmd))) {
        spdlog::debug("registered command '{}'", name);
        return;
    }
    spdlog::warn("command '{}' is already registered, keeping the original", name);
    StreamExceptionGuard out_guard(out_);
    out_ << "Warning: Command with handle " << name << " already exists.";
}

void Shell::add_function(const std::string& name, FunctionCommand::Function fn,
                         const std::string& help) {
    add_command(name, std::make_unique<FunctionCommand>(std::move(fn), help));
}

void Shell::run() {
    StreamExceptionGuard in_guard(in_);
    StreamExceptionGuard out_guard(out_);

    std::string line;
    while (true) {
        out_ << kPrompt;
        out_.flush();
        if (!std::getline(in_, line)) {
            spdlog::debug("end of input, leaving command loop");
            return;
        }
        if (dispatch(line) == Signal::Stop) {
            spdlog::debug("command loop stopped");
            return;
        }
    }
}

Signal Shell::execute_line(const std::string& line) {
    StreamExceptionGuard out_guard(out_);
    return dispatch(line);
}

Signal Shell::dispatch(const std::string& raw_line) {
    auto line = Parser::trim(raw_line);
    if (line.empty()) return Signal::Continue;

    auto parsed = Parser::tokenize(line);
    auto* cmd = registry_.find(parsed.command);
    if (!cmd) {
        spdlog::debug("unknown command '{}'", parsed.command);
        out_ << "No command " << parsed.command << "\n";
        return Signal::Continue;
    }

    spdlog::debug("dispatching '{}' with {} argument(s)", parsed.command, parsed.args.size());
    CommandContext ctx(parsed.args, out_);
    return cmd->execute(ctx);
}
