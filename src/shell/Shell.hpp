#pragma once
#include <istream>
#include <ostream>
#include <memory>
#include <string>

#include "CommandRegistry.hpp"
#include "FunctionCommand.hpp"

// Read-parse-dispatch loop. Owns its registry; borrows the streams, which
// must outlive the Shell and must not be shared with another Shell.
//
// I/O failures are thrown: while the Shell writes or reads, badbit
// exceptions are enabled on both streams, so an exception raised by a
// stream buffer escapes unchanged and a buffer that only reports failure
// surfaces as std::ios_base::failure.
class Shell {
public:
    static constexpr const char* kPrompt = "(cmd) ";

    Shell(std::istream& in, std::ostream& out);

    // Register cmd under name. A taken name keeps its original command and a
    // warning is written to the output stream.
    void add_command(const std::string& name, std::unique_ptr<ICommand> cmd);
    void add_function(const std::string& name, FunctionCommand::Function fn,
                      const std::string& help = std::string());

    // Prompt, read and dispatch until a command returns Signal::Stop or the
    // input is exhausted.
    void run();

    // Dispatch a single line without prompting.
    Signal execute_line(const std::string& line);

    const CommandRegistry& registry() const { return registry_; }

private:
    std::istream& in_;
    std::ostream& out_;
    CommandRegistry registry_;

    Signal dispatch(const std::string& line);
};
