#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <core/command_line.hpp>

namespace fs = std::filesystem;

// One step of a generation job.
struct Command {
    std::string label;            // e.g. "sbt 0.13 (2)", names the step in failures
    CommandLine line;
    fs::path working_dir;         // absolute
    std::string failure_message;  // optional, defaults to "Command '<label>' failed."
};

// Runs external commands synchronously. Subclasses only provide execute();
// run() turns a non-zero exit into a structured CommandFailure.
class ExternalInvoker {
public:
    virtual ~ExternalInvoker() = default;

    Result<void, GenError> run(const Command& cmd);

protected:
    // Block until the command terminates; return its exit code.
    virtual int execute(const Command& cmd) = 0;
};

// Spawns real child processes through platform::spawn.
class ProcessInvoker : public ExternalInvoker {
public:
    ProcessInvoker() = default;

    // Append every child's stderr to this file instead of the terminal.
    explicit ProcessInvoker(std::string stderr_log) : stderr_log_(std::move(stderr_log)) {}

protected:
    int execute(const Command& cmd) override;

private:
    std::string stderr_log_;
};
