#include "external_invoker.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

Result<void, GenError> ExternalInvoker::run(const Command& cmd) {
    int exit_code = execute(cmd);
    gen_log_command(cmd.label, cmd.line.to_string(), cmd.working_dir, exit_code);

    if (exit_code == 0) {
        return Result<void, GenError>::Ok();
    }

    GenError err;
    err.kind = ErrorKind::Command;
    err.label = cmd.label;
    err.command = cmd.line.to_string();
    err.working_dir = cmd.working_dir;
    err.exit_code = exit_code;
    err.message = cmd.failure_message.empty()
        ? fmt::format("Command '{}' failed.", cmd.label)
        : cmd.failure_message;
    return Result<void, GenError>::Err(err);
}

int ProcessInvoker::execute(const Command& cmd) {
    platform::SpawnOptions options;
    options.working_dir = cmd.working_dir;
    options.stderr_log = stderr_log_;

    auto handle = platform::spawn(cmd.line.program(), cmd.line.arguments(), options);
    if (!handle.valid()) {
        gen_log(fmt::format("{}: could not spawn {}", cmd.label, cmd.line.program()));
        return EXIT_SPAWN_FAILED;
    }
    return handle.wait();
}
