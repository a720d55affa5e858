#pragma once

#include <string>
#include <vector>
#include "types.hpp"

// Program + argument list for one external invocation.
//
// Tool commands go through for_tool(), which is the only place the host
// flavour matters:
//   Posix:   sbt <args...>
//   Windows: cmd.exe /C sbt.bat <args...>
class CommandLine {
public:
    CommandLine() = default;
    explicit CommandLine(std::string program);

    // Build-tool invocation with the host-dependent prefix.
    static CommandLine for_tool(const std::string& tool, HostOs host);

    CommandLine& arg(std::string value);
    CommandLine& args(const std::vector<std::string>& values);

    // -Dkey=value system property, opaque to everything but the tool.
    CommandLine& property(const std::string& key, const std::string& value);

    const std::string& program() const { return program_; }
    const std::vector<std::string>& arguments() const { return args_; }
    bool empty() const { return program_.empty(); }

    // Shell-like rendering for logs and error messages (never executed).
    std::string to_string() const;

    bool operator==(const CommandLine& other) const {
        return program_ == other.program_ && args_ == other.args_;
    }

private:
    std::string program_;
    std::vector<std::string> args_;
};
