#include "command_line.hpp"
#include <fmt/format.h>

CommandLine::CommandLine(std::string program) : program_(std::move(program)) {}

CommandLine CommandLine::for_tool(const std::string& tool, HostOs host) {
    if (host == HostOs::Windows) {
        CommandLine cmd("cmd.exe");
        cmd.arg("/C").arg(tool + ".bat");
        return cmd;
    }
    return CommandLine(tool);
}

CommandLine& CommandLine::arg(std::string value) {
    args_.push_back(std::move(value));
    return *this;
}

CommandLine& CommandLine::args(const std::vector<std::string>& values) {
    args_.insert(args_.end(), values.begin(), values.end());
    return *this;
}

CommandLine& CommandLine::property(const std::string& key, const std::string& value) {
    args_.push_back(fmt::format("-D{}={}", key, value));
    return *this;
}

static std::string quote_if_needed(const std::string& s) {
    if (s.empty()) return "''";
    if (s.find_first_of(" \t\"'\\$") == std::string::npos) return s;
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

std::string CommandLine::to_string() const {
    std::string out = quote_if_needed(program_);
    for (const auto& a : args_) {
        out += ' ';
        out += quote_if_needed(a);
    }
    return out;
}
