#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <unistd.h>
#include "cli/gencache_cli.hpp"
#include "cli/theme.hpp"
#include "core/constants.hpp"

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    gencache"
              << theme::color::RESET << theme::color::BROWN << " [-C dir] [command]"
              << theme::color::RESET << theme::color::DIM
              << "   Run in dir (default: current directory)" << theme::color::RESET << "\n";
    GencacheCLI(std::filesystem::current_path()).print_help();
    std::cout << theme::color::DIM
              << "    gencache --version    Show version\n"
              << "    gencache --help       Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    if (!isatty(STDOUT_FILENO)) theme::disable_colors();

    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        std::filesystem::path project_dir = std::filesystem::current_path();
        std::string cmd = "run";

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& a = args[i];
            if (a == "--version") {
                std::cout << theme::color::BROWN << theme::color::BOLD << "gencache"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << GENCACHE_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (a == "--help" || a == "-h") {
                print_usage();
                return 0;
            } else if (a == "-C") {
                if (i + 1 >= args.size()) {
                    std::cout << theme::fail("Missing directory after -C.");
                    return 1;
                }
                project_dir = std::filesystem::absolute(args[++i]);
            } else {
                cmd = a;
            }
        }

        GencacheCLI cli(project_dir);
        if (!cli.has_command(cmd)) {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }
        return cli.execute_command(cmd);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
