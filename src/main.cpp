#include <iostream>
#include <vector>
#include <string>
#include "cli/tether_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::blue("    tether")
              << theme::dim("                  Enter the REPL") << "\n";
    std::cout << theme::blue("    tether connect ") << theme::brown("<name>")
              << theme::dim("   Connect to a saved session, then enter the REPL") << "\n";
    std::cout << "\n";
    std::cout << theme::dim("    tether --version        Show version\n"
                            "    tether --help           Show this help") << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc > 1) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::brown(theme::bold("tether"))
                          << theme::dim(" version " TETHER_VERSION) << "\n";
                return 0;
            } else if (cmd == "--help") {
                print_usage();
                return 0;
            } else if (cmd != "connect") {
                std::cout << theme::fail("Unknown command: " + cmd);
                print_usage();
                return 1;
            }
        }

        TetherCLI cli;

        if (argc == 1) {
            std::cout << theme::banner();
            cli.run_repl();
        } else {
            if (argc < 3) {
                std::cout << theme::fail("Missing session name.");
                std::cout << theme::step("Usage: tether connect <name>");
                return 1;
            }
            cli.run_saved(argv[2]);
        }

        return 0;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
