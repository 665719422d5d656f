#include "tether_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <core/config.hpp>
#include <platform/terminal.hpp>
#include <readline/readline.h>
#include <readline/history.h>

std::string read_password(const std::string& prompt) {
    std::cout << prompt;
    std::cout.flush();

    platform::RawModeGuard guard(platform::RawModeGuard::kNoEcho);

    std::string password;
    // Read character by character (no echo, no canonical)
    while (true) {
        if (!platform::poll_stdin(60000)) break;  // 60s timeout
        char c;
        if (platform::read_stdin(&c, 1) != 1) break;
        if (c == '\n' || c == '\r') break;
        if (c == 127 || c == 8) {  // backspace
            if (!password.empty()) password.pop_back();
            continue;
        }
        if (c >= 32) password += c;
    }

    std::cout << "\n";
    return password;
}

TetherCLI::TetherCLI() : BaseCLI() {
    register_all_commands();
}

void TetherCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "Show this help message");

    auto quit = [](BaseCLI& cli, const std::string&) {
        cli.print(theme::dim("    Disconnecting...") + "\n");
        cli.quit_requested = true;
    };
    add_command("quit", quit, "Disconnect and exit");
    add_command("exit", quit, "Disconnect and exit");

    add_command("clear", [](BaseCLI& cli, const std::string&) {
        cli.print("\033[2J\033[H");
    }, "Clear the screen");

    register_connection_commands(*this);
    register_shell_commands(*this);
    register_transfer_commands(*this);
    register_sessions_commands(*this);
}

void TetherCLI::run_saved(const std::string& name) {
    std::cout << theme::banner();
    execute_command("connect", name);
    run_repl();
}

void TetherCLI::run_repl() {
    if (!config_error.empty()) {
        std::cout << theme::fail("Config: " + config_error);
        std::cout << theme::step("Using built-in defaults.");
    } else if (!config_exists()) {
        auto created = create_default_config();
        if (created.is_err()) {
            std::cout << theme::fail("Could not write default config: " + created.error);
        }
    }

    std::cout << theme::kv("Config", get_config_path().string());
    std::cout << theme::kv("Sessions", store->path().string());
    std::cout << theme::divider();
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    // Cleanup
    session->disconnect();
    if (session->state().is(SessionPhase::Connecting)) {
        print(theme::dim("    Waiting for the connect attempt to give up...") + "\n");
    }
}
