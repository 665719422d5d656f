#pragma once

#include "base_cli.hpp"
#include <string>

// Forward declarations for command registration
void register_connection_commands(BaseCLI& cli);
void register_shell_commands(BaseCLI& cli);
void register_transfer_commands(BaseCLI& cli);
void register_sessions_commands(BaseCLI& cli);

// Prompt without echo; used for passwords.
std::string read_password(const std::string& prompt);

class TetherCLI : public BaseCLI {
public:
    TetherCLI();

    // readline loop until quit or EOF
    void run_repl();

    // One-shot: connect to a saved session, then enter the REPL
    void run_saved(const std::string& name);

private:
    void register_all_commands();
};
