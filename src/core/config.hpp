#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <chrono>
#include "types.hpp"
#include "constants.hpp"

namespace fs = std::filesystem;

// Values used when a form leaves a field blank.
struct ConnectionDefaults {
    int port = DEFAULT_SSH_PORT;
    int timeout = DEFAULT_CONNECT_TIMEOUT_SECS;
    bool keepalive = DEFAULT_KEEPALIVE;
};

// Interactive shell behavior: pump/feed cadence, keepalive, PTY.
struct ShellSettings {
    int poll_interval_ms = SHELL_POLL_INTERVAL_MS;
    int keepalive_interval_secs = KEEPALIVE_INTERVAL_SECS;
    std::string keepalive_probe = KEEPALIVE_PROBE;
    std::string pty_type = DEFAULT_PTY_TYPE;
    int pty_cols = DEFAULT_PTY_COLS;
    int pty_rows = DEFAULT_PTY_ROWS;

    std::chrono::milliseconds poll_interval() const {
        return std::chrono::milliseconds(poll_interval_ms);
    }
    std::chrono::milliseconds keepalive_interval() const {
        return std::chrono::seconds(keepalive_interval_secs);
    }
};

struct TransferSettings {
    int chunk_size = SFTP_CHUNK_SIZE;
};

class Config {
public:
    // Load ~/.tether/config.yaml; a missing file yields the defaults.
    static Result<Config> load();

    // Load a specific file; a missing file yields the defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and by tests).
    static Result<Config> parse(const std::string& yaml_text);

    const ConnectionDefaults& defaults() const { return defaults_; }
    const ShellSettings& shell() const { return shell_; }
    const TransferSettings& transfer() const { return transfer_; }
    const fs::path& sessions_path() const { return sessions_path_; }
    const fs::path& log_path() const { return log_path_; }

    Config();

private:
    ConnectionDefaults defaults_;
    ShellSettings shell_;
    TransferSettings transfer_;
    fs::path sessions_path_;
    fs::path log_path_;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

bool config_exists();

// "~/x" -> $HOME/x; anything else unchanged.
fs::path expand_home(const std::string& p);

// Write a commented default config (never overwrites an existing one)
Result<void> create_default_config();
