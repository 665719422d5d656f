#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

fs::path expand_home(const std::string& p) {
    if (p == "~") return platform::home_dir();
    if (p.rfind("~/", 0) == 0) return platform::home_dir() / p.substr(2);
    return fs::path(p);
}

fs::path get_config_dir() {
    return platform::home_dir() / TETHER_HOME_DIR;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

bool config_exists() {
    return fs::exists(get_config_path());
}

Config::Config()
    : sessions_path_(get_config_dir() / SESSIONS_FILE_NAME),
      log_path_(platform::temp_dir() / DEBUG_LOG_FILE_NAME) {}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    fs::create_directories(config_path.parent_path());

    const char* default_config = R"(# tether configuration

# Used when a connection form leaves a field blank
defaults:
  port: 22
  timeout: 10                      # seconds, covers TCP connect + handshake + auth
  keepalive: true

shell:
  poll_interval_ms: 100            # output pump / display cadence
  keepalive_interval_secs: 30
  pty_type: "xterm"
  pty_cols: 80
  pty_rows: 24

transfer:
  chunk_size: 32768

# Optional overrides
# sessions_file: "~/.tether/sessions.yaml"
# log_file: "/tmp/tether_debug.log"
)";

    try {
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

Result<Config> Config::load() {
    return load_file(get_config_path());
}

Result<Config> Config::load_file(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config file: " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto result = parse(ss.str());
    if (result.is_err()) {
        return Result<Config>::Err(path.string() + ": " + result.error);
    }
    return result;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    Config config;

    try {
        YAML::Node root = YAML::Load(yaml_text);
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err("Config root must be a mapping");
        }

        if (auto d = root["defaults"]) {
            config.defaults_.port = d["port"].as<int>(DEFAULT_SSH_PORT);
            config.defaults_.timeout = d["timeout"].as<int>(DEFAULT_CONNECT_TIMEOUT_SECS);
            config.defaults_.keepalive = d["keepalive"].as<bool>(DEFAULT_KEEPALIVE);
        }

        if (auto s = root["shell"]) {
            auto& shell = config.shell_;
            shell.poll_interval_ms = s["poll_interval_ms"].as<int>(SHELL_POLL_INTERVAL_MS);
            shell.keepalive_interval_secs =
                s["keepalive_interval_secs"].as<int>(KEEPALIVE_INTERVAL_SECS);
            shell.keepalive_probe = s["keepalive_probe"].as<std::string>(KEEPALIVE_PROBE);
            shell.pty_type = s["pty_type"].as<std::string>(DEFAULT_PTY_TYPE);
            shell.pty_cols = s["pty_cols"].as<int>(DEFAULT_PTY_COLS);
            shell.pty_rows = s["pty_rows"].as<int>(DEFAULT_PTY_ROWS);
        }

        if (auto t = root["transfer"]) {
            config.transfer_.chunk_size = t["chunk_size"].as<int>(SFTP_CHUNK_SIZE);
        }

        if (root["sessions_file"] && root["sessions_file"].IsScalar()) {
            config.sessions_path_ = expand_home(root["sessions_file"].as<std::string>());
        }
        if (root["log_file"] && root["log_file"].IsScalar()) {
            config.log_path_ = expand_home(root["log_file"].as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(std::string("Invalid config: ") + e.what());
    }

    // Reject values the background tasks cannot run with
    if (config.defaults_.port < 1 || config.defaults_.port > 65535) {
        return Result<Config>::Err("defaults.port must be between 1 and 65535");
    }
    if (config.defaults_.timeout <= 0) {
        return Result<Config>::Err("defaults.timeout must be positive");
    }
    if (config.shell_.poll_interval_ms <= 0) {
        return Result<Config>::Err("shell.poll_interval_ms must be positive");
    }
    if (config.shell_.keepalive_interval_secs <= 0) {
        return Result<Config>::Err("shell.keepalive_interval_secs must be positive");
    }
    if (config.shell_.pty_cols <= 0 || config.shell_.pty_rows <= 0) {
        return Result<Config>::Err("shell.pty_cols and shell.pty_rows must be positive");
    }
    if (config.shell_.keepalive_probe.empty()) {
        return Result<Config>::Err("shell.keepalive_probe must not be empty");
    }
    if (config.transfer_.chunk_size <= 0) {
        return Result<Config>::Err("transfer.chunk_size must be positive");
    }

    return Result<Config>::Ok(config);
}
