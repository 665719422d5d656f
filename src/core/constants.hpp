#pragma once

// ── Connection defaults ─────────────────────────────────────
constexpr int DEFAULT_SSH_PORT            = 22;
constexpr int DEFAULT_CONNECT_TIMEOUT_SECS = 10;
constexpr bool DEFAULT_KEEPALIVE          = true;

// ── Shell pump / keepalive cadence ──────────────────────────
constexpr int SHELL_POLL_INTERVAL_MS      = 100;   // Data pump + chunk feed cadence
constexpr int KEEPALIVE_INTERVAL_SECS     = 30;    // Seconds between keepalive probes
constexpr const char* KEEPALIVE_PROBE     = " \n"; // Harmless at any shell prompt

// ── Libssh2 non-blocking loops ──────────────────────────────
constexpr int SSH_EAGAIN_SLEEP_MS         = 10;    // Backoff between EAGAIN retries
constexpr int SSH_WRITE_MAX_RETRIES       = 500;   // EAGAIN budget for a single write (~5s)
constexpr int FAILURE_LOCK_RETRY_MS       = 5;     // Background failure report lock retry

// ── PTY ─────────────────────────────────────────────────────
constexpr const char* DEFAULT_PTY_TYPE    = "xterm";
constexpr int DEFAULT_PTY_COLS            = 80;
constexpr int DEFAULT_PTY_ROWS            = 24;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE           = 4096;
constexpr int SFTP_CHUNK_SIZE             = 32768;
constexpr int SFTP_STALL_TIMEOUT_SECS     = 60;    // No SFTP progress for this long = lost

// ── Local files ─────────────────────────────────────────────
constexpr const char* TETHER_HOME_DIR     = ".tether";
constexpr const char* CONFIG_FILE_NAME    = "config.yaml";
constexpr const char* SESSIONS_FILE_NAME  = "sessions.yaml";
constexpr const char* DEBUG_LOG_FILE_NAME = "tether_debug.log";
