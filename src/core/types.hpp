#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <chrono>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Result that also carries a machine-readable error kind.
// Kind must be an enum; its value is meaningless when success is true.
template <typename T, typename Kind>
struct Outcome {
    bool success;
    T value;
    Kind kind;
    std::string error;

    static Outcome Ok(T val) {
        return {true, std::move(val), Kind{}, ""};
    }

    static Outcome Err(Kind k, const std::string& err) {
        return {false, T{}, k, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

template <typename Kind>
struct Outcome<void, Kind> {
    bool success;
    Kind kind;
    std::string error;

    static Outcome Ok() {
        return {true, Kind{}, ""};
    }

    static Outcome Err(Kind k, const std::string& err) {
        return {false, k, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Error taxonomy ──────────────────────────────────────────

// Bad user input, detected before any network activity.
enum class ValidationErrorKind {
    MissingField,
    InvalidPort,
    InvalidTimeout,
    MissingCredential,
    KeyFormat,
};

// Handshake / authentication phase.
enum class ConnectErrorKind {
    AuthFailed,
    Timeout,
    HostUnreachable,
    KeyError,
    ShellUnavailable,   // server refused the PTY or shell request
    AlreadyActive,      // another attempt is in flight or a session is up
    Cancelled,          // disconnect() was called while connecting
};

// Scoped to a single transfer job.
enum class TransferErrorKind {
    IOError,
    RemoteNotFound,
    PermissionDenied,
    TransportLost,
};

const char* to_string(ValidationErrorKind kind);
const char* to_string(ConnectErrorKind kind);
const char* to_string(TransferErrorKind kind);

// ── Connection parameters ───────────────────────────────────

enum class AuthMethod {
    Password,
    PrivateKey,
};

struct Credential {
    AuthMethod method = AuthMethod::Password;
    std::string secret;     // the password, or the private key path
};

// Validated, typed connection parameters (see CredentialResolver).
struct ConnectionRequest {
    std::string host;
    int port = 22;
    std::string username;
    Credential auth;
    std::chrono::seconds timeout{10};
    bool keepalive_enabled = true;

    // "user@host:port" for logs and status lines
    std::string target() const {
        return username + "@" + host + ":" + std::to_string(port);
    }
};

// A named connection profile. Never holds a password.
struct SavedSession {
    std::string name;
    std::string host;
    int port = 22;
    std::string username;
    std::string key_file;
    int timeout = 10;
    bool keepalive = true;
    std::optional<std::string> last_connected;     // ISO timestamp
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
