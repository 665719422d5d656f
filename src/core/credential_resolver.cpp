#include "credential_resolver.hpp"
#include "utils.hpp"
#include <fstream>
#include <sstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

// Private key files larger than this are not keys.
static constexpr std::uintmax_t MAX_KEY_FILE_BYTES = 1024 * 1024;

ResolveResult CredentialResolver::resolve(const RawConnectionFields& fields) {
    std::string host = trimmed(fields.host);
    std::string port_str = trimmed(fields.port);
    std::string username = trimmed(fields.username);
    std::string key_file = trimmed(fields.key_file);

    if (host.empty() || port_str.empty() || username.empty()) {
        return ResolveResult::Err(ValidationErrorKind::MissingField,
                                  "Host, port and username are required");
    }

    auto port = parse_int(port_str);
    if (!port || *port < 1 || *port > 65535) {
        return ResolveResult::Err(ValidationErrorKind::InvalidPort,
                                  fmt::format("Port must be a number between 1 and 65535 (got '{}')",
                                              port_str));
    }

    auto timeout = parse_int(fields.timeout);
    if (!timeout || *timeout <= 0) {
        return ResolveResult::Err(ValidationErrorKind::InvalidTimeout,
                                  fmt::format("Timeout must be a positive number of seconds (got '{}')",
                                              trimmed(fields.timeout)));
    }

    if (fields.password.empty() && key_file.empty()) {
        return ResolveResult::Err(ValidationErrorKind::MissingCredential,
                                  "Provide a password or a private key file");
    }

    ConnectionRequest req;
    req.host = host;
    req.port = *port;
    req.username = username;
    req.timeout = std::chrono::seconds(*timeout);
    req.keepalive_enabled = fields.keepalive;

    if (!key_file.empty()) {
        auto key_check = check_private_key(key_file);
        if (key_check.is_err()) {
            return ResolveResult::Err(ValidationErrorKind::KeyFormat, key_check.error);
        }
        req.auth = Credential{AuthMethod::PrivateKey, key_file};
    } else {
        req.auth = Credential{AuthMethod::Password, fields.password};
    }

    return ResolveResult::Ok(std::move(req));
}

RawConnectionFields CredentialResolver::fields_for(const SavedSession& saved,
                                                   const std::string& password) {
    RawConnectionFields f;
    f.host = saved.host;
    f.port = std::to_string(saved.port);
    f.username = saved.username;
    f.password = password;
    f.key_file = saved.key_file;
    f.timeout = std::to_string(saved.timeout);
    f.keepalive = saved.keepalive;
    return f;
}

Result<void> CredentialResolver::check_private_key(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Result<void>::Err("Key file not found: " + path.string());
    }
    auto size = fs::file_size(path, ec);
    if (ec || size == 0 || size > MAX_KEY_FILE_BYTES) {
        return Result<void>::Err("Key file is empty or not a key: " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<void>::Err("Cannot read key file: " + path.string());
    }

    // Accept "-----BEGIN <anything> PRIVATE KEY-----" closed by the
    // matching "-----END <same> PRIVATE KEY-----" line.
    std::string line;
    std::string label;
    bool in_block = false;
    int body_lines = 0;
    while (std::getline(in, line)) {
        trim(line);
        if (!in_block) {
            const std::string begin = "-----BEGIN ";
            const std::string tail = "PRIVATE KEY-----";
            if (line.compare(0, begin.size(), begin) == 0 &&
                line.size() >= begin.size() + tail.size() &&
                line.compare(line.size() - tail.size(), tail.size(), tail) == 0) {
                label = line.substr(begin.size(), line.size() - begin.size() - 5);
                in_block = true;
            }
            continue;
        }
        if (line == "-----END " + label + "-----") {
            if (body_lines == 0) break;
            return Result<void>::Ok();
        }
        if (!line.empty()) ++body_lines;
    }

    return Result<void>::Err("Not a PEM/OpenSSH private key: " + path.string());
}
