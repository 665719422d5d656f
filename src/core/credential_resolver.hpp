#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

// Untyped connection fields as a form, a REPL command or a saved
// session supplies them.
struct RawConnectionFields {
    std::string host;
    std::string port;
    std::string username;
    std::string password;
    std::string key_file;
    std::string timeout;
    bool keepalive = true;
};

using ResolveResult = Outcome<ConnectionRequest, ValidationErrorKind>;

// Validates raw fields into a ConnectionRequest without touching the network.
//
// A key file, when given, wins over a password and must contain a PEM or
// OpenSSH private key block; anything else is KeyFormat.
class CredentialResolver {
public:
    static ResolveResult resolve(const RawConnectionFields& fields);

    // Fields for a saved profile; the password is never stored, so the
    // caller supplies it (may be empty when the profile uses a key file).
    static RawConnectionFields fields_for(const SavedSession& saved,
                                          const std::string& password = "");

    // Ok when the file holds something that looks like a private key.
    static Result<void> check_private_key(const std::filesystem::path& path);
};
