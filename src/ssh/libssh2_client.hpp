#pragma once

#include <core/config.hpp>
#include "ssh_client.hpp"

// SshClient over libssh2.
//
// Host keys are accepted without verification and without being recorded
// (trust on every use). The server's SHA-256 host key fingerprint is written
// to the debug log so it can be checked by hand.
class Libssh2Client : public SshClient {
public:
    Libssh2Client(const ShellSettings& shell, const TransferSettings& transfer);
    ~Libssh2Client() override = default;

    TransportResult connect(const ConnectionRequest& request) override;

private:
    ShellSettings shell_;
    TransferSettings transfer_;
};
