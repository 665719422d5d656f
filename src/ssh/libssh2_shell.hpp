#pragma once

#include <memory>
#include <string>
#include "ssh_client.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

class Libssh2Transport;

// RAII handle for the interactive PTY shell channel.
// Owns the channel and closes+frees it on destruction. Keeps the transport
// alive; once the transport is closed every call reports an error.
class Libssh2Shell : public ShellChannel {
public:
    Libssh2Shell(LIBSSH2_CHANNEL* ch, std::shared_ptr<Libssh2Transport> transport);
    ~Libssh2Shell() override;

    ReadResult read(char* buf, size_t len) override;
    Result<void> write_all(const std::string& data) override;
    void close() override;

    // Non-copyable
    Libssh2Shell(const Libssh2Shell&) = delete;
    Libssh2Shell& operator=(const Libssh2Shell&) = delete;

private:
    LIBSSH2_CHANNEL* ch_;
    std::shared_ptr<Libssh2Transport> transport_;
};
