#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <core/config.hpp>
#include <platform/socket_util.hpp>
#include "ssh_client.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// One authenticated libssh2 session over one TCP socket.
//
// libssh2 sessions are not thread-safe: every call on the session, its shell
// channel or its SFTP sessions happens under io_mutex(), held only for the
// duration of a single libssh2 call. The session runs in non-blocking mode so
// no caller holds the mutex while waiting on the network.
class Libssh2Transport : public Transport,
                         public std::enable_shared_from_this<Libssh2Transport> {
public:
    Libssh2Transport(LIBSSH2_SESSION* session, socket_t sock,
                     const ShellSettings& shell, const TransferSettings& transfer,
                     std::string target);
    ~Libssh2Transport() override;

    ShellResult open_shell(std::chrono::milliseconds timeout) override;
    FileTransferResult open_file_transfer() override;
    bool is_open() const override { return open_.load(); }
    void close() override;

    // Raw session; only valid while io_mutex() is held and is_open() is true.
    LIBSSH2_SESSION* raw_session() const { return session_; }
    std::mutex& io_mutex() const { return io_mutex_; }
    const std::string& target() const { return target_; }

    // Text of the last libssh2 error. Caller holds io_mutex().
    std::string last_error_locked() const;

    Libssh2Transport(const Libssh2Transport&) = delete;
    Libssh2Transport& operator=(const Libssh2Transport&) = delete;

private:
    LIBSSH2_SESSION* session_;
    socket_t sock_;
    ShellSettings shell_;
    TransferSettings transfer_;
    std::string target_;
    std::atomic<bool> open_{true};
    mutable std::mutex io_mutex_;
};
