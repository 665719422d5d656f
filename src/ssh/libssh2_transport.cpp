#include "libssh2_transport.hpp"
#include "libssh2_shell.hpp"
#include "libssh2_sftp.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <cstring>

using Clock = std::chrono::steady_clock;

Libssh2Transport::Libssh2Transport(LIBSSH2_SESSION* session, socket_t sock,
                                   const ShellSettings& shell,
                                   const TransferSettings& transfer,
                                   std::string target)
    : session_(session), sock_(sock), shell_(shell), transfer_(transfer),
      target_(std::move(target)) {}

Libssh2Transport::~Libssh2Transport() {
    close();
}

std::string Libssh2Transport::last_error_locked() const {
    if (!session_) return "session closed";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : std::string("unknown error");
}

ShellResult Libssh2Transport::open_shell(std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    if (!is_open()) {
        return ShellResult::Err(ConnectErrorKind::HostUnreachable, "Connection is closed");
    }

    auto fail_channel = [&](LIBSSH2_CHANNEL* ch, ConnectErrorKind kind, const std::string& msg) {
        if (ch) {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (open_) libssh2_channel_free(ch);
        }
        tether_log(fmt::format("shell: {} failed: {}", target_, msg));
        return ShellResult::Err(kind, msg);
    };

    // Open channel
    LIBSSH2_CHANNEL* ch = nullptr;
    while (true) {
        int err;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (!open_) return fail_channel(nullptr, ConnectErrorKind::HostUnreachable,
                                            "Connection is closed");
            ch = libssh2_channel_open_session(session_);
            err = ch ? 0 : libssh2_session_last_errno(session_);
        }
        if (ch) break;
        if (err != LIBSSH2_ERROR_EAGAIN) {
            std::string msg;
            {
                std::lock_guard<std::mutex> lock(io_mutex_);
                msg = last_error_locked();
            }
            return fail_channel(nullptr, ConnectErrorKind::ShellUnavailable,
                                "Failed to open SSH channel: " + msg);
        }
        if (Clock::now() >= deadline) {
            return fail_channel(nullptr, ConnectErrorKind::Timeout,
                                "Timed out opening SSH channel");
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    // Request PTY
    int rc;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            rc = libssh2_channel_request_pty_ex(
                ch, shell_.pty_type.c_str(), static_cast<unsigned int>(shell_.pty_type.size()),
                nullptr, 0, shell_.pty_cols, shell_.pty_rows, 0, 0);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (Clock::now() >= deadline) {
            return fail_channel(ch, ConnectErrorKind::Timeout, "Timed out requesting PTY");
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        return fail_channel(ch, ConnectErrorKind::ShellUnavailable, "Server refused the PTY request");
    }

    // Request shell
    while (true) {
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            rc = libssh2_channel_shell(ch);
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (Clock::now() >= deadline) {
            return fail_channel(ch, ConnectErrorKind::Timeout, "Timed out requesting shell");
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        return fail_channel(ch, ConnectErrorKind::ShellUnavailable, "Server refused the shell request");
    }

    tether_log(fmt::format("shell: {} opened ({} {}x{})", target_, shell_.pty_type,
                           shell_.pty_cols, shell_.pty_rows));
    return ShellResult::Ok(std::make_unique<Libssh2Shell>(ch, shared_from_this()));
}

FileTransferResult Libssh2Transport::open_file_transfer() {
    auto deadline = Clock::now() + std::chrono::seconds(SFTP_STALL_TIMEOUT_SECS);
    LIBSSH2_SFTP* sftp = nullptr;
    while (true) {
        int err;
        std::string msg;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            if (!open_) {
                return FileTransferResult::Err(TransferErrorKind::TransportLost,
                                               "Connection is closed");
            }
            sftp = libssh2_sftp_init(session_);
            err = sftp ? 0 : libssh2_session_last_errno(session_);
            if (!sftp && err != LIBSSH2_ERROR_EAGAIN) msg = last_error_locked();
        }
        if (sftp) break;
        if (err == LIBSSH2_ERROR_EAGAIN) {
            if (Clock::now() >= deadline) {
                return FileTransferResult::Err(TransferErrorKind::TransportLost,
                                               "Timed out starting SFTP");
            }
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
            continue;
        }
        tether_log(fmt::format("sftp: {} init failed: {}", target_, msg));
        bool lost = err == LIBSSH2_ERROR_SOCKET_SEND || err == LIBSSH2_ERROR_SOCKET_RECV ||
                    err == LIBSSH2_ERROR_SOCKET_DISCONNECT;
        return FileTransferResult::Err(
            lost ? TransferErrorKind::TransportLost : TransferErrorKind::IOError,
            "Failed to start SFTP: " + msg);
    }
    return FileTransferResult::Ok(std::make_unique<Libssh2Sftp>(
        sftp, shared_from_this(), static_cast<size_t>(transfer_.chunk_size)));
}

void Libssh2Transport::close() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!open_.exchange(false)) return;
    if (session_) {
        libssh2_session_disconnect(session_, "Normal shutdown");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != TETHER_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = TETHER_INVALID_SOCKET;
    }
    tether_log(fmt::format("transport: {} closed", target_));
}
