#include "libssh2_shell.hpp"
#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <fmt/format.h>

Libssh2Shell::Libssh2Shell(LIBSSH2_CHANNEL* ch, std::shared_ptr<Libssh2Transport> transport)
    : ch_(ch), transport_(std::move(transport)) {}

Libssh2Shell::~Libssh2Shell() {
    close();
}

ReadResult Libssh2Shell::read(char* buf, size_t len) {
    std::lock_guard<std::mutex> lock(transport_->io_mutex());
    if (!ch_ || !transport_->is_open()) {
        return ReadResult{IoStatus::Error, 0, "Connection is closed"};
    }
    ssize_t n = libssh2_channel_read(ch_, buf, len);
    if (n > 0) {
        return ReadResult{IoStatus::Data, static_cast<size_t>(n), ""};
    }
    if (n == LIBSSH2_ERROR_EAGAIN || n == 0) {
        if (libssh2_channel_eof(ch_)) {
            return ReadResult{IoStatus::Eof, 0, ""};
        }
        return ReadResult{IoStatus::Idle, 0, ""};
    }
    // Negative return other than EAGAIN = channel error
    return ReadResult{IoStatus::Error, 0, transport_->last_error_locked()};
}

Result<void> Libssh2Shell::write_all(const std::string& data) {
    size_t sent = 0;
    int write_retries = 0;
    while (sent < data.size()) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(transport_->io_mutex());
            if (!ch_ || !transport_->is_open()) {
                return Result<void>::Err("Connection is closed");
            }
            w = libssh2_channel_write(ch_, data.data() + sent, data.size() - sent);
            if (w < 0 && w != LIBSSH2_ERROR_EAGAIN) {
                return Result<void>::Err("Channel write failed: " + transport_->last_error_locked());
            }
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > SSH_WRITE_MAX_RETRIES) {
                return Result<void>::Err("Write stalled (EAGAIN for too long)");
            }
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
            continue;
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

void Libssh2Shell::close() {
    if (!ch_) return;
    std::lock_guard<std::mutex> lock(transport_->io_mutex());
    // Once the session is freed the channel went with it.
    if (transport_->is_open()) {
        libssh2_channel_close(ch_);
        libssh2_channel_free(ch_);
    }
    ch_ = nullptr;
    tether_log(fmt::format("shell: {} channel closed", transport_->target()));
}
