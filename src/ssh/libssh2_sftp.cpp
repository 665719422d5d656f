#include "libssh2_sftp.hpp"
#include "libssh2_transport.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <libssh2.h>
#include <libssh2_sftp.h>
#include <fmt/format.h>
#include <chrono>
#include <fstream>
#include <vector>

using Clock = std::chrono::steady_clock;

namespace {

enum class Step { Done, Again };

// Drive one non-blocking libssh2 call to completion. `call` runs with the
// transport's io mutex held and reports Again while libssh2 says EAGAIN.
// Returns false when the transport closed or no progress was made within
// SFTP_STALL_TIMEOUT_SECS.
template <typename Call>
bool drive(Libssh2Transport& transport, Call call) {
    auto deadline = Clock::now() + std::chrono::seconds(SFTP_STALL_TIMEOUT_SECS);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(transport.io_mutex());
            if (!transport.is_open()) return false;
            if (call() == Step::Done) return true;
        }
        if (Clock::now() >= deadline) return false;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
}

bool would_block(LIBSSH2_SESSION* session) {
    return libssh2_session_last_errno(session) == LIBSSH2_ERROR_EAGAIN;
}

} // namespace

Libssh2Sftp::Libssh2Sftp(LIBSSH2_SFTP* sftp, std::shared_ptr<Libssh2Transport> transport,
                         size_t chunk_size)
    : sftp_(sftp), transport_(std::move(transport)),
      chunk_size_(chunk_size > 0 ? chunk_size : SFTP_CHUNK_SIZE) {}

Libssh2Sftp::~Libssh2Sftp() {
    close();
}

TransferOutcome Libssh2Sftp::transport_lost() const {
    return TransferOutcome::Err(TransferErrorKind::TransportLost,
                                "Connection to " + transport_->target() + " was lost");
}

TransferOutcome Libssh2Sftp::failure_locked(const std::string& what) const {
    int err = libssh2_session_last_errno(transport_->raw_session());
    if (err == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long code = libssh2_sftp_last_error(sftp_);
        switch (code) {
            case LIBSSH2_FX_NO_SUCH_FILE:
            case LIBSSH2_FX_NO_SUCH_PATH:
                return TransferOutcome::Err(TransferErrorKind::RemoteNotFound,
                                            what + ": no such file");
            case LIBSSH2_FX_PERMISSION_DENIED:
            case LIBSSH2_FX_WRITE_PROTECT:
                return TransferOutcome::Err(TransferErrorKind::PermissionDenied,
                                            what + ": permission denied");
            default:
                return TransferOutcome::Err(TransferErrorKind::IOError,
                                            fmt::format("{}: SFTP status {}", what, code));
        }
    }
    switch (err) {
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        case LIBSSH2_ERROR_CHANNEL_CLOSED:
        case LIBSSH2_ERROR_CHANNEL_EOF_SENT:
            return TransferOutcome::Err(TransferErrorKind::TransportLost,
                                        what + ": " + transport_->last_error_locked());
        default:
            return TransferOutcome::Err(TransferErrorKind::IOError,
                                        what + ": " + transport_->last_error_locked());
    }
}

void Libssh2Sftp::close_handle(LIBSSH2_SFTP_HANDLE* h) {
    if (!h) return;
    bool ok = drive(*transport_, [&] {
        return libssh2_sftp_close_handle(h) == LIBSSH2_ERROR_EAGAIN ? Step::Again : Step::Done;
    });
    if (!ok) tether_log("sftp: handle close abandoned (transport gone)");
}

TransferOutcome Libssh2Sftp::put(const fs::path& local, const std::string& remote,
                                 const ByteProgress& progress) {
    if (!sftp_) return transport_lost();

    std::ifstream in(local, std::ios::binary);
    if (!in) {
        return TransferOutcome::Err(TransferErrorKind::IOError,
                                    "Cannot read local file " + local.string());
    }
    std::error_code ec;
    uint64_t total = fs::file_size(local, ec);
    if (ec) total = 0;

    TransferOutcome failure = TransferOutcome::Ok();
    LIBSSH2_SFTP_HANDLE* h = nullptr;
    bool alive = drive(*transport_, [&] {
        h = libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned int>(remote.size()),
                                 LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                 0644, LIBSSH2_SFTP_OPENFILE);
        if (h) return Step::Done;
        if (would_block(transport_->raw_session())) return Step::Again;
        failure = failure_locked("open " + remote);
        return Step::Done;
    });
    if (!alive) return transport_lost();
    if (!h) return failure;

    std::vector<char> buf(chunk_size_);
    uint64_t done = 0;
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        auto n = static_cast<size_t>(in.gcount());
        if (n == 0) break;

        size_t off = 0;
        while (off < n) {
            ssize_t w = 0;
            alive = drive(*transport_, [&] {
                w = libssh2_sftp_write(h, buf.data() + off, n - off);
                if (w == LIBSSH2_ERROR_EAGAIN) return Step::Again;
                if (w < 0) failure = failure_locked("write " + remote);
                return Step::Done;
            });
            if (!alive) {
                close_handle(h);
                return transport_lost();
            }
            if (w < 0) {
                close_handle(h);
                return failure;
            }
            off += static_cast<size_t>(w);
            done += static_cast<uint64_t>(w);
            if (progress) progress(done, total);
        }
    }
    if (in.bad()) {
        close_handle(h);
        return TransferOutcome::Err(TransferErrorKind::IOError,
                                    "Read failed on local file " + local.string());
    }

    close_handle(h);
    tether_log(fmt::format("sftp: put {} -> {} ({} bytes)", local.string(), remote, done));
    return TransferOutcome::Ok();
}

TransferOutcome Libssh2Sftp::get(const std::string& remote, const fs::path& local,
                                 const ByteProgress& progress) {
    if (!sftp_) return transport_lost();

    TransferOutcome failure = TransferOutcome::Ok();
    LIBSSH2_SFTP_HANDLE* h = nullptr;
    bool alive = drive(*transport_, [&] {
        h = libssh2_sftp_open_ex(sftp_, remote.c_str(), static_cast<unsigned int>(remote.size()),
                                 LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
        if (h) return Step::Done;
        if (would_block(transport_->raw_session())) return Step::Again;
        failure = failure_locked("open " + remote);
        return Step::Done;
    });
    if (!alive) return transport_lost();
    if (!h) return failure;

    uint64_t total = 0;
    LIBSSH2_SFTP_ATTRIBUTES attrs{};
    int rc = 0;
    alive = drive(*transport_, [&] {
        rc = libssh2_sftp_fstat_ex(h, &attrs, 0);
        return rc == LIBSSH2_ERROR_EAGAIN ? Step::Again : Step::Done;
    });
    if (alive && rc == 0 && (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)) {
        total = attrs.filesize;
    }

    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) {
        close_handle(h);
        return TransferOutcome::Err(TransferErrorKind::IOError,
                                    "Cannot write local file " + local.string());
    }

    // A partial local file never survives a failed download.
    auto discard = [&](TransferOutcome why) {
        out.close();
        close_handle(h);
        std::error_code ec;
        fs::remove(local, ec);
        return why;
    };

    std::vector<char> buf(chunk_size_);
    uint64_t done = 0;
    while (true) {
        ssize_t n = 0;
        alive = drive(*transport_, [&] {
            n = libssh2_sftp_read(h, buf.data(), buf.size());
            if (n == LIBSSH2_ERROR_EAGAIN) return Step::Again;
            if (n < 0) failure = failure_locked("read " + remote);
            return Step::Done;
        });
        if (!alive) return discard(transport_lost());
        if (n < 0) return discard(failure);
        if (n == 0) break;

        out.write(buf.data(), n);
        if (!out) {
            return discard(TransferOutcome::Err(TransferErrorKind::IOError,
                                                "Write failed on local file " + local.string()));
        }
        done += static_cast<uint64_t>(n);
        if (progress) progress(done, total);
    }

    out.close();
    close_handle(h);
    if (!out) {
        std::error_code ec;
        fs::remove(local, ec);
        return TransferOutcome::Err(TransferErrorKind::IOError,
                                    "Failed to finish local file " + local.string());
    }
    tether_log(fmt::format("sftp: get {} -> {} ({} bytes)", remote, local.string(), done));
    return TransferOutcome::Ok();
}

void Libssh2Sftp::close() {
    if (!sftp_) return;
    LIBSSH2_SFTP* sftp = sftp_;
    sftp_ = nullptr;
    bool ok = drive(*transport_, [&] {
        return libssh2_sftp_shutdown(sftp) == LIBSSH2_ERROR_EAGAIN ? Step::Again : Step::Done;
    });
    if (!ok) tether_log("sftp: shutdown abandoned (transport gone)");
}
