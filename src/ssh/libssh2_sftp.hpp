#pragma once

#include <memory>
#include <string>
#include "ssh_client.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SFTP LIBSSH2_SFTP;
typedef struct _LIBSSH2_SFTP_HANDLE LIBSSH2_SFTP_HANDLE;

class Libssh2Transport;

// One SFTP subsystem session on a shared transport. Closed (shut down) on
// destruction. Operations fail with TransportLost once the transport closes.
class Libssh2Sftp : public FileTransferSession {
public:
    Libssh2Sftp(LIBSSH2_SFTP* sftp, std::shared_ptr<Libssh2Transport> transport,
                size_t chunk_size);
    ~Libssh2Sftp() override;

    TransferOutcome put(const fs::path& local, const std::string& remote,
                        const ByteProgress& progress) override;
    TransferOutcome get(const std::string& remote, const fs::path& local,
                        const ByteProgress& progress) override;
    void close() override;

    Libssh2Sftp(const Libssh2Sftp&) = delete;
    Libssh2Sftp& operator=(const Libssh2Sftp&) = delete;

private:
    LIBSSH2_SFTP* sftp_;
    std::shared_ptr<Libssh2Transport> transport_;
    size_t chunk_size_;

    // Map the current libssh2/SFTP error to a transfer failure.
    // Caller holds the transport's io mutex.
    TransferOutcome failure_locked(const std::string& what) const;

    TransferOutcome transport_lost() const;
    void close_handle(LIBSSH2_SFTP_HANDLE* h);
};
