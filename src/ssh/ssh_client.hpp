#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>

namespace fs = std::filesystem;

// The SSH client capability the session layer is built on. The production
// implementation is libssh2 (libssh2_client.hpp); tests substitute fakes.
//
//   SshClient::connect        handshake + auth → Transport
//   Transport::open_shell     interactive PTY shell → ShellChannel
//   Transport::open_file_transfer  SFTP subsystem → FileTransferSession

enum class IoStatus {
    Data,       // bytes were read
    Idle,       // nothing available right now
    Eof,        // remote closed the channel
    Error,
};

struct ReadResult {
    IoStatus status;
    size_t bytes;
    std::string error;
};

// Bidirectional byte stream of an interactive shell. Reads never block.
// Reads and writes may come from different threads; close() may not race
// with either (the owner stops its readers/writers first).
class ShellChannel {
public:
    virtual ~ShellChannel() = default;

    virtual ReadResult read(char* buf, size_t len) = 0;
    virtual Result<void> write_all(const std::string& data) = 0;
    virtual void close() = 0;
};

// bytes_done, bytes_total (0 when unknown)
using ByteProgress = std::function<void(uint64_t, uint64_t)>;

using TransferOutcome = Outcome<void, TransferErrorKind>;

// One SFTP subsystem session; each transfer job opens its own.
class FileTransferSession {
public:
    virtual ~FileTransferSession() = default;

    virtual TransferOutcome put(const fs::path& local, const std::string& remote,
                                const ByteProgress& progress) = 0;
    virtual TransferOutcome get(const std::string& remote, const fs::path& local,
                                const ByteProgress& progress) = 0;
    virtual void close() = 0;
};

using ShellResult = Outcome<std::unique_ptr<ShellChannel>, ConnectErrorKind>;
using FileTransferResult = Outcome<std::unique_ptr<FileTransferSession>, TransferErrorKind>;

// An authenticated connection. Shared between the supervisor and any running
// transfer jobs; after close() every open_* call and every operation on a
// secondary session fails with TransportLost.
class Transport {
public:
    virtual ~Transport() = default;

    virtual ShellResult open_shell(std::chrono::milliseconds timeout) = 0;
    virtual FileTransferResult open_file_transfer() = 0;
    virtual bool is_open() const = 0;
    virtual void close() = 0;
};

using TransportResult = Outcome<std::shared_ptr<Transport>, ConnectErrorKind>;

class SshClient {
public:
    virtual ~SshClient() = default;

    // TCP connect, handshake and authentication, bounded by request.timeout.
    // Host keys are accepted without verification.
    virtual TransportResult connect(const ConnectionRequest& request) = 0;
};
