#pragma once

#include <ssh/ssh_client.hpp>
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <deque>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// In-memory doubles for the SshClient capability. Every fake is thread-safe:
// the session layer drives them from its pump, beacon and transfer threads.

// Poll pred until it holds or timeout passes.
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// ── Shell ───────────────────────────────────────────────────

// Script for one remote shell; tests keep a shared_ptr to it while the
// session layer owns the channel.
class FakeShell {
public:
    void feed(const std::string& bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        incoming_.push_back(bytes);
    }
    void end_of_stream() {
        std::lock_guard<std::mutex> lock(mutex_);
        eof_ = true;
    }
    void fail_reads(const std::string& msg) {
        std::lock_guard<std::mutex> lock(mutex_);
        read_error_ = msg;
    }
    void fail_writes(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        write_fails_ = fail;
    }

    std::vector<std::string> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }
    size_t write_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_.size();
    }
    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    ReadResult read(char* buf, size_t len) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return {IoStatus::Error, 0, "channel closed"};
        if (!incoming_.empty()) {
            std::string& front = incoming_.front();
            size_t n = std::min(len, front.size());
            std::memcpy(buf, front.data(), n);
            if (n == front.size()) {
                incoming_.pop_front();
            } else {
                front.erase(0, n);
            }
            return {IoStatus::Data, n, ""};
        }
        if (eof_) return {IoStatus::Eof, 0, ""};
        if (read_error_) return {IoStatus::Error, 0, *read_error_};
        return {IoStatus::Idle, 0, ""};
    }

    Result<void> write_all(const std::string& data) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return Result<void>::Err("channel closed");
        if (write_fails_) return Result<void>::Err("broken pipe");
        writes_.push_back(data);
        return Result<void>::Ok();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

private:
    mutable std::mutex mutex_;
    std::deque<std::string> incoming_;
    bool eof_ = false;
    std::optional<std::string> read_error_;
    bool write_fails_ = false;
    std::vector<std::string> writes_;
    bool closed_ = false;
};

class FakeShellChannel : public ShellChannel {
public:
    explicit FakeShellChannel(std::shared_ptr<FakeShell> shell) : shell_(std::move(shell)) {}

    ReadResult read(char* buf, size_t len) override { return shell_->read(buf, len); }
    Result<void> write_all(const std::string& data) override { return shell_->write_all(data); }
    void close() override { shell_->close(); }

private:
    std::shared_ptr<FakeShell> shell_;
};

// ── Remote filesystem ───────────────────────────────────────

class FakeRemoteFs {
public:
    void add_file(const std::string& path, const std::string& content) {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[path] = content;
    }
    std::optional<std::string> file(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(path);
        if (it == files_.end()) return std::nullopt;
        return it->second;
    }
    void deny(const std::string& path) {
        std::lock_guard<std::mutex> lock(mutex_);
        denied_.insert(path);
    }

    // While held, put/get block before touching any file.
    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }
    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }
    size_t waiting() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return waiting_;
    }

    void wait_while_held() {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting_;
        cv_.wait(lock, [this] { return !held_; });
        --waiting_;
    }

    bool denied(const std::string& path) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return denied_.count(path) > 0;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<std::string, std::string> files_;
    std::set<std::string> denied_;
    bool held_ = false;
    size_t waiting_ = 0;
};

class FakeTransport;

class FakeFileTransferSession : public FileTransferSession {
public:
    FakeFileTransferSession(std::shared_ptr<FakeRemoteFs> fs, std::shared_ptr<FakeTransport> transport)
        : fs_(std::move(fs)), transport_(std::move(transport)) {}

    TransferOutcome put(const fs::path& local, const std::string& remote,
                        const ByteProgress& progress) override;
    TransferOutcome get(const std::string& remote, const fs::path& local,
                        const ByteProgress& progress) override;
    void close() override {}

private:
    std::shared_ptr<FakeRemoteFs> fs_;
    std::shared_ptr<FakeTransport> transport_;
};

// ── Transport / client ──────────────────────────────────────

class FakeTransport : public Transport, public std::enable_shared_from_this<FakeTransport> {
public:
    FakeTransport(std::shared_ptr<FakeShell> shell, std::shared_ptr<FakeRemoteFs> fs,
                  std::optional<ConnectErrorKind> shell_failure = std::nullopt)
        : shell_(std::move(shell)), fs_(std::move(fs)), shell_failure_(shell_failure) {}

    ShellResult open_shell(std::chrono::milliseconds budget) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            shell_budget_ = budget;
        }
        if (!is_open()) return ShellResult::Err(ConnectErrorKind::HostUnreachable, "transport closed");
        if (shell_failure_) return ShellResult::Err(*shell_failure_, "shell request refused");
        return ShellResult::Ok(std::make_unique<FakeShellChannel>(shell_));
    }

    FileTransferResult open_file_transfer() override {
        if (!is_open()) return FileTransferResult::Err(TransferErrorKind::TransportLost, "transport closed");
        return FileTransferResult::Ok(
            std::make_unique<FakeFileTransferSession>(fs_, shared_from_this()));
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return open_;
    }
    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = false;
    }

    // Time left for the shell request, or nullopt if it was never asked for
    std::optional<std::chrono::milliseconds> shell_budget() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return shell_budget_;
    }

private:
    std::shared_ptr<FakeShell> shell_;
    std::shared_ptr<FakeRemoteFs> fs_;
    std::optional<ConnectErrorKind> shell_failure_;
    mutable std::mutex mutex_;
    bool open_ = true;
    std::optional<std::chrono::milliseconds> shell_budget_;
};

inline TransferOutcome FakeFileTransferSession::put(const fs::path& local, const std::string& remote,
                                                    const ByteProgress& progress) {
    fs_->wait_while_held();
    if (!transport_->is_open()) {
        return TransferOutcome::Err(TransferErrorKind::TransportLost, "connection lost");
    }
    if (fs_->denied(remote)) {
        return TransferOutcome::Err(TransferErrorKind::PermissionDenied, "Permission denied: " + remote);
    }
    std::ifstream in(local, std::ios::binary);
    if (!in) return TransferOutcome::Err(TransferErrorKind::IOError, "Cannot read " + local.string());
    std::stringstream ss;
    ss << in.rdbuf();
    std::string content = ss.str();
    fs_->add_file(remote, content);
    if (progress) progress(content.size(), content.size());
    return TransferOutcome::Ok();
}

inline TransferOutcome FakeFileTransferSession::get(const std::string& remote, const fs::path& local,
                                                    const ByteProgress& progress) {
    fs_->wait_while_held();
    if (!transport_->is_open()) {
        return TransferOutcome::Err(TransferErrorKind::TransportLost, "connection lost");
    }
    if (fs_->denied(remote)) {
        return TransferOutcome::Err(TransferErrorKind::PermissionDenied, "Permission denied: " + remote);
    }
    auto content = fs_->file(remote);
    if (!content) return TransferOutcome::Err(TransferErrorKind::RemoteNotFound, "No such file: " + remote);
    std::ofstream out(local, std::ios::binary | std::ios::trunc);
    if (!out) return TransferOutcome::Err(TransferErrorKind::IOError, "Cannot write " + local.string());
    out << *content;
    if (progress) progress(content->size(), content->size());
    return TransferOutcome::Ok();
}

// Hands out a fresh FakeShell and FakeTransport per successful connect.
class FakeSshClient : public SshClient {
public:
    TransportResult connect(const ConnectionRequest& request) override {
        std::chrono::milliseconds delay;
        std::optional<ConnectErrorKind> failure;
        std::optional<ConnectErrorKind> shell_failure;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
            delay = delay_;
            failure = failure_;
            shell_failure = shell_failure_;
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (failure) return TransportResult::Err(*failure, "fake connect failure");

        auto shell = std::make_shared<FakeShell>();
        auto transport = std::make_shared<FakeTransport>(shell, fs_, shell_failure);
        std::lock_guard<std::mutex> lock(mutex_);
        last_shell_ = shell;
        last_transport_ = transport;
        return TransportResult::Ok(transport);
    }

    void fail_with(std::optional<ConnectErrorKind> kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        failure_ = kind;
    }
    void refuse_shell(std::optional<ConnectErrorKind> kind) {
        std::lock_guard<std::mutex> lock(mutex_);
        shell_failure_ = kind;
    }
    void set_delay(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = d;
    }

    std::shared_ptr<FakeShell> last_shell() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_shell_;
    }
    std::shared_ptr<FakeTransport> last_transport() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_transport_;
    }
    size_t connect_calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }
    std::shared_ptr<FakeRemoteFs> remote_fs() const { return fs_; }

private:
    mutable std::mutex mutex_;
    std::optional<ConnectErrorKind> failure_;
    std::optional<ConnectErrorKind> shell_failure_;
    std::chrono::milliseconds delay_{0};
    std::vector<ConnectionRequest> requests_;
    std::shared_ptr<FakeShell> last_shell_;
    std::shared_ptr<FakeTransport> last_transport_;
    std::shared_ptr<FakeRemoteFs> fs_ = std::make_shared<FakeRemoteFs>();
};

inline ConnectionRequest fake_request(bool keepalive = false) {
    ConnectionRequest req;
    req.host = "example.org";
    req.port = 22;
    req.username = "alice";
    req.auth = Credential{AuthMethod::Password, "secret"};
    req.timeout = std::chrono::seconds(5);
    req.keepalive_enabled = keepalive;
    return req;
}
