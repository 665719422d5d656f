#include "session_manager.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

SessionManager::SessionManager(SshClient& client, SessionRegistry& registry,
                               ShellSettings shell, SessionCallbacks callbacks)
    : registry_(registry),
      supervisor_(client, output_, std::move(shell), std::move(callbacks.on_state)),
      transfers_(std::move(callbacks.on_transfer), std::move(callbacks.on_progress)) {}

SessionManager::~SessionManager() {
    // An in-flight connect must finish before the supervisor goes away;
    // disconnect() makes it give up as soon as the handshake returns.
    supervisor_.disconnect();
    {
        std::lock_guard<std::mutex> lock(worker_mutex_);
        if (connect_worker_.joinable()) connect_worker_.join();
    }
    supervisor_.disconnect();
    transfers_.wait_all();
}

// ── Connect ─────────────────────────────────────────────────

ConnectOutcome SessionManager::connect(const ConnectionRequest& request,
                                       const std::string& saved_name) {
    auto result = supervisor_.connect(request);
    if (result.is_err()) {
        return result;
    }
    {
        std::lock_guard<std::mutex> lock(request_mutex_);
        last_request_ = request;
    }
    if (!saved_name.empty()) {
        stamp_last_connected(saved_name);
    }
    return result;
}

void SessionManager::stamp_last_connected(const std::string& saved_name) {
    auto saved = registry_.get(saved_name);
    if (!saved) {
        tether_log("sessions: '" + saved_name + "' vanished before last_connected update");
        return;
    }
    saved->last_connected = now_iso();
    auto stored = registry_.put(*saved);
    if (stored.is_err()) {
        tether_log("sessions: failed to record last_connected: " + stored.error);
    }
}

void SessionManager::connect_async(ConnectionRequest request, std::string saved_name,
                                   ConnectDone done) {
    std::lock_guard<std::mutex> lock(worker_mutex_);
    if (worker_busy_) {
        if (done) {
            done(ConnectOutcome::Err(ConnectErrorKind::AlreadyActive,
                                     "A connect attempt is already in progress"));
        }
        return;
    }
    if (connect_worker_.joinable()) connect_worker_.join();

    worker_busy_ = true;
    connect_worker_ = std::thread([this, request = std::move(request),
                                   saved_name = std::move(saved_name),
                                   done = std::move(done)]() {
        auto result = connect(request, saved_name);
        if (done) done(result);
        worker_busy_ = false;
    });
}

ResolveResult SessionManager::request_from_saved(const std::string& name,
                                                 const std::string& password) const {
    auto saved = registry_.get(name);
    if (!saved) {
        return ResolveResult::Err(ValidationErrorKind::MissingField,
                                  "No saved session named '" + name + "'");
    }
    return CredentialResolver::resolve(CredentialResolver::fields_for(*saved, password));
}

std::optional<ConnectionRequest> SessionManager::last_request() const {
    std::lock_guard<std::mutex> lock(request_mutex_);
    return last_request_;
}

// ── Session I/O ─────────────────────────────────────────────

void SessionManager::disconnect() {
    supervisor_.disconnect();
}

Result<void> SessionManager::send(const std::string& text) {
    return supervisor_.send(text);
}

// ── Transfers ───────────────────────────────────────────────

TransferJob SessionManager::upload(const fs::path& local, const std::string& remote) {
    return transfers_.upload(supervisor_.transport(), local, remote);
}

TransferJob SessionManager::download(const std::string& remote, const fs::path& local) {
    return transfers_.download(supervisor_.transport(), remote, local);
}

void SessionManager::wait_for_transfers() {
    transfers_.wait_all();
}
