#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <core/config.hpp>
#include <core/credential_resolver.hpp>
#include <ssh/ssh_client.hpp>
#include "connection_supervisor.hpp"
#include "delivery_queue.hpp"
#include "session_registry.hpp"
#include "transfer_orchestrator.hpp"

struct SessionCallbacks {
    StateCallback on_state;
    TransferEventCallback on_transfer;
    TransferProgressCallback on_progress;
};

// Everything a presentation layer needs: one supervised session, its output
// queue, transfers over its transport and the saved-session registry.
class SessionManager {
public:
    using ConnectDone = std::function<void(const ConnectOutcome&)>;

    SessionManager(SshClient& client, SessionRegistry& registry, ShellSettings shell,
                   SessionCallbacks callbacks = {});
    ~SessionManager();

    // Blocking connect. With a saved_name, a success stamps that saved
    // session's last_connected.
    ConnectOutcome connect(const ConnectionRequest& request, const std::string& saved_name = "");

    // Same on a worker thread; done runs there. Rejected with AlreadyActive
    // while an earlier connect_async is still working.
    void connect_async(ConnectionRequest request, std::string saved_name = "",
                       ConnectDone done = nullptr);

    // Validated request for a saved session plus a password (which may be
    // empty when the session has a key file).
    ResolveResult request_from_saved(const std::string& name,
                                     const std::string& password = "") const;

    void disconnect();
    Result<void> send(const std::string& text);

    // Jobs on the live transport. Without one they fail TransportLost.
    TransferJob upload(const fs::path& local, const std::string& remote);
    TransferJob download(const std::string& remote, const fs::path& local);
    void wait_for_transfers();
    size_t active_transfers() const { return transfers_.active_count(); }

    SessionState state() const { return supervisor_.state(); }
    DeliveryQueue& output() { return output_; }

    // Last request that connected; the basis for "save".
    std::optional<ConnectionRequest> last_request() const;

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

private:
    void stamp_last_connected(const std::string& saved_name);

    SessionRegistry& registry_;
    DeliveryQueue output_;
    ConnectionSupervisor supervisor_;
    TransferOrchestrator transfers_;

    mutable std::mutex request_mutex_;
    std::optional<ConnectionRequest> last_request_;

    std::mutex worker_mutex_;
    std::thread connect_worker_;
    std::atomic<bool> worker_busy_{false};
};
