#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include <ssh/ssh_client.hpp>
#include "channel_task.hpp"
#include "data_pump.hpp"
#include "delivery_queue.hpp"
#include "keepalive_beacon.hpp"

enum class SessionPhase {
    Disconnected,
    Connecting,
    Connected,
    Disconnecting,
    Failed,
};

const char* to_string(SessionPhase phase);

struct SessionState {
    SessionPhase phase = SessionPhase::Disconnected;
    std::string reason;                             // target, or why it ended
    std::optional<ConnectErrorKind> connect_error;  // set for Failed during connect

    bool is(SessionPhase p) const { return phase == p; }
};

// "Connected (u@h:22)", "Failed(Timeout): ..."
std::string describe(const SessionState& state);

using StateCallback = std::function<void(const SessionState&)>;
using ConnectOutcome = Outcome<void, ConnectErrorKind>;

// Owns the lifecycle of one SSH connection and its interactive shell.
//
//   Disconnected ─connect─▶ Connecting ─ok─▶ Connected ─▶ Disconnecting ─▶ Disconnected
//                                      └─err─▶ Failed(kind)            └─▶ Failed(reason)
//
// Transitions are serialized on one mutex and reported, in order, through the
// state callback, which runs with that mutex held and must not call back into
// the supervisor (state() is the exception). A pump or beacon that sees the
// channel die pushes the end into the supervisor, which tears down exactly as
// disconnect() does.
class ConnectionSupervisor {
public:
    ConnectionSupervisor(SshClient& client, DeliveryQueue& queue, ShellSettings settings,
                         StateCallback on_state = nullptr);
    ~ConnectionSupervisor();

    // Blocking: TCP, handshake, auth and shell, all bounded by request.timeout.
    // Rejected with AlreadyActive unless Disconnected or Failed.
    ConnectOutcome connect(const ConnectionRequest& request);

    // Stops pump and beacon, closes the channel, then the transport.
    // Idempotent. While Connecting, abandons the attempt.
    void disconnect();

    // Shell input; only while Connected. A failed write is a channel error.
    Result<void> send(const std::string& text);

    SessionState state() const;
    std::shared_ptr<Transport> transport() const;

    // Increments on every successful connect.
    uint64_t generation() const;

    ConnectionSupervisor(const ConnectionSupervisor&) = delete;
    ConnectionSupervisor& operator=(const ConnectionSupervisor&) = delete;

private:
    struct Handle {
        uint64_t generation = 0;
        std::shared_ptr<Transport> transport;
        std::unique_ptr<ShellChannel> channel;
        std::unique_ptr<DataPump> pump;
        std::unique_ptr<KeepaliveBeacon> beacon;
    };

    void set_state_locked(SessionState next);
    ConnectOutcome fail_connect_locked(ConnectErrorKind kind, const std::string& msg);
    void on_channel_end(uint64_t generation, ChannelEnd end, const std::string& reason,
                        StopSignal& reporter);
    void teardown_locked(SessionState final_state);
    void reap_retired_locked();

    SshClient& client_;
    DeliveryQueue& queue_;
    ShellSettings settings_;
    StateCallback on_state_;

    mutable std::mutex transition_mutex_;
    std::unique_ptr<Handle> handle_;
    uint64_t generation_ = 0;
    bool abort_requested_ = false;

    // Tasks that tore the session down from their own thread; joined later.
    std::vector<std::unique_ptr<DataPump>> retired_pumps_;
    std::vector<std::unique_ptr<KeepaliveBeacon>> retired_beacons_;

    mutable std::mutex state_mutex_;
    SessionState state_;
};
