#include "connection_supervisor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>

using Clock = std::chrono::steady_clock;

const char* to_string(SessionPhase phase) {
    switch (phase) {
    case SessionPhase::Disconnected:  return "Disconnected";
    case SessionPhase::Connecting:    return "Connecting";
    case SessionPhase::Connected:     return "Connected";
    case SessionPhase::Disconnecting: return "Disconnecting";
    case SessionPhase::Failed:        return "Failed";
    }
    return "?";
}

std::string describe(const SessionState& state) {
    std::string out = to_string(state.phase);
    if (state.connect_error) {
        out += fmt::format("({})", to_string(*state.connect_error));
    }
    if (!state.reason.empty()) {
        out += state.is(SessionPhase::Failed) ? ": " + state.reason
                                              : " (" + state.reason + ")";
    }
    return out;
}

// ── Construction / Destruction ──────────────────────────────

ConnectionSupervisor::ConnectionSupervisor(SshClient& client, DeliveryQueue& queue,
                                           ShellSettings settings, StateCallback on_state)
    : client_(client), queue_(queue), settings_(std::move(settings)),
      on_state_(std::move(on_state)) {}

ConnectionSupervisor::~ConnectionSupervisor() {
    disconnect();
    std::lock_guard<std::mutex> lock(transition_mutex_);
    reap_retired_locked();
}

// ── State ───────────────────────────────────────────────────

SessionState ConnectionSupervisor::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::shared_ptr<Transport> ConnectionSupervisor::transport() const {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    return handle_ ? handle_->transport : nullptr;
}

uint64_t ConnectionSupervisor::generation() const {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    return generation_;
}

void ConnectionSupervisor::set_state_locked(SessionState next) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = next;
    }
    tether_log("session: " + describe(next));
    if (on_state_) on_state_(next);
}

void ConnectionSupervisor::reap_retired_locked() {
    for (auto& pump : retired_pumps_) pump->join();
    for (auto& beacon : retired_beacons_) beacon->join();
    retired_pumps_.clear();
    retired_beacons_.clear();
}

// ── Connect ─────────────────────────────────────────────────

ConnectOutcome ConnectionSupervisor::fail_connect_locked(ConnectErrorKind kind,
                                                         const std::string& msg) {
    SessionState failed;
    failed.phase = SessionPhase::Failed;
    failed.reason = msg;
    failed.connect_error = kind;
    set_state_locked(failed);
    return ConnectOutcome::Err(kind, msg);
}

ConnectOutcome ConnectionSupervisor::connect(const ConnectionRequest& request) {
    {
        std::lock_guard<std::mutex> lock(transition_mutex_);
        reap_retired_locked();
        SessionPhase phase = state().phase;
        if (phase == SessionPhase::Connecting || phase == SessionPhase::Connected ||
            phase == SessionPhase::Disconnecting) {
            return ConnectOutcome::Err(ConnectErrorKind::AlreadyActive,
                                       fmt::format("Session is already {}", to_string(phase)));
        }
        abort_requested_ = false;
        set_state_locked(SessionState{SessionPhase::Connecting, request.target(), std::nullopt});
    }

    // Network work happens without the transition lock so disconnect() and
    // state() stay responsive.
    auto started = Clock::now();
    TransportResult transport = client_.connect(request);
    ShellResult shell = ShellResult::Err(ConnectErrorKind::Timeout, "");
    if (transport.is_ok()) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(request.timeout) - elapsed;
        if (remaining.count() <= 0) {
            shell = ShellResult::Err(ConnectErrorKind::Timeout,
                                     fmt::format("Timed out after {}s before the shell opened",
                                                 request.timeout.count()));
        } else {
            shell = transport.value->open_shell(remaining);
        }
    }

    std::lock_guard<std::mutex> lock(transition_mutex_);

    if (abort_requested_) {
        abort_requested_ = false;
        if (shell.is_ok()) shell.value->close();
        if (transport.is_ok()) transport.value->close();
        set_state_locked(SessionState{SessionPhase::Disconnected, "connect abandoned", std::nullopt});
        return ConnectOutcome::Err(ConnectErrorKind::Cancelled, "Connect abandoned by disconnect");
    }
    if (transport.is_err()) {
        return fail_connect_locked(transport.kind, transport.error);
    }
    if (shell.is_err()) {
        transport.value->close();
        return fail_connect_locked(shell.kind, shell.error);
    }

    auto handle = std::make_unique<Handle>();
    handle->generation = ++generation_;
    handle->transport = transport.value;
    handle->channel = std::move(shell.value);

    uint64_t gen = handle->generation;
    auto on_end = [this, gen](ChannelEnd end, const std::string& reason, StopSignal& reporter) {
        on_channel_end(gen, end, reason, reporter);
    };

    handle->pump = std::make_unique<DataPump>(*handle->channel, queue_,
                                              settings_.poll_interval(), on_end);
    if (request.keepalive_enabled) {
        handle->beacon = std::make_unique<KeepaliveBeacon>(*handle->channel,
                                                           settings_.keepalive_interval(),
                                                           settings_.keepalive_probe, on_end);
    }

    handle_ = std::move(handle);
    handle_->pump->start();
    if (handle_->beacon) handle_->beacon->start();

    set_state_locked(SessionState{SessionPhase::Connected, request.target(), std::nullopt});
    return ConnectOutcome::Ok();
}

// ── Disconnect / teardown ───────────────────────────────────

void ConnectionSupervisor::disconnect() {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    SessionPhase phase = state().phase;
    if (phase == SessionPhase::Connecting) {
        tether_log("session: disconnect requested while connecting");
        abort_requested_ = true;
        return;
    }
    if (handle_) {
        teardown_locked(SessionState{SessionPhase::Disconnected, "disconnected", std::nullopt});
    }
    reap_retired_locked();
}

void ConnectionSupervisor::teardown_locked(SessionState final_state) {
    std::unique_ptr<Handle> h = std::move(handle_);
    set_state_locked(SessionState{SessionPhase::Disconnecting, final_state.reason, std::nullopt});

    // Stop both first so neither can write while the other is joined.
    h->pump->request_stop();
    if (h->beacon) h->beacon->request_stop();

    if (h->pump->is_current_thread()) {
        retired_pumps_.push_back(std::move(h->pump));
    } else {
        h->pump->join();
    }
    if (h->beacon) {
        if (h->beacon->is_current_thread()) {
            retired_beacons_.push_back(std::move(h->beacon));
        } else {
            h->beacon->join();
        }
    }

    h->channel->close();
    h->transport->close();
    tether_log(fmt::format("session: generation {} torn down", h->generation));

    set_state_locked(final_state);
}

void ConnectionSupervisor::on_channel_end(uint64_t generation, ChannelEnd end,
                                          const std::string& reason, StopSignal& reporter) {
    // A teardown in progress holds the lock and is waiting for this task to
    // exit; it has already stopped us, so back off instead of blocking.
    std::unique_lock<std::mutex> lock(transition_mutex_, std::defer_lock);
    while (!lock.try_lock()) {
        if (reporter.stop_requested()) return;
        platform::sleep_ms(FAILURE_LOCK_RETRY_MS);
    }
    if (reporter.stop_requested()) return;
    if (!handle_ || handle_->generation != generation) return;

    if (end == ChannelEnd::RemoteClosed) {
        teardown_locked(SessionState{SessionPhase::Disconnected, reason, std::nullopt});
    } else {
        tether_log("session: channel error: " + reason);
        teardown_locked(SessionState{SessionPhase::Failed, reason, std::nullopt});
    }
}

// ── Input ───────────────────────────────────────────────────

Result<void> ConnectionSupervisor::send(const std::string& text) {
    std::lock_guard<std::mutex> lock(transition_mutex_);
    if (!handle_ || !state().is(SessionPhase::Connected)) {
        return Result<void>::Err("Not connected");
    }
    auto sent = handle_->channel->write_all(text);
    if (sent.is_err()) {
        tether_log("session: send failed: " + sent.error);
        teardown_locked(SessionState{SessionPhase::Failed, "send failed: " + sent.error,
                                     std::nullopt});
    }
    return sent;
}
