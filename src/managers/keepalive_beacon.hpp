#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <ssh/ssh_client.hpp>
#include "channel_task.hpp"
#include "stop_signal.hpp"

// Writes the probe on the shell channel every interval. The first failed
// write is reported through on_end and ends the beacon; it is not retried.
class KeepaliveBeacon {
public:
    KeepaliveBeacon(ShellChannel& channel, std::chrono::milliseconds interval,
                    std::string probe, ChannelEndCallback on_end);
    ~KeepaliveBeacon();

    void start();

    // Waits for a probe write in progress; none starts after this returns.
    void request_stop();
    void join();

    bool is_current_thread() const { return thread_.get_id() == std::this_thread::get_id(); }
    uint64_t probes_sent() const { return probes_sent_.load(); }

    KeepaliveBeacon(const KeepaliveBeacon&) = delete;
    KeepaliveBeacon& operator=(const KeepaliveBeacon&) = delete;

private:
    void beacon_loop();

    ShellChannel& channel_;
    std::chrono::milliseconds interval_;
    std::string probe_;
    ChannelEndCallback on_end_;
    StopSignal stop_;
    std::atomic<uint64_t> probes_sent_{0};
    std::thread thread_;
};
