#include "keepalive_beacon.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

KeepaliveBeacon::KeepaliveBeacon(ShellChannel& channel, std::chrono::milliseconds interval,
                                 std::string probe, ChannelEndCallback on_end)
    : channel_(channel), interval_(interval), probe_(std::move(probe)),
      on_end_(std::move(on_end)) {}

KeepaliveBeacon::~KeepaliveBeacon() {
    request_stop();
    join();
}

void KeepaliveBeacon::start() {
    if (thread_.joinable()) return;
    thread_ = std::thread(&KeepaliveBeacon::beacon_loop, this);
}

void KeepaliveBeacon::request_stop() {
    stop_.request_stop();
}

void KeepaliveBeacon::join() {
    if (thread_.joinable() && !is_current_thread()) {
        thread_.join();
    }
}

void KeepaliveBeacon::beacon_loop() {
    tether_log(fmt::format("keepalive: every {}ms", interval_.count()));
    while (!stop_.wait_for(interval_)) {
        Result<void> sent = Result<void>::Ok();
        bool ran = stop_.run_unless_stopped([&] { sent = channel_.write_all(probe_); });
        if (!ran) break;
        if (sent.is_err()) {
            tether_log("keepalive: probe failed: " + sent.error);
            if (on_end_) on_end_(ChannelEnd::Error, "keepalive failed: " + sent.error, stop_);
            return;
        }
        ++probes_sent_;
    }
    tether_log(fmt::format("keepalive: stopped after {} probes", probes_sent_.load()));
}
