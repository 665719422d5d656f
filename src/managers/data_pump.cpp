#include "data_pump.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <vector>

DataPump::DataPump(ShellChannel& channel, DeliveryQueue& queue,
                   std::chrono::milliseconds poll_interval, ChannelEndCallback on_end)
    : channel_(channel), queue_(queue), poll_interval_(poll_interval),
      on_end_(std::move(on_end)) {}

DataPump::~DataPump() {
    request_stop();
    join();
}

// ── Lifecycle ───────────────────────────────────────────────

void DataPump::start() {
    if (thread_.joinable()) return;
    thread_ = std::thread(&DataPump::pump_loop, this);
}

void DataPump::request_stop() {
    stop_.request_stop();
}

void DataPump::join() {
    if (thread_.joinable() && !is_current_thread()) {
        thread_.join();
    }
}

// ── Pump loop ───────────────────────────────────────────────

void DataPump::deliver(std::string text) {
    if (text.empty()) return;
    bool pushed = stop_.run_unless_stopped([&] { queue_.push(std::move(text)); });
    if (pushed) ++chunks_pushed_;
}

void DataPump::pump_loop() {
    tether_log("pump: started");
    std::vector<char> buf(SSH_READ_BUF_SIZE);

    while (!stop_.stop_requested()) {
        while (!stop_.stop_requested()) {
            ReadResult r = channel_.read(buf.data(), buf.size());
            if (r.status == IoStatus::Data) {
                deliver(decoder_.feed(buf.data(), r.bytes));
                continue;
            }
            if (r.status == IoStatus::Idle) break;

            deliver(decoder_.flush());
            if (r.status == IoStatus::Eof) {
                tether_log("pump: remote closed the shell");
                if (on_end_) on_end_(ChannelEnd::RemoteClosed, "remote closed the shell", stop_);
            } else {
                tether_log("pump: read error: " + r.error);
                if (on_end_) on_end_(ChannelEnd::Error, "read failed: " + r.error, stop_);
            }
            return;
        }
        if (stop_.wait_for(poll_interval_)) break;
    }
    tether_log(fmt::format("pump: stopped after {} chunks", chunks_pushed_.load()));
}
