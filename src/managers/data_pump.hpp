#pragma once

#include <atomic>
#include <chrono>
#include <thread>
#include <core/utf8_decoder.hpp>
#include <ssh/ssh_client.hpp>
#include "channel_task.hpp"
#include "delivery_queue.hpp"
#include "stop_signal.hpp"

// Background reader for one shell channel.
//
// Each cycle reads until the channel is idle, decodes the bytes as UTF-8 and
// pushes every non-empty piece onto the queue, then sleeps poll_interval on
// the stop signal. Ends on stop, EOF or a read error; EOF and errors are
// reported through on_end after anything already read has been queued.
// The pump never closes the channel.
class DataPump {
public:
    DataPump(ShellChannel& channel, DeliveryQueue& queue,
             std::chrono::milliseconds poll_interval, ChannelEndCallback on_end);
    ~DataPump();

    void start();

    // After this returns no further chunk is pushed.
    void request_stop();
    void join();

    bool is_current_thread() const { return thread_.get_id() == std::this_thread::get_id(); }
    uint64_t chunks_pushed() const { return chunks_pushed_.load(); }

    DataPump(const DataPump&) = delete;
    DataPump& operator=(const DataPump&) = delete;

private:
    void pump_loop();
    void deliver(std::string text);

    ShellChannel& channel_;
    DeliveryQueue& queue_;
    std::chrono::milliseconds poll_interval_;
    ChannelEndCallback on_end_;
    Utf8Decoder decoder_;
    StopSignal stop_;
    std::atomic<uint64_t> chunks_pushed_{0};
    std::thread thread_;
};
