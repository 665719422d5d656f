#pragma once

#include <chrono>
#include <functional>
#include <thread>
#include "delivery_queue.hpp"
#include "stop_signal.hpp"

// Consumer side of a DeliveryQueue: drains it every interval on a background
// thread and hands each chunk, in order, to the consumer callback.
class ChunkFeed {
public:
    using Consumer = std::function<void(const OutputChunk&)>;

    ChunkFeed(DeliveryQueue& queue, Consumer consumer, std::chrono::milliseconds interval);
    ~ChunkFeed();

    void start();

    // Stop the thread, then deliver whatever is still queued.
    void stop();

    bool running() const { return thread_.joinable(); }

    ChunkFeed(const ChunkFeed&) = delete;
    ChunkFeed& operator=(const ChunkFeed&) = delete;

private:
    void feed_loop();
    void deliver_pending();

    DeliveryQueue& queue_;
    Consumer consumer_;
    std::chrono::milliseconds interval_;
    StopSignal stop_;
    std::thread thread_;
};
