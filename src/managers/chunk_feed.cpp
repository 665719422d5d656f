#include "chunk_feed.hpp"

ChunkFeed::ChunkFeed(DeliveryQueue& queue, Consumer consumer, std::chrono::milliseconds interval)
    : queue_(queue), consumer_(std::move(consumer)), interval_(interval) {}

ChunkFeed::~ChunkFeed() {
    stop();
}

void ChunkFeed::start() {
    if (thread_.joinable()) return;
    stop_.reset();
    thread_ = std::thread(&ChunkFeed::feed_loop, this);
}

void ChunkFeed::stop() {
    if (!thread_.joinable()) return;
    stop_.request_stop();
    thread_.join();
    deliver_pending();
}

void ChunkFeed::deliver_pending() {
    for (const auto& chunk : queue_.drain()) {
        if (consumer_) consumer_(chunk);
    }
}

void ChunkFeed::feed_loop() {
    do {
        deliver_pending();
    } while (!stop_.wait_for(interval_));
}
