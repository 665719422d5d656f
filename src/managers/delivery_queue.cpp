#include "delivery_queue.hpp"
#include <iterator>

uint64_t DeliveryQueue::push(std::string text) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t seq = next_seq_++;
    chunks_.push_back(OutputChunk{seq, std::move(text)});
    return seq;
}

std::vector<OutputChunk> DeliveryQueue::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OutputChunk> out(std::make_move_iterator(chunks_.begin()),
                                 std::make_move_iterator(chunks_.end()));
    chunks_.clear();
    return out;
}

size_t DeliveryQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

uint64_t DeliveryQueue::last_seq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_seq_ - 1;
}
