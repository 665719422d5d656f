#pragma once

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

// Decoded shell output plus its arrival sequence number (1, 2, 3, ...).
struct OutputChunk {
    uint64_t seq;
    std::string text;
};

// Ordered hand-off between the data pump (producer) and the presentation
// layer (consumer). Unbounded; every chunk is drained exactly once, FIFO.
class DeliveryQueue {
public:
    // Append text; returns the sequence number it was given.
    uint64_t push(std::string text);

    // Remove and return everything queued, oldest first.
    std::vector<OutputChunk> drain();

    size_t size() const;
    bool empty() const { return size() == 0; }

    // Sequence number of the most recent push (0 before the first).
    uint64_t last_seq() const;

private:
    mutable std::mutex mutex_;
    std::deque<OutputChunk> chunks_;
    uint64_t next_seq_ = 1;
};
