#pragma once

#include "core/Types.h"

#include <atomic>
#include <vector>

namespace ensemble {

/// Lock-free single-producer single-consumer ring with a capacity fixed at
/// construction. tryPush fails instead of overwriting when full.
template<typename T>
class SPSCQueue {
    std::vector<T> buffer_;
    std::atomic<int> readPos_{0};
    std::atomic<int> writePos_{0};

    int slots() const { return (int)buffer_.size(); }
    int next(int pos) const { return (pos + 1) % slots(); }

public:
    explicit SPSCQueue(int capacity)
        : buffer_(static_cast<size_t>(capacity > 0 ? capacity : 1) + 1)
    {
    }

    SPSCQueue(const SPSCQueue&) = delete;
    SPSCQueue& operator=(const SPSCQueue&) = delete;

    bool tryPush(const T& item)
    {
        int write = writePos_.load(std::memory_order_relaxed);
        int nextWrite = next(write);
        if (nextWrite == readPos_.load(std::memory_order_acquire))
            return false;
        buffer_[write] = item;
        writePos_.store(nextWrite, std::memory_order_release);
        return true;
    }

    bool tryPop(T& item)
    {
        int read = readPos_.load(std::memory_order_relaxed);
        if (read == writePos_.load(std::memory_order_acquire))
            return false;
        item = buffer_[read];
        readPos_.store(next(read), std::memory_order_release);
        return true;
    }

    int size() const
    {
        int write = writePos_.load(std::memory_order_acquire);
        int read = readPos_.load(std::memory_order_acquire);
        int diff = write - read;
        return diff >= 0 ? diff : diff + slots();
    }

    int capacity() const { return slots() - 1; }
    bool empty() const { return size() == 0; }
    bool full() const { return size() == capacity(); }
};

/// The audio output boundary: the service pushes, the audio callback pops.
using AudioQueue = SPSCQueue<StereoSample>;

} // namespace ensemble
