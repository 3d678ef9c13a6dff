#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace ensemble {

/// Counting wake signal shared by every inbound channel of one actor, so the
/// actor can block on all of them at once.
class Wakeup {
public:
    Wakeup() = default;

    Wakeup(const Wakeup&) = delete;
    Wakeup& operator=(const Wakeup&) = delete;

    void notify()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++pending_;
        cv_.notify_one();
    }

    // Blocks until at least one notify() since the last wait, then clears the count.
    void wait()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return pending_ > 0; });
        pending_ = 0;
    }

    // Returns false on timeout.
    bool waitUntil(std::chrono::steady_clock::time_point deadline)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_until(lock, deadline, [this] { return pending_ > 0; }))
            return false;
        pending_ = 0;
        return true;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int pending_ = 0;
};

enum class SendResult { sent, full, closed };

inline const char* sendResultName(SendResult result)
{
    switch (result) {
        case SendResult::sent:   return "sent";
        case SendResult::full:   return "full";
        case SendResult::closed: return "closed";
    }
    return "unknown";
}

template<typename T>
struct ChannelState {
    std::mutex mutex;
    std::deque<T> items;
    std::size_t capacity = 0; // 0 = unbounded
    bool closed = false;
    std::shared_ptr<Wakeup> wakeup;
};

/// Cloneable send side. Default-constructed senders are detached and report closed.
template<typename T>
class Sender {
public:
    Sender() = default;
    explicit Sender(std::shared_ptr<ChannelState<T>> state) : state_(std::move(state)) {}

    SendResult trySend(T item) const
    {
        if (!state_)
            return SendResult::closed;

        std::shared_ptr<Wakeup> wakeup;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->closed)
                return SendResult::closed;
            if (state_->capacity > 0 && state_->items.size() >= state_->capacity)
                return SendResult::full;
            state_->items.push_back(std::move(item));
            wakeup = state_->wakeup;
        }
        if (wakeup)
            wakeup->notify();
        return SendResult::sent;
    }

    bool sameChannel(const Sender& other) const { return state_ && state_ == other.state_; }

    bool isClosed() const
    {
        if (!state_)
            return true;
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->closed;
    }

    bool isValid() const { return state_ != nullptr; }

private:
    std::shared_ptr<ChannelState<T>> state_;
};

/// Single-consumer receive side. Closes the channel when destroyed.
template<typename T>
class Receiver {
public:
    Receiver() = default;
    explicit Receiver(std::shared_ptr<ChannelState<T>> state) : state_(std::move(state)) {}

    ~Receiver() { close(); }

    Receiver(Receiver&& other) noexcept = default;
    Receiver& operator=(Receiver&& other) noexcept
    {
        if (this != &other) {
            close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    Receiver(const Receiver&) = delete;
    Receiver& operator=(const Receiver&) = delete;

    bool tryRecv(T& out)
    {
        if (!state_)
            return false;
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->items.empty())
            return false;
        out = std::move(state_->items.front());
        state_->items.pop_front();
        return true;
    }

    // Blocking receive for single-channel consumers and tests. Returns false
    // on timeout or when the channel has no wakeup.
    bool recvFor(T& out, std::chrono::milliseconds timeout)
    {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (true) {
            if (tryRecv(out))
                return true;
            auto wakeup = getWakeup();
            if (!wakeup || !wakeup->waitUntil(deadline))
                return tryRecv(out);
        }
    }

    // Marks the channel closed and hands back whatever was never received.
    std::vector<T> closeAndDrain()
    {
        std::vector<T> leftovers;
        if (!state_)
            return leftovers;
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
        leftovers.reserve(state_->items.size());
        for (auto& item : state_->items)
            leftovers.push_back(std::move(item));
        state_->items.clear();
        return leftovers;
    }

    void close() { closeAndDrain(); }

    std::size_t size() const
    {
        if (!state_)
            return 0;
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->items.size();
    }

    Sender<T> makeSender() const { return Sender<T>(state_); }

    std::shared_ptr<Wakeup> getWakeup() const
    {
        if (!state_)
            return nullptr;
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->wakeup;
    }

private:
    std::shared_ptr<ChannelState<T>> state_;
};

template<typename T>
struct ChannelPair {
    Sender<T> sender;
    Receiver<T> receiver;
};

/// Creates a channel woken through `wakeup` (a fresh one if null).
/// capacity 0 means unbounded.
template<typename T>
ChannelPair<T> makeChannel(std::shared_ptr<Wakeup> wakeup = nullptr, std::size_t capacity = 0)
{
    auto state = std::make_shared<ChannelState<T>>();
    state->capacity = capacity;
    state->wakeup = wakeup ? std::move(wakeup) : std::make_shared<Wakeup>();
    ChannelPair<T> pair;
    pair.sender = Sender<T>(state);
    pair.receiver = Receiver<T>(state);
    return pair;
}

} // namespace ensemble
