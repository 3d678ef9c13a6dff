#pragma once

#include "core/Channel.h"
#include "core/Logger.h"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace ensemble {

/// Fan-out registry of outbound channels. Subscribing is idempotent by
/// channel identity.
template<typename A>
class Subscription {
public:
    void subscribe(const Sender<A>& sender)
    {
        if (!sender.isValid())
            return;
        if (contains(sender))
            return;
        subscribers_.push_back(sender);
    }

    void unsubscribe(const Sender<A>& sender)
    {
        subscribers_.erase(
            std::remove_if(subscribers_.begin(), subscribers_.end(),
                           [&sender](const Sender<A>& s) { return s.sameChannel(sender); }),
            subscribers_.end());
    }

    bool contains(const Sender<A>& sender) const
    {
        return std::any_of(subscribers_.begin(), subscribers_.end(),
                           [&sender](const Sender<A>& s) { return s.sameChannel(sender); });
    }

    // Best-effort: failed sends are ignored.
    void broadcast(const A& action) const
    {
        for (auto& sender : subscribers_) {
            auto result = sender.trySend(action);
            if (result != SendResult::sent)
                EN_DEBUG("Subscription::broadcast: send failed (%s)", sendResultName(result));
        }
    }

    // Drops subscribers whose channel is closed. Returns the number pruned.
    int broadcastPruning(const A& action)
    {
        auto oldSize = subscribers_.size();
        subscribers_.erase(
            std::remove_if(subscribers_.begin(), subscribers_.end(),
                           [&action](const Sender<A>& s) {
                               auto result = s.trySend(action);
                               if (result == SendResult::full)
                                   EN_WARN("Subscription::broadcastPruning: subscriber full, action dropped");
                               return result == SendResult::closed;
                           }),
            subscribers_.end());
        int pruned = static_cast<int>(oldSize - subscribers_.size());
        if (pruned > 0)
            EN_DEBUG("Subscription::broadcastPruning: pruned %d closed subscriber(s)", pruned);
        return pruned;
    }

    std::size_t size() const { return subscribers_.size(); }
    bool empty() const { return subscribers_.empty(); }
    void clear() { subscribers_.clear(); }

private:
    std::vector<Sender<A>> subscribers_;
};

} // namespace ensemble
