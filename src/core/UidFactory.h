#pragma once

#include "core/Types.h"

#include <atomic>
#include <cstddef>

namespace ensemble {

/// Mints monotonically increasing ids starting at 1. Injected into the Engine
/// and shared with whatever needs to mint, so that separate engines never
/// share a sequence.
template<typename IdType>
class UidFactory {
public:
    UidFactory() = default;
    explicit UidFactory(std::size_t firstValue) : next_(firstValue == 0 ? 1 : firstValue) {}

    UidFactory(const UidFactory&) = delete;
    UidFactory& operator=(const UidFactory&) = delete;

    IdType mintNext()
    {
        IdType id;
        id.value = next_.fetch_add(1, std::memory_order_relaxed);
        return id;
    }

private:
    std::atomic<std::size_t> next_{1};
};

using EntityUidFactory = UidFactory<Uid>;
using TrackUidFactory = UidFactory<TrackUid>;

} // namespace ensemble
