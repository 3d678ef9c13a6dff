#pragma once

#include "core/EntityActor.h"
#include "core/Types.h"

#include <memory>
#include <vector>

namespace ensemble {

/// Ordered list of effect actors inside one track. Transformation runs in
/// list order, one effect at a time.
class EffectChain {
public:
    EffectChain();
    ~EffectChain();

    // Non-copyable, non-movable
    EffectChain(const EffectChain&) = delete;
    EffectChain& operator=(const EffectChain&) = delete;

    // --- Structural modification (track worker only) ---
    void append(std::unique_ptr<EntityActor> effect);
    std::unique_ptr<EntityActor> remove(int index);
    bool move(int fromIndex, int toIndex);
    void clear();

    // --- Query ---
    int size() const;
    bool empty() const;
    EntityActor* at(int index) const;
    EntityActor* findByUid(Uid uid) const;
    int indexOf(Uid uid) const;

    // Snapshot of the current order, used to seed one transformation pass.
    std::vector<Uid> getUids() const;

private:
    std::vector<std::unique_ptr<EntityActor>> effects_;
};

} // namespace ensemble
