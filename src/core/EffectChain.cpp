#include "core/EffectChain.h"
#include "core/Logger.h"

namespace ensemble {

EffectChain::EffectChain()
{
    EN_DEBUG("EffectChain created");
}

EffectChain::~EffectChain()
{
    EN_DEBUG("EffectChain destroyed, size=%d", (int)effects_.size());
}

void EffectChain::append(std::unique_ptr<EntityActor> effect)
{
    if (!effect) {
        EN_WARN("EffectChain::append: null effect");
        return;
    }
    EN_DEBUG("EffectChain::append: uid=%zu, new size=%d",
             effect->getUid().value, (int)effects_.size() + 1);
    effects_.push_back(std::move(effect));
}

std::unique_ptr<EntityActor> EffectChain::remove(int index)
{
    if (index < 0 || index >= (int)effects_.size()) {
        EN_DEBUG("EffectChain::remove: index=%d out of range (size=%d)", index, (int)effects_.size());
        return nullptr;
    }

    auto effect = std::move(effects_[index]);
    effects_.erase(effects_.begin() + index);
    EN_DEBUG("EffectChain::remove: uid=%zu from index=%d, new size=%d",
             effect->getUid().value, index, (int)effects_.size());
    return effect;
}

bool EffectChain::move(int fromIndex, int toIndex)
{
    int sz = (int)effects_.size();
    if (fromIndex < 0 || fromIndex >= sz || toIndex < 0 || toIndex >= sz) {
        EN_DEBUG("EffectChain::move: out of range from=%d to=%d (size=%d)", fromIndex, toIndex, sz);
        return false;
    }
    if (fromIndex == toIndex)
        return true;

    EN_DEBUG("EffectChain::move: %d -> %d (uid=%zu)", fromIndex, toIndex,
             effects_[fromIndex]->getUid().value);

    auto effect = std::move(effects_[fromIndex]);
    effects_.erase(effects_.begin() + fromIndex);
    effects_.insert(effects_.begin() + toIndex, std::move(effect));
    return true;
}

void EffectChain::clear()
{
    EN_DEBUG("EffectChain::clear: destroying %d effects", (int)effects_.size());
    effects_.clear();
}

int EffectChain::size() const
{
    return (int)effects_.size();
}

bool EffectChain::empty() const
{
    return effects_.empty();
}

EntityActor* EffectChain::at(int index) const
{
    if (index < 0 || index >= (int)effects_.size())
        return nullptr;
    return effects_[index].get();
}

EntityActor* EffectChain::findByUid(Uid uid) const
{
    for (auto& effect : effects_) {
        if (effect->getUid() == uid)
            return effect.get();
    }
    return nullptr;
}

int EffectChain::indexOf(Uid uid) const
{
    for (int i = 0; i < (int)effects_.size(); ++i) {
        if (effects_[i]->getUid() == uid)
            return i;
    }
    return -1;
}

std::vector<Uid> EffectChain::getUids() const
{
    std::vector<Uid> uids;
    uids.reserve(effects_.size());
    for (auto& effect : effects_)
        uids.push_back(effect->getUid());
    return uids;
}

} // namespace ensemble
