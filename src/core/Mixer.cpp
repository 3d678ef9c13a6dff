#include "core/Mixer.h"
#include "core/Logger.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <algorithm>

namespace ensemble {

void Mixer::addTrack(TrackUid uid)
{
    if (tracks_.count(uid)) {
        EN_DEBUG("Mixer::addTrack: track %zu already registered", uid.value);
        return;
    }
    tracks_[uid] = Entry{};
    recalc();
    EN_DEBUG("Mixer::addTrack: track %zu, %d track(s)", uid.value, (int)tracks_.size());
}

bool Mixer::removeTrack(TrackUid uid)
{
    if (tracks_.erase(uid) == 0)
        return false;
    recalc();
    EN_DEBUG("Mixer::removeTrack: track %zu, %d track(s)", uid.value, (int)tracks_.size());
    return true;
}

bool Mixer::hasTrack(TrackUid uid) const
{
    return tracks_.count(uid) > 0;
}

int Mixer::getTrackCount() const
{
    return (int)tracks_.size();
}

bool Mixer::setLevel(TrackUid uid, float level)
{
    auto it = tracks_.find(uid);
    if (it == tracks_.end()) {
        EN_WARN("Mixer::setLevel: unknown track %zu", uid.value);
        return false;
    }
    it->second.level = std::clamp(level, kMinLevel, kMaxLevel);
    recalc();
    return true;
}

float Mixer::getLevel(TrackUid uid) const
{
    auto it = tracks_.find(uid);
    return it != tracks_.end() ? it->second.level : kMinLevel;
}

bool Mixer::setMuted(TrackUid uid, bool muted)
{
    auto it = tracks_.find(uid);
    if (it == tracks_.end()) {
        EN_WARN("Mixer::setMuted: unknown track %zu", uid.value);
        return false;
    }
    it->second.muted = muted;
    return true;
}

bool Mixer::isMuted(TrackUid uid) const
{
    auto it = tracks_.find(uid);
    return it != tracks_.end() && it->second.muted;
}

float Mixer::getRelativeLevel(TrackUid uid) const
{
    auto it = tracks_.find(uid);
    return it != tracks_.end() ? it->second.relativeLevel : 0.0f;
}

void Mixer::mix(TrackUid uid, const StereoSample* source, StereoSample* dest, int numFrames) const
{
    auto it = tracks_.find(uid);
    if (it == tracks_.end()) {
        EN_DEBUG("Mixer::mix: unknown track %zu", uid.value);
        return;
    }
    const auto& entry = it->second;
    if (entry.muted || entry.level <= kMinLevel || numFrames <= 0)
        return;

    juce::FloatVectorOperations::addWithMultiply(reinterpret_cast<float*>(dest),
                                                 reinterpret_cast<const float*>(source),
                                                 entry.relativeLevel, numFrames * 2);
}

// A zero total leaves every relative level stale; mix() is a no-op for all
// tracks in that case because every level is at the minimum.
void Mixer::recalc()
{
    float total = 0.0f;
    for (auto& [uid, entry] : tracks_)
        total += entry.level;

    if (total <= 0.0f)
        return;

    for (auto& [uid, entry] : tracks_)
        entry.relativeLevel = entry.level / total;
}

} // namespace ensemble
