#pragma once

#include "core/Types.h"

#include <map>

namespace ensemble {

/// Gain/mute state for the tracks feeding an aggregating track. Levels are
/// normalized against the sum of every registered level, muted or not.
class Mixer {
public:
    static constexpr float kMinLevel = 0.0f;
    static constexpr float kMaxLevel = 1.0f;

    Mixer() = default;

    // --- Registration ---
    void addTrack(TrackUid uid);
    bool removeTrack(TrackUid uid);
    bool hasTrack(TrackUid uid) const;
    int getTrackCount() const;

    // --- Levels (clamped to [kMinLevel, kMaxLevel]) ---
    bool setLevel(TrackUid uid, float level);
    float getLevel(TrackUid uid) const;
    bool setMuted(TrackUid uid, bool muted);
    bool isMuted(TrackUid uid) const;
    float getRelativeLevel(TrackUid uid) const;

    /// dest[i] += source[i] * relativeLevel(uid). No-op for unknown, muted or
    /// minimum-level tracks.
    void mix(TrackUid uid, const StereoSample* source, StereoSample* dest, int numFrames) const;

private:
    struct Entry {
        float level = kMaxLevel;
        bool muted = false;
        float relativeLevel = 1.0f;
    };

    void recalc();

    std::map<TrackUid, Entry> tracks_;
};

} // namespace ensemble
