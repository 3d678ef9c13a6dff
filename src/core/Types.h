#pragma once

#include <juce_audio_basics/juce_audio_basics.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace ensemble {

// Hard protocol bound on every frame batch passed between actors.
constexpr int kMaxBatchFrames = 64;

template<typename Tag>
struct Id {
    std::size_t value = 0;

    bool isValid() const { return value != 0; }

    bool operator==(const Id& other) const { return value == other.value; }
    bool operator!=(const Id& other) const { return value != other.value; }
    bool operator<(const Id& other) const { return value < other.value; }
};

struct EntityIdTag;
struct TrackIdTag;

/// Identifies any addressable unit inside a track. 0 is never minted.
using Uid = Id<EntityIdTag>;
/// Identifies a track. 0 is never minted.
using TrackUid = Id<TrackIdTag>;

using Sample = float;

struct StereoSample {
    Sample left = 0.0f;
    Sample right = 0.0f;

    static constexpr StereoSample silence() { return {0.0f, 0.0f}; }

    bool isSilent() const { return left == 0.0f && right == 0.0f; }

    StereoSample& operator+=(const StereoSample& other)
    {
        left += other.left;
        right += other.right;
        return *this;
    }

    bool operator==(const StereoSample& other) const
    {
        return left == other.left && right == other.right;
    }
    bool operator!=(const StereoSample& other) const { return !(*this == other); }
};

static_assert(sizeof(StereoSample) == 2 * sizeof(Sample),
              "StereoSample must be two packed samples so batches can be treated as interleaved");

using FrameBatch = std::vector<StereoSample>;

/// Half-open interval [startBeats, endBeats) of musical time.
struct TimeRange {
    double startBeats = 0.0;
    double endBeats = 0.0;

    double lengthBeats() const { return endBeats - startBeats; }
    bool isEmpty() const { return endBeats <= startBeats; }
};

/// MIDI channel 0-15.
using MidiChannel = uint8_t;

using ControlIndex = int;
/// Normalized parameter value, 0.0-1.0.
using ControlValue = double;

struct ControlLink {
    Uid source;
    Uid target;
    ControlIndex index;

    bool operator==(const ControlLink& other) const
    {
        return source == other.source && target == other.target && index == other.index;
    }
};

/// Shared configurable state propagated top-down from the Engine.
struct Configuration {
    double sampleRate = 44100.0;
    double tempo = 120.0;
    juce::AudioPlayHead::TimeSignature timeSignature{4, 4};
};

} // namespace ensemble

namespace std {

template<typename Tag>
struct hash<ensemble::Id<Tag>> {
    size_t operator()(const ensemble::Id<Tag>& id) const noexcept
    {
        return hash<size_t>()(id.value);
    }
};

} // namespace std
