#pragma once

#include "core/Types.h"

#include <juce_audio_basics/juce_audio_basics.h>

namespace ensemble {

/// An entity produced or transformed a batch of audio.
struct AudioAction {
    enum class Kind { frames, transformed };

    Uid sourceUid;
    Kind kind = Kind::frames;
    FrameBatch frames;
};

/// A track completed a generation cycle.
struct TrackAudioAction {
    TrackUid trackUid;
    FrameBatch frames;
};

/// An entity emitted a MIDI message.
struct MidiAction {
    Uid sourceUid;
    MidiChannel channel = 0;
    juce::MidiMessage message;
};

/// An entity's control output changed.
struct ControlAction {
    Uid sourceUid;
    ControlValue value = 0.0;
};

inline const char* audioActionKindName(AudioAction::Kind kind)
{
    return kind == AudioAction::Kind::frames ? "frames" : "transformed";
}

} // namespace ensemble
