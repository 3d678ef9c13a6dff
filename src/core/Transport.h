#pragma once

#include "core/Logger.h"
#include "core/Types.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <cstdint>

namespace ensemble {

enum class TransportState { stopped, playing };

/// Musical clock that hands out one TimeRange per generation cycle.
/// Owned by the Engine; not thread-safe on its own.
class Transport {
public:
    Transport();

    // Advances by numFrames while playing and returns the covered range.
    // A stopped transport returns an empty range at the current position.
    TimeRange advance(int numFrames);

    // State control
    void play();
    void stop();
    void skipToStart();

    void setSampleRate(double sampleRate);
    void setTempo(double bpm);
    bool setTimeSignature(int numerator, int denominator);

    // Queries
    TransportState getState() const;
    bool isPlaying() const;

    double getSampleRate() const;
    double getTempo() const;
    juce::AudioPlayHead::TimeSignature getTimeSignature() const;

    int64_t getPositionInSamples() const;
    double getPositionInSeconds() const;
    double getPositionInBeats() const;

private:
    TransportState state_ = TransportState::stopped;
    double sampleRate_ = 44100.0;
    double tempo_ = 120.0;
    juce::AudioPlayHead::TimeSignature timeSignature_{4, 4};

    // Beats accumulate per cycle so tempo changes never move the playhead.
    int64_t positionInSamples_ = 0;
    double positionInBeats_ = 0.0;
};

} // namespace ensemble
