#pragma once

#include "core/Entity.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <cmath>
#include <string>

namespace ensemble {

/// Fills every frame with a constant value. Control 0 is "value".
class ConstantGenerator : public Entity, public GeneratesAudio {
public:
    explicit ConstantGenerator(Sample value = 0.5f)
        : Entity("ConstantGenerator"), value_(value) {}

    bool generate(StereoSample* frames, int numFrames) override
    {
        for (int i = 0; i < numFrames; ++i)
            frames[i] = {value_, value_};
        return value_ != 0.0f;
    }

    int getControlCount() const override { return 1; }

    std::string getControlName(ControlIndex index) const override
    {
        return index == 0 ? "value" : "";
    }

    ControlValue getControl(ControlIndex index) const override
    {
        return index == 0 ? value_ : 0.0;
    }

    void setControl(ControlIndex index, ControlValue value) override
    {
        if (index == 0) value_ = static_cast<Sample>(value);
    }

private:
    Sample value_;
};

/// Negates every sample.
class Inverter : public Entity, public TransformsAudio {
public:
    Inverter() : Entity("Inverter") {}

    void transform(StereoSample* frames, int numFrames) override
    {
        for (int i = 0; i < numFrames; ++i)
            frames[i] = {-frames[i].left, -frames[i].right};
    }
};

/// Scales every sample by its "quiet factor" control.
class Quietener : public Entity, public TransformsAudio {
public:
    explicit Quietener(ControlValue quietFactor = 0.5)
        : Entity("Quietener"), quietFactor_(quietFactor) {}

    void transform(StereoSample* frames, int numFrames) override
    {
        auto factor = static_cast<Sample>(quietFactor_);
        for (int i = 0; i < numFrames; ++i)
            frames[i] = {frames[i].left * factor, frames[i].right * factor};
    }

    int getControlCount() const override { return 1; }
    std::string getControlName(ControlIndex index) const override { return index == 0 ? "quiet factor" : ""; }
    ControlValue getControl(ControlIndex index) const override { return index == 0 ? quietFactor_ : 0.0; }

    void setControl(ControlIndex index, ControlValue value) override
    {
        if (index == 0) quietFactor_ = juce::jlimit(0.0, 1.0, value);
    }

private:
    ControlValue quietFactor_;
};

/// Monophonic sine voice driven by note-on/note-off. Control 0 is "level".
class ToyInstrument : public Entity, public GeneratesAudio, public HandlesMidi {
public:
    ToyInstrument() : Entity("ToyInstrument") {}

    bool generate(StereoSample* frames, int numFrames) override
    {
        if (currentNote_ < 0)
            return false;

        double delta = juce::MathConstants<double>::twoPi * frequency_ / sampleRate_;
        for (int i = 0; i < numFrames; ++i) {
            auto s = static_cast<Sample>(std::sin(phase_) * velocity_ * level_);
            frames[i] = {s, s};
            phase_ += delta;
            if (phase_ >= juce::MathConstants<double>::twoPi)
                phase_ -= juce::MathConstants<double>::twoPi;
        }
        return true;
    }

    void handleMidiMessage(MidiChannel /*channel*/, const juce::MidiMessage& message,
                           const MidiEventFn& /*emit*/) override
    {
        if (message.isNoteOn()) {
            currentNote_ = message.getNoteNumber();
            frequency_ = juce::MidiMessage::getMidiNoteInHertz(currentNote_);
            velocity_ = message.getFloatVelocity();
        } else if (message.isNoteOff()) {
            if (message.getNoteNumber() == currentNote_)
                currentNote_ = -1;
        } else if (message.isAllNotesOff() || message.isAllSoundOff()) {
            currentNote_ = -1;
        }
    }

    void configure(const Configuration& configuration) override
    {
        sampleRate_ = configuration.sampleRate;
    }

    int getControlCount() const override { return 1; }
    std::string getControlName(ControlIndex index) const override { return index == 0 ? "level" : ""; }
    ControlValue getControl(ControlIndex index) const override { return index == 0 ? level_ : 0.0; }

    void setControl(ControlIndex index, ControlValue value) override
    {
        if (index == 0) level_ = juce::jlimit(0.0, 1.0, value);
    }

    int getCurrentNote() const { return currentNote_; }

private:
    double sampleRate_ = 44100.0;
    double phase_ = 0.0;
    double frequency_ = 440.0;
    float velocity_ = 0.0f;
    ControlValue level_ = 0.5;
    int currentNote_ = -1;
};

// Plays one note on every other beat, alternating between the base note and
// its fifth. An incoming note-on moves the base note.
class Arpeggiator : public Entity, public HandlesMidi, public Controls {
public:
    Arpeggiator() : Entity("Arpeggiator") {}

    void handleMidiMessage(MidiChannel /*channel*/, const juce::MidiMessage& message,
                           const MidiEventFn& /*emit*/) override
    {
        if (message.isNoteOn())
            baseNote_ = message.getNoteNumber();
    }

    void updateTimeRange(const TimeRange& range) override { range_ = range; }

    void work(const WorkEventFn& emit) override
    {
        auto latestBeat = static_cast<long>(std::floor(range_.endBeats));
        bool beatChanged = latestBeat > lastBeat_;
        if (!beatChanged)
            return;
        lastBeat_ = latestBeat;

        if (playing_) {
            emit(WorkEvent::midi(0, juce::MidiMessage::noteOff(1, noteWePlay_, (juce::uint8)127)));
            playing_ = false;
            playLowNote_ = !playLowNote_;
        } else {
            noteWePlay_ = juce::jlimit(0, 127, baseNote_ + (playLowNote_ ? 0 : 7));
            emit(WorkEvent::midi(0, juce::MidiMessage::noteOn(1, noteWePlay_, (juce::uint8)127)));
            playing_ = true;
        }
    }

    int getBaseNote() const { return baseNote_; }

private:
    TimeRange range_;
    long lastBeat_ = 0;
    bool playing_ = false;
    bool playLowNote_ = true;
    int baseNote_ = 60;
    int noteWePlay_ = 60;
};

/// Emits a slow sine as a control value. Generation only advances the
/// oscillator; the output stays silent.
class DroneController : public Entity, public GeneratesAudio, public Controls {
public:
    explicit DroneController(double frequencyHz = 1.0)
        : Entity("DroneController"), frequency_(frequencyHz) {}

    bool generate(StereoSample* /*frames*/, int numFrames) override
    {
        value_ = (std::sin(phase_) + 1.0) * 0.5;
        phase_ += juce::MathConstants<double>::twoPi * frequency_ * numFrames / sampleRate_;
        phase_ = std::fmod(phase_, juce::MathConstants<double>::twoPi);
        return false;
    }

    void configure(const Configuration& configuration) override
    {
        sampleRate_ = configuration.sampleRate;
    }

    void updateTimeRange(const TimeRange& range) override { range_ = range; }

    // Runs before the cycle's generate, so the value trails by one cycle.
    void work(const WorkEventFn& emit) override
    {
        if (value_ == lastValue_)
            return;
        emit(WorkEvent::control(value_));
        lastValue_ = value_;
    }

    ControlValue getValue() const { return value_; }

private:
    TimeRange range_;
    double sampleRate_ = 44100.0;
    double frequency_;
    double phase_ = juce::MathConstants<double>::halfPi;
    ControlValue value_ = 0.0;
    ControlValue lastValue_ = 0.0;
};

} // namespace ensemble
