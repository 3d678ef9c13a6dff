#pragma once

#include "core/Logger.h"
#include "core/Types.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace ensemble {

using MidiEventFn = std::function<void(MidiChannel, const juce::MidiMessage&)>;

/// Something a timed unit emits while doing its work for a TimeRange.
struct WorkEvent {
    enum class Type { midi, control };

    Type type = Type::midi;
    MidiChannel channel = 0;
    juce::MidiMessage message;
    ControlValue value = 0.0;

    static WorkEvent midi(MidiChannel channel, const juce::MidiMessage& message)
    {
        WorkEvent e;
        e.type = Type::midi;
        e.channel = channel;
        e.message = message;
        return e;
    }

    static WorkEvent control(ControlValue value)
    {
        WorkEvent e;
        e.type = Type::control;
        e.value = value;
        return e;
    }
};

using WorkEventFn = std::function<void(const WorkEvent&)>;

/// An instrument, effect or controller. The base carries identity, named
/// control parameters and configuration; what the unit can actually do is
/// declared by also deriving from the capability interfaces below.
class Entity {
public:
    explicit Entity(const std::string& name)
        : name_(name)
    {
        EN_DEBUG("Entity created: name=%s", name_.c_str());
    }

    virtual ~Entity() = default;

    Entity(const Entity&) = delete;
    Entity& operator=(const Entity&) = delete;

    // --- Identity ---
    const std::string& getName() const { return name_; }
    Uid getUid() const { return uid_; }
    void setUid(Uid uid) { uid_ = uid; }

    // --- Controls (by index) ---
    virtual int getControlCount() const { return 0; }
    virtual std::string getControlName(ControlIndex index) const { (void)index; return ""; }
    virtual ControlValue getControl(ControlIndex index) const { (void)index; return 0.0; }
    virtual void setControl(ControlIndex index, ControlValue value) { (void)index; (void)value; }

    // --- Configuration ---
    virtual void configure(const Configuration& configuration) { (void)configuration; }

private:
    std::string name_;
    Uid uid_;
};

// --- Capabilities ---

class GeneratesAudio {
public:
    virtual ~GeneratesAudio() = default;

    /// Fill `frames` (pre-cleared to silence). Returns true if the output is
    /// audible.
    virtual bool generate(StereoSample* frames, int numFrames) = 0;
};

class TransformsAudio {
public:
    virtual ~TransformsAudio() = default;

    virtual void transform(StereoSample* frames, int numFrames) = 0;
};

class HandlesMidi {
public:
    virtual ~HandlesMidi() = default;

    virtual void handleMidiMessage(MidiChannel channel, const juce::MidiMessage& message,
                                   const MidiEventFn& emit) = 0;
};

/// Units that do timed work (sequencers, arpeggiators, LFO controllers).
class Controls {
public:
    virtual ~Controls() = default;

    virtual void updateTimeRange(const TimeRange& range) = 0;
    virtual void work(const WorkEventFn& emit) = 0;
};

/// Lock-guarded shared handle to an entity. The owning EntityActor's worker
/// is the only writer; everyone else may only peek.
class EntityHandle {
public:
    explicit EntityHandle(std::unique_ptr<Entity> entity)
        : uid_(entity ? entity->getUid() : Uid{}),
          entity_(std::move(entity)),
          generator_(dynamic_cast<GeneratesAudio*>(entity_.get())),
          transformer_(dynamic_cast<TransformsAudio*>(entity_.get())),
          midiHandler_(dynamic_cast<HandlesMidi*>(entity_.get())),
          controller_(dynamic_cast<Controls*>(entity_.get()))
    {
    }

    EntityHandle(const EntityHandle&) = delete;
    EntityHandle& operator=(const EntityHandle&) = delete;

    Uid getUid() const { return uid_; }
    bool isValid() const { return entity_ != nullptr; }

    bool generatesAudio() const { return generator_ != nullptr; }
    bool transformsAudio() const { return transformer_ != nullptr; }
    bool handlesMidi() const { return midiHandler_ != nullptr; }
    bool controls() const { return controller_ != nullptr; }

    /// Runs fn(const Entity&) under the entity lock. Never call from the
    /// generation path.
    template<typename Fn>
    auto peek(Fn&& fn) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(static_cast<const Entity&>(*entity_));
    }

private:
    friend class EntityActor;

    struct Access {
        Entity& entity;
        GeneratesAudio* generator;
        TransformsAudio* transformer;
        HandlesMidi* midiHandler;
        Controls* controller;
    };

    template<typename Fn>
    auto modify(Fn&& fn)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Access access{*entity_, generator_, transformer_, midiHandler_, controller_};
        return fn(access);
    }

    Uid uid_;
    mutable std::mutex mutex_;
    std::unique_ptr<Entity> entity_;
    GeneratesAudio* generator_;
    TransformsAudio* transformer_;
    HandlesMidi* midiHandler_;
    Controls* controller_;
};

} // namespace ensemble
