#pragma once

#include "core/Actions.h"
#include "core/Channel.h"
#include "core/Entity.h"
#include "core/Types.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <memory>

namespace ensemble {

/// Where an entity sits inside a track.
enum class EntityRole { source, effect };

inline const char* entityRoleName(EntityRole role)
{
    return role == EntityRole::source ? "source" : "effect";
}

struct TrackRequest {
    enum class Type {
        subscribeAudio,
        unsubscribeAudio,
        subscribeMidi,
        unsubscribeMidi,
        midi,
        advanceTime,
        needsAudio,
        addSend,
        removeSend,
        addEntity,
        removeEntity,
        linkControl,
        unlinkControl,
        moveEffect,
        setControl,
        setMixerLevel,
        setMixerMuted,
        configure,
        quit
    };

    Type type = Type::quit;

    Sender<TrackAudioAction> audioSender;
    Sender<MidiAction> midiSender;
    MidiChannel channel = 0;
    juce::MidiMessage message;
    TimeRange timeRange;
    int numFrames = 0;
    TrackUid sendUid;
    Sender<TrackRequest> sendSender;
    std::shared_ptr<EntityHandle> entity;
    EntityRole role = EntityRole::source;
    Uid entityUid;
    ControlLink link{};
    int index = 0;
    ControlValue controlValue = 0.0;
    float level = 0.0f;
    bool muted = false;
    Configuration configuration;

    static TrackRequest subscribeAudio(const Sender<TrackAudioAction>& s) { TrackRequest r; r.type = Type::subscribeAudio; r.audioSender = s; return r; }
    static TrackRequest unsubscribeAudio(const Sender<TrackAudioAction>& s) { TrackRequest r; r.type = Type::unsubscribeAudio; r.audioSender = s; return r; }
    static TrackRequest subscribeMidi(const Sender<MidiAction>& s) { TrackRequest r; r.type = Type::subscribeMidi; r.midiSender = s; return r; }
    static TrackRequest unsubscribeMidi(const Sender<MidiAction>& s) { TrackRequest r; r.type = Type::unsubscribeMidi; r.midiSender = s; return r; }

    static TrackRequest midi(MidiChannel channel, const juce::MidiMessage& message)
    {
        TrackRequest r;
        r.type = Type::midi;
        r.channel = channel;
        r.message = message;
        return r;
    }

    static TrackRequest advanceTime(const TimeRange& range)
    {
        TrackRequest r;
        r.type = Type::advanceTime;
        r.timeRange = range;
        return r;
    }

    static TrackRequest needsAudio(int numFrames)
    {
        TrackRequest r;
        r.type = Type::needsAudio;
        r.numFrames = numFrames;
        return r;
    }

    static TrackRequest addSend(TrackUid uid, const Sender<TrackRequest>& sender)
    {
        TrackRequest r;
        r.type = Type::addSend;
        r.sendUid = uid;
        r.sendSender = sender;
        return r;
    }

    static TrackRequest removeSend(TrackUid uid)
    {
        TrackRequest r;
        r.type = Type::removeSend;
        r.sendUid = uid;
        return r;
    }

    static TrackRequest addEntity(std::shared_ptr<EntityHandle> handle, EntityRole role)
    {
        TrackRequest r;
        r.type = Type::addEntity;
        r.entity = std::move(handle);
        r.role = role;
        return r;
    }

    static TrackRequest removeEntity(Uid uid)
    {
        TrackRequest r;
        r.type = Type::removeEntity;
        r.entityUid = uid;
        return r;
    }

    static TrackRequest linkControl(const ControlLink& link)
    {
        TrackRequest r;
        r.type = Type::linkControl;
        r.link = link;
        return r;
    }

    static TrackRequest unlinkControl(const ControlLink& link)
    {
        TrackRequest r;
        r.type = Type::unlinkControl;
        r.link = link;
        return r;
    }

    static TrackRequest moveEffect(Uid uid, int toIndex)
    {
        TrackRequest r;
        r.type = Type::moveEffect;
        r.entityUid = uid;
        r.index = toIndex;
        return r;
    }

    static TrackRequest setControl(Uid uid, ControlIndex index, ControlValue value)
    {
        TrackRequest r;
        r.type = Type::setControl;
        r.entityUid = uid;
        r.index = index;
        r.controlValue = value;
        return r;
    }

    static TrackRequest setMixerLevel(TrackUid uid, float level)
    {
        TrackRequest r;
        r.type = Type::setMixerLevel;
        r.sendUid = uid;
        r.level = level;
        return r;
    }

    static TrackRequest setMixerMuted(TrackUid uid, bool muted)
    {
        TrackRequest r;
        r.type = Type::setMixerMuted;
        r.sendUid = uid;
        r.muted = muted;
        return r;
    }

    static TrackRequest configure(const Configuration& configuration)
    {
        TrackRequest r;
        r.type = Type::configure;
        r.configuration = configuration;
        return r;
    }

    static TrackRequest quit()
    {
        TrackRequest r;
        r.type = Type::quit;
        return r;
    }
};

inline const char* trackRequestTypeName(TrackRequest::Type type)
{
    switch (type) {
        case TrackRequest::Type::subscribeAudio:   return "subscribeAudio";
        case TrackRequest::Type::unsubscribeAudio: return "unsubscribeAudio";
        case TrackRequest::Type::subscribeMidi:    return "subscribeMidi";
        case TrackRequest::Type::unsubscribeMidi:  return "unsubscribeMidi";
        case TrackRequest::Type::midi:             return "midi";
        case TrackRequest::Type::advanceTime:      return "advanceTime";
        case TrackRequest::Type::needsAudio:       return "needsAudio";
        case TrackRequest::Type::addSend:          return "addSend";
        case TrackRequest::Type::removeSend:       return "removeSend";
        case TrackRequest::Type::addEntity:        return "addEntity";
        case TrackRequest::Type::removeEntity:     return "removeEntity";
        case TrackRequest::Type::linkControl:      return "linkControl";
        case TrackRequest::Type::unlinkControl:    return "unlinkControl";
        case TrackRequest::Type::moveEffect:       return "moveEffect";
        case TrackRequest::Type::setControl:       return "setControl";
        case TrackRequest::Type::setMixerLevel:    return "setMixerLevel";
        case TrackRequest::Type::setMixerMuted:    return "setMixerMuted";
        case TrackRequest::Type::configure:        return "configure";
        case TrackRequest::Type::quit:             return "quit";
    }
    return "unknown";
}

} // namespace ensemble
