#pragma once

#include "core/Actions.h"
#include "core/Channel.h"
#include "core/Entity.h"
#include "core/Subscription.h"
#include "core/Types.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <atomic>
#include <memory>
#include <thread>
#include <unordered_map>
#include <vector>

namespace ensemble {

struct EntityRequest {
    enum class Type {
        subscribeAudio,
        unsubscribeAudio,
        subscribeMidi,
        unsubscribeMidi,
        subscribeControl,
        unsubscribeControl,
        linkControl,
        unlinkControl,
        midi,
        setControl,
        advanceTime,
        needsAudio,
        needsTransformation,
        configure,
        quit
    };

    Type type = Type::quit;

    Sender<AudioAction> audioSender;
    Sender<MidiAction> midiSender;
    Sender<ControlAction> controlSender;
    Uid sourceUid;
    ControlIndex controlIndex = 0;
    ControlValue controlValue = 0.0;
    MidiChannel channel = 0;
    juce::MidiMessage message;
    TimeRange timeRange;
    int numFrames = 0;
    FrameBatch frames;
    Configuration configuration;

    static EntityRequest subscribeAudio(const Sender<AudioAction>& s) { EntityRequest r; r.type = Type::subscribeAudio; r.audioSender = s; return r; }
    static EntityRequest unsubscribeAudio(const Sender<AudioAction>& s) { EntityRequest r; r.type = Type::unsubscribeAudio; r.audioSender = s; return r; }
    static EntityRequest subscribeMidi(const Sender<MidiAction>& s) { EntityRequest r; r.type = Type::subscribeMidi; r.midiSender = s; return r; }
    static EntityRequest unsubscribeMidi(const Sender<MidiAction>& s) { EntityRequest r; r.type = Type::unsubscribeMidi; r.midiSender = s; return r; }
    static EntityRequest subscribeControl(const Sender<ControlAction>& s) { EntityRequest r; r.type = Type::subscribeControl; r.controlSender = s; return r; }
    static EntityRequest unsubscribeControl(const Sender<ControlAction>& s) { EntityRequest r; r.type = Type::unsubscribeControl; r.controlSender = s; return r; }

    static EntityRequest linkControl(Uid source, ControlIndex index)
    {
        EntityRequest r;
        r.type = Type::linkControl;
        r.sourceUid = source;
        r.controlIndex = index;
        return r;
    }

    static EntityRequest unlinkControl(Uid source, ControlIndex index)
    {
        EntityRequest r;
        r.type = Type::unlinkControl;
        r.sourceUid = source;
        r.controlIndex = index;
        return r;
    }

    static EntityRequest midi(MidiChannel channel, const juce::MidiMessage& message)
    {
        EntityRequest r;
        r.type = Type::midi;
        r.channel = channel;
        r.message = message;
        return r;
    }

    static EntityRequest setControl(ControlIndex index, ControlValue value)
    {
        EntityRequest r;
        r.type = Type::setControl;
        r.controlIndex = index;
        r.controlValue = value;
        return r;
    }

    static EntityRequest advanceTime(const TimeRange& range)
    {
        EntityRequest r;
        r.type = Type::advanceTime;
        r.timeRange = range;
        return r;
    }

    static EntityRequest needsAudio(int numFrames)
    {
        EntityRequest r;
        r.type = Type::needsAudio;
        r.numFrames = numFrames;
        return r;
    }

    static EntityRequest needsTransformation(const FrameBatch& frames)
    {
        EntityRequest r;
        r.type = Type::needsTransformation;
        r.frames = frames;
        return r;
    }

    static EntityRequest configure(const Configuration& configuration)
    {
        EntityRequest r;
        r.type = Type::configure;
        r.configuration = configuration;
        return r;
    }

    static EntityRequest quit()
    {
        EntityRequest r;
        r.type = Type::quit;
        return r;
    }
};

const char* entityRequestTypeName(EntityRequest::Type type);

/// Runs one entity on a dedicated worker. Requests go in through send();
/// results come out only through the audio, MIDI and control subscriptions.
class EntityActor {
public:
    explicit EntityActor(std::shared_ptr<EntityHandle> handle);
    ~EntityActor();

    EntityActor(const EntityActor&) = delete;
    EntityActor& operator=(const EntityActor&) = delete;

    // Best-effort; a request to an exited actor is dropped.
    void send(const EntityRequest& request) const;

    Uid getUid() const;
    const Sender<EntityRequest>& getSender() const;
    const Sender<ControlAction>& getControlSender() const;
    const std::shared_ptr<EntityHandle>& getHandle() const;

    // UI activity only; carries no correctness weight.
    bool isSoundActive() const;

private:
    void run();
    bool handleRequest(EntityRequest& request);
    void handleControlAction(const ControlAction& action);
    void handleMidi(MidiChannel channel, const juce::MidiMessage& message);
    void generate(int numFrames);
    void transform(FrameBatch frames);
    void doWork(const TimeRange& range);
    void answerAfterExit(std::vector<EntityRequest>& leftovers);

    Uid uid_;
    std::shared_ptr<EntityHandle> handle_;
    std::atomic<bool> soundActive_{false};

    std::shared_ptr<Wakeup> wakeup_;
    Sender<EntityRequest> requestSender_;
    Receiver<EntityRequest> requests_;
    Sender<ControlAction> controlSender_;
    Receiver<ControlAction> controls_;

    // Worker-only state
    Subscription<AudioAction> audioSubscription_;
    Subscription<MidiAction> midiSubscription_;
    Subscription<ControlAction> controlSubscription_;
    std::unordered_map<Uid, std::vector<ControlIndex>> sourceToControlIndexes_;
    FrameBatch scratch_;

    std::thread worker_;
};

} // namespace ensemble
