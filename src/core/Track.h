#pragma once

#include "core/Actions.h"
#include "core/Channel.h"
#include "core/EffectChain.h"
#include "core/EntityActor.h"
#include "core/Mixer.h"
#include "core/Subscription.h"
#include "core/TrackRequest.h"
#include "core/Types.h"

#include <deque>
#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace ensemble {

enum class TrackKind { ordinary, master };

enum class TrackState { idle, awaitingSources, awaitingEffect };

const char* trackStateName(TrackState state);

/// One control parameter exposed by an entity in this track.
struct Controllable {
    std::string name;
    Uid uid;
    ControlIndex index = 0;
};

/// The per-track generation state machine and its wiring. Not thread-safe:
/// every call comes from the owning TrackActor's worker.
///
/// A cycle starts on NeedsAudio(n): every source entity and every send track
/// is asked for n frames, the replies are summed (or mixed through the Mixer
/// on the master track), then the effect chain transforms the buffer one
/// effect at a time, and the result goes out to the audio subscribers.
class Track {
public:
    /// Inbound channels the track hands to its entities and children so
    /// their outputs come back to this track.
    struct Inbound {
        Sender<AudioAction> entityAudio;
        Sender<MidiAction> midi;
    };

    Track(TrackUid uid, TrackKind kind, Inbound inbound);
    ~Track();

    Track(const Track&) = delete;
    Track& operator=(const Track&) = delete;

    TrackUid getUid() const { return uid_; }
    TrackKind getKind() const { return kind_; }
    TrackState getState() const { return state_; }

    // Returns false on quit.
    bool handleRequest(TrackRequest& request);
    void handleEntityAudio(AudioAction& action);
    void handleSendAudio(TrackAudioAction& action);
    void handleMidiAction(const MidiAction& action);

    // Finishes an in-flight cycle with what has been gathered, answers any
    // undelivered NeedsAudio with silence and tears the entities down.
    void shutdown(std::vector<TrackRequest>& leftovers);

    // --- Query (worker only) ---
    int getSourceCount() const;
    int getEffectCount() const;
    int getSendCount() const;
    const std::vector<Controllable>& getControllables() const;
    const std::vector<ControlLink>& getControlLinks() const;
    const Mixer& getMixer() const;

private:
    struct SendEntry {
        TrackUid uid;
        Sender<TrackRequest> sender;
    };

    // --- Generation cycle ---
    void startCycle(int numFrames);
    void sourceDone();
    void startEffects();
    void nextEffect();
    void finishCycle();
    void checkBatch(const FrameBatch& frames, const char* what, Uid from) const;

    // --- Structure ---
    void addEntity(std::shared_ptr<EntityHandle> handle, EntityRole role);
    void removeEntity(Uid uid);
    void addSend(TrackUid uid, const Sender<TrackRequest>& sender);
    void removeSend(TrackUid uid);
    bool linkControl(const ControlLink& link);
    bool unlinkControl(const ControlLink& link);
    bool hasLinkBetween(Uid source, Uid target) const;
    void moveEffect(Uid uid, int toIndex);

    EntityActor* findEntity(Uid uid) const;
    bool hasSend(TrackUid uid) const;
    void sendToEntities(const EntityRequest& request, Uid except = Uid{}) const;

    TrackUid uid_;
    TrackKind kind_;
    Inbound inbound_;

    std::vector<std::unique_ptr<EntityActor>> sources_;
    EffectChain effects_;
    std::vector<SendEntry> sends_;
    Mixer mixer_;
    std::vector<Controllable> controllables_;
    std::vector<ControlLink> links_;

    Subscription<TrackAudioAction> audioSubscription_;
    Subscription<MidiAction> midiSubscription_;

    // --- Cycle state ---
    TrackState state_ = TrackState::idle;
    int requestedFrames_ = 0;
    FrameBatch buffer_;
    std::unordered_set<Uid> pendingEntities_;
    std::unordered_set<TrackUid> pendingSends_;
    std::deque<Uid> effectQueue_;
    Uid currentEffect_;
};

} // namespace ensemble
