#pragma once

#include "core/Actions.h"
#include "core/Channel.h"
#include "core/Entity.h"
#include "core/Subscription.h"
#include "core/TrackActor.h"
#include "core/TrackRequest.h"
#include "core/Transport.h"
#include "core/Types.h"
#include "core/UidFactory.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ensemble {

/// Owns the master track, every ordinary track and the transport. All public
/// methods are control-thread calls serialized by one mutex; actual work
/// happens asynchronously on the track and entity workers.
class Engine {
public:
    Engine(std::shared_ptr<EntityUidFactory> entityUids = std::make_shared<EntityUidFactory>(),
           std::shared_ptr<TrackUidFactory> trackUids = std::make_shared<TrackUidFactory>());
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    std::string getVersion() const;

    // --- Tracks (control thread) ---
    TrackUid createTrack();
    bool deleteTrack(TrackUid uid);
    TrackUid getMasterUid() const;
    std::vector<TrackUid> getTrackUids() const;
    int getTrackCount() const;

    // --- Entities (control thread) ---
    // Mints a Uid, configures the entity and hands it to the track.
    // Returns an invalid Uid and fills `error` on failure.
    Uid addEntity(TrackUid track, std::unique_ptr<Entity> entity, EntityRole role,
                  std::string& error);
    bool removeEntity(Uid uid);
    std::shared_ptr<EntityHandle> getEntity(Uid uid) const;
    TrackUid getEntityTrack(Uid uid) const;
    bool setControl(Uid uid, ControlIndex index, ControlValue value);
    bool moveEffect(Uid uid, int toIndex);

    // --- Control links (control thread) ---
    bool linkControl(const ControlLink& link, std::string& error);
    bool unlinkControl(const ControlLink& link, std::string& error);
    std::vector<ControlLink> getControlLinks() const;

    // --- Master mixer (control thread) ---
    bool setTrackLevel(TrackUid uid, float level);
    bool setTrackMuted(TrackUid uid, bool muted);

    // --- Outputs (master track) ---
    void subscribeAudio(const Sender<TrackAudioAction>& sender);
    void unsubscribeAudio(const Sender<TrackAudioAction>& sender);
    void subscribeMidi(const Sender<MidiAction>& sender);
    void unsubscribeMidi(const Sender<MidiAction>& sender);

    // --- Generation ---
    // Advances the transport, lets every track do its timed work, then asks
    // the master track for numFrames. The caller must not start a new cycle
    // before the master has emitted the previous one.
    void startGeneration(int numFrames);
    void handleMidi(MidiChannel channel, const juce::MidiMessage& message);

    // --- Transport ---
    void play();
    void stop();
    void skipToStart();
    bool isPlaying() const;
    double getPositionInBeats() const;
    int64_t getPositionInSamples() const;

    // --- Configuration ---
    void updateSampleRate(double sampleRate);
    void updateTempo(double bpm);
    bool updateTimeSignature(int numerator, int denominator);
    Configuration getConfiguration() const;

    // Quits and joins every track. The engine ignores further calls.
    void requestQuit();

private:
    struct EntityRecord {
        TrackUid track;
        std::shared_ptr<EntityHandle> handle;
    };

    TrackActor* findTrack(TrackUid uid) const;
    void broadcastConfiguration();
    void destroyTrack(std::unique_ptr<TrackActor> track);

    mutable std::mutex controlMutex_;

    std::shared_ptr<EntityUidFactory> entityUids_;
    std::shared_ptr<TrackUidFactory> trackUids_;

    std::unique_ptr<TrackActor> master_;
    std::map<TrackUid, std::unique_ptr<TrackActor>> tracks_;
    Subscription<TrackRequest> trackSubscription_;

    std::unordered_map<Uid, EntityRecord> entities_;
    std::vector<ControlLink> links_;

    Transport transport_;
    Configuration configuration_;
    bool quit_ = false;
};

} // namespace ensemble
