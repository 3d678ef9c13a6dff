#pragma once

#include "core/Actions.h"
#include "core/Channel.h"
#include "core/Track.h"
#include "core/TrackRequest.h"
#include "core/Types.h"

#include <memory>
#include <thread>

namespace ensemble {

/// Runs one Track on a dedicated worker. The worker waits on four inbound
/// channels (requests, entity audio, send-track audio, MIDI) and always
/// drains requests first.
class TrackActor {
public:
    TrackActor(TrackUid uid, TrackKind kind = TrackKind::ordinary);
    ~TrackActor();

    TrackActor(const TrackActor&) = delete;
    TrackActor& operator=(const TrackActor&) = delete;

    // Best-effort; a request to an exited actor is dropped.
    void send(const TrackRequest& request) const;

    TrackUid getUid() const;
    const Sender<TrackRequest>& getSender() const;

    // Where child tracks deliver completed cycles when this track pulls
    // them as sends.
    const Sender<TrackAudioAction>& getSendAudioSender() const;

    // Where child tracks publish their MIDI.
    const Sender<MidiAction>& getMidiSender() const;

private:
    void run();

    TrackUid uid_;
    std::shared_ptr<Wakeup> wakeup_;

    Sender<TrackRequest> requestSender_;
    Receiver<TrackRequest> requests_;
    Sender<AudioAction> entityAudioSender_;
    Receiver<AudioAction> entityAudio_;
    Sender<TrackAudioAction> sendAudioSender_;
    Receiver<TrackAudioAction> sendAudio_;
    Sender<MidiAction> midiSender_;
    Receiver<MidiAction> midi_;

    std::unique_ptr<Track> track_;
    std::thread worker_;
};

} // namespace ensemble
