#include "core/TrackActor.h"
#include "core/Logger.h"

namespace ensemble {

TrackActor::TrackActor(TrackUid uid, TrackKind kind)
    : uid_(uid),
      wakeup_(std::make_shared<Wakeup>())
{
    auto requestPair = makeChannel<TrackRequest>(wakeup_);
    requestSender_ = requestPair.sender;
    requests_ = std::move(requestPair.receiver);

    auto entityAudioPair = makeChannel<AudioAction>(wakeup_);
    entityAudioSender_ = entityAudioPair.sender;
    entityAudio_ = std::move(entityAudioPair.receiver);

    auto sendAudioPair = makeChannel<TrackAudioAction>(wakeup_);
    sendAudioSender_ = sendAudioPair.sender;
    sendAudio_ = std::move(sendAudioPair.receiver);

    auto midiPair = makeChannel<MidiAction>(wakeup_);
    midiSender_ = midiPair.sender;
    midi_ = std::move(midiPair.receiver);

    track_ = std::make_unique<Track>(uid_, kind, Track::Inbound{entityAudioSender_, midiSender_});

    worker_ = std::thread([this] { run(); });
    EN_DEBUG("TrackActor: started uid=%zu", uid_.value);
}

TrackActor::~TrackActor()
{
    send(TrackRequest::quit());
    if (worker_.joinable())
        worker_.join();
    EN_DEBUG("TrackActor: destroyed uid=%zu", uid_.value);
}

void TrackActor::send(const TrackRequest& request) const
{
    auto result = requestSender_.trySend(request);
    if (result != SendResult::sent)
        EN_DEBUG("TrackActor::send: uid=%zu dropped %s (%s)", uid_.value,
                 trackRequestTypeName(request.type), sendResultName(result));
}

TrackUid TrackActor::getUid() const { return uid_; }
const Sender<TrackRequest>& TrackActor::getSender() const { return requestSender_; }
const Sender<TrackAudioAction>& TrackActor::getSendAudioSender() const { return sendAudioSender_; }
const Sender<MidiAction>& TrackActor::getMidiSender() const { return midiSender_; }

void TrackActor::run()
{
    bool running = true;
    TrackRequest request;
    TrackAudioAction trackAudio;
    AudioAction entityAudio;
    MidiAction midi;

    while (running) {
        if (requests_.tryRecv(request)) {
            running = track_->handleRequest(request);
            continue;
        }
        if (sendAudio_.tryRecv(trackAudio)) {
            track_->handleSendAudio(trackAudio);
            continue;
        }
        if (entityAudio_.tryRecv(entityAudio)) {
            track_->handleEntityAudio(entityAudio);
            continue;
        }
        if (midi_.tryRecv(midi)) {
            track_->handleMidiAction(midi);
            continue;
        }
        wakeup_->wait();
    }

    sendAudio_.close();
    entityAudio_.close();
    midi_.close();
    auto leftovers = requests_.closeAndDrain();
    track_->shutdown(leftovers);
    EN_DEBUG("TrackActor: worker exiting uid=%zu", uid_.value);
}

} // namespace ensemble
