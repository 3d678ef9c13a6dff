#include "core/Engine.h"
#include "core/Logger.h"

#include <algorithm>

namespace ensemble {

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

Engine::Engine(std::shared_ptr<EntityUidFactory> entityUids,
               std::shared_ptr<TrackUidFactory> trackUids)
    : entityUids_(std::move(entityUids)),
      trackUids_(std::move(trackUids))
{
    master_ = std::make_unique<TrackActor>(trackUids_->mintNext(), TrackKind::master);
    trackSubscription_.subscribe(master_->getSender());
    transport_.setSampleRate(configuration_.sampleRate);
    transport_.setTempo(configuration_.tempo);

    EN_INFO("Engine: created sr=%.0f masterUid=%zu", configuration_.sampleRate,
            master_->getUid().value);
}

Engine::~Engine()
{
    requestQuit();
    EN_INFO("Engine: destroyed");
}

std::string Engine::getVersion() const
{
    return "0.1.0";
}

// ═══════════════════════════════════════════════════════════════════
// Tracks
// ═══════════════════════════════════════════════════════════════════

TrackUid Engine::createTrack()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (quit_) {
        EN_WARN("Engine::createTrack: engine has quit");
        return {};
    }

    TrackUid uid = trackUids_->mintNext();
    auto track = std::make_unique<TrackActor>(uid);

    // Publish into the master before the master can ask for audio.
    track->send(TrackRequest::subscribeAudio(master_->getSendAudioSender()));
    track->send(TrackRequest::subscribeMidi(master_->getMidiSender()));
    master_->send(TrackRequest::addSend(uid, track->getSender()));
    trackSubscription_.subscribe(track->getSender());

    tracks_[uid] = std::move(track);
    EN_INFO("Engine: created track %zu (%d tracks)", uid.value, (int)tracks_.size());
    return uid;
}

bool Engine::deleteTrack(TrackUid uid)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    auto it = tracks_.find(uid);
    if (it == tracks_.end()) {
        EN_WARN("Engine::deleteTrack: unknown track %zu", uid.value);
        return false;
    }

    auto track = std::move(it->second);
    tracks_.erase(it);
    destroyTrack(std::move(track));
    EN_INFO("Engine: deleted track %zu (%d tracks)", uid.value, (int)tracks_.size());
    return true;
}

void Engine::destroyTrack(std::unique_ptr<TrackActor> track)
{
    TrackUid uid = track->getUid();

    master_->send(TrackRequest::removeSend(uid));
    trackSubscription_.unsubscribe(track->getSender());
    track->send(TrackRequest::unsubscribeAudio(master_->getSendAudioSender()));
    track->send(TrackRequest::unsubscribeMidi(master_->getMidiSender()));

    for (auto it = entities_.begin(); it != entities_.end();) {
        if (it->second.track == uid) {
            Uid entityUid = it->first;
            links_.erase(std::remove_if(links_.begin(), links_.end(),
                                        [entityUid](const ControlLink& l) {
                                            return l.source == entityUid || l.target == entityUid;
                                        }),
                         links_.end());
            it = entities_.erase(it);
        } else {
            ++it;
        }
    }

    // Destruction sends quit and joins the worker.
    track.reset();
}

TrackUid Engine::getMasterUid() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return master_ ? master_->getUid() : TrackUid{};
}

std::vector<TrackUid> Engine::getTrackUids() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    std::vector<TrackUid> uids;
    uids.reserve(tracks_.size());
    for (auto& [uid, track] : tracks_)
        uids.push_back(uid);
    return uids;
}

int Engine::getTrackCount() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return (int)tracks_.size();
}

TrackActor* Engine::findTrack(TrackUid uid) const
{
    if (master_ && master_->getUid() == uid)
        return master_.get();
    auto it = tracks_.find(uid);
    return it != tracks_.end() ? it->second.get() : nullptr;
}

// ═══════════════════════════════════════════════════════════════════
// Entities
// ═══════════════════════════════════════════════════════════════════

Uid Engine::addEntity(TrackUid trackUid, std::unique_ptr<Entity> entity, EntityRole role,
                      std::string& error)
{
    std::lock_guard<std::mutex> lock(controlMutex_);

    if (!entity) {
        error = "Entity is null";
        EN_WARN("Engine::addEntity: %s", error.c_str());
        return {};
    }

    auto* track = findTrack(trackUid);
    if (!track) {
        error = "Unknown track " + std::to_string(trackUid.value);
        EN_WARN("Engine::addEntity: %s", error.c_str());
        return {};
    }

    if (role == EntityRole::effect && !dynamic_cast<TransformsAudio*>(entity.get())) {
        error = "Entity '" + entity->getName() + "' cannot transform audio";
        EN_WARN("Engine::addEntity: %s", error.c_str());
        return {};
    }

    Uid uid = entityUids_->mintNext();
    entity->setUid(uid);
    entity->configure(configuration_);

    std::string name = entity->getName();
    auto handle = std::make_shared<EntityHandle>(std::move(entity));
    entities_[uid] = {trackUid, handle};
    track->send(TrackRequest::addEntity(handle, role));

    EN_INFO("Engine: added %s '%s' uid=%zu to track %zu", entityRoleName(role), name.c_str(),
            uid.value, trackUid.value);
    return uid;
}

bool Engine::removeEntity(Uid uid)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    auto it = entities_.find(uid);
    if (it == entities_.end()) {
        EN_WARN("Engine::removeEntity: unknown entity %zu", uid.value);
        return false;
    }

    links_.erase(std::remove_if(links_.begin(), links_.end(),
                                [uid](const ControlLink& l) {
                                    return l.source == uid || l.target == uid;
                                }),
                 links_.end());

    if (auto* track = findTrack(it->second.track))
        track->send(TrackRequest::removeEntity(uid));
    entities_.erase(it);
    EN_INFO("Engine: removed entity %zu", uid.value);
    return true;
}

std::shared_ptr<EntityHandle> Engine::getEntity(Uid uid) const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    auto it = entities_.find(uid);
    return it != entities_.end() ? it->second.handle : nullptr;
}

TrackUid Engine::getEntityTrack(Uid uid) const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    auto it = entities_.find(uid);
    return it != entities_.end() ? it->second.track : TrackUid{};
}

bool Engine::setControl(Uid uid, ControlIndex index, ControlValue value)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    auto it = entities_.find(uid);
    if (it == entities_.end()) {
        EN_WARN("Engine::setControl: unknown entity %zu", uid.value);
        return false;
    }

    int count = it->second.handle->peek([](const Entity& e) { return e.getControlCount(); });
    if (index < 0 || index >= count) {
        EN_WARN("Engine::setControl: entity %zu has no control %d", uid.value, index);
        return false;
    }

    if (auto* track = findTrack(it->second.track))
        track->send(TrackRequest::setControl(uid, index, value));
    return true;
}

bool Engine::moveEffect(Uid uid, int toIndex)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    auto it = entities_.find(uid);
    if (it == entities_.end()) {
        EN_WARN("Engine::moveEffect: unknown entity %zu", uid.value);
        return false;
    }
    if (auto* track = findTrack(it->second.track))
        track->send(TrackRequest::moveEffect(uid, toIndex));
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Control links
// ═══════════════════════════════════════════════════════════════════

bool Engine::linkControl(const ControlLink& link, std::string& error)
{
    std::lock_guard<std::mutex> lock(controlMutex_);

    auto source = entities_.find(link.source);
    auto target = entities_.find(link.target);
    if (source == entities_.end() || target == entities_.end()) {
        error = "Unknown entity in link " + std::to_string(link.source.value) + " -> "
              + std::to_string(link.target.value);
        EN_WARN("Engine::linkControl: %s", error.c_str());
        return false;
    }

    if (source->second.track != target->second.track) {
        error = "Linked entities must share a track";
        EN_WARN("Engine::linkControl: %s", error.c_str());
        return false;
    }

    int count = target->second.handle->peek([](const Entity& e) { return e.getControlCount(); });
    if (link.index < 0 || link.index >= count) {
        error = "Entity " + std::to_string(link.target.value) + " has no control "
              + std::to_string(link.index);
        EN_WARN("Engine::linkControl: %s", error.c_str());
        return false;
    }

    if (std::find(links_.begin(), links_.end(), link) != links_.end()) {
        error = "Link already exists";
        EN_WARN("Engine::linkControl: %s", error.c_str());
        return false;
    }

    links_.push_back(link);
    if (auto* track = findTrack(source->second.track))
        track->send(TrackRequest::linkControl(link));

    EN_DEBUG("Engine: linked %zu -> %zu[%d]", link.source.value, link.target.value, link.index);
    return true;
}

bool Engine::unlinkControl(const ControlLink& link, std::string& error)
{
    std::lock_guard<std::mutex> lock(controlMutex_);

    auto it = std::find(links_.begin(), links_.end(), link);
    if (it == links_.end()) {
        error = "No such link";
        EN_WARN("Engine::unlinkControl: %s", error.c_str());
        return false;
    }
    links_.erase(it);

    auto source = entities_.find(link.source);
    if (source != entities_.end()) {
        if (auto* track = findTrack(source->second.track))
            track->send(TrackRequest::unlinkControl(link));
    }

    EN_DEBUG("Engine: unlinked %zu -> %zu[%d]", link.source.value, link.target.value, link.index);
    return true;
}

std::vector<ControlLink> Engine::getControlLinks() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return links_;
}

// ═══════════════════════════════════════════════════════════════════
// Master mixer
// ═══════════════════════════════════════════════════════════════════

bool Engine::setTrackLevel(TrackUid uid, float level)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!tracks_.count(uid)) {
        EN_WARN("Engine::setTrackLevel: unknown track %zu", uid.value);
        return false;
    }
    master_->send(TrackRequest::setMixerLevel(uid, level));
    return true;
}

bool Engine::setTrackMuted(TrackUid uid, bool muted)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!tracks_.count(uid)) {
        EN_WARN("Engine::setTrackMuted: unknown track %zu", uid.value);
        return false;
    }
    master_->send(TrackRequest::setMixerMuted(uid, muted));
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Outputs
// ═══════════════════════════════════════════════════════════════════

void Engine::subscribeAudio(const Sender<TrackAudioAction>& sender)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (master_)
        master_->send(TrackRequest::subscribeAudio(sender));
}

void Engine::unsubscribeAudio(const Sender<TrackAudioAction>& sender)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (master_)
        master_->send(TrackRequest::unsubscribeAudio(sender));
}

void Engine::subscribeMidi(const Sender<MidiAction>& sender)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (master_)
        master_->send(TrackRequest::subscribeMidi(sender));
}

void Engine::unsubscribeMidi(const Sender<MidiAction>& sender)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (master_)
        master_->send(TrackRequest::unsubscribeMidi(sender));
}

// ═══════════════════════════════════════════════════════════════════
// Generation
// ═══════════════════════════════════════════════════════════════════

void Engine::startGeneration(int numFrames)
{
    if (numFrames > kMaxBatchFrames)
        EN_PROTOCOL_VIOLATION("Engine::startGeneration(%d) exceeds %d frames", numFrames,
                              kMaxBatchFrames);

    std::lock_guard<std::mutex> lock(controlMutex_);
    if (numFrames <= 0) {
        EN_WARN("Engine::startGeneration: ignoring request for %d frames", numFrames);
        return;
    }
    if (!master_)
        return;

    TimeRange range = transport_.advance(numFrames);
    trackSubscription_.broadcast(TrackRequest::advanceTime(range));
    master_->send(TrackRequest::needsAudio(numFrames));
}

void Engine::handleMidi(MidiChannel channel, const juce::MidiMessage& message)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    trackSubscription_.broadcast(TrackRequest::midi(channel, message));
}

// ═══════════════════════════════════════════════════════════════════
// Transport
// ═══════════════════════════════════════════════════════════════════

void Engine::play()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    transport_.play();
}

void Engine::stop()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    transport_.stop();
    trackSubscription_.broadcast(TrackRequest::midi(0, juce::MidiMessage::allNotesOff(1)));
}

void Engine::skipToStart()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    transport_.skipToStart();
}

bool Engine::isPlaying() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return transport_.isPlaying();
}

double Engine::getPositionInBeats() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return transport_.getPositionInBeats();
}

int64_t Engine::getPositionInSamples() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return transport_.getPositionInSamples();
}

// ═══════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════

void Engine::updateSampleRate(double sampleRate)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (sampleRate <= 0.0) {
        EN_WARN("Engine::updateSampleRate: rejected %.2f", sampleRate);
        return;
    }
    transport_.setSampleRate(sampleRate);
    configuration_.sampleRate = sampleRate;
    broadcastConfiguration();
    EN_INFO("Engine: sample rate %.0f", sampleRate);
}

void Engine::updateTempo(double bpm)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    transport_.setTempo(bpm);
    configuration_.tempo = transport_.getTempo();
    broadcastConfiguration();
}

bool Engine::updateTimeSignature(int numerator, int denominator)
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (!transport_.setTimeSignature(numerator, denominator))
        return false;
    configuration_.timeSignature = transport_.getTimeSignature();
    broadcastConfiguration();
    return true;
}

Configuration Engine::getConfiguration() const
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    return configuration_;
}

void Engine::broadcastConfiguration()
{
    trackSubscription_.broadcast(TrackRequest::configure(configuration_));
}

// ═══════════════════════════════════════════════════════════════════
// Shutdown
// ═══════════════════════════════════════════════════════════════════

void Engine::requestQuit()
{
    std::lock_guard<std::mutex> lock(controlMutex_);
    if (quit_)
        return;
    quit_ = true;

    EN_DEBUG("Engine::requestQuit: stopping %d track(s) and master", (int)tracks_.size());
    while (!tracks_.empty()) {
        auto it = tracks_.begin();
        auto track = std::move(it->second);
        tracks_.erase(it);
        destroyTrack(std::move(track));
    }

    trackSubscription_.clear();
    master_.reset();
    entities_.clear();
    links_.clear();
}

} // namespace ensemble
