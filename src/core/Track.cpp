#include "core/Track.h"
#include "core/Logger.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <algorithm>

namespace ensemble {

const char* trackStateName(TrackState state)
{
    switch (state) {
        case TrackState::idle:            return "idle";
        case TrackState::awaitingSources: return "awaitingSources";
        case TrackState::awaitingEffect:  return "awaitingEffect";
    }
    return "unknown";
}

static void addInto(FrameBatch& dest, const FrameBatch& source)
{
    juce::FloatVectorOperations::add(reinterpret_cast<float*>(dest.data()),
                                     reinterpret_cast<const float*>(source.data()),
                                     static_cast<int>(dest.size()) * 2);
}

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

Track::Track(TrackUid uid, TrackKind kind, Inbound inbound)
    : uid_(uid), kind_(kind), inbound_(std::move(inbound))
{
    buffer_.reserve(kMaxBatchFrames);
    EN_DEBUG("Track created: uid=%zu kind=%s", uid_.value,
             kind_ == TrackKind::master ? "master" : "ordinary");
}

Track::~Track()
{
    EN_DEBUG("Track destroyed: uid=%zu sources=%d effects=%d sends=%d",
             uid_.value, (int)sources_.size(), effects_.size(), (int)sends_.size());
}

// ═══════════════════════════════════════════════════════════════════
// Requests
// ═══════════════════════════════════════════════════════════════════

bool Track::handleRequest(TrackRequest& request)
{
    EN_TRACE("Track %zu: request %s", uid_.value, trackRequestTypeName(request.type));

    switch (request.type) {
        case TrackRequest::Type::subscribeAudio:
            audioSubscription_.subscribe(request.audioSender);
            break;
        case TrackRequest::Type::unsubscribeAudio:
            audioSubscription_.unsubscribe(request.audioSender);
            break;
        case TrackRequest::Type::subscribeMidi:
            midiSubscription_.subscribe(request.midiSender);
            break;
        case TrackRequest::Type::unsubscribeMidi:
            midiSubscription_.unsubscribe(request.midiSender);
            break;
        case TrackRequest::Type::midi:
            sendToEntities(EntityRequest::midi(request.channel, request.message));
            break;
        case TrackRequest::Type::advanceTime:
            sendToEntities(EntityRequest::advanceTime(request.timeRange));
            break;
        case TrackRequest::Type::needsAudio:
            startCycle(request.numFrames);
            break;
        case TrackRequest::Type::addSend:
            addSend(request.sendUid, request.sendSender);
            break;
        case TrackRequest::Type::removeSend:
            removeSend(request.sendUid);
            break;
        case TrackRequest::Type::addEntity:
            addEntity(std::move(request.entity), request.role);
            break;
        case TrackRequest::Type::removeEntity:
            removeEntity(request.entityUid);
            break;
        case TrackRequest::Type::linkControl:
            linkControl(request.link);
            break;
        case TrackRequest::Type::unlinkControl:
            unlinkControl(request.link);
            break;
        case TrackRequest::Type::moveEffect:
            moveEffect(request.entityUid, request.index);
            break;
        case TrackRequest::Type::setControl:
            if (auto* entity = findEntity(request.entityUid))
                entity->send(EntityRequest::setControl(request.index, request.controlValue));
            else
                EN_WARN("Track %zu: setControl unknown entity %zu", uid_.value, request.entityUid.value);
            break;
        case TrackRequest::Type::setMixerLevel:
            mixer_.setLevel(request.sendUid, request.level);
            break;
        case TrackRequest::Type::setMixerMuted:
            mixer_.setMuted(request.sendUid, request.muted);
            break;
        case TrackRequest::Type::configure:
            sendToEntities(EntityRequest::configure(request.configuration));
            break;
        case TrackRequest::Type::quit:
            return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// Replies
// ═══════════════════════════════════════════════════════════════════

void Track::handleEntityAudio(AudioAction& action)
{
    Uid from = action.sourceUid;

    if (action.kind == AudioAction::Kind::frames) {
        if (state_ == TrackState::awaitingSources && pendingEntities_.erase(from) > 0) {
            checkBatch(action.frames, "frames", from);
            if ((int)action.frames.size() != requestedFrames_)
                EN_PROTOCOL_VIOLATION("Track %zu: source %zu returned %d frames, asked for %d",
                                      uid_.value, from.value, (int)action.frames.size(), requestedFrames_);
            addInto(buffer_, action.frames);
            sourceDone();
            return;
        }
    } else {
        if (state_ == TrackState::awaitingEffect && from == currentEffect_) {
            checkBatch(action.frames, "transformed", from);
            if (action.frames.size() != buffer_.size())
                EN_PROTOCOL_VIOLATION("Track %zu: effect %zu returned %d frames, gave it %d",
                                      uid_.value, from.value, (int)action.frames.size(), (int)buffer_.size());
            buffer_ = std::move(action.frames);
            nextEffect();
            return;
        }
    }

    // Uids are never reused, so a reply from a uid this track no longer holds
    // is a late reply from a removed entity.
    if (!findEntity(from)) {
        EN_DEBUG("Track %zu: discarding late %s from removed entity %zu",
                 uid_.value, audioActionKindName(action.kind), from.value);
        return;
    }

    EN_PROTOCOL_VIOLATION("Track %zu: unexpected %s from entity %zu while %s",
                          uid_.value, audioActionKindName(action.kind), from.value,
                          trackStateName(state_));
}

void Track::handleSendAudio(TrackAudioAction& action)
{
    TrackUid from = action.trackUid;

    if (state_ == TrackState::awaitingSources && pendingSends_.erase(from) > 0) {
        if (action.frames.size() > static_cast<size_t>(kMaxBatchFrames)
            || (int)action.frames.size() != requestedFrames_)
            EN_PROTOCOL_VIOLATION("Track %zu: send %zu returned %d frames, asked for %d",
                                  uid_.value, from.value, (int)action.frames.size(), requestedFrames_);

        if (kind_ == TrackKind::master)
            mixer_.mix(from, action.frames.data(), buffer_.data(), requestedFrames_);
        else
            addInto(buffer_, action.frames);
        sourceDone();
        return;
    }

    if (!hasSend(from)) {
        EN_DEBUG("Track %zu: discarding late frames from removed send %zu", uid_.value, from.value);
        return;
    }

    EN_PROTOCOL_VIOLATION("Track %zu: unexpected frames from track %zu while %s",
                          uid_.value, from.value, trackStateName(state_));
}

void Track::handleMidiAction(const MidiAction& action)
{
    midiSubscription_.broadcastPruning(action);
    sendToEntities(EntityRequest::midi(action.channel, action.message), action.sourceUid);
}

// ═══════════════════════════════════════════════════════════════════
// Generation cycle
// ═══════════════════════════════════════════════════════════════════

void Track::startCycle(int numFrames)
{
    if (state_ != TrackState::idle)
        EN_PROTOCOL_VIOLATION("Track %zu: NeedsAudio(%d) while %s", uid_.value, numFrames,
                              trackStateName(state_));
    if (numFrames < 0 || numFrames > kMaxBatchFrames)
        EN_PROTOCOL_VIOLATION("Track %zu: NeedsAudio(%d) outside [0, %d]", uid_.value, numFrames,
                              kMaxBatchFrames);

    requestedFrames_ = numFrames;
    buffer_.assign(static_cast<size_t>(numFrames), StereoSample::silence());
    pendingEntities_.clear();
    pendingSends_.clear();

    // No sources and no sends: answer with silence, effects untouched.
    if (sources_.empty() && sends_.empty()) {
        EN_TRACE("Track %zu: no sources, %d frames of silence", uid_.value, numFrames);
        finishCycle();
        return;
    }

    state_ = TrackState::awaitingSources;

    for (auto& source : sources_) {
        pendingEntities_.insert(source->getUid());
        source->send(EntityRequest::needsAudio(numFrames));
    }

    for (auto& send : sends_) {
        auto result = send.sender.trySend(TrackRequest::needsAudio(numFrames));
        if (result == SendResult::sent)
            pendingSends_.insert(send.uid);
        else
            EN_DEBUG("Track %zu: send %zu unreachable (%s), counted as silence",
                     uid_.value, send.uid.value, sendResultName(result));
    }

    EN_TRACE("Track %zu: cycle of %d frames, awaiting %d source(s)", uid_.value, numFrames,
             (int)(pendingEntities_.size() + pendingSends_.size()));
    sourceDone();
}

void Track::sourceDone()
{
    if (state_ == TrackState::awaitingSources && pendingEntities_.empty() && pendingSends_.empty())
        startEffects();
}

void Track::startEffects()
{
    state_ = TrackState::awaitingEffect;
    auto uids = effects_.getUids();
    effectQueue_.assign(uids.begin(), uids.end());
    nextEffect();
}

void Track::nextEffect()
{
    while (!effectQueue_.empty()) {
        Uid uid = effectQueue_.front();
        effectQueue_.pop_front();

        auto* effect = effects_.findByUid(uid);
        if (!effect)
            continue;

        currentEffect_ = uid;
        effect->send(EntityRequest::needsTransformation(buffer_));
        return;
    }
    finishCycle();
}

void Track::finishCycle()
{
    state_ = TrackState::idle;
    currentEffect_ = Uid{};
    effectQueue_.clear();
    pendingEntities_.clear();
    pendingSends_.clear();

    audioSubscription_.broadcastPruning({uid_, buffer_});
    EN_TRACE("Track %zu: cycle complete, %d frames", uid_.value, (int)buffer_.size());
}

void Track::checkBatch(const FrameBatch& frames, const char* what, Uid from) const
{
    if (frames.size() > static_cast<size_t>(kMaxBatchFrames))
        EN_PROTOCOL_VIOLATION("Track %zu: %s batch of %d frames from %zu (max %d)", uid_.value,
                              what, (int)frames.size(), from.value, kMaxBatchFrames);
}

// ═══════════════════════════════════════════════════════════════════
// Entities
// ═══════════════════════════════════════════════════════════════════

void Track::addEntity(std::shared_ptr<EntityHandle> handle, EntityRole role)
{
    if (!handle || !handle->isValid()) {
        EN_WARN("Track %zu: addEntity with no entity", uid_.value);
        return;
    }

    Uid uid = handle->getUid();
    if (findEntity(uid)) {
        EN_WARN("Track %zu: entity %zu already present", uid_.value, uid.value);
        return;
    }

    handle->peek([this, uid](const Entity& entity) {
        for (int i = 0; i < entity.getControlCount(); ++i)
            controllables_.push_back({entity.getControlName(i), uid, i});
    });

    auto actor = std::make_unique<EntityActor>(std::move(handle));
    actor->send(EntityRequest::subscribeAudio(inbound_.entityAudio));
    actor->send(EntityRequest::subscribeMidi(inbound_.midi));

    EN_DEBUG("Track %zu: added entity %zu as %s", uid_.value, uid.value, entityRoleName(role));
    if (role == EntityRole::source)
        sources_.push_back(std::move(actor));
    else
        effects_.append(std::move(actor));
}

void Track::removeEntity(Uid uid)
{
    std::vector<ControlLink> touching;
    for (auto& link : links_)
        if (link.source == uid || link.target == uid)
            touching.push_back(link);
    for (auto& link : touching)
        unlinkControl(link);

    std::unique_ptr<EntityActor> actor;
    auto it = std::find_if(sources_.begin(), sources_.end(),
                           [uid](const std::unique_ptr<EntityActor>& a) { return a->getUid() == uid; });
    if (it != sources_.end()) {
        actor = std::move(*it);
        sources_.erase(it);
    } else {
        actor = effects_.remove(effects_.indexOf(uid));
    }

    if (!actor) {
        EN_WARN("Track %zu: removeEntity unknown uid %zu", uid_.value, uid.value);
        return;
    }

    actor->send(EntityRequest::unsubscribeAudio(inbound_.entityAudio));
    actor->send(EntityRequest::unsubscribeMidi(inbound_.midi));
    controllables_.erase(
        std::remove_if(controllables_.begin(), controllables_.end(),
                       [uid](const Controllable& c) { return c.uid == uid; }),
        controllables_.end());
    actor.reset();
    EN_DEBUG("Track %zu: removed entity %zu", uid_.value, uid.value);

    // A removed source counts as silence; a removed effect as pass-through.
    if (state_ == TrackState::awaitingSources && pendingEntities_.erase(uid) > 0) {
        sourceDone();
    } else if (state_ == TrackState::awaitingEffect) {
        effectQueue_.erase(std::remove(effectQueue_.begin(), effectQueue_.end(), uid),
                           effectQueue_.end());
        if (currentEffect_ == uid)
            nextEffect();
    }
}

void Track::moveEffect(Uid uid, int toIndex)
{
    int from = effects_.indexOf(uid);
    if (from < 0) {
        EN_WARN("Track %zu: moveEffect unknown effect %zu", uid_.value, uid.value);
        return;
    }
    if (!effects_.move(from, toIndex))
        EN_WARN("Track %zu: moveEffect index %d out of range (size=%d)", uid_.value, toIndex,
                effects_.size());
}

EntityActor* Track::findEntity(Uid uid) const
{
    for (auto& source : sources_)
        if (source->getUid() == uid)
            return source.get();
    return effects_.findByUid(uid);
}

bool Track::hasSend(TrackUid uid) const
{
    return std::any_of(sends_.begin(), sends_.end(),
                       [uid](const SendEntry& s) { return s.uid == uid; });
}

void Track::sendToEntities(const EntityRequest& request, Uid except) const
{
    for (auto& source : sources_)
        if (source->getUid() != except)
            source->send(request);
    for (int i = 0; i < effects_.size(); ++i) {
        auto* effect = effects_.at(i);
        if (effect->getUid() != except)
            effect->send(request);
    }
}

// ═══════════════════════════════════════════════════════════════════
// Sends
// ═══════════════════════════════════════════════════════════════════

void Track::addSend(TrackUid uid, const Sender<TrackRequest>& sender)
{
    for (auto& send : sends_) {
        if (send.uid == uid) {
            EN_WARN("Track %zu: send %zu already present", uid_.value, uid.value);
            return;
        }
    }
    sends_.push_back({uid, sender});
    mixer_.addTrack(uid);
    EN_DEBUG("Track %zu: added send %zu", uid_.value, uid.value);
}

void Track::removeSend(TrackUid uid)
{
    auto it = std::find_if(sends_.begin(), sends_.end(),
                           [uid](const SendEntry& s) { return s.uid == uid; });
    if (it == sends_.end()) {
        EN_WARN("Track %zu: removeSend unknown send %zu", uid_.value, uid.value);
        return;
    }
    sends_.erase(it);
    mixer_.removeTrack(uid);
    EN_DEBUG("Track %zu: removed send %zu", uid_.value, uid.value);

    if (state_ == TrackState::awaitingSources && pendingSends_.erase(uid) > 0)
        sourceDone();
}

// ═══════════════════════════════════════════════════════════════════
// Control links
// ═══════════════════════════════════════════════════════════════════

bool Track::linkControl(const ControlLink& link)
{
    auto* source = findEntity(link.source);
    auto* target = findEntity(link.target);
    if (!source || !target) {
        EN_WARN("Track %zu: linkControl %zu -> %zu: entity not in track", uid_.value,
                link.source.value, link.target.value);
        return false;
    }

    bool validIndex = std::any_of(controllables_.begin(), controllables_.end(),
                                  [&link](const Controllable& c) {
                                      return c.uid == link.target && c.index == link.index;
                                  });
    if (!validIndex) {
        EN_WARN("Track %zu: linkControl: entity %zu has no control %d", uid_.value,
                link.target.value, link.index);
        return false;
    }

    if (std::find(links_.begin(), links_.end(), link) != links_.end()) {
        EN_WARN("Track %zu: linkControl %zu -> %zu[%d] already linked", uid_.value,
                link.source.value, link.target.value, link.index);
        return false;
    }

    bool firstBetween = !hasLinkBetween(link.source, link.target);

    // The target learns the mapping before the source can emit into it.
    target->send(EntityRequest::linkControl(link.source, link.index));
    if (firstBetween)
        source->send(EntityRequest::subscribeControl(target->getControlSender()));

    links_.push_back(link);
    EN_DEBUG("Track %zu: linked %zu -> %zu[%d]", uid_.value, link.source.value,
             link.target.value, link.index);
    return true;
}

bool Track::unlinkControl(const ControlLink& link)
{
    auto it = std::find(links_.begin(), links_.end(), link);
    if (it == links_.end()) {
        EN_WARN("Track %zu: unlinkControl %zu -> %zu[%d] not linked", uid_.value,
                link.source.value, link.target.value, link.index);
        return false;
    }
    links_.erase(it);

    auto* source = findEntity(link.source);
    auto* target = findEntity(link.target);
    if (target)
        target->send(EntityRequest::unlinkControl(link.source, link.index));
    if (source && target && !hasLinkBetween(link.source, link.target))
        source->send(EntityRequest::unsubscribeControl(target->getControlSender()));

    EN_DEBUG("Track %zu: unlinked %zu -> %zu[%d]", uid_.value, link.source.value,
             link.target.value, link.index);
    return true;
}

bool Track::hasLinkBetween(Uid source, Uid target) const
{
    return std::any_of(links_.begin(), links_.end(), [source, target](const ControlLink& l) {
        return l.source == source && l.target == target;
    });
}

// ═══════════════════════════════════════════════════════════════════
// Shutdown
// ═══════════════════════════════════════════════════════════════════

void Track::shutdown(std::vector<TrackRequest>& leftovers)
{
    if (state_ != TrackState::idle) {
        EN_DEBUG("Track %zu: quitting while %s, emitting partial cycle", uid_.value,
                 trackStateName(state_));
        finishCycle();
    }

    for (auto& request : leftovers) {
        if (request.type != TrackRequest::Type::needsAudio)
            continue;
        int n = std::min(std::max(request.numFrames, 0), kMaxBatchFrames);
        audioSubscription_.broadcastPruning({uid_, FrameBatch(static_cast<size_t>(n))});
    }

    effects_.clear();
    sources_.clear();
    EN_DEBUG("Track %zu: shut down", uid_.value);
}

// ═══════════════════════════════════════════════════════════════════
// Query
// ═══════════════════════════════════════════════════════════════════

int Track::getSourceCount() const { return (int)sources_.size(); }
int Track::getEffectCount() const { return effects_.size(); }
int Track::getSendCount() const { return (int)sends_.size(); }
const std::vector<Controllable>& Track::getControllables() const { return controllables_; }
const std::vector<ControlLink>& Track::getControlLinks() const { return links_; }
const Mixer& Track::getMixer() const { return mixer_; }

} // namespace ensemble
