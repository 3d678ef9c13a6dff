#include "core/EntityActor.h"
#include "core/Logger.h"

#include <algorithm>

namespace ensemble {

const char* entityRequestTypeName(EntityRequest::Type type)
{
    switch (type) {
        case EntityRequest::Type::subscribeAudio:      return "subscribeAudio";
        case EntityRequest::Type::unsubscribeAudio:    return "unsubscribeAudio";
        case EntityRequest::Type::subscribeMidi:       return "subscribeMidi";
        case EntityRequest::Type::unsubscribeMidi:     return "unsubscribeMidi";
        case EntityRequest::Type::subscribeControl:    return "subscribeControl";
        case EntityRequest::Type::unsubscribeControl:  return "unsubscribeControl";
        case EntityRequest::Type::linkControl:         return "linkControl";
        case EntityRequest::Type::unlinkControl:       return "unlinkControl";
        case EntityRequest::Type::midi:                return "midi";
        case EntityRequest::Type::setControl:          return "setControl";
        case EntityRequest::Type::advanceTime:         return "advanceTime";
        case EntityRequest::Type::needsAudio:          return "needsAudio";
        case EntityRequest::Type::needsTransformation: return "needsTransformation";
        case EntityRequest::Type::configure:           return "configure";
        case EntityRequest::Type::quit:                return "quit";
    }
    return "unknown";
}

static bool anyAudible(const FrameBatch& frames)
{
    return std::any_of(frames.begin(), frames.end(),
                       [](const StereoSample& s) { return !s.isSilent(); });
}

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

EntityActor::EntityActor(std::shared_ptr<EntityHandle> handle)
    : uid_(handle ? handle->getUid() : Uid{}),
      handle_(std::move(handle)),
      wakeup_(std::make_shared<Wakeup>())
{
    auto requestPair = makeChannel<EntityRequest>(wakeup_);
    requestSender_ = requestPair.sender;
    requests_ = std::move(requestPair.receiver);

    auto controlPair = makeChannel<ControlAction>(wakeup_);
    controlSender_ = controlPair.sender;
    controls_ = std::move(controlPair.receiver);

    scratch_.reserve(kMaxBatchFrames);

    worker_ = std::thread([this] { run(); });
    EN_DEBUG("EntityActor: started uid=%zu", uid_.value);
}

EntityActor::~EntityActor()
{
    send(EntityRequest::quit());
    if (worker_.joinable())
        worker_.join();
    EN_DEBUG("EntityActor: destroyed uid=%zu", uid_.value);
}

// ═══════════════════════════════════════════════════════════════════
// Public API (any thread)
// ═══════════════════════════════════════════════════════════════════

void EntityActor::send(const EntityRequest& request) const
{
    auto result = requestSender_.trySend(request);
    if (result != SendResult::sent)
        EN_DEBUG("EntityActor::send: uid=%zu dropped %s (%s)", uid_.value,
                 entityRequestTypeName(request.type), sendResultName(result));
}

Uid EntityActor::getUid() const { return uid_; }
const Sender<EntityRequest>& EntityActor::getSender() const { return requestSender_; }
const Sender<ControlAction>& EntityActor::getControlSender() const { return controlSender_; }
const std::shared_ptr<EntityHandle>& EntityActor::getHandle() const { return handle_; }

bool EntityActor::isSoundActive() const
{
    return soundActive_.load(std::memory_order_relaxed);
}

// ═══════════════════════════════════════════════════════════════════
// Worker
// ═══════════════════════════════════════════════════════════════════

void EntityActor::run()
{
    bool running = handle_ && handle_->isValid();
    if (!running)
        EN_WARN("EntityActor: uid=%zu has no entity, exiting", uid_.value);

    EntityRequest request;
    ControlAction control;
    while (running) {
        if (requests_.tryRecv(request)) {
            running = handleRequest(request);
            continue;
        }
        if (controls_.tryRecv(control)) {
            handleControlAction(control);
            continue;
        }
        wakeup_->wait();
    }

    controls_.close();
    auto leftovers = requests_.closeAndDrain();
    answerAfterExit(leftovers);
    EN_DEBUG("EntityActor: worker exiting uid=%zu", uid_.value);
}

bool EntityActor::handleRequest(EntityRequest& request)
{
    EN_TRACE("EntityActor: uid=%zu request %s", uid_.value, entityRequestTypeName(request.type));

    switch (request.type) {
        case EntityRequest::Type::subscribeAudio:
            audioSubscription_.subscribe(request.audioSender);
            break;
        case EntityRequest::Type::unsubscribeAudio:
            audioSubscription_.unsubscribe(request.audioSender);
            break;
        case EntityRequest::Type::subscribeMidi:
            midiSubscription_.subscribe(request.midiSender);
            break;
        case EntityRequest::Type::unsubscribeMidi:
            midiSubscription_.unsubscribe(request.midiSender);
            break;
        case EntityRequest::Type::subscribeControl:
            controlSubscription_.subscribe(request.controlSender);
            break;
        case EntityRequest::Type::unsubscribeControl:
            controlSubscription_.unsubscribe(request.controlSender);
            break;
        case EntityRequest::Type::linkControl:
            sourceToControlIndexes_[request.sourceUid].push_back(request.controlIndex);
            break;
        case EntityRequest::Type::unlinkControl: {
            auto it = sourceToControlIndexes_.find(request.sourceUid);
            if (it == sourceToControlIndexes_.end())
                break;
            auto& indexes = it->second;
            auto pos = std::find(indexes.begin(), indexes.end(), request.controlIndex);
            if (pos != indexes.end())
                indexes.erase(pos);
            if (indexes.empty())
                sourceToControlIndexes_.erase(it);
            break;
        }
        case EntityRequest::Type::midi:
            handleMidi(request.channel, request.message);
            break;
        case EntityRequest::Type::setControl:
            handle_->modify([&request](EntityHandle::Access& a) {
                a.entity.setControl(request.controlIndex, request.controlValue);
            });
            break;
        case EntityRequest::Type::advanceTime:
            doWork(request.timeRange);
            break;
        case EntityRequest::Type::needsAudio:
            generate(request.numFrames);
            break;
        case EntityRequest::Type::needsTransformation:
            transform(std::move(request.frames));
            break;
        case EntityRequest::Type::configure:
            handle_->modify([&request](EntityHandle::Access& a) {
                a.entity.configure(request.configuration);
            });
            break;
        case EntityRequest::Type::quit:
            return false;
    }
    return true;
}

void EntityActor::handleControlAction(const ControlAction& action)
{
    auto it = sourceToControlIndexes_.find(action.sourceUid);
    if (it == sourceToControlIndexes_.end())
        return;

    const auto& indexes = it->second;
    handle_->modify([&indexes, &action](EntityHandle::Access& a) {
        for (auto index : indexes)
            a.entity.setControl(index, action.value);
    });
}

void EntityActor::handleMidi(MidiChannel channel, const juce::MidiMessage& message)
{
    if (!handle_->handlesMidi())
        return;

    handle_->modify([this, channel, &message](EntityHandle::Access& a) {
        a.midiHandler->handleMidiMessage(channel, message,
            [this](MidiChannel c, const juce::MidiMessage& m) {
                midiSubscription_.broadcastPruning({uid_, c, m});
            });
    });
}

void EntityActor::generate(int numFrames)
{
    if (numFrames < 0 || numFrames > kMaxBatchFrames)
        EN_PROTOCOL_VIOLATION("EntityActor uid=%zu asked for %d frames (max %d)",
                              uid_.value, numFrames, kMaxBatchFrames);

    scratch_.assign(static_cast<size_t>(numFrames), StereoSample::silence());

    bool active = false;
    if (handle_->generatesAudio()) {
        active = handle_->modify([this, numFrames](EntityHandle::Access& a) {
            return a.generator->generate(scratch_.data(), numFrames);
        });
    }
    soundActive_.store(active, std::memory_order_relaxed);

    audioSubscription_.broadcastPruning({uid_, AudioAction::Kind::frames, scratch_});
}

void EntityActor::transform(FrameBatch frames)
{
    if (frames.size() > static_cast<size_t>(kMaxBatchFrames))
        EN_PROTOCOL_VIOLATION("EntityActor uid=%zu asked to transform %d frames (max %d)",
                              uid_.value, (int)frames.size(), kMaxBatchFrames);

    if (handle_->transformsAudio()) {
        handle_->modify([&frames](EntityHandle::Access& a) {
            a.transformer->transform(frames.data(), static_cast<int>(frames.size()));
        });
        soundActive_.store(anyAudible(frames), std::memory_order_relaxed);
    }

    audioSubscription_.broadcastPruning({uid_, AudioAction::Kind::transformed, std::move(frames)});
}

void EntityActor::doWork(const TimeRange& range)
{
    if (!handle_->controls())
        return;

    handle_->modify([this, &range](EntityHandle::Access& a) {
        a.controller->updateTimeRange(range);
        a.controller->work([this](const WorkEvent& event) {
            if (event.type == WorkEvent::Type::midi)
                midiSubscription_.broadcastPruning({uid_, event.channel, event.message});
            else
                controlSubscription_.broadcastPruning({uid_, event.value});
        });
    });
}

// A track may already be waiting on requests that arrived after quit.
// Answer them the cheapest correct way so no cycle stalls on this actor.
void EntityActor::answerAfterExit(std::vector<EntityRequest>& leftovers)
{
    for (auto& request : leftovers) {
        if (request.type == EntityRequest::Type::needsAudio) {
            int n = std::min(std::max(request.numFrames, 0), kMaxBatchFrames);
            audioSubscription_.broadcastPruning(
                {uid_, AudioAction::Kind::frames, FrameBatch(static_cast<size_t>(n))});
        } else if (request.type == EntityRequest::Type::needsTransformation) {
            audioSubscription_.broadcastPruning(
                {uid_, AudioAction::Kind::transformed, std::move(request.frames)});
        }
    }
    if (!leftovers.empty())
        EN_DEBUG("EntityActor: uid=%zu discarded %d request(s) after quit",
                 uid_.value, (int)leftovers.size());
}

} // namespace ensemble
