#include "core/EngineService.h"
#include "core/Logger.h"

#include <algorithm>
#include <cmath>

namespace ensemble {

// ═══════════════════════════════════════════════════════════════════
// Construction / Destruction
// ═══════════════════════════════════════════════════════════════════

EngineService::EngineService(EngineServiceConfig config, std::shared_ptr<Engine> engine)
    : config_(std::move(config)),
      engine_(std::move(engine)),
      wakeup_(std::make_shared<Wakeup>())
{
    auto inputPair = makeChannel<EngineServiceInput>(wakeup_);
    inputSender_ = inputPair.sender;
    inputs_ = std::move(inputPair.receiver);

    auto audioPair = makeChannel<TrackAudioAction>(wakeup_);
    audioSender_ = audioPair.sender;
    audio_ = std::move(audioPair.receiver);

    auto midiPair = makeChannel<MidiAction>(wakeup_);
    midiSender_ = midiPair.sender;
    midi_ = std::move(midiPair.receiver);

    auto wavPair = makeChannel<WavWriterEvent>(wakeup_);
    wavEventSender_ = wavPair.sender;
    wavEvents_ = std::move(wavPair.receiver);

    auto eventPair = makeChannel<EngineServiceEvent>(nullptr, std::max<std::size_t>(config_.eventCapacity, 1));
    eventSender_ = eventPair.sender;
    events_ = std::move(eventPair.receiver);

    if (!config_.recordingDirectory.empty())
        writer_ = std::make_unique<WavWriterService>(wavEventSender_);

    engine_->subscribeAudio(audioSender_);
    engine_->subscribeMidi(midiSender_);

    worker_ = std::thread([this] { run(); });
    EN_INFO("EngineService: started (recording %s)",
            writer_ ? config_.recordingDirectory.c_str() : "disabled");
}

EngineService::~EngineService()
{
    send(EngineServiceInput::quit());
    if (worker_.joinable())
        worker_.join();
    EN_INFO("EngineService: destroyed");
}

void EngineService::send(const EngineServiceInput& input) const
{
    auto result = inputSender_.trySend(input);
    if (result != SendResult::sent)
        EN_DEBUG("EngineService::send: dropped input (%s)", sendResultName(result));
}

const Sender<EngineServiceInput>& EngineService::getSender() const { return inputSender_; }
Receiver<EngineServiceEvent>& EngineService::getEvents() { return events_; }
std::shared_ptr<Engine> EngineService::getEngine() const { return engine_; }

// ═══════════════════════════════════════════════════════════════════
// Worker
// ═══════════════════════════════════════════════════════════════════

void EngineService::run()
{
    EngineServiceInput input;
    TrackAudioAction audio;
    MidiAction midi;
    WavWriterEvent wavEvent;
    bool running = true;

    while (running) {
        bool startGeneration = false;

        if (inputs_.tryRecv(input)) {
            running = handleInput(input, startGeneration);
        } else if (audio_.tryRecv(audio)) {
            handleAudio(audio, startGeneration);
        } else if (midi_.tryRecv(midi)) {
            handleMidi(midi);
        } else if (wavEvents_.tryRecv(wavEvent)) {
            handleWavEvent(wavEvent);
        } else {
            wakeup_->wait();
            continue;
        }

        if (running && startGeneration)
            engine_->startGeneration(std::min(framesRequested_, kMaxBatchFrames));
    }

    audio_.close();
    midi_.close();
    inputs_.close();
    engine_->requestQuit();
    writer_.reset();
    wavEvents_.close();
    EN_DEBUG("EngineService: worker exiting");
}

bool EngineService::handleInput(EngineServiceInput& input, bool& startGeneration)
{
    switch (input.type) {
        case EngineServiceInput::Type::configure:
            audioQueue_ = std::move(input.audioQueue);
            engine_->updateSampleRate(input.sampleRate);
            if (writer_) {
                writer_->send(WavWriterInput::reset(recordingPath(input.sampleRate, input.channelCount),
                                                    input.sampleRate, input.channelCount));
            }
            EN_INFO("EngineService: configured sr=%.0f ch=%d queue=%d", input.sampleRate,
                    input.channelCount, audioQueue_ ? audioQueue_->capacity() : 0);
            break;

        case EngineServiceInput::Type::midi:
            engine_->handleMidi(input.channel, input.message);
            break;

        case EngineServiceInput::Type::needsAudio:
            if (input.count <= 0) {
                EN_DEBUG("EngineService: ignoring needsAudio(%d)", input.count);
                break;
            }
            if (framesRequested_ == 0)
                startGeneration = true;
            framesRequested_ += input.count;
            break;

        case EngineServiceInput::Type::quit:
            return false;
    }
    return true;
}

// Up to kMaxBatchFrames - 1 frames beyond the ask can land in the queue;
// the next callback consumes them.
void EngineService::handleAudio(const TrackAudioAction& action, bool& startGeneration)
{
    int length = static_cast<int>(action.frames.size());
    if (length > kMaxBatchFrames)
        EN_PROTOCOL_VIOLATION("EngineService: batch of %d frames (max %d)", length, kMaxBatchFrames);

    if (audioQueue_) {
        int dropped = 0;
        for (auto& frame : action.frames)
            if (!audioQueue_->tryPush(frame))
                ++dropped;
        if (dropped > 0)
            EN_WARN("EngineService: audio queue full, dropped %d of %d frames (len/cap %d/%d, requested %d)",
                    dropped, length, audioQueue_->size(), audioQueue_->capacity(), framesRequested_);
    } else {
        EN_DEBUG("EngineService: no audio queue configured, %d frames discarded", length);
    }

    if (writer_)
        writer_->send(WavWriterInput::write(action.frames));

    if (framesRequested_ > length) {
        framesRequested_ -= length;
        startGeneration = true;
    } else {
        framesRequested_ = 0;
    }
}

void EngineService::handleMidi(const MidiAction& action)
{
    EngineServiceEvent event;
    event.type = EngineServiceEvent::Type::midi;
    event.channel = action.channel;
    event.message = action.message;
    publish(event);
}

void EngineService::handleWavEvent(const WavWriterEvent& wavEvent)
{
    EN_WARN("EngineService: recording error: %s", wavEvent.message.c_str());
    EngineServiceEvent event;
    event.type = EngineServiceEvent::Type::recordingError;
    event.error = wavEvent.message;
    publish(event);
}

void EngineService::publish(const EngineServiceEvent& event)
{
    auto result = eventSender_.trySend(event);
    if (result == SendResult::full) {
        if (droppedEvents_++ == 0)
            EN_WARN("EngineService: event queue full (cap %zu), dropping events",
                    config_.eventCapacity);
        return;
    }
    if (result != SendResult::sent) {
        EN_DEBUG("EngineService: event dropped (%s)", sendResultName(result));
        return;
    }
    if (droppedEvents_ > 0) {
        EN_WARN("EngineService: event queue drained, %d events were dropped", droppedEvents_);
        droppedEvents_ = 0;
    }
}

std::string EngineService::recordingPath(double sampleRate, int channelCount) const
{
    auto name = config_.recordingFilePrefix + "-" + std::to_string(std::lround(sampleRate)) + "-"
              + std::to_string(channelCount) + ".wav";
    return juce::File::getCurrentWorkingDirectory()
        .getChildFile(juce::String(config_.recordingDirectory))
        .getChildFile(juce::String(name))
        .getFullPathName()
        .toStdString();
}

} // namespace ensemble
