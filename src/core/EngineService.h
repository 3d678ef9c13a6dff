#pragma once

#include "core/Actions.h"
#include "core/Channel.h"
#include "core/Engine.h"
#include "core/SPSCQueue.h"
#include "core/Types.h"
#include "core/WavWriterService.h"

#include <juce_audio_basics/juce_audio_basics.h>

#include <memory>
#include <string>
#include <thread>

namespace ensemble {

struct EngineServiceInput {
    enum class Type { configure, midi, needsAudio, quit };

    Type type = Type::quit;
    double sampleRate = 0.0;
    int channelCount = 0;
    std::shared_ptr<AudioQueue> audioQueue;
    MidiChannel channel = 0;
    juce::MidiMessage message;
    int count = 0;

    static EngineServiceInput configure(double sampleRate, int channelCount,
                                        std::shared_ptr<AudioQueue> audioQueue)
    {
        EngineServiceInput in;
        in.type = Type::configure;
        in.sampleRate = sampleRate;
        in.channelCount = channelCount;
        in.audioQueue = std::move(audioQueue);
        return in;
    }

    static EngineServiceInput midi(MidiChannel channel, const juce::MidiMessage& message)
    {
        EngineServiceInput in;
        in.type = Type::midi;
        in.channel = channel;
        in.message = message;
        return in;
    }

    // Low-water-mark notification from the audio callback.
    static EngineServiceInput needsAudio(int count)
    {
        EngineServiceInput in;
        in.type = Type::needsAudio;
        in.count = count;
        return in;
    }

    static EngineServiceInput quit()
    {
        EngineServiceInput in;
        in.type = Type::quit;
        return in;
    }
};

struct EngineServiceEvent {
    enum class Type { midi, recordingError };

    Type type = Type::midi;
    MidiChannel channel = 0;
    juce::MidiMessage message;
    std::string error;
};

struct EngineServiceConfig {
    std::string recordingDirectory;          // empty disables WAV capture
    std::string recordingFilePrefix = "out";
    std::size_t eventCapacity = 1024;        // undrained events beyond this are dropped
};

/// The real-time-facing shell around an Engine. Turns low-water-mark
/// notifications into generation cycles of at most kMaxBatchFrames, moves
/// finished batches into the audio queue and the WAV sink, and surfaces the
/// engine's MIDI output as events.
class EngineService {
public:
    explicit EngineService(EngineServiceConfig config = {},
                           std::shared_ptr<Engine> engine = std::make_shared<Engine>());
    ~EngineService();

    EngineService(const EngineService&) = delete;
    EngineService& operator=(const EngineService&) = delete;

    void send(const EngineServiceInput& input) const;
    const Sender<EngineServiceInput>& getSender() const;

    // Single consumer.
    Receiver<EngineServiceEvent>& getEvents();

    std::shared_ptr<Engine> getEngine() const;

private:
    void run();
    bool handleInput(EngineServiceInput& input, bool& startGeneration);
    void handleAudio(const TrackAudioAction& action, bool& startGeneration);
    void handleMidi(const MidiAction& action);
    void handleWavEvent(const WavWriterEvent& event);
    void publish(const EngineServiceEvent& event);
    std::string recordingPath(double sampleRate, int channelCount) const;

    EngineServiceConfig config_;
    std::shared_ptr<Engine> engine_;
    std::shared_ptr<Wakeup> wakeup_;

    Sender<EngineServiceInput> inputSender_;
    Receiver<EngineServiceInput> inputs_;
    Sender<TrackAudioAction> audioSender_;
    Receiver<TrackAudioAction> audio_;
    Sender<MidiAction> midiSender_;
    Receiver<MidiAction> midi_;
    Sender<WavWriterEvent> wavEventSender_;
    Receiver<WavWriterEvent> wavEvents_;
    Sender<EngineServiceEvent> eventSender_;
    Receiver<EngineServiceEvent> events_;

    // Worker-only state
    std::unique_ptr<WavWriterService> writer_;
    std::shared_ptr<AudioQueue> audioQueue_;
    int framesRequested_ = 0;
    int droppedEvents_ = 0;

    std::thread worker_;
};

} // namespace ensemble
