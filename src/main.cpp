#include "core/EngineService.h"
#include "core/Logger.h"
#include "core/SPSCQueue.h"
#include "core/ToyEntities.h"

#include <juce_core/juce_core.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace ensemble;

namespace {

constexpr double kSampleRate = 44100.0;
constexpr int kChannels = 2;
constexpr int kQueueCapacity = 4096;
constexpr int kLowWaterMark = 2048;
constexpr int kCallbackFrames = 512;
constexpr double kRenderSeconds = 4.0;

// Stands in for a device callback: pops one block per period and asks for
// more whenever the queue drops under the low-water mark.
void simulateCallback(EngineService& service, AudioQueue& queue, std::atomic<bool>& done)
{
    const auto period = std::chrono::microseconds(
        static_cast<long long>(1.0e6 * kCallbackFrames / kSampleRate));
    const int blocks = static_cast<int>(kRenderSeconds * kSampleRate / kCallbackFrames);

    for (int block = 0; block < blocks; ++block) {
        int underrun = 0;
        StereoSample sample;
        for (int i = 0; i < kCallbackFrames; ++i)
            if (!queue.tryPop(sample))
                ++underrun;
        if (underrun > 0)
            EN_WARN_RT("callback: underrun of %d frames in block %d", underrun, block);

        if (queue.size() < kLowWaterMark)
            service.send(EngineServiceInput::needsAudio(kCallbackFrames));

        std::this_thread::sleep_for(period);
    }
    done.store(true);
}

} // namespace

int main()
{
    Logger::setLevel(LogLevel::info);

    juce::Logger::writeToLog("ensemble render - JUCE " + juce::String(JUCE_MAJOR_VERSION)
                             + "." + juce::String(JUCE_MINOR_VERSION)
                             + "." + juce::String(JUCE_BUILDNUMBER));

    EngineServiceConfig config;
    config.recordingDirectory = juce::File::getCurrentWorkingDirectory().getFullPathName().toStdString();

    EngineService service(config);
    auto engine = service.getEngine();

    std::string error;
    TrackUid track = engine->createTrack();
    Uid instrument = engine->addEntity(track, std::make_unique<ToyInstrument>(), EntityRole::source, error);
    Uid arpeggiator = engine->addEntity(track, std::make_unique<Arpeggiator>(), EntityRole::source, error);
    Uid drone = engine->addEntity(track, std::make_unique<DroneController>(0.5), EntityRole::source, error);
    Uid quietener = engine->addEntity(track, std::make_unique<Quietener>(0.8), EntityRole::effect, error);
    if (!instrument.isValid() || !arpeggiator.isValid() || !drone.isValid() || !quietener.isValid()) {
        EN_ERROR("render: failed to build track: %s", error.c_str());
        return 1;
    }

    if (!engine->linkControl({drone, quietener, 0}, error)) {
        EN_ERROR("render: failed to link drone: %s", error.c_str());
        return 1;
    }

    engine->updateTempo(132.0);
    engine->play();

    auto queue = std::make_shared<AudioQueue>(kQueueCapacity);
    service.send(EngineServiceInput::configure(kSampleRate, kChannels, queue));
    service.send(EngineServiceInput::midi(0, juce::MidiMessage::noteOn(1, 57, (juce::uint8)100)));
    service.send(EngineServiceInput::needsAudio(kLowWaterMark));

    std::atomic<bool> done{false};
    std::thread callback([&] { simulateCallback(service, *queue, done); });

    int midiEvents = 0;
    while (!done.load()) {
        EngineServiceEvent event;
        while (service.getEvents().tryRecv(event)) {
            if (event.type == EngineServiceEvent::Type::midi)
                ++midiEvents;
            else
                EN_WARN("render: %s", event.error.c_str());
        }
        Logger::drain();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    callback.join();

    engine->stop();
    Logger::drain();
    EN_INFO("render: done, %d MIDI events, transport at %.2f beats", midiEvents,
            engine->getPositionInBeats());
    return 0;
}
