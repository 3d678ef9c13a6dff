#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/EntityActor.h"
#include "core/ToyEntities.h"

#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace ensemble;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {

// Echoes every note an octave up and records its configuration.
class OctaveEcho : public Entity, public HandlesMidi {
public:
    OctaveEcho() : Entity("OctaveEcho") {}

    void handleMidiMessage(MidiChannel channel, const juce::MidiMessage& message,
                           const MidiEventFn& emit) override
    {
        if (message.isNoteOn())
            emit(channel, juce::MidiMessage::noteOn(message.getChannel(),
                                                    message.getNoteNumber() + 12,
                                                    message.getVelocity()));
    }

    void configure(const Configuration& configuration) override { sampleRate = configuration.sampleRate; }

    double sampleRate = 0.0;
};

template<typename E>
std::unique_ptr<EntityActor> makeActor(std::unique_ptr<E> entity, std::size_t uid)
{
    entity->setUid(Uid{uid});
    return std::make_unique<EntityActor>(std::make_shared<EntityHandle>(std::move(entity)));
}

template<typename Pred>
bool eventually(Pred pred)
{
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(1ms);
    }
    return pred();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════
// Audio
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("EntityActor: generator answers NeedsAudio with exactly n frames")
{
    auto actor = makeActor(std::make_unique<ConstantGenerator>(0.25f), 1);
    auto audio = makeChannel<AudioAction>();
    actor->send(EntityRequest::subscribeAudio(audio.sender));
    actor->send(EntityRequest::needsAudio(16));

    AudioAction action;
    REQUIRE(audio.receiver.recvFor(action, 2000ms));
    CHECK(action.sourceUid.value == 1);
    CHECK(action.kind == AudioAction::Kind::frames);
    REQUIRE(action.frames.size() == 16);
    for (auto& s : action.frames)
        CHECK(s == StereoSample{0.25f, 0.25f});
    CHECK(eventually([&] { return actor->isSoundActive(); }));
}

TEST_CASE("EntityActor: NeedsAudio(0) answers with an empty batch")
{
    auto actor = makeActor(std::make_unique<ConstantGenerator>(), 1);
    auto audio = makeChannel<AudioAction>();
    actor->send(EntityRequest::subscribeAudio(audio.sender));
    actor->send(EntityRequest::needsAudio(0));

    AudioAction action;
    REQUIRE(audio.receiver.recvFor(action, 2000ms));
    CHECK(action.frames.empty());
}

TEST_CASE("EntityActor: non-generator answers NeedsAudio with silence")
{
    auto actor = makeActor(std::make_unique<Inverter>(), 2);
    auto audio = makeChannel<AudioAction>();
    actor->send(EntityRequest::subscribeAudio(audio.sender));
    actor->send(EntityRequest::needsAudio(8));

    AudioAction action;
    REQUIRE(audio.receiver.recvFor(action, 2000ms));
    REQUIRE(action.frames.size() == 8);
    for (auto& s : action.frames)
        CHECK(s.isSilent());
}

TEST_CASE("EntityActor: transformer replies Transformed with its output")
{
    auto actor = makeActor(std::make_unique<Inverter>(), 3);
    auto audio = makeChannel<AudioAction>();
    actor->send(EntityRequest::subscribeAudio(audio.sender));
    actor->send(EntityRequest::needsTransformation(FrameBatch(4, {0.5f, -0.25f})));

    AudioAction action;
    REQUIRE(audio.receiver.recvFor(action, 2000ms));
    CHECK(action.kind == AudioAction::Kind::transformed);
    REQUIRE(action.frames.size() == 4);
    for (auto& s : action.frames)
        CHECK(s == StereoSample{-0.5f, 0.25f});
}

TEST_CASE("EntityActor: non-transformer passes frames through unchanged")
{
    auto actor = makeActor(std::make_unique<ConstantGenerator>(), 4);
    auto audio = makeChannel<AudioAction>();
    actor->send(EntityRequest::subscribeAudio(audio.sender));
    actor->send(EntityRequest::needsTransformation(FrameBatch(3, {0.1f, 0.2f})));

    AudioAction action;
    REQUIRE(audio.receiver.recvFor(action, 2000ms));
    CHECK(action.kind == AudioAction::Kind::transformed);
    for (auto& s : action.frames)
        CHECK(s == StereoSample{0.1f, 0.2f});
}

TEST_CASE("EntityActor: every audio subscriber receives each reply")
{
    auto actor = makeActor(std::make_unique<ConstantGenerator>(), 5);
    auto a = makeChannel<AudioAction>();
    auto b = makeChannel<AudioAction>();
    actor->send(EntityRequest::subscribeAudio(a.sender));
    actor->send(EntityRequest::subscribeAudio(b.sender));
    actor->send(EntityRequest::subscribeAudio(a.sender));
    actor->send(EntityRequest::needsAudio(2));

    AudioAction action;
    REQUIRE(a.receiver.recvFor(action, 2000ms));
    REQUIRE(b.receiver.recvFor(action, 2000ms));

    // Duplicate subscription delivers once
    CHECK_FALSE(a.receiver.recvFor(action, 50ms));
}

TEST_CASE("EntityActor: unsubscribed channel receives nothing")
{
    auto actor = makeActor(std::make_unique<ConstantGenerator>(), 6);
    auto audio = makeChannel<AudioAction>();
    actor->send(EntityRequest::subscribeAudio(audio.sender));
    actor->send(EntityRequest::unsubscribeAudio(audio.sender));
    actor->send(EntityRequest::needsAudio(2));

    AudioAction action;
    CHECK_FALSE(audio.receiver.recvFor(action, 100ms));
}

// ═══════════════════════════════════════════════════════════════════
// MIDI, controls, configuration
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("EntityActor: MIDI handler output goes to MIDI subscribers")
{
    auto actor = makeActor(std::make_unique<OctaveEcho>(), 7);
    auto midi = makeChannel<MidiAction>();
    actor->send(EntityRequest::subscribeMidi(midi.sender));
    actor->send(EntityRequest::midi(2, juce::MidiMessage::noteOn(3, 60, (juce::uint8)90)));

    MidiAction action;
    REQUIRE(midi.receiver.recvFor(action, 2000ms));
    CHECK(action.sourceUid.value == 7);
    CHECK(action.channel == 2);
    CHECK(action.message.isNoteOn());
    CHECK(action.message.getNoteNumber() == 72);
}

TEST_CASE("EntityActor: setControl and configure reach the entity")
{
    auto entity = std::make_unique<OctaveEcho>();
    auto* raw = entity.get();
    auto quiet = makeActor(std::make_unique<Quietener>(0.5), 8);
    auto echo = makeActor(std::move(entity), 9);

    quiet->send(EntityRequest::setControl(0, 0.125));
    Configuration configuration;
    configuration.sampleRate = 96000.0;
    echo->send(EntityRequest::configure(configuration));

    CHECK(eventually([&] {
        return quiet->getHandle()->peek([](const Entity& e) { return e.getControl(0); }) == 0.125;
    }));
    CHECK(eventually([&] {
        return echo->getHandle()->peek([raw](const Entity&) { return raw->sampleRate; }) == 96000.0;
    }));
}

TEST_CASE("EntityActor: control output drives linked controls of the target")
{
    auto drone = makeActor(std::make_unique<DroneController>(1.0), 10);
    auto target = makeActor(std::make_unique<ConstantGenerator>(0.0f), 11);

    target->send(EntityRequest::linkControl(Uid{10}, 0));
    drone->send(EntityRequest::subscribeControl(target->getControlSender()));

    // First generate puts the drone at its peak; the next work emits it.
    drone->send(EntityRequest::needsAudio(1));
    drone->send(EntityRequest::advanceTime({0.0, 0.1}));

    CHECK(eventually([&] {
        return target->getHandle()->peek([](const Entity& e) { return e.getControl(0); }) == 1.0;
    }));
}

TEST_CASE("EntityActor: unlinked control values are ignored")
{
    auto drone = makeActor(std::make_unique<DroneController>(1.0), 12);
    auto target = makeActor(std::make_unique<ConstantGenerator>(0.0f), 13);

    target->send(EntityRequest::linkControl(Uid{12}, 0));
    target->send(EntityRequest::unlinkControl(Uid{12}, 0));
    drone->send(EntityRequest::subscribeControl(target->getControlSender()));
    drone->send(EntityRequest::needsAudio(1));
    drone->send(EntityRequest::advanceTime({0.0, 0.1}));

    // Round-trip a request so the control action has certainly been handled.
    auto audio = makeChannel<AudioAction>();
    target->send(EntityRequest::subscribeAudio(audio.sender));
    std::this_thread::sleep_for(50ms);
    target->send(EntityRequest::needsAudio(1));
    AudioAction action;
    REQUIRE(audio.receiver.recvFor(action, 2000ms));

    CHECK(target->getHandle()->peek([](const Entity& e) { return e.getControl(0); }) == 0.0);
}

TEST_CASE("EntityActor: arpeggiator fifth stays inside the MIDI note range")
{
    Arpeggiator arp;
    std::vector<juce::MidiMessage> played;
    auto collect = [&played](const WorkEvent& e) {
        if (e.type == WorkEvent::Type::midi)
            played.push_back(e.message);
    };

    arp.handleMidiMessage(0, juce::MidiMessage::noteOn(1, 124, (juce::uint8)100),
                          [](MidiChannel, const juce::MidiMessage&) {});
    CHECK(arp.getBaseNote() == 124);

    for (double beat = 0.0; beat < 3.0; beat += 1.0) {
        arp.updateTimeRange({beat, beat + 1.0});
        arp.work(collect);
    }

    REQUIRE(played.size() == 3);
    CHECK(played[0].isNoteOn());
    CHECK(played[0].getNoteNumber() == 124);
    CHECK(played[1].isNoteOff());
    CHECK(played[2].isNoteOn());
    CHECK(played[2].getNoteNumber() == 127);
}

// ═══════════════════════════════════════════════════════════════════
// Shutdown
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("EntityActor: NeedsAudio queued behind quit is answered with silence")
{
    auto audio = makeChannel<AudioAction>();
    auto actor = makeActor(std::make_unique<ConstantGenerator>(0.75f), 14);
    actor->send(EntityRequest::subscribeAudio(audio.sender));

    actor->send(EntityRequest::quit());
    auto result = actor->getSender().trySend(EntityRequest::needsAudio(4));
    actor.reset();

    AudioAction action;
    if (result == SendResult::sent) {
        REQUIRE(audio.receiver.tryRecv(action));
        REQUIRE(action.frames.size() == 4);
        for (auto& s : action.frames)
            CHECK(s.isSilent());
    } else {
        CHECK(result == SendResult::closed);
        CHECK_FALSE(audio.receiver.tryRecv(action));
    }
}

TEST_CASE("EntityActor: requests after exit report closed")
{
    auto actor = makeActor(std::make_unique<Inverter>(), 15);
    Sender<EntityRequest> sender = actor->getSender();
    actor.reset();
    CHECK(sender.trySend(EntityRequest::needsAudio(1)) == SendResult::closed);
}
