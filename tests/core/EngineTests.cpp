#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/Engine.h"
#include "core/ToyEntities.h"

#include <chrono>
#include <memory>
#include <thread>

using namespace ensemble;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {

class Offset : public Entity, public TransformsAudio {
public:
    explicit Offset(Sample amount) : Entity("Offset"), amount_(amount) {}

    void transform(StereoSample* frames, int numFrames) override
    {
        for (int i = 0; i < numFrames; ++i)
            frames[i] = {frames[i].left + amount_, frames[i].right + amount_};
    }

private:
    Sample amount_;
};

class NoteRepeater : public Entity, public HandlesMidi {
public:
    NoteRepeater() : Entity("NoteRepeater") {}

    void handleMidiMessage(MidiChannel channel, const juce::MidiMessage& message,
                           const MidiEventFn& emit) override
    {
        if (message.isNoteOn())
            emit(channel, message);
    }
};

// Collects the master track's output for one engine.
struct Listener {
    explicit Listener(Engine& engine)
        : engine(engine),
          audio(makeChannel<TrackAudioAction>()),
          midi(makeChannel<MidiAction>())
    {
        engine.subscribeAudio(audio.sender);
        engine.subscribeMidi(midi.sender);
    }

    FrameBatch generate(int numFrames)
    {
        engine.startGeneration(numFrames);
        TrackAudioAction action;
        REQUIRE(audio.receiver.recvFor(action, 2000ms));
        CHECK(action.trackUid == engine.getMasterUid());
        return action.frames;
    }

    Engine& engine;
    ChannelPair<TrackAudioAction> audio;
    ChannelPair<MidiAction> midi;
};

void checkAll(const FrameBatch& frames, float value)
{
    for (auto& s : frames) {
        CHECK_THAT(s.left, WithinAbs(value, 1e-6));
        CHECK_THAT(s.right, WithinAbs(value, 1e-6));
    }
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
// Tracks
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Engine: reports a version")
{
    Engine engine;
    CHECK_FALSE(engine.getVersion().empty());
}

TEST_CASE("Engine: master track exists at construction")
{
    Engine engine;
    CHECK(engine.getMasterUid().isValid());
    CHECK(engine.getTrackCount() == 0);
}

TEST_CASE("Engine: createTrack mints distinct ids")
{
    Engine engine;
    auto a = engine.createTrack();
    auto b = engine.createTrack();
    CHECK(a.isValid());
    CHECK(b.isValid());
    CHECK(a != b);
    CHECK(a != engine.getMasterUid());
    CHECK(engine.getTrackCount() == 2);
    CHECK(engine.getTrackUids() == std::vector<TrackUid>{a, b});
}

TEST_CASE("Engine: deleteTrack removes only known tracks")
{
    Engine engine;
    auto a = engine.createTrack();
    CHECK(engine.deleteTrack(a));
    CHECK_FALSE(engine.deleteTrack(a));
    CHECK_FALSE(engine.deleteTrack(engine.getMasterUid()));
    CHECK(engine.getTrackCount() == 0);
}

TEST_CASE("Engine: injected factories are shared between engines")
{
    auto entityUids = std::make_shared<EntityUidFactory>();
    auto trackUids = std::make_shared<TrackUidFactory>();
    Engine first(entityUids, trackUids);
    Engine second(entityUids, trackUids);
    CHECK(first.getMasterUid() != second.getMasterUid());

    std::string error;
    auto a = first.addEntity(first.createTrack(), std::make_unique<Inverter>(), EntityRole::source, error);
    auto b = second.addEntity(second.createTrack(), std::make_unique<Inverter>(), EntityRole::source, error);
    CHECK(a != b);
}

// ═══════════════════════════════════════════════════════════════════
// Generation
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Engine: empty engine generates silence")
{
    Engine engine;
    Listener listener(engine);
    auto frames = listener.generate(16);
    REQUIRE(frames.size() == 16);
    checkAll(frames, 0.0f);
}

TEST_CASE("Engine: track output reaches the master")
{
    Engine engine;
    Listener listener(engine);
    std::string error;
    auto track = engine.createTrack();
    REQUIRE(engine.addEntity(track, std::make_unique<ConstantGenerator>(0.5f), EntityRole::source, error).isValid());

    auto frames = listener.generate(kMaxBatchFrames);
    REQUIRE(frames.size() == (size_t)kMaxBatchFrames);
    checkAll(frames, 0.5f);
}

TEST_CASE("Engine: master normalizes across tracks")
{
    Engine engine;
    Listener listener(engine);
    std::string error;
    auto a = engine.createTrack();
    auto b = engine.createTrack();
    engine.addEntity(a, std::make_unique<ConstantGenerator>(0.5f), EntityRole::source, error);
    engine.addEntity(b, std::make_unique<ConstantGenerator>(0.25f), EntityRole::source, error);

    checkAll(listener.generate(8), 0.375f);

    REQUIRE(engine.setTrackMuted(b, true));
    checkAll(listener.generate(8), 0.25f);

    REQUIRE(engine.setTrackMuted(b, false));
    REQUIRE(engine.setTrackLevel(b, 0.0f));
    checkAll(listener.generate(8), 0.5f);
}

TEST_CASE("Engine: mixer setters reject unknown tracks")
{
    Engine engine;
    CHECK_FALSE(engine.setTrackLevel(TrackUid{999}, 0.5f));
    CHECK_FALSE(engine.setTrackMuted(engine.getMasterUid(), true));
}

TEST_CASE("Engine: effects on a track transform its output")
{
    Engine engine;
    Listener listener(engine);
    std::string error;
    auto track = engine.createTrack();
    engine.addEntity(track, std::make_unique<ConstantGenerator>(0.5f), EntityRole::source, error);
    engine.addEntity(track, std::make_unique<Inverter>(), EntityRole::effect, error);
    auto quiet = engine.addEntity(track, std::make_unique<Quietener>(0.5), EntityRole::effect, error);
    REQUIRE(quiet.isValid());

    checkAll(listener.generate(8), -0.25f);

    REQUIRE(engine.setControl(quiet, 0, 1.0));
    checkAll(listener.generate(8), -0.5f);
}

TEST_CASE("Engine: effects on the master apply to the mix")
{
    Engine engine;
    Listener listener(engine);
    std::string error;
    auto track = engine.createTrack();
    engine.addEntity(track, std::make_unique<ConstantGenerator>(0.5f), EntityRole::source, error);
    REQUIRE(engine.addEntity(engine.getMasterUid(), std::make_unique<Inverter>(), EntityRole::effect, error).isValid());
    checkAll(listener.generate(8), -0.5f);
}

TEST_CASE("Engine: removed entity stops contributing")
{
    Engine engine;
    Listener listener(engine);
    std::string error;
    auto track = engine.createTrack();
    auto gen = engine.addEntity(track, std::make_unique<ConstantGenerator>(0.5f), EntityRole::source, error);
    checkAll(listener.generate(4), 0.5f);

    REQUIRE(engine.removeEntity(gen));
    CHECK_FALSE(engine.removeEntity(gen));
    CHECK(engine.getEntity(gen) == nullptr);
    checkAll(listener.generate(4), 0.0f);
}

TEST_CASE("Engine: deleted track stops contributing")
{
    Engine engine;
    Listener listener(engine);
    std::string error;
    auto a = engine.createTrack();
    auto b = engine.createTrack();
    engine.addEntity(a, std::make_unique<ConstantGenerator>(0.5f), EntityRole::source, error);
    auto gen = engine.addEntity(b, std::make_unique<ConstantGenerator>(0.25f), EntityRole::source, error);

    REQUIRE(engine.deleteTrack(b));
    CHECK(engine.getEntity(gen) == nullptr);
    checkAll(listener.generate(4), 0.5f);
}

TEST_CASE("Engine: startGeneration ignores non-positive frame counts")
{
    Engine engine;
    Listener listener(engine);
    engine.startGeneration(0);
    engine.startGeneration(-4);
    TrackAudioAction action;
    CHECK_FALSE(listener.audio.receiver.recvFor(action, 50ms));
}

// ═══════════════════════════════════════════════════════════════════
// Entities
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Engine: addEntity validates its arguments")
{
    Engine engine;
    auto track = engine.createTrack();
    std::string error;

    CHECK_FALSE(engine.addEntity(track, nullptr, EntityRole::source, error).isValid());
    CHECK_FALSE(error.empty());

    error.clear();
    CHECK_FALSE(engine.addEntity(TrackUid{999}, std::make_unique<Inverter>(), EntityRole::source, error).isValid());
    CHECK_FALSE(error.empty());

    error.clear();
    CHECK_FALSE(engine.addEntity(track, std::make_unique<ConstantGenerator>(), EntityRole::effect, error).isValid());
    CHECK(error.find("cannot transform") != std::string::npos);
}

TEST_CASE("Engine: addEntity records the entity and its track")
{
    Engine engine;
    auto track = engine.createTrack();
    std::string error;
    auto uid = engine.addEntity(track, std::make_unique<Quietener>(), EntityRole::effect, error);
    REQUIRE(uid.isValid());

    auto handle = engine.getEntity(uid);
    REQUIRE(handle != nullptr);
    CHECK(handle->getUid() == uid);
    CHECK(handle->transformsAudio());
    CHECK(engine.getEntityTrack(uid) == track);
    CHECK(handle->peek([](const Entity& e) { return e.getName(); }) == "Quietener");
}

TEST_CASE("Engine: setControl rejects unknown entities and indexes")
{
    Engine engine;
    auto track = engine.createTrack();
    std::string error;
    auto uid = engine.addEntity(track, std::make_unique<Quietener>(), EntityRole::effect, error);

    CHECK_FALSE(engine.setControl(Uid{999}, 0, 0.5));
    CHECK_FALSE(engine.setControl(uid, 1, 0.5));
    CHECK_FALSE(engine.setControl(uid, -1, 0.5));
    CHECK(engine.setControl(uid, 0, 0.5));
}

TEST_CASE("Engine: moveEffect reorders a track's chain")
{
    Engine engine;
    Listener listener(engine);
    std::string error;
    auto track = engine.createTrack();
    engine.addEntity(track, std::make_unique<ConstantGenerator>(0.5f), EntityRole::source, error);
    auto offset = engine.addEntity(track, std::make_unique<Offset>(0.5f), EntityRole::effect, error);
    engine.addEntity(track, std::make_unique<Inverter>(), EntityRole::effect, error);
    checkAll(listener.generate(4), -1.0f);

    CHECK(engine.moveEffect(offset, 1));
    CHECK_FALSE(engine.moveEffect(Uid{999}, 0));
    checkAll(listener.generate(4), 0.0f);
}

TEST_CASE("Engine: new entities receive the current configuration")
{
    Engine engine;
    engine.updateSampleRate(48000.0);
    auto track = engine.createTrack();
    std::string error;
    auto uid = engine.addEntity(track, std::make_unique<ToyInstrument>(), EntityRole::source, error);
    REQUIRE(uid.isValid());
    CHECK(engine.getConfiguration().sampleRate == 48000.0);
}

// ═══════════════════════════════════════════════════════════════════
// Control links
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Engine: linkControl validates links")
{
    Engine engine;
    std::string error;
    auto a = engine.createTrack();
    auto b = engine.createTrack();
    auto drone = engine.addEntity(a, std::make_unique<DroneController>(), EntityRole::source, error);
    auto quiet = engine.addEntity(a, std::make_unique<Quietener>(), EntityRole::effect, error);
    auto elsewhere = engine.addEntity(b, std::make_unique<Quietener>(), EntityRole::effect, error);

    CHECK_FALSE(engine.linkControl({drone, Uid{999}, 0}, error));
    CHECK_FALSE(engine.linkControl({drone, elsewhere, 0}, error));
    CHECK(error.find("share a track") != std::string::npos);
    CHECK_FALSE(engine.linkControl({drone, quiet, 1}, error));

    CHECK(engine.linkControl({drone, quiet, 0}, error));
    CHECK_FALSE(engine.linkControl({drone, quiet, 0}, error));
    CHECK(engine.getControlLinks().size() == 1);

    CHECK(engine.unlinkControl({drone, quiet, 0}, error));
    CHECK_FALSE(engine.unlinkControl({drone, quiet, 0}, error));
    CHECK(engine.getControlLinks().empty());
}

TEST_CASE("Engine: removing an entity drops its links")
{
    Engine engine;
    std::string error;
    auto track = engine.createTrack();
    auto drone = engine.addEntity(track, std::make_unique<DroneController>(), EntityRole::source, error);
    auto quiet = engine.addEntity(track, std::make_unique<Quietener>(), EntityRole::effect, error);
    REQUIRE(engine.linkControl({drone, quiet, 0}, error));

    engine.removeEntity(quiet);
    CHECK(engine.getControlLinks().empty());
}

TEST_CASE("Engine: linked drone modulates the effect during generation")
{
    Engine engine;
    Listener listener(engine);
    std::string error;
    auto track = engine.createTrack();
    auto drone = engine.addEntity(track, std::make_unique<DroneController>(1.0), EntityRole::source, error);
    auto quiet = engine.addEntity(track, std::make_unique<Quietener>(0.0), EntityRole::effect, error);
    REQUIRE(engine.linkControl({drone, quiet, 0}, error));

    listener.generate(8);
    listener.generate(8);

    auto handle = engine.getEntity(quiet);
    CHECK(eventually([&] {
        return handle->peek([](const Entity& e) { return e.getControl(0); }) > 0.99;
    }));
}

// ═══════════════════════════════════════════════════════════════════
// MIDI
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Engine: handleMidi reaches instruments on every track")
{
    Engine engine;
    std::string error;
    auto a = engine.createTrack();
    auto b = engine.createTrack();
    auto first = engine.addEntity(a, std::make_unique<ToyInstrument>(), EntityRole::source, error);
    auto second = engine.addEntity(b, std::make_unique<ToyInstrument>(), EntityRole::source, error);

    engine.handleMidi(0, juce::MidiMessage::noteOn(1, 67, (juce::uint8)100));

    auto noteOf = [&engine](Uid uid) {
        return engine.getEntity(uid)->peek([](const Entity& e) {
            return static_cast<const ToyInstrument&>(e).getCurrentNote();
        });
    };
    CHECK(eventually([&] { return noteOf(first) == 67 && noteOf(second) == 67; }));

    engine.stop();
    CHECK(eventually([&] { return noteOf(first) == -1 && noteOf(second) == -1; }));
}

TEST_CASE("Engine: entity MIDI is published through the master")
{
    Engine engine;
    Listener listener(engine);
    std::string error;
    auto track = engine.createTrack();
    auto repeater = engine.addEntity(track, std::make_unique<NoteRepeater>(), EntityRole::source, error);

    engine.handleMidi(3, juce::MidiMessage::noteOn(4, 50, (juce::uint8)80));

    MidiAction action;
    REQUIRE(listener.midi.receiver.recvFor(action, 2000ms));
    CHECK(action.sourceUid == repeater);
    CHECK(action.channel == 3);
    CHECK(action.message.getNoteNumber() == 50);
}

// ═══════════════════════════════════════════════════════════════════
// Transport and configuration
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Engine: generation advances the transport only while playing")
{
    Engine engine;
    Listener listener(engine);

    listener.generate(32);
    CHECK(engine.getPositionInSamples() == 0);

    engine.play();
    CHECK(engine.isPlaying());
    listener.generate(32);
    listener.generate(32);
    CHECK(engine.getPositionInSamples() == 64);
    CHECK(engine.getPositionInBeats() > 0.0);

    engine.skipToStart();
    CHECK(engine.getPositionInSamples() == 0);
    CHECK(engine.isPlaying());

    listener.generate(16);
    engine.stop();
    CHECK_FALSE(engine.isPlaying());
    CHECK(engine.getPositionInSamples() == 0);
}

TEST_CASE("Engine: configuration updates are validated")
{
    Engine engine;
    engine.updateSampleRate(96000.0);
    engine.updateSampleRate(-1.0);
    CHECK(engine.getConfiguration().sampleRate == 96000.0);

    engine.updateTempo(2000.0);
    CHECK(engine.getConfiguration().tempo == 999.0);

    CHECK(engine.updateTimeSignature(3, 4));
    CHECK_FALSE(engine.updateTimeSignature(3, 5));
    CHECK(engine.getConfiguration().timeSignature.numerator == 3);
    CHECK(engine.getConfiguration().timeSignature.denominator == 4);
}

// ═══════════════════════════════════════════════════════════════════
// Shutdown
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Engine: requestQuit stops every track and is idempotent")
{
    Engine engine;
    std::string error;
    auto track = engine.createTrack();
    engine.addEntity(track, std::make_unique<ConstantGenerator>(), EntityRole::source, error);

    engine.requestQuit();
    engine.requestQuit();
    CHECK(engine.getTrackCount() == 0);
    CHECK_FALSE(engine.getMasterUid().isValid());
    CHECK_FALSE(engine.createTrack().isValid());

    // Further calls are harmless.
    engine.startGeneration(8);
    engine.handleMidi(0, juce::MidiMessage::allNotesOff(1));
}
