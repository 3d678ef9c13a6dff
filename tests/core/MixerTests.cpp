#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "core/Mixer.h"

#include <vector>

using namespace ensemble;
using Catch::Matchers::WithinAbs;

static TrackUid trackUid(std::size_t value)
{
    return TrackUid{value};
}

// ═══════════════════════════════════════════════════════════════════
// Registration
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Mixer: new tracks start at full level, unmuted")
{
    Mixer mixer;
    mixer.addTrack(trackUid(1));
    CHECK(mixer.hasTrack(trackUid(1)));
    CHECK(mixer.getTrackCount() == 1);
    CHECK(mixer.getLevel(trackUid(1)) == Mixer::kMaxLevel);
    CHECK_FALSE(mixer.isMuted(trackUid(1)));
    CHECK(mixer.getRelativeLevel(trackUid(1)) == 1.0f);
}

TEST_CASE("Mixer: adding a track twice keeps its settings")
{
    Mixer mixer;
    mixer.addTrack(trackUid(1));
    mixer.setLevel(trackUid(1), 0.3f);
    mixer.addTrack(trackUid(1));
    CHECK(mixer.getTrackCount() == 1);
    CHECK_THAT(mixer.getLevel(trackUid(1)), WithinAbs(0.3, 1e-6));
}

TEST_CASE("Mixer: removeTrack reports unknown tracks")
{
    Mixer mixer;
    mixer.addTrack(trackUid(1));
    CHECK(mixer.removeTrack(trackUid(1)));
    CHECK_FALSE(mixer.removeTrack(trackUid(1)));
    CHECK(mixer.getTrackCount() == 0);
}

// ═══════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Mixer: relative levels are normalized by the sum of levels")
{
    Mixer mixer;
    mixer.addTrack(trackUid(1));
    mixer.addTrack(trackUid(2));
    CHECK_THAT(mixer.getRelativeLevel(trackUid(1)), WithinAbs(0.5, 1e-6));
    CHECK_THAT(mixer.getRelativeLevel(trackUid(2)), WithinAbs(0.5, 1e-6));

    mixer.setLevel(trackUid(2), 0.25f);
    CHECK_THAT(mixer.getRelativeLevel(trackUid(1)), WithinAbs(0.8, 1e-6));
    CHECK_THAT(mixer.getRelativeLevel(trackUid(2)), WithinAbs(0.2, 1e-6));

    mixer.removeTrack(trackUid(2));
    CHECK_THAT(mixer.getRelativeLevel(trackUid(1)), WithinAbs(1.0, 1e-6));
}

TEST_CASE("Mixer: setLevel clamps to the allowed range")
{
    Mixer mixer;
    mixer.addTrack(trackUid(1));
    mixer.setLevel(trackUid(1), 4.0f);
    CHECK(mixer.getLevel(trackUid(1)) == Mixer::kMaxLevel);
    mixer.setLevel(trackUid(1), -1.0f);
    CHECK(mixer.getLevel(trackUid(1)) == Mixer::kMinLevel);
}

TEST_CASE("Mixer: setters reject unknown tracks")
{
    Mixer mixer;
    CHECK_FALSE(mixer.setLevel(trackUid(9), 0.5f));
    CHECK_FALSE(mixer.setMuted(trackUid(9), true));
    CHECK(mixer.getRelativeLevel(trackUid(9)) == 0.0f);
}

TEST_CASE("Mixer: muting does not change relative levels")
{
    Mixer mixer;
    mixer.addTrack(trackUid(1));
    mixer.addTrack(trackUid(2));
    mixer.setMuted(trackUid(1), true);
    CHECK(mixer.isMuted(trackUid(1)));
    CHECK_THAT(mixer.getRelativeLevel(trackUid(2)), WithinAbs(0.5, 1e-6));
}

// ═══════════════════════════════════════════════════════════════════
// Mixing
// ═══════════════════════════════════════════════════════════════════

TEST_CASE("Mixer: mix accumulates scaled frames into the destination")
{
    Mixer mixer;
    mixer.addTrack(trackUid(1));
    mixer.addTrack(trackUid(2));

    std::vector<StereoSample> a(4, {1.0f, -1.0f});
    std::vector<StereoSample> b(4, {0.5f, 0.5f});
    std::vector<StereoSample> out(4);

    mixer.mix(trackUid(1), a.data(), out.data(), 4);
    mixer.mix(trackUid(2), b.data(), out.data(), 4);

    for (auto& s : out) {
        CHECK_THAT(s.left, WithinAbs(0.75, 1e-6));
        CHECK_THAT(s.right, WithinAbs(-0.25, 1e-6));
    }
}

TEST_CASE("Mixer: muted, silent-level and unknown tracks contribute nothing")
{
    Mixer mixer;
    mixer.addTrack(trackUid(1));
    mixer.addTrack(trackUid(2));
    mixer.setMuted(trackUid(1), true);
    mixer.setLevel(trackUid(2), 0.0f);

    std::vector<StereoSample> in(8, {1.0f, 1.0f});
    std::vector<StereoSample> out(8);
    mixer.mix(trackUid(1), in.data(), out.data(), 8);
    mixer.mix(trackUid(2), in.data(), out.data(), 8);
    mixer.mix(trackUid(3), in.data(), out.data(), 8);

    for (auto& s : out)
        CHECK(s.isSilent());
}
