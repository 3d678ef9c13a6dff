#include "core/Transport.h"

#include <algorithm>

namespace ensemble {

// ═══════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════

Transport::Transport()
{
    EN_DEBUG("Transport: created (stopped, 120 BPM, 4/4)");
}

// ═══════════════════════════════════════════════════════════════════
// State control
// ═══════════════════════════════════════════════════════════════════

void Transport::play()
{
    if (state_ == TransportState::playing) return;
    EN_DEBUG("Transport: play at beat %.4f", positionInBeats_);
    state_ = TransportState::playing;
}

void Transport::stop()
{
    if (state_ == TransportState::stopped) return;
    EN_DEBUG("Transport: stop");
    state_ = TransportState::stopped;
    skipToStart();
}

void Transport::skipToStart()
{
    positionInSamples_ = 0;
    positionInBeats_ = 0.0;
    EN_DEBUG("Transport: skipToStart");
}

// ═══════════════════════════════════════════════════════════════════
// Configuration
// ═══════════════════════════════════════════════════════════════════

void Transport::setSampleRate(double sampleRate)
{
    if (sampleRate <= 0.0) {
        EN_WARN("Transport: setSampleRate rejected (%.2f)", sampleRate);
        return;
    }
    sampleRate_ = sampleRate;
    EN_DEBUG("Transport: setSampleRate %.0f", sampleRate_);
}

void Transport::setTempo(double bpm)
{
    tempo_ = std::clamp(bpm, 1.0, 999.0);
    EN_DEBUG("Transport: setTempo %.2f", tempo_);
}

bool Transport::setTimeSignature(int numerator, int denominator)
{
    bool powerOfTwo = denominator > 0 && (denominator & (denominator - 1)) == 0;
    if (numerator < 1 || numerator > 32 || !powerOfTwo || denominator > 32) {
        EN_WARN("Transport: setTimeSignature rejected %d/%d", numerator, denominator);
        return false;
    }

    timeSignature_ = {numerator, denominator};
    EN_DEBUG("Transport: time signature %d/%d", numerator, denominator);
    return true;
}

// ═══════════════════════════════════════════════════════════════════
// advance
// ═══════════════════════════════════════════════════════════════════

TimeRange Transport::advance(int numFrames)
{
    TimeRange range{positionInBeats_, positionInBeats_};

    if (state_ != TransportState::playing || numFrames <= 0)
        return range;

    positionInSamples_ += numFrames;
    positionInBeats_ += static_cast<double>(numFrames) / sampleRate_ * (tempo_ / 60.0);

    range.endBeats = positionInBeats_;
    return range;
}

// ═══════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════

TransportState Transport::getState() const { return state_; }
bool Transport::isPlaying() const { return state_ == TransportState::playing; }
double Transport::getSampleRate() const { return sampleRate_; }
double Transport::getTempo() const { return tempo_; }

juce::AudioPlayHead::TimeSignature Transport::getTimeSignature() const
{
    return timeSignature_;
}

int64_t Transport::getPositionInSamples() const { return positionInSamples_; }

double Transport::getPositionInSeconds() const
{
    return static_cast<double>(positionInSamples_) / sampleRate_;
}

double Transport::getPositionInBeats() const { return positionInBeats_; }

} // namespace ensemble
