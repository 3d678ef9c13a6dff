#pragma once

#include "core/Channel.h"
#include "core/Types.h"

#include <juce_audio_formats/juce_audio_formats.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace ensemble {

struct WavWriterInput {
    enum class Type { reset, frames, quit };

    Type type = Type::quit;
    std::string path;
    double sampleRate = 0.0;
    int channelCount = 0;
    FrameBatch frames;

    static WavWriterInput reset(const std::string& path, double sampleRate, int channelCount)
    {
        WavWriterInput in;
        in.type = Type::reset;
        in.path = path;
        in.sampleRate = sampleRate;
        in.channelCount = channelCount;
        return in;
    }

    static WavWriterInput write(const FrameBatch& frames)
    {
        WavWriterInput in;
        in.type = Type::frames;
        in.frames = frames;
        return in;
    }

    static WavWriterInput quit()
    {
        WavWriterInput in;
        in.type = Type::quit;
        return in;
    }
};

struct WavWriterEvent {
    enum class Type { error };

    Type type = Type::error;
    std::string message;
};

/// Append-only 32-bit float WAV sink on its own worker. Nothing is written
/// until the first non-silent sample after a reset.
class WavWriterService {
public:
    explicit WavWriterService(Sender<WavWriterEvent> events = {});
    ~WavWriterService();

    WavWriterService(const WavWriterService&) = delete;
    WavWriterService& operator=(const WavWriterService&) = delete;

    void send(const WavWriterInput& input) const;
    const Sender<WavWriterInput>& getSender() const;

private:
    void run();
    void reset(const std::string& path, double sampleRate, int channelCount);
    void write(const FrameBatch& frames);
    void close();
    void reportError(const std::string& message);

    Sender<WavWriterEvent> events_;
    Sender<WavWriterInput> inputSender_;
    Receiver<WavWriterInput> inputs_;

    // Worker-only state
    std::unique_ptr<juce::AudioFormatWriter> writer_;
    std::string path_;
    int channelCount_ = 0;
    bool capturing_ = false;
    int64_t framesWritten_ = 0;
    std::vector<float> left_;
    std::vector<float> right_;

    std::thread worker_;
};

} // namespace ensemble
