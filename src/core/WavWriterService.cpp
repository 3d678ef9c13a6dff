#include "core/WavWriterService.h"
#include "core/Logger.h"

namespace ensemble {

WavWriterService::WavWriterService(Sender<WavWriterEvent> events)
    : events_(std::move(events))
{
    auto pair = makeChannel<WavWriterInput>();
    inputSender_ = pair.sender;
    inputs_ = std::move(pair.receiver);

    left_.reserve(kMaxBatchFrames);
    right_.reserve(kMaxBatchFrames);

    worker_ = std::thread([this] { run(); });
    EN_DEBUG("WavWriterService: started");
}

WavWriterService::~WavWriterService()
{
    send(WavWriterInput::quit());
    if (worker_.joinable())
        worker_.join();
    EN_DEBUG("WavWriterService: destroyed");
}

void WavWriterService::send(const WavWriterInput& input) const
{
    auto result = inputSender_.trySend(input);
    if (result != SendResult::sent)
        EN_DEBUG("WavWriterService::send: dropped (%s)", sendResultName(result));
}

const Sender<WavWriterInput>& WavWriterService::getSender() const
{
    return inputSender_;
}

void WavWriterService::run()
{
    auto wakeup = inputs_.getWakeup();
    WavWriterInput input;
    bool running = true;

    while (running) {
        if (!inputs_.tryRecv(input)) {
            wakeup->wait();
            continue;
        }

        switch (input.type) {
            case WavWriterInput::Type::reset:
                reset(input.path, input.sampleRate, input.channelCount);
                break;
            case WavWriterInput::Type::frames:
                write(input.frames);
                break;
            case WavWriterInput::Type::quit:
                running = false;
                break;
        }
    }

    inputs_.close();
    close();
}

// ═══════════════════════════════════════════════════════════════════
// File handling
// ═══════════════════════════════════════════════════════════════════

void WavWriterService::reset(const std::string& path, double sampleRate, int channelCount)
{
    close();

    if (channelCount < 1 || channelCount > 2) {
        reportError("Unsupported channel count " + std::to_string(channelCount) + " for " + path);
        return;
    }
    if (sampleRate <= 0.0) {
        reportError("Invalid sample rate for " + path);
        return;
    }

    auto file = juce::File::getCurrentWorkingDirectory().getChildFile(juce::String(path));
    if (!file.getParentDirectory().isDirectory()) {
        reportError("Directory does not exist for " + path);
        return;
    }

    auto stream = std::make_unique<juce::FileOutputStream>(file);
    if (!stream->openedOk()) {
        reportError("Cannot open " + path + ": " + stream->getStatus().getErrorMessage().toStdString());
        return;
    }
    if (!stream->setPosition(0)) {
        reportError("Cannot rewind " + path);
        return;
    }
    auto truncated = stream->truncate();
    if (truncated.failed()) {
        reportError("Cannot truncate " + path + ": " + truncated.getErrorMessage().toStdString());
        return;
    }

    juce::WavAudioFormat format;
    std::unique_ptr<juce::AudioFormatWriter> writer(
        format.createWriterFor(stream.get(), sampleRate, static_cast<unsigned int>(channelCount),
                               32, {}, 0));
    if (!writer) {
        reportError("Cannot create WAV writer for " + path);
        return;
    }

    // The writer owns the stream from here on.
    stream.release();
    writer_ = std::move(writer);
    path_ = path;
    channelCount_ = channelCount;
    capturing_ = false;
    framesWritten_ = 0;
    EN_INFO("WavWriterService: recording to %s (sr=%.0f ch=%d)", path.c_str(), sampleRate,
            channelCount);
}

void WavWriterService::write(const FrameBatch& frames)
{
    if (!writer_)
        return;

    size_t start = 0;
    if (!capturing_) {
        while (start < frames.size() && frames[start].isSilent())
            ++start;
        if (start == frames.size())
            return;
        capturing_ = true;
        EN_DEBUG("WavWriterService: first audible sample, capture started");
    }

    left_.clear();
    right_.clear();
    for (size_t i = start; i < frames.size(); ++i) {
        if (channelCount_ == 1) {
            left_.push_back((frames[i].left + frames[i].right) * 0.5f);
        } else {
            left_.push_back(frames[i].left);
            right_.push_back(frames[i].right);
        }
    }

    const float* channels[] = {left_.data(), right_.data()};
    int numFrames = static_cast<int>(left_.size());
    if (!writer_->writeFromFloatArrays(channels, channelCount_, numFrames)) {
        std::string message = "Write failed for " + path_;
        writer_.reset();
        reportError(message);
        return;
    }
    framesWritten_ += numFrames;
}

void WavWriterService::close()
{
    if (!writer_)
        return;
    writer_.reset();
    EN_INFO("WavWriterService: closed %s after %lld frames", path_.c_str(),
            (long long)framesWritten_);
}

void WavWriterService::reportError(const std::string& message)
{
    EN_WARN("WavWriterService: %s", message.c_str());
    WavWriterEvent event;
    event.type = WavWriterEvent::Type::error;
    event.message = message;
    auto result = events_.trySend(event);
    if (result != SendResult::sent)
        EN_DEBUG("WavWriterService: error event dropped (%s)", sendResultName(result));
}

} // namespace ensemble
