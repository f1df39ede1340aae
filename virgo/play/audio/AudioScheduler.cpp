#include "AudioScheduler.hpp"

#include <cmath>

#include "../core/Config.hpp"

namespace virgo {

AudioScheduler::AudioScheduler(std::shared_ptr<TimeSource> clock, std::optional<bool> outputEnabled)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemTimeSource>()),
      outputEnabled_(outputEnabled.value_or(Config::getInstance().getAudioOutputEnabled())),
      lookaheadSeconds_(juce::jmax(0, Config::getInstance().getAudioLookaheadMs()) * 0.001) {
    auto samplePath = Config::getInstance().getClickSamplePath();
    if (!samplePath.empty()) {
        auto result = loadClickSample(juce::File(samplePath));
        if (result.failed())
            DBG("AudioScheduler: using synthesised click (" << result.getErrorMessage() << ")");
    }
}

AudioScheduler::~AudioScheduler() {
    stop();
}

// =============================================================================
// Session control
// =============================================================================

bool AudioScheduler::resume() {
    if (!outputEnabled_) {
        DBG("AudioScheduler: audio output disabled, clicks are silent");
        return false;
    }
    if (isSessionActive())
        return true;

    if (deviceManager_ == nullptr)
        deviceManager_ = std::make_unique<juce::AudioDeviceManager>();

    if (deviceManager_->getCurrentAudioDevice() == nullptr) {
        auto preferred = juce::String(Config::getInstance().getPreferredOutputDevice());
        auto error = deviceManager_->initialise(0, 2, nullptr, true, preferred, nullptr);
        if (error.isNotEmpty()) {
            DBG("AudioScheduler: failed to open output device: " << error);
            return false;
        }
    }

    auto* device = deviceManager_->getCurrentAudioDevice();
    if (device == nullptr) {
        DBG("AudioScheduler: no output device available");
        return false;
    }
    DBG("AudioScheduler: output device " << device->getName() << " at "
                                         << device->getCurrentSampleRate() << " Hz");

    if (!callbackRegistered_) {
        // audioDeviceAboutToStart runs synchronously from here
        deviceManager_->addAudioCallback(this);
        callbackRegistered_ = true;
    }
    return isSessionActive();
}

void AudioScheduler::stop() {
    if (deviceManager_ == nullptr)
        return;

    if (callbackRegistered_) {
        deviceManager_->removeAudioCallback(this);
        callbackRegistered_ = false;
    }
    deviceManager_->closeAudioDevice();
    sessionActive_.store(false, std::memory_order_release);
}

// =============================================================================
// Scheduling
// =============================================================================

float AudioScheduler::computeTickGain(float volume, bool isAccented) {
    float sanitised = std::isfinite(volume) ? volume : 0.0f;
    float gain = isAccented ? sanitised * kAccentMultiplier : sanitised;
    return juce::jlimit(0.0f, 1.0f, gain);
}

void AudioScheduler::playTick(float volume, bool isAccented,
                              std::optional<HardwareTimestamp> atTime) {
    float gain = computeTickGain(volume, isAccented);
    lastTickGain_.store(gain, std::memory_order_relaxed);

    if (!isSessionActive())
        return;

    juce::int64 position = -1;
    if (atTime && atTime->isValid() && atTime->sampleRate == renderer_.getSampleRate())
        position = atTime->samplePosition;

    bool queued = false;
    {
        const juce::SpinLock::ScopedLockType lock(scheduleLock_);
        queued = renderer_.schedule(gain, isAccented, position);
    }
    if (!queued)
        DBG("AudioScheduler: click queue full, dropping click");
}

std::optional<HardwareTimestamp> AudioScheduler::convertToAudioEngineTime(double logicalTime) const {
    if (!isSessionActive())
        return std::nullopt;

    auto position = renderer_.samplePositionForTime(logicalTime + lookaheadSeconds_);
    if (!position)
        return std::nullopt;

    return HardwareTimestamp{*position, renderer_.getSampleRate()};
}

juce::Result AudioScheduler::loadClickSample(const juce::File& file) {
    if (!file.existsAsFile())
        return juce::Result::fail("Click sample not found: " + file.getFullPathName());

    juce::AudioFormatManager formatManager;
    formatManager.registerBasicFormats();

    std::unique_ptr<juce::AudioFormatReader> reader(formatManager.createReaderFor(file));
    if (reader == nullptr)
        return juce::Result::fail("Unsupported click sample: " + file.getFullPathName());

    auto length = static_cast<int>(reader->lengthInSamples);
    if (length <= 0)
        return juce::Result::fail("Empty click sample: " + file.getFullPathName());

    juce::AudioBuffer<float> buffer(static_cast<int>(reader->numChannels), length);
    if (!reader->read(&buffer, 0, length, 0, true, true))
        return juce::Result::fail("Failed to read click sample: " + file.getFullPathName());

    renderer_.setClickSample(buffer);
    DBG("AudioScheduler: loaded click sample " << file.getFileName());
    return juce::Result::ok();
}

// =============================================================================
// juce::AudioIODeviceCallback
// =============================================================================

void AudioScheduler::audioDeviceIOCallbackWithContext(
    const float* const* inputChannelData, int numInputChannels, float* const* outputChannelData,
    int numOutputChannels, int numSamples, const juce::AudioIODeviceCallbackContext& context) {
    juce::ignoreUnused(inputChannelData, numInputChannels, context);
    renderer_.render(outputChannelData, numOutputChannels, numSamples, clock_->nowSeconds());
}

void AudioScheduler::audioDeviceAboutToStart(juce::AudioIODevice* device) {
    renderer_.prepare(device->getCurrentSampleRate(), device->getCurrentBufferSizeSamples());
    sessionActive_.store(true, std::memory_order_release);
}

void AudioScheduler::audioDeviceStopped() {
    sessionActive_.store(false, std::memory_order_release);
    renderer_.release();
}

void AudioScheduler::audioDeviceError(const juce::String& errorMessage) {
    DBG("AudioScheduler: device error: " << errorMessage);
    sessionActive_.store(false, std::memory_order_release);
}

}  // namespace virgo
