#pragma once

#include <juce_audio_devices/juce_audio_devices.h>
#include <juce_audio_formats/juce_audio_formats.h>

#include <atomic>
#include <memory>
#include <optional>

#include "../engine/TimeSource.hpp"
#include "ClickRenderer.hpp"
#include "HardwareTimestamp.hpp"

namespace virgo {

/**
 * @brief Plays metronome clicks on the audio hardware clock
 *
 * Owns an output-only juce::AudioDeviceManager. Logical beat times (TimeSource
 * seconds) are converted to device sample positions through the anchor the
 * ClickRenderer records each callback, and clicks are handed to the audio
 * thread without locking.
 *
 * Every failure stays inside this class: a missing device, a failed open or a
 * full click queue is logged and the click is skipped. Callers never see an
 * error and logical timing is never affected.
 */
class AudioScheduler : private juce::AudioIODeviceCallback {
  public:
    static constexpr float kAccentMultiplier = 1.3f;

    /**
     * @param clock Clock shared with the TimingEngine
     * @param outputEnabled Open an output device on resume(). Taken from Config when unset.
     */
    explicit AudioScheduler(std::shared_ptr<TimeSource> clock,
                            std::optional<bool> outputEnabled = std::nullopt);
    ~AudioScheduler() override;

    /**
     * @brief Open (or reopen) the output device
     * @return true when an audio session is running
     */
    bool resume();

    /** Close the device. Safe to call repeatedly or before resume(). */
    void stop();

    bool isSessionActive() const {
        return sessionActive_.load(std::memory_order_acquire);
    }

    /**
     * @brief Schedule one click
     *
     * Never throws. The volume is sanitised (non-finite becomes 0), accents are
     * boosted by kAccentMultiplier and the result clamped to [0, 1]. Without a
     * valid timestamp the click plays as soon as possible.
     */
    void playTick(float volume, bool isAccented,
                  std::optional<HardwareTimestamp> atTime = std::nullopt);

    /**
     * @brief Map a TimeSource time onto the device sample clock
     *
     * Adds the configured lookahead so the click lands after the block being
     * rendered. nullopt means "audio unavailable", never a timing error.
     */
    std::optional<HardwareTimestamp> convertToAudioEngineTime(double logicalTime) const;

    /**
     * @brief Use an audio file as the click sound
     *
     * On failure the synthesised click stays in use and the error is returned.
     */
    juce::Result loadClickSample(const juce::File& file);

    /** Final click gain for a volume. */
    static float computeTickGain(float volume, bool isAccented);

    /** Gain of the last playTick(), for monitoring. */
    float getLastTickGain() const {
        return lastTickGain_.load(std::memory_order_relaxed);
    }

    int getDroppedClickCount() const {
        return renderer_.getDroppedClickCount();
    }

    double getLookaheadSeconds() const {
        return lookaheadSeconds_;
    }

  private:
    // juce::AudioIODeviceCallback
    void audioDeviceIOCallbackWithContext(const float* const* inputChannelData,
                                          int numInputChannels, float* const* outputChannelData,
                                          int numOutputChannels, int numSamples,
                                          const juce::AudioIODeviceCallbackContext& context) override;
    void audioDeviceAboutToStart(juce::AudioIODevice* device) override;
    void audioDeviceStopped() override;
    void audioDeviceError(const juce::String& errorMessage) override;

    std::shared_ptr<TimeSource> clock_;
    const bool outputEnabled_;
    const double lookaheadSeconds_;

    std::unique_ptr<juce::AudioDeviceManager> deviceManager_;
    bool callbackRegistered_ = false;

    ClickRenderer renderer_;
    juce::SpinLock scheduleLock_;  // serialises producers into the SPSC click queue

    std::atomic<bool> sessionActive_{false};
    std::atomic<float> lastTickGain_{0.0f};

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AudioScheduler)
};

}  // namespace virgo
