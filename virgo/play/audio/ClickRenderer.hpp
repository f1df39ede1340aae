#pragma once

#include <juce_audio_basics/juce_audio_basics.h>

#include <array>
#include <atomic>
#include <optional>

#include "LockFreeQueue.hpp"

namespace virgo {

/**
 * @brief A click waiting for the audio thread
 */
struct ScheduledClick {
    float gain = 0.0f;
    bool accent = false;
    juce::int64 samplePosition = -1;  // -1 = as soon as possible
};

/**
 * @brief Audio-thread half of the click scheduler
 *
 * Mixes click voices into the device output at sample-accurate offsets and
 * keeps the device sample clock. Every render() records an anchor pair
 * (sample position at block start, TimeSource seconds at callback entry) so
 * other threads can map clock times onto sample positions.
 *
 * Threading:
 * - schedule(): one producer at a time (callers serialise through AudioScheduler)
 * - prepare()/render()/release(): audio device thread
 * - setClickSample()/useSynthesisedClick(): message thread
 * - samplePositionForTime() and the counters: any thread
 */
class ClickRenderer {
  public:
    static constexpr int kMaxVoices = 8;
    static constexpr int kClickQueueSize = 64;
    static constexpr double kClickLengthSeconds = 0.03;
    static constexpr double kClickFrequencyHz = 1000.0;
    static constexpr double kAccentFrequencyHz = 1500.0;

    ClickRenderer() = default;

    /** Use a loaded sample for both normal and accented clicks (mixed to mono). */
    void setClickSample(const juce::AudioBuffer<float>& sample);

    /** Go back to the synthesised clicks. */
    void useSynthesisedClick();

    bool isUsingSynthesisedClick() const;

    /**
     * @brief Queue a click for the audio thread
     * @return false when the queue is full and the click was dropped
     */
    bool schedule(float gain, bool accent, juce::int64 samplePosition);

    // Audio thread
    void prepare(double sampleRate, int maximumBlockSize);
    void render(float* const* outputs, int numChannels, int numSamples, double hostSeconds);
    void release();

    /**
     * @brief Sample position at which a TimeSource time falls
     * @return nullopt before the first rendered block or after release()
     */
    std::optional<juce::int64> samplePositionForTime(double seconds) const;

    double getSampleRate() const {
        return sampleRate_.load(std::memory_order_acquire);
    }
    juce::int64 getSamplePosition() const {
        return samplePosition_.load(std::memory_order_acquire);
    }
    int getDroppedClickCount() const {
        return droppedClicks_.load(std::memory_order_relaxed);
    }
    int getRenderedClickCount() const {
        return renderedClicks_.load(std::memory_order_relaxed);
    }

    /** Short decaying sine, higher pitched for accents. */
    static juce::AudioBuffer<float> synthesiseClick(double sampleRate, bool accent);

  private:
    struct Voice {
        bool active = false;
        bool accent = false;
        float gain = 0.0f;
        juce::int64 startSample = 0;
        int readPosition = 0;
        juce::uint32 generation = 0;  // click sounds it was started with
    };

    void rebuildClickBuffers();
    void startVoice(const ScheduledClick& click, juce::int64 blockStart);

    LockFreeQueue<ScheduledClick, kClickQueueSize> queue_;
    std::array<Voice, kMaxVoices> voices_;

    // Click sounds (samplesLock_; audio thread only try-locks)
    juce::SpinLock samplesLock_;
    juce::AudioBuffer<float> normalClick_;
    juce::AudioBuffer<float> accentClick_;
    juce::AudioBuffer<float> loadedSample_;
    bool hasLoadedSample_ = false;
    std::atomic<juce::uint32> sampleGeneration_{0};  // bumped whenever the click sounds change

    // Hardware clock anchor (anchorLock_)
    juce::SpinLock anchorLock_;
    juce::int64 anchorSample_ = -1;
    double anchorHostSeconds_ = 0.0;

    std::atomic<double> sampleRate_{0.0};
    std::atomic<juce::int64> samplePosition_{0};
    std::atomic<int> droppedClicks_{0};
    std::atomic<int> renderedClicks_{0};
};

}  // namespace virgo
