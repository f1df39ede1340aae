#pragma once

#include <juce_core/juce_core.h>

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

#include "../audio/AudioScheduler.hpp"
#include "../core/DrumTypes.hpp"
#include "TimeSource.hpp"
#include "TimingEngine.hpp"

namespace virgo {

/**
 * @brief Receives metronome beats and transport changes
 */
class MetronomeListener {
  public:
    virtual ~MetronomeListener() = default;

    /**
     * @brief Called on the timing driver thread for every beat
     * @param beatIndex Zero-based beat within the measure
     * @param isAccented True on the first beat of the measure
     * @param beatTimeSeconds Ideal beat time on the metronome clock
     */
    virtual void metronomeBeat(int beatIndex, bool isAccented, double beatTimeSeconds) = 0;

    /** Called on the thread that started or stopped the metronome. */
    virtual void metronomeStateChanged(bool isEnabled) {
        juce::ignoreUnused(isEnabled);
    }
};

/**
 * @brief Metronome facade: logical timing plus audible clicks
 *
 * Owns a TimingEngine and an AudioScheduler sharing one clock. Every beat the
 * TimingEngine reports is turned into a click scheduled on the hardware clock
 * and then forwarded to the listeners. Audio failures only make the metronome
 * silent; beats keep coming.
 */
class MetronomeEngine {
  public:
    /**
     * @param clock Shared clock (system clock when null)
     * @param pollIntervalMs Timing driver period, see TimingEngine
     * @param audioOutputEnabled Open an audio device; taken from Config when unset
     */
    explicit MetronomeEngine(std::shared_ptr<TimeSource> clock = nullptr, int pollIntervalMs = -1,
                             std::optional<bool> audioOutputEnabled = std::nullopt);
    ~MetronomeEngine();

    // =========================================================================
    // Transport
    // =========================================================================

    /** Configure, then start clicking from beat 0 now. */
    void start(double bpm, const TimeSignature& timeSignature);

    /** Start with the current configuration at a clock time, resuming from a beat count. */
    void startAt(double startTimeSeconds, int totalBeatsElapsed);

    void stop();
    void toggle(double bpm, const TimeSignature& timeSignature);

    /** Update tempo and meter without touching the transport. */
    void configure(double bpm, const TimeSignature& timeSignature);

    /** Play a single accented click. */
    void testClick();

    /** Run one timing driver step (for a zero poll interval). */
    void poll();

    // =========================================================================
    // Settings
    // =========================================================================

    /** Non-finite volumes are ignored; everything else is clamped to [0, 1]. */
    void updateVolume(float newVolume);

    /** Clamped to the Config bpm range. */
    void updateBPM(double newBpm);
    void updateTimeSignature(const TimeSignature& timeSignature);

    // =========================================================================
    // Queries
    // =========================================================================

    bool isEnabled() const {
        return timing_.isPlaying();
    }
    int getCurrentBeat() const {
        return timing_.getCurrentBeat();
    }
    float getVolume() const {
        return volume_.load(std::memory_order_relaxed);
    }
    double getBpm() const {
        return timing_.getBpm();
    }
    TimeSignature getTimeSignature() const;

    std::optional<double> getCurrentPlaybackTime() const {
        return timing_.getCurrentPlaybackTime();
    }
    std::optional<BeatProgress> getCurrentBeatProgress() const;

    /** Current time on the metronome clock. */
    double now() const {
        return clock_->nowSeconds();
    }
    std::shared_ptr<TimeSource> getClock() const {
        return clock_;
    }

    bool isTimingDriverRunning() const {
        return timing_.isDriverRunning();
    }

    AudioScheduler& getAudioScheduler() {
        return scheduler_;
    }

    // =========================================================================
    // Listeners
    // =========================================================================

    void addListener(MetronomeListener* listener);

    /** Waits for a beat being delivered on another thread. */
    void removeListener(MetronomeListener* listener);

  private:
    void handleBeat(int beatIndex, bool isAccented, double beatTimeSeconds);
    void notifyStateChanged(bool isEnabled);

    std::shared_ptr<TimeSource> clock_;
    AudioScheduler scheduler_;  // outlives timing_
    TimingEngine timing_;

    std::atomic<float> volume_;

    mutable juce::CriticalSection timeSignatureLock_;
    TimeSignature timeSignature_;

    juce::CriticalSection listenerLock_;
    std::vector<MetronomeListener*> listeners_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MetronomeEngine)
};

}  // namespace virgo
