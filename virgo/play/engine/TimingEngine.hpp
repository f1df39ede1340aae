#pragma once

#include <juce_core/juce_core.h>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>

#include "../core/DrumTypes.hpp"
#include "TimeSource.hpp"

namespace virgo {

/**
 * @brief Where playback is inside the beat grid at one instant
 */
struct BeatProgress {
    int measureIndex = 0;             // zero-based
    int beatIndex = 0;                // zero-based, within the measure
    double fractionalProgress = 0.0;  // [0, 1) through the current beat
    bool isAccent = false;            // beatIndex == 0
    double totalBeats = 0.0;          // beats since the session started
};

/**
 * @brief Logical metronome clock
 *
 * Keeps a time anchor (clock time, beats elapsed at that time) and derives the
 * beat grid from it at the configured tempo. A driver thread polls the anchor
 * and reports every new beat through onBeat, independent of any UI loop.
 *
 * Threading:
 * - currentBeat, isPlaying, bpm and beatsPerMeasure are atomics, safe to read anywhere
 * - control calls may come from any thread; the anchor is guarded by a critical section
 * - onBeat runs on the driver thread (or the caller of poll()), outside the lock
 *
 * currentBeat is zero-based and always in [0, beatsPerMeasure). It rests at 0
 * while stopped.
 */
class TimingEngine : private juce::HighResolutionTimer {
  public:
    /** beatIndex (zero-based), isAccented, ideal beat time in TimeSource seconds */
    using BeatCallback = std::function<void(int, bool, double)>;

    /**
     * @param clock Clock to measure against (system clock when null)
     * @param pollIntervalMs Driver period; 0 leaves driving to explicit poll() calls.
     *        Negative takes the value from Config.
     */
    explicit TimingEngine(std::shared_ptr<TimeSource> clock = nullptr, int pollIntervalMs = -1);
    ~TimingEngine() override;

    /** Set before start(). Not synchronised with the driver thread. */
    void setBeatCallback(BeatCallback callback);

    /**
     * @brief Update tempo and measure length
     *
     * Never changes isPlaying or currentBeat. A non-finite or non-positive bpm is
     * ignored. Changing bpm while playing re-anchors so the running beat count
     * stays continuous.
     */
    void configure(double bpm, const TimeSignature& timeSignature);

    void start();

    /**
     * @brief Start with the first beat at a given clock time
     * @param startTimeSeconds TimeSource time of the first beat (past values start now)
     * @param totalBeatsElapsed Beats already played, e.g. when resuming
     */
    void startAt(double startTimeSeconds, int totalBeatsElapsed = 0);

    void stop();
    void toggle();

    /**
     * @brief Check for a due beat and fire it
     *
     * Called by the driver thread. With a zero poll interval the owner calls it.
     * If several beats became due since the last poll only the latest fires.
     */
    void poll();

    bool isPlaying() const {
        return playing_.load(std::memory_order_acquire);
    }
    int getCurrentBeat() const;
    double getBpm() const {
        return bpm_.load(std::memory_order_acquire);
    }
    int getBeatsPerMeasure() const {
        return beatsPerMeasure_.load(std::memory_order_acquire);
    }
    double getBeatInterval() const {
        return 60.0 / getBpm();
    }

    /** True while the driver thread is running. */
    bool isDriverRunning() const;

    /**
     * @brief Seconds since this start()/startAt() anchor
     *
     * Beats passed to startAt() as already elapsed are not included.
     * @return nullopt when stopped. Negative during a scheduled pre-roll.
     */
    std::optional<double> getCurrentPlaybackTime() const;

    /**
     * @brief Beat grid position right now
     * @return nullopt when stopped or before the first scheduled beat
     */
    std::optional<BeatProgress> getCurrentBeatProgress(const TimeSignature& timeSignature) const;
    std::optional<BeatProgress> getCurrentBeatProgress() const;

    const TimeSource& getClock() const {
        return *clock_;
    }

  private:
    void hiResTimerCallback() override;

    // Beats elapsed at a clock time (caller holds anchorLock_)
    double beatsAt(double now) const;

    std::shared_ptr<TimeSource> clock_;
    const int pollIntervalMs_;
    BeatCallback onBeat_;

    std::atomic<bool> playing_{false};
    std::atomic<int> currentBeat_{0};
    std::atomic<double> bpm_{120.0};
    std::atomic<int> beatsPerMeasure_{4};

    juce::CriticalSection anchorLock_;
    double anchorTime_ = 0.0;      // clock seconds
    double anchorBeats_ = 0.0;     // beats elapsed at anchorTime_
    double anchorElapsed_ = 0.0;   // session seconds at anchorTime_
    juce::int64 lastFiredBeat_ = -1;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TimingEngine)
};

}  // namespace virgo
