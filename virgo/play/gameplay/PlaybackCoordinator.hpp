#pragma once

#include <juce_events/juce_events.h>

#include <atomic>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

#include "../audio/LockFreeQueue.hpp"
#include "../core/ChartStore.hpp"
#include "../core/DrumBeat.hpp"
#include "../core/ElapsedBeatTracker.hpp"
#include "../core/GameplayLayout.hpp"
#include "../core/PracticeSettings.hpp"
#include "../engine/MetronomeEngine.hpp"
#include "InputMatcher.hpp"
#include "PlaybackState.hpp"

namespace virgo {

/**
 * @brief Receives playback state changes (message thread)
 */
class PlaybackCoordinatorListener {
  public:
    virtual ~PlaybackCoordinatorListener() = default;

    /** Called when the phase changes and whenever a new beat is reached. */
    virtual void playbackStateChanged(const PlaybackState& state) = 0;

    virtual void playbackFinished() {}
};

/**
 * @brief Drives one chart through gameplay
 *
 * Turns the chart notes into a sorted beat sequence and layout caches, runs
 * the metronome at the practice speed and resolves which beat is "now" on
 * every update. Update runs on the message thread, either from the internal
 * juce::Timer or from the host calling update().
 *
 * Metronome beats arrive on the timing thread and only go into a lock-free
 * queue; the next update feeds them to the ElapsedBeatTracker.
 *
 * Usage:
 *   loadChartData();   // Idle -> Loaded
 *   setupGameplay();   // caches, metronome and input configuration
 *   startPlayback();   // Loaded/Paused/Finished -> Playing
 *   ...
 *   cleanup();
 */
class PlaybackCoordinator : private juce::Timer, private MetronomeListener {
  public:
    static constexpr double kResumeLeadInSeconds = 0.05;
    static constexpr double kActiveBeatTolerance = 0.05;  // measures
    static constexpr double kMinimumBackingTrackSpeed = 0.5;
    static constexpr double kMinBackingTrackRate = 0.5;
    static constexpr double kMaxBackingTrackRate = 2.0;
    static constexpr int kBeatQueueSize = 64;

    PlaybackCoordinator(const ChartStore& store, ChartId chartId, MetronomeEngine& metronome,
                        PracticeSettings& practiceSettings);
    ~PlaybackCoordinator() override;

    // =========================================================================
    // Loading
    // =========================================================================

    /**
     * @brief Snapshot the chart from the store
     * @return false when the chart does not exist; the coordinator stays Idle
     */
    bool loadChartData();

    /**
     * @brief Build every cache and configure metronome and input
     *
     * Does nothing before loadChartData().
     * @param loadPersistedSpeed Apply the speed saved for this chart
     */
    void setupGameplay(bool loadPersistedSpeed = true);

    // =========================================================================
    // Playback control
    // =========================================================================

    /** Start fresh, or resume from a pause. No-op until the chart is loaded. */
    void startPlayback();
    void pausePlayback();
    void togglePlayback();

    /** Back to Loaded with all progress zeroed. Does not start playing. */
    void restartPlayback();
    void skipToEnd();

    /** Save the speed, stop everything and unsubscribe. Safe to call repeatedly. */
    void cleanup();

    /** Advance playback state from the metronome clock. */
    void update();

    // =========================================================================
    // Practice speed
    // =========================================================================

    double effectiveBPM() const;

    /** Change speed, live while playing. */
    void updateSpeed(double newSpeed);

    /** Pick up a speed set on the PracticeSettings directly. */
    void applyPracticeSettings();

    // =========================================================================
    // Computations
    // =========================================================================

    void computeDrumBeats();
    void computeCachedLayoutData();

    /** Rebuild beam groups from the current drum beats. Part of computeCachedLayoutData(). */
    void computeBeamGroups();

    /**
     * @brief Last beat at or before a position
     * @param measureIndex Zero-based measure
     * @param beatPosition Fraction of the measure
     * @return Index into getDrumBeats(), 0 when there are no beats
     */
    int findClosestBeatIndex(int measureIndex, double beatPosition) const;

    /** Seconds for the whole chart at the current speed. */
    double calculateTrackDuration() const;

    /** Seconds from measure 1 to the first note at the current speed. */
    double calculateBGMOffset() const;

    double remainingBGMOffset() const;

    /** Position on the gameplay timeline for a time inside the backing track file. */
    double bgmTimelineElapsedTime(double bgmCurrentTime) const;

    /** Backing track playback rate for a speed, clamped to what a resampler handles well. */
    static double clampedBGMRate(double speedMultiplier);

    /** Where a note at a chart position is drawn (staff centre of its row). */
    std::optional<LayoutPoint> positionForTimePosition(double timePosition) const;

    /** Where the progress indicator sits after a number of whole beats. */
    std::optional<LayoutPoint> indicatorPositionForBeat(int totalBeats) const;

    /** Indicator position for the metronome's current beat; nullopt unless playing. */
    std::optional<LayoutPoint> calculateProgressIndicatorPosition() const;

    // =========================================================================
    // State and caches
    // =========================================================================

    PlaybackState getState() const;
    PlaybackPhase getPhase() const {
        return getState().phase;
    }
    bool isPlaying() const {
        return getPhase() == PlaybackPhase::Playing;
    }
    bool isDataLoaded() const {
        return track_.has_value();
    }

    const std::optional<DrumTrack>& getTrack() const {
        return track_;
    }
    const std::vector<DrumBeat>& getDrumBeats() const {
        return drumBeats_;
    }
    const std::vector<GameplayLayout::MeasurePosition>& getMeasurePositions() const {
        return measurePositions_;
    }
    const std::map<int, GameplayLayout::MeasurePosition>& getMeasurePositionMap() const {
        return measurePositionMap_;
    }
    const std::vector<BeamGroup>& getBeamGroups() const {
        return beamGroups_;
    }
    const BeamGroup* getBeamGroupForBeat(BeatId beatId) const;
    const std::unordered_map<BeatId, LayoutPoint>& getBeatPositions() const {
        return beatPositions_;
    }
    double getCachedTrackDuration() const {
        return cachedTrackDuration_;
    }
    double getBGMOffset() const {
        return bgmOffsetSeconds_;
    }

    InputMatcher& getInputMatcher() {
        return inputMatcher_;
    }

    void addListener(PlaybackCoordinatorListener* listener);
    void removeListener(PlaybackCoordinatorListener* listener);

  private:
    // juce::Timer
    void timerCallback() override;

    // MetronomeListener (timing thread)
    void metronomeBeat(int beatIndex, bool isAccented, double beatTimeSeconds) override;

    void resetPlaybackState(PlaybackState& state) const;
    void refreshTimingCaches();
    std::optional<double> enforceBGMMinimumSpeedIfNeeded() const;
    void applySpeedChange(double previousSpeed);
    void cacheBeatPositions();
    void updateActiveBeat(PlaybackState& state, int discreteTotalBeats) const;
    void handlePlaybackCompletion(PlaybackState& state);
    double trackDurationInSeconds(double secondsPerMeasure) const;
    const GameplayLayout::MeasurePosition* measurePositionFor(int measureIndex) const;
    TimeSignature timeSignature() const;
    bool hasBackingTrack() const;

    void startUpdates();
    void stopMetronome();
    void commitState(const PlaybackState& state, bool notify);

    const ChartStore& store_;
    const ChartId chartId_;
    MetronomeEngine& metronome_;
    PracticeSettings& practiceSettings_;
    InputMatcher inputMatcher_;

    // Chart snapshot
    std::optional<DrumTrack> track_;
    std::vector<Note> notes_;
    juce::String songDuration_;

    // Caches
    std::vector<DrumBeat> drumBeats_;
    std::vector<GameplayLayout::MeasurePosition> measurePositions_;
    std::map<int, GameplayLayout::MeasurePosition> measurePositionMap_;
    std::vector<BeamGroup> beamGroups_;
    std::unordered_map<BeatId, size_t> beatToBeamGroup_;
    std::unordered_map<BeatId, LayoutPoint> beatPositions_;
    double cachedTrackDuration_ = 0.0;
    double bgmOffsetSeconds_ = 0.0;
    double lastAppliedSpeed_ = 1.0;

    mutable juce::CriticalSection stateLock_;
    PlaybackState state_;

    ElapsedBeatTracker beatTracker_;
    int lastDiscreteBeat_ = -1;
    bool gameplaySetUp_ = false;
    bool subscribed_ = false;

    LockFreeQueue<int, kBeatQueueSize> beatQueue_;
    std::atomic<bool> acceptingBeats_{false};

    std::vector<PlaybackCoordinatorListener*> listeners_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PlaybackCoordinator)
};

}  // namespace virgo
