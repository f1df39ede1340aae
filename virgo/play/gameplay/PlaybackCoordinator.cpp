#include "PlaybackCoordinator.hpp"

#include <algorithm>
#include <cmath>

#include "../core/BeamGrouping.hpp"
#include "../core/Config.hpp"
#include "../core/MeasureUtils.hpp"
#include "../core/NotePositionKey.hpp"

namespace virgo {

PlaybackCoordinator::PlaybackCoordinator(const ChartStore& store, ChartId chartId,
                                         MetronomeEngine& metronome,
                                         PracticeSettings& practiceSettings)
    : store_(store),
      chartId_(chartId),
      metronome_(metronome),
      practiceSettings_(practiceSettings),
      inputMatcher_(metronome.getClock()),
      lastAppliedSpeed_(practiceSettings.getSpeed()) {}

PlaybackCoordinator::~PlaybackCoordinator() {
    cleanup();
}

// =============================================================================
// Loading
// =============================================================================

bool PlaybackCoordinator::loadChartData() {
    auto track = store_.makeDrumTrack(chartId_);
    if (!track) {
        DBG("PlaybackCoordinator: chart " << chartId_ << " not found");
        return false;
    }

    track_ = std::move(track);
    notes_ = store_.getNotes(chartId_);
    songDuration_ = track_->duration;

    auto state = getState();
    if (state.phase == PlaybackPhase::Idle) {
        state.phase = PlaybackPhase::Loaded;
        commitState(state, true);
    }
    DBG("PlaybackCoordinator: loaded '" << track_->title << "' with " << (int)notes_.size()
                                        << " notes");
    return true;
}

void PlaybackCoordinator::setupGameplay(bool loadPersistedSpeed) {
    if (!track_) {
        DBG("PlaybackCoordinator: setupGameplay called before the chart was loaded");
        return;
    }

    if (loadPersistedSpeed)
        practiceSettings_.loadAndApplySpeed(chartId_);

    computeDrumBeats();
    computeCachedLayoutData();

    if (auto clamped = enforceBGMMinimumSpeedIfNeeded())
        practiceSettings_.setSpeed(*clamped);
    lastAppliedSpeed_ = practiceSettings_.getSpeed();
    refreshTimingCaches();

    const auto ts = timeSignature();
    metronome_.configure(effectiveBPM(), ts);
    inputMatcher_.configure(effectiveBPM(), ts, notes_);
    beatTracker_.setBeatsPerMeasure(ts.beatsPerMeasure);

    if (!subscribed_) {
        metronome_.addListener(this);
        subscribed_ = true;
    }
    gameplaySetUp_ = true;
}

// =============================================================================
// Playback control
// =============================================================================

void PlaybackCoordinator::startPlayback() {
    auto state = getState();
    if (!track_ || state.phase == PlaybackPhase::Idle) {
        DBG("PlaybackCoordinator: cannot start, chart not loaded");
        return;
    }
    if (state.phase == PlaybackPhase::Playing)
        return;

    if (state.phase == PlaybackPhase::Finished) {
        resetPlaybackState(state);
        state.pausedElapsedTime = 0.0;
    }

    if (!subscribed_) {
        metronome_.addListener(this);
        subscribed_ = true;
    }

    const auto ts = timeSignature();
    const int beatsPerMeasure = ts.beatsPerMeasure;
    const double bpm = effectiveBPM();
    const double now = metronome_.now();
    double songStart = now;

    beatQueue_.clear();
    beatTracker_.setBeatsPerMeasure(beatsPerMeasure);

    if (state.pausedElapsedTime > 0.0) {
        const double elapsed = state.pausedElapsedTime;
        const double elapsedBeats = elapsed / MeasureUtils::secondsPerBeat(bpm);
        const int discreteBeats = static_cast<int>(elapsedBeats);

        state.totalBeatsElapsed = discreteBeats;
        state.currentMeasureIndex = discreteBeats / beatsPerMeasure;
        state.currentBeatPosition =
            static_cast<double>(discreteBeats % beatsPerMeasure) / beatsPerMeasure;
        state.rawBeatPosition = std::fmod(elapsedBeats, beatsPerMeasure) / beatsPerMeasure;

        if (cachedTrackDuration_ > 0.0) {
            state.playbackProgress = juce::jmin(elapsed / cachedTrackDuration_, 1.0);
        } else {
            DBG("PlaybackCoordinator: track duration is zero, progress reset");
            state.playbackProgress = 0.0;
        }
        state.currentBeat = findClosestBeatIndex(state.currentMeasureIndex,
                                                 state.currentBeatPosition);

        beatTracker_.seed(discreteBeats);
        lastDiscreteBeat_ = discreteBeats;

        const double startTime = now + kResumeLeadInSeconds;
        metronome_.configure(bpm, ts);
        acceptingBeats_.store(true, std::memory_order_release);
        metronome_.startAt(startTime, discreteBeats);
        songStart = startTime - elapsed;
        DBG("PlaybackCoordinator: resuming from " << elapsed << "s (beat " << discreteBeats
                                                  << ")");
    } else {
        resetPlaybackState(state);
        state.pausedElapsedTime = 0.0;
        beatTracker_.reset();
        lastDiscreteBeat_ = -1;

        acceptingBeats_.store(true, std::memory_order_release);
        metronome_.start(bpm, ts);
        DBG("PlaybackCoordinator: starting '" << track_->title << "' at " << bpm << " BPM");
    }

    inputMatcher_.startListening(songStart);
    state.phase = PlaybackPhase::Playing;
    commitState(state, true);
    startUpdates();
}

void PlaybackCoordinator::pausePlayback() {
    auto state = getState();
    if (state.phase != PlaybackPhase::Playing)
        return;

    stopTimer();
    if (auto sessionTime = metronome_.getCurrentPlaybackTime())
        state.pausedElapsedTime += juce::jmax(0.0, *sessionTime);

    stopMetronome();
    inputMatcher_.stopListening();

    state.indicatorPosition.reset();
    state.phase = PlaybackPhase::Paused;
    commitState(state, true);
    DBG("PlaybackCoordinator: paused at " << state.pausedElapsedTime << "s");
}

void PlaybackCoordinator::togglePlayback() {
    if (isPlaying())
        pausePlayback();
    else
        startPlayback();
}

void PlaybackCoordinator::restartPlayback() {
    auto state = getState();
    if (state.phase == PlaybackPhase::Idle)
        return;

    stopTimer();
    stopMetronome();
    inputMatcher_.stopListening();

    resetPlaybackState(state);
    state.pausedElapsedTime = 0.0;
    beatTracker_.reset();
    lastDiscreteBeat_ = -1;

    state.phase = PlaybackPhase::Loaded;
    commitState(state, true);
}

void PlaybackCoordinator::skipToEnd() {
    auto state = getState();
    if (state.phase == PlaybackPhase::Idle)
        return;

    stopTimer();
    stopMetronome();
    inputMatcher_.stopListening();

    state.playbackProgress = 1.0;
    state.pausedElapsedTime = 0.0;
    state.indicatorPosition.reset();
    state.phase = PlaybackPhase::Finished;
    commitState(state, true);

    for (auto* listener : listeners_)
        listener->playbackFinished();
}

void PlaybackCoordinator::cleanup() {
    if (isPlaying())
        pausePlayback();

    // Only save once this chart's own speed has been applied
    if (gameplaySetUp_) {
        if (!practiceSettings_.saveSpeed(practiceSettings_.getSpeed(), chartId_))
            DBG("PlaybackCoordinator: failed to save practice speed");
        gameplaySetUp_ = false;
    }

    stopTimer();
    stopMetronome();
    if (subscribed_) {
        metronome_.removeListener(this);
        subscribed_ = false;
    }
    inputMatcher_.stopListening();
    inputMatcher_.closeMidiInputs();
}

// =============================================================================
// Update
// =============================================================================

void PlaybackCoordinator::timerCallback() {
    update();
}

void PlaybackCoordinator::metronomeBeat(int beatIndex, bool isAccented, double beatTimeSeconds) {
    juce::ignoreUnused(isAccented, beatTimeSeconds);
    if (!acceptingBeats_.load(std::memory_order_acquire))
        return;
    if (!beatQueue_.push(beatIndex))
        DBG("PlaybackCoordinator: beat queue full, dropping beat");
}

void PlaybackCoordinator::update() {
    auto state = getState();
    if (state.phase != PlaybackPhase::Playing || !track_)
        return;

    // No driver thread: the update loop drives the metronome
    if (metronome_.isEnabled() && !metronome_.isTimingDriverRunning())
        metronome_.poll();

    int localBeat = 0;
    while (beatQueue_.pop(localBeat))
        beatTracker_.observe(localBeat);

    auto sessionTime = metronome_.getCurrentPlaybackTime();
    if (!sessionTime)
        return;

    if (cachedTrackDuration_ <= 0.0) {
        DBG("PlaybackCoordinator: skipping update, track duration not initialised");
        return;
    }

    const int beatsPerMeasure = timeSignature().beatsPerMeasure;
    const double elapsed = state.pausedElapsedTime + juce::jmax(0.0, *sessionTime);
    const double totalBeats = elapsed / MeasureUtils::secondsPerBeat(effectiveBPM());
    const int discreteBeats = static_cast<int>(totalBeats);

    state.currentMeasureIndex = discreteBeats / beatsPerMeasure;
    state.currentBeatPosition =
        static_cast<double>(discreteBeats % beatsPerMeasure) / beatsPerMeasure;
    state.rawBeatPosition = std::fmod(totalBeats, beatsPerMeasure) / beatsPerMeasure;
    state.totalBeatsElapsed = beatTracker_.getTotalBeats();
    state.playbackProgress = juce::jmin(elapsed / cachedTrackDuration_, 1.0);
    state.currentBeat = findClosestBeatIndex(state.currentMeasureIndex, state.currentBeatPosition);
    updateActiveBeat(state, discreteBeats);
    state.indicatorPosition = calculateProgressIndicatorPosition();

    const bool beatChanged = discreteBeats != lastDiscreteBeat_;
    lastDiscreteBeat_ = discreteBeats;

    if (state.playbackProgress >= 1.0) {
        handlePlaybackCompletion(state);
        commitState(state, true);
        for (auto* listener : listeners_)
            listener->playbackFinished();
        return;
    }

    commitState(state, beatChanged);
}

void PlaybackCoordinator::handlePlaybackCompletion(PlaybackState& state) {
    stopTimer();
    stopMetronome();
    inputMatcher_.stopListening();

    resetPlaybackState(state);
    state.pausedElapsedTime = 0.0;
    state.playbackProgress = 1.0;
    state.phase = PlaybackPhase::Finished;
    beatTracker_.reset();
    lastDiscreteBeat_ = -1;
    DBG("PlaybackCoordinator: playback finished for '" << track_->title << "'");
}

void PlaybackCoordinator::updateActiveBeat(PlaybackState& state, int discreteTotalBeats) const {
    const int beatsPerMeasure = timeSignature().beatsPerMeasure;
    const int measureIndex = discreteTotalBeats / beatsPerMeasure;
    const double beatWithinMeasure = discreteTotalBeats % beatsPerMeasure;
    const double position = measureIndex + beatWithinMeasure / beatsPerMeasure;

    auto it = std::lower_bound(drumBeats_.begin(), drumBeats_.end(),
                               position - kActiveBeatTolerance,
                               [](const DrumBeat& beat, double value) {
                                   return beat.timePosition < value;
                               });
    for (; it != drumBeats_.end() && it->timePosition < position + kActiveBeatTolerance; ++it) {
        if (std::abs(it->timePosition - position) < kActiveBeatTolerance) {
            state.activeBeatId = it->id;
            return;
        }
    }
    state.activeBeatId.reset();
}

// =============================================================================
// Practice speed
// =============================================================================

double PlaybackCoordinator::effectiveBPM() const {
    return practiceSettings_.effectiveBPM(track_ ? track_->bpm : ChartStore::kDefaultBpm);
}

void PlaybackCoordinator::updateSpeed(double newSpeed) {
    const double previousSpeed = practiceSettings_.getSpeed();
    practiceSettings_.setSpeed(newSpeed);
    applySpeedChange(previousSpeed);
}

void PlaybackCoordinator::applyPracticeSettings() {
    applySpeedChange(lastAppliedSpeed_);
}

void PlaybackCoordinator::applySpeedChange(double previousSpeed) {
    if (auto clamped = enforceBGMMinimumSpeedIfNeeded())
        practiceSettings_.setSpeed(*clamped);
    refreshTimingCaches();

    const double currentSpeed = practiceSettings_.getSpeed();
    if (std::abs(previousSpeed - currentSpeed) <= 0.0001)
        return;
    lastAppliedSpeed_ = currentSpeed;

    if (!track_)
        return;

    const double bpm = effectiveBPM();
    const auto ts = timeSignature();
    const bool validRatio = previousSpeed > 0.0 && currentSpeed > 0.0;
    const double speedRatio = validRatio ? previousSpeed / currentSpeed : 1.0;

    // Keep scoring aligned even before playback starts
    inputMatcher_.configure(bpm, ts, notes_);

    auto state = getState();
    if (state.phase == PlaybackPhase::Playing) {
        auto sessionTime = metronome_.getCurrentPlaybackTime();
        if (sessionTime && validRatio) {
            state.pausedElapsedTime =
                (state.pausedElapsedTime + juce::jmax(0.0, *sessionTime)) * speedRatio;
            int beatOffset = static_cast<int>(state.pausedElapsedTime * bpm / 60.0);
            beatOffset = juce::jmax(beatOffset, beatTracker_.getTotalBeats());
            state.totalBeatsElapsed = beatOffset;

            stopMetronome();
            beatTracker_.seed(beatOffset);
            lastDiscreteBeat_ = beatOffset;

            const double startTime = metronome_.now() + kResumeLeadInSeconds;
            metronome_.configure(bpm, ts);
            acceptingBeats_.store(true, std::memory_order_release);
            metronome_.startAt(startTime, beatOffset);
            inputMatcher_.startListening(startTime - state.pausedElapsedTime);
        } else {
            metronome_.configure(bpm, ts);
        }
        DBG("PlaybackCoordinator: live speed change to " << juce::roundToInt(currentSpeed * 100)
                                                         << "% (" << bpm << " BPM)");
    } else {
        if (state.pausedElapsedTime > 0.0 && validRatio) {
            state.pausedElapsedTime *= speedRatio;
            state.playbackProgress =
                cachedTrackDuration_ > 0.0
                    ? juce::jmin(state.pausedElapsedTime / cachedTrackDuration_, 1.0)
                    : 0.0;
        }
        metronome_.configure(bpm, ts);
    }

    commitState(state, true);
}

std::optional<double> PlaybackCoordinator::enforceBGMMinimumSpeedIfNeeded() const {
    if (!hasBackingTrack())
        return std::nullopt;
    if (practiceSettings_.getSpeed() < kMinimumBackingTrackSpeed) {
        DBG("PlaybackCoordinator: backing track present, clamping speed to "
            << juce::roundToInt(kMinimumBackingTrackSpeed * 100) << "%");
        return kMinimumBackingTrackSpeed;
    }
    return std::nullopt;
}

void PlaybackCoordinator::refreshTimingCaches() {
    if (!track_)
        return;
    bgmOffsetSeconds_ = calculateBGMOffset();
    cachedTrackDuration_ = calculateTrackDuration();
}

// =============================================================================
// Computations
// =============================================================================

void PlaybackCoordinator::computeDrumBeats() {
    drumBeats_.clear();
    if (notes_.empty())
        return;

    // Ordered by measure, then quantized offset
    std::map<NotePositionKey, std::vector<const Note*>> groups;
    for (const auto& note : notes_)
        groups[NotePositionKey(note.measureNumber, note.measureOffset)].push_back(&note);

    BeatId nextBeatId = 0;
    drumBeats_.reserve(groups.size());
    for (const auto& group : groups) {
        const auto& key = group.first;
        DrumBeat beat;
        beat.id = nextBeatId++;
        beat.timePosition = MeasureUtils::timePosition(key.measureNumber, key.getMeasureOffset());
        beat.interval = group.second.front()->interval;
        for (const auto* note : group.second)
            beat.drums.insert(drumTypeFromNoteType(note->noteType));
        drumBeats_.push_back(std::move(beat));
    }

    std::stable_sort(drumBeats_.begin(), drumBeats_.end(),
                     [](const DrumBeat& a, const DrumBeat& b) {
                         return a.timePosition < b.timePosition;
                     });
}

void PlaybackCoordinator::computeCachedLayoutData() {
    measurePositions_.clear();
    measurePositionMap_.clear();
    beamGroups_.clear();
    beatToBeamGroup_.clear();
    beatPositions_.clear();

    if (!track_)
        return;

    const auto ts = timeSignature();
    const double secondsPerMeasure = MeasureUtils::secondsPerMeasure(track_->bpm, ts);
    const int measures = juce::jmax(
        1, static_cast<int>(std::ceil(trackDurationInSeconds(secondsPerMeasure) / secondsPerMeasure)));

    measurePositions_ = GameplayLayout::calculateMeasurePositions(measures, ts);
    for (const auto& position : measurePositions_)
        measurePositionMap_[position.measureIndex] = position;

    if (measurePositionMap_.find(0) == measurePositionMap_.end()) {
        DBG("PlaybackCoordinator: measure 0 missing from layout, adding fallback");
        measurePositionMap_[0] = GameplayLayout::MeasurePosition{0, GameplayLayout::kLeftMargin, 0};
    }

    computeBeamGroups();
    cacheBeatPositions();
}

void PlaybackCoordinator::computeBeamGroups() {
    beatToBeamGroup_.clear();
    beamGroups_ = BeamGrouping::calculateBeamGroups(drumBeats_);
    for (size_t i = 0; i < beamGroups_.size(); ++i) {
        for (const auto& beat : beamGroups_[i].beats)
            beatToBeamGroup_[beat.id] = i;
    }
}

void PlaybackCoordinator::cacheBeatPositions() {
    beatPositions_.clear();
    for (const auto& beat : drumBeats_) {
        if (auto position = positionForTimePosition(beat.timePosition))
            beatPositions_[beat.id] = *position;
    }
    DBG("PlaybackCoordinator: cached " << (int)beatPositions_.size() << " beat positions");
}

int PlaybackCoordinator::findClosestBeatIndex(int measureIndex, double beatPosition) const {
    if (drumBeats_.empty())
        return 0;

    const double position = measureIndex + beatPosition;
    int left = 0;
    int right = static_cast<int>(drumBeats_.size()) - 1;
    int result = 0;

    while (left <= right) {
        int mid = (left + right) / 2;
        if (drumBeats_[static_cast<size_t>(mid)].timePosition <= position) {
            result = mid;
            left = mid + 1;
        } else {
            right = mid - 1;
        }
    }
    return result;
}

double PlaybackCoordinator::trackDurationInSeconds(double secondsPerMeasure) const {
    double songSeconds = MeasureUtils::parseDurationString(songDuration_);
    if (songSeconds > 0.0)
        return songSeconds;

    int maxMeasureIndex = 0;
    for (const auto& beat : drumBeats_)
        maxMeasureIndex = juce::jmax(maxMeasureIndex, MeasureUtils::measureIndex(beat.timePosition));
    return juce::jmax(1, maxMeasureIndex + 1) * secondsPerMeasure;
}

double PlaybackCoordinator::calculateTrackDuration() const {
    if (!track_)
        return 0.0;

    const double secondsPerMeasure = MeasureUtils::secondsPerMeasure(track_->bpm, timeSignature());
    const double baseDuration = trackDurationInSeconds(secondsPerMeasure);
    const double speed = practiceSettings_.getSpeed();
    return speed > 0.0 ? baseDuration / speed : baseDuration;
}

double PlaybackCoordinator::calculateBGMOffset() const {
    if (!track_ || notes_.empty())
        return 0.0;

    auto earliest = std::min_element(notes_.begin(), notes_.end(), [](const Note& a, const Note& b) {
        if (a.measureNumber != b.measureNumber)
            return a.measureNumber < b.measureNumber;
        return a.measureOffset < b.measureOffset;
    });

    if (earliest->measureNumber <= 1 && earliest->measureOffset <= 0.0)
        return 0.0;

    const double secondsPerMeasure = MeasureUtils::secondsPerMeasure(track_->bpm, timeSignature());
    const double noteSeconds =
        MeasureUtils::toZeroBasedIndex(earliest->measureNumber) * secondsPerMeasure +
        earliest->measureOffset * secondsPerMeasure;
    const double speed = practiceSettings_.getSpeed();
    return speed > 0.0 ? noteSeconds / speed : noteSeconds;
}

double PlaybackCoordinator::remainingBGMOffset() const {
    return juce::jmax(0.0, bgmOffsetSeconds_ - getState().pausedElapsedTime);
}

double PlaybackCoordinator::bgmTimelineElapsedTime(double bgmCurrentTime) const {
    const double speed = practiceSettings_.getSpeed();
    if (speed <= 0.0)
        return bgmCurrentTime + bgmOffsetSeconds_;
    return bgmCurrentTime / speed + bgmOffsetSeconds_;
}

double PlaybackCoordinator::clampedBGMRate(double speedMultiplier) {
    if (!std::isfinite(speedMultiplier)) {
        DBG("PlaybackCoordinator: non-finite backing track rate, using 100%");
        return 1.0;
    }
    if (speedMultiplier < kMinBackingTrackRate) {
        DBG("PlaybackCoordinator: backing track rate clamped from "
            << juce::roundToInt(speedMultiplier * 100) << "% to 50%, audio may drift");
    } else if (speedMultiplier > kMaxBackingTrackRate) {
        DBG("PlaybackCoordinator: backing track rate clamped from "
            << juce::roundToInt(speedMultiplier * 100) << "% to 200%, audio may drift");
    }
    return juce::jlimit(kMinBackingTrackRate, kMaxBackingTrackRate, speedMultiplier);
}

// =============================================================================
// Layout positions
// =============================================================================

const GameplayLayout::MeasurePosition* PlaybackCoordinator::measurePositionFor(
    int measureIndex) const {
    auto it = measurePositionMap_.find(measureIndex);
    if (it == measurePositionMap_.end())
        it = measurePositionMap_.find(0);
    return it != measurePositionMap_.end() ? &it->second : nullptr;
}

std::optional<LayoutPoint> PlaybackCoordinator::positionForTimePosition(double timePosition) const {
    const int measureIndex = MeasureUtils::measureIndex(timePosition);
    auto it = measurePositionMap_.find(measureIndex);
    if (it == measurePositionMap_.end())
        return std::nullopt;

    const double beatPosition = (timePosition - measureIndex) * timeSignature().beatsPerMeasure;
    return LayoutPoint{GameplayLayout::preciseNoteXPosition(it->second, beatPosition),
                       GameplayLayout::staffCenterY(it->second.row)};
}

std::optional<LayoutPoint> PlaybackCoordinator::indicatorPositionForBeat(int totalBeats) const {
    if (totalBeats < 0)
        return std::nullopt;

    const int beatsPerMeasure = timeSignature().beatsPerMeasure;
    const auto* measure = measurePositionFor(totalBeats / beatsPerMeasure);
    if (measure == nullptr)
        return std::nullopt;

    const double beatWithinMeasure = totalBeats % beatsPerMeasure;
    return LayoutPoint{GameplayLayout::preciseNoteXPosition(*measure, beatWithinMeasure),
                       GameplayLayout::staffCenterY(measure->row)};
}

std::optional<LayoutPoint> PlaybackCoordinator::calculateProgressIndicatorPosition() const {
    if (!track_ || !isPlaying())
        return std::nullopt;

    auto progress = metronome_.getCurrentBeatProgress();
    if (!progress)
        return std::nullopt;
    return indicatorPositionForBeat(static_cast<int>(progress->totalBeats));
}

const BeamGroup* PlaybackCoordinator::getBeamGroupForBeat(BeatId beatId) const {
    auto it = beatToBeamGroup_.find(beatId);
    return it != beatToBeamGroup_.end() ? &beamGroups_[it->second] : nullptr;
}

// =============================================================================
// State
// =============================================================================

PlaybackState PlaybackCoordinator::getState() const {
    const juce::ScopedLock sl(stateLock_);
    return state_;
}

void PlaybackCoordinator::resetPlaybackState(PlaybackState& state) const {
    state.currentBeat = 0;
    state.totalBeatsElapsed = 0;
    state.playbackProgress = 0.0;
    state.currentMeasureIndex = 0;
    state.currentBeatPosition = 0.0;
    state.rawBeatPosition = 0.0;
    state.activeBeatId.reset();
    state.indicatorPosition.reset();
}

void PlaybackCoordinator::commitState(const PlaybackState& state, bool notify) {
    {
        const juce::ScopedLock sl(stateLock_);
        state_ = state;
    }
    if (notify) {
        for (auto* listener : listeners_)
            listener->playbackStateChanged(state);
    }
}

TimeSignature PlaybackCoordinator::timeSignature() const {
    if (!track_)
        return TimeSignature();
    // Fields may have been assigned directly; the constructor clamps the beat count
    return TimeSignature(track_->timeSignature.beatsPerMeasure, track_->timeSignature.noteValue);
}

bool PlaybackCoordinator::hasBackingTrack() const {
    return track_ && track_->bgmFilePath.isNotEmpty();
}

void PlaybackCoordinator::startUpdates() {
    const int interval = Config::getInstance().getPlaybackUpdateIntervalMs();
    if (interval > 0)
        startTimer(interval);
}

void PlaybackCoordinator::stopMetronome() {
    acceptingBeats_.store(false, std::memory_order_release);
    metronome_.stop();
    beatQueue_.clear();
}

void PlaybackCoordinator::addListener(PlaybackCoordinatorListener* listener) {
    if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void PlaybackCoordinator::removeListener(PlaybackCoordinatorListener* listener) {
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

}  // namespace virgo
