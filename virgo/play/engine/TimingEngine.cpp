#include "TimingEngine.hpp"

#include <cmath>

#include "../core/Config.hpp"

namespace virgo {

TimingEngine::TimingEngine(std::shared_ptr<TimeSource> clock, int pollIntervalMs)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemTimeSource>()),
      pollIntervalMs_(pollIntervalMs >= 0 ? pollIntervalMs
                                          : Config::getInstance().getTimingPollIntervalMs()) {}

TimingEngine::~TimingEngine() {
    playing_.store(false, std::memory_order_release);
    stopTimer();
}

void TimingEngine::setBeatCallback(BeatCallback callback) {
    onBeat_ = std::move(callback);
}

// =============================================================================
// Configuration
// =============================================================================

void TimingEngine::configure(double bpm, const TimeSignature& timeSignature) {
    beatsPerMeasure_.store(juce::jmax(1, timeSignature.beatsPerMeasure), std::memory_order_release);

    if (!std::isfinite(bpm) || bpm <= 0.0) {
        DBG("TimingEngine: ignoring invalid bpm " << bpm);
        return;
    }

    const juce::ScopedLock sl(anchorLock_);
    double oldBpm = bpm_.load(std::memory_order_acquire);
    if (bpm == oldBpm)
        return;

    // Keep the beat count continuous across the tempo change. In pre-roll the
    // anchor is still in the future and stays where it is.
    if (isPlaying()) {
        double now = clock_->nowSeconds();
        if (now > anchorTime_) {
            anchorElapsed_ += now - anchorTime_;
            anchorBeats_ = beatsAt(now);
            anchorTime_ = now;
        }
    }

    bpm_.store(bpm, std::memory_order_release);
}

// =============================================================================
// Transport
// =============================================================================

void TimingEngine::start() {
    if (isPlaying())
        return;
    startAt(clock_->nowSeconds(), 0);
}

void TimingEngine::startAt(double startTimeSeconds, int totalBeatsElapsed) {
    if (isPlaying())
        return;

    {
        const juce::ScopedLock sl(anchorLock_);
        double now = clock_->nowSeconds();
        int beats = juce::jmax(0, totalBeatsElapsed);

        anchorTime_ = (std::isfinite(startTimeSeconds) && startTimeSeconds > now) ? startTimeSeconds
                                                                                  : now;
        anchorBeats_ = beats;
        anchorElapsed_ = 0.0;
        lastFiredBeat_ = static_cast<juce::int64>(beats) - 1;

        currentBeat_.store(beats % getBeatsPerMeasure(), std::memory_order_release);
        playing_.store(true, std::memory_order_release);
    }

    if (pollIntervalMs_ > 0)
        startTimer(pollIntervalMs_);
}

void TimingEngine::stop() {
    {
        const juce::ScopedLock sl(anchorLock_);
        if (!isPlaying() && !isTimerRunning())
            return;
        playing_.store(false, std::memory_order_release);
        currentBeat_.store(0, std::memory_order_release);
        lastFiredBeat_ = -1;
    }

    // Waits for a callback in progress on another thread
    stopTimer();
}

void TimingEngine::toggle() {
    if (isPlaying())
        stop();
    else
        start();
}

bool TimingEngine::isDriverRunning() const {
    return isTimerRunning();
}

// =============================================================================
// Beat detection
// =============================================================================

double TimingEngine::beatsAt(double now) const {
    return anchorBeats_ + (now - anchorTime_) * bpm_.load(std::memory_order_acquire) / 60.0;
}

void TimingEngine::hiResTimerCallback() {
    poll();
}

void TimingEngine::poll() {
    int localBeat = 0;
    double idealTime = 0.0;

    {
        const juce::ScopedLock sl(anchorLock_);
        if (!isPlaying())
            return;

        double now = clock_->nowSeconds();
        if (now < anchorTime_)
            return;

        auto due = static_cast<juce::int64>(std::floor(beatsAt(now)));
        if (due <= lastFiredBeat_)
            return;

        if (due > lastFiredBeat_ + 1) {
            DBG("TimingEngine: skipped " << (due - lastFiredBeat_ - 1) << " late beat(s)");
        }

        lastFiredBeat_ = due;
        localBeat = static_cast<int>(due % getBeatsPerMeasure());
        idealTime = anchorTime_ + (static_cast<double>(due) - anchorBeats_) * getBeatInterval();
        currentBeat_.store(localBeat, std::memory_order_release);
    }

    if (onBeat_)
        onBeat_(localBeat, localBeat == 0, idealTime);
}

// =============================================================================
// Queries
// =============================================================================

int TimingEngine::getCurrentBeat() const {
    if (!isPlaying())
        return 0;
    return currentBeat_.load(std::memory_order_acquire) % getBeatsPerMeasure();
}

std::optional<double> TimingEngine::getCurrentPlaybackTime() const {
    const juce::ScopedLock sl(anchorLock_);
    if (!isPlaying())
        return std::nullopt;
    return anchorElapsed_ + (clock_->nowSeconds() - anchorTime_);
}

std::optional<BeatProgress> TimingEngine::getCurrentBeatProgress(
    const TimeSignature& timeSignature) const {
    double totalBeats = 0.0;
    {
        const juce::ScopedLock sl(anchorLock_);
        if (!isPlaying())
            return std::nullopt;
        double now = clock_->nowSeconds();
        if (now < anchorTime_)
            return std::nullopt;
        totalBeats = beatsAt(now);
    }

    const double beatsPerMeasure = juce::jmax(1, timeSignature.beatsPerMeasure);
    double beatInMeasure = std::fmod(totalBeats, beatsPerMeasure);

    BeatProgress progress;
    progress.totalBeats = totalBeats;
    progress.measureIndex = static_cast<int>(std::floor(totalBeats / beatsPerMeasure));
    progress.beatIndex = static_cast<int>(std::floor(beatInMeasure));
    progress.fractionalProgress = beatInMeasure - progress.beatIndex;
    progress.isAccent = progress.beatIndex == 0;
    return progress;
}

std::optional<BeatProgress> TimingEngine::getCurrentBeatProgress() const {
    return getCurrentBeatProgress(TimeSignature(getBeatsPerMeasure(), 4));
}

}  // namespace virgo
