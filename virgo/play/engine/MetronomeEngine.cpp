#include "MetronomeEngine.hpp"

#include <algorithm>
#include <cmath>

#include "../core/Config.hpp"

namespace virgo {

MetronomeEngine::MetronomeEngine(std::shared_ptr<TimeSource> clock, int pollIntervalMs,
                                 std::optional<bool> audioOutputEnabled)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemTimeSource>()),
      scheduler_(clock_, audioOutputEnabled),
      timing_(clock_, pollIntervalMs),
      volume_(juce::jlimit(0.0f, 1.0f, Config::getInstance().getMetronomeVolume())) {
    timing_.setBeatCallback([this](int beatIndex, bool isAccented, double beatTimeSeconds) {
        handleBeat(beatIndex, isAccented, beatTimeSeconds);
    });
}

MetronomeEngine::~MetronomeEngine() {
    timing_.stop();
    scheduler_.stop();
}

// =============================================================================
// Transport
// =============================================================================

void MetronomeEngine::start(double bpm, const TimeSignature& timeSignature) {
    configure(bpm, timeSignature);
    startAt(clock_->nowSeconds(), 0);
}

void MetronomeEngine::startAt(double startTimeSeconds, int totalBeatsElapsed) {
    if (timing_.isPlaying())
        return;

    if (!scheduler_.resume())
        DBG("MetronomeEngine: audio unavailable, beats continue silently");

    timing_.startAt(startTimeSeconds, totalBeatsElapsed);
    notifyStateChanged(true);
}

void MetronomeEngine::stop() {
    bool wasPlaying = timing_.isPlaying();
    timing_.stop();
    scheduler_.stop();
    if (wasPlaying)
        notifyStateChanged(false);
}

void MetronomeEngine::toggle(double bpm, const TimeSignature& timeSignature) {
    if (isEnabled())
        stop();
    else
        start(bpm, timeSignature);
}

void MetronomeEngine::configure(double bpm, const TimeSignature& timeSignature) {
    {
        const juce::ScopedLock sl(timeSignatureLock_);
        timeSignature_ = timeSignature;
    }
    timing_.configure(bpm, timeSignature);
}

void MetronomeEngine::testClick() {
    scheduler_.playTick(getVolume(), true);
}

void MetronomeEngine::poll() {
    timing_.poll();
}

// =============================================================================
// Settings
// =============================================================================

void MetronomeEngine::updateVolume(float newVolume) {
    if (!std::isfinite(newVolume)) {
        DBG("MetronomeEngine: ignoring non-finite volume");
        return;
    }
    volume_.store(juce::jlimit(0.0f, 1.0f, newVolume), std::memory_order_relaxed);
}

void MetronomeEngine::updateBPM(double newBpm) {
    if (!std::isfinite(newBpm)) {
        DBG("MetronomeEngine: ignoring non-finite bpm");
        return;
    }
    auto& config = Config::getInstance();
    const double low = juce::jmin(config.getMinBpm(), config.getMaxBpm());
    const double high = juce::jmax(config.getMinBpm(), config.getMaxBpm());
    timing_.configure(juce::jlimit(low, high, newBpm), getTimeSignature());
}

void MetronomeEngine::updateTimeSignature(const TimeSignature& timeSignature) {
    configure(getBpm(), timeSignature);
}

TimeSignature MetronomeEngine::getTimeSignature() const {
    const juce::ScopedLock sl(timeSignatureLock_);
    return timeSignature_;
}

std::optional<BeatProgress> MetronomeEngine::getCurrentBeatProgress() const {
    return timing_.getCurrentBeatProgress(getTimeSignature());
}

// =============================================================================
// Beats
// =============================================================================

void MetronomeEngine::handleBeat(int beatIndex, bool isAccented, double beatTimeSeconds) {
    // nullopt means no audio session; playTick then plays immediately or not at all
    auto hardwareTime = scheduler_.convertToAudioEngineTime(beatTimeSeconds);
    scheduler_.playTick(getVolume(), isAccented, hardwareTime);

    const juce::ScopedLock sl(listenerLock_);
    for (auto* listener : listeners_)
        listener->metronomeBeat(beatIndex, isAccented, beatTimeSeconds);
}

void MetronomeEngine::notifyStateChanged(bool isEnabled) {
    const juce::ScopedLock sl(listenerLock_);
    for (auto* listener : listeners_)
        listener->metronomeStateChanged(isEnabled);
}

void MetronomeEngine::addListener(MetronomeListener* listener) {
    const juce::ScopedLock sl(listenerLock_);
    if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void MetronomeEngine::removeListener(MetronomeListener* listener) {
    const juce::ScopedLock sl(listenerLock_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

}  // namespace virgo
