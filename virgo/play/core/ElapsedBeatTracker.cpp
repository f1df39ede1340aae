#include "ElapsedBeatTracker.hpp"

#include <juce_core/juce_core.h>

namespace virgo {

ElapsedBeatTracker::ElapsedBeatTracker(int beatsPerMeasure)
    : beatsPerMeasure_(juce::jmax(1, beatsPerMeasure)) {}

void ElapsedBeatTracker::setBeatsPerMeasure(int beatsPerMeasure) {
    beatsPerMeasure_ = juce::jmax(1, beatsPerMeasure);
    if (lastLocal_ >= 0)
        lastLocal_ = total_ % beatsPerMeasure_;
}

int ElapsedBeatTracker::observe(int localBeat) {
    if (localBeat < 0)
        return total_;

    int local = localBeat % beatsPerMeasure_;
    if (local == lastLocal_)
        return total_;

    int measureStart = (total_ / beatsPerMeasure_) * beatsPerMeasure_;

    if (lastLocal_ >= 0 && local < lastLocal_) {
        // Wrapped into the next measure
        total_ = measureStart + beatsPerMeasure_ + local;
    } else {
        total_ = measureStart + local;
    }

    lastLocal_ = local;
    return total_;
}

void ElapsedBeatTracker::seed(int totalBeats) {
    total_ = juce::jmax(0, totalBeats);
    lastLocal_ = total_ % beatsPerMeasure_;
}

void ElapsedBeatTracker::reset() {
    lastLocal_ = -1;
    total_ = 0;
}

}  // namespace virgo
