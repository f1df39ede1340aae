#pragma once

#include <juce_core/juce_core.h>

#include <set>
#include <vector>

#include "DrumTypes.hpp"
#include "TypeIds.hpp"

namespace virgo {

/**
 * @brief Every drum struck at one notated instant
 *
 * timePosition is in measures from the start of the chart (1.0 = one full
 * measure). Sequences of beats are kept sorted by timePosition.
 */
struct DrumBeat {
    BeatId id = 0;
    std::set<DrumType> drums;
    double timePosition = 0.0;
    NoteInterval interval = NoteInterval::Quarter;
};

/**
 * @brief Consecutive flagged notes drawn under one beam
 */
struct BeamGroup {
    juce::String id;
    std::vector<DrumBeat> beats;
};

}  // namespace virgo
