#pragma once

#include <cmath>

#include "DrumTypes.hpp"

namespace virgo {
namespace MeasureUtils {

/*
 * Chart positions are measured in measures: 1.0 is one full measure, so a
 * time position of 2.25 is a quarter of the way into the third measure
 * (measure index 2, measure number 3).
 */

inline int toOneBasedNumber(int zeroBasedIndex) {
    return zeroBasedIndex + 1;
}

inline int toZeroBasedIndex(int oneBasedNumber) {
    return oneBasedNumber - 1;
}

/**
 * @brief Time position from a 1-based measure number and an offset within it
 */
inline double timePosition(int measureNumber, double measureOffset) {
    return static_cast<double>(toZeroBasedIndex(measureNumber)) + measureOffset;
}

/** Zero-based measure index containing a time position (floor). */
inline int measureIndex(double timePosition) {
    return static_cast<int>(std::floor(timePosition));
}

/** Fraction of the measure elapsed at a time position, in [0, 1). */
inline double measureOffset(double timePosition) {
    return timePosition - std::floor(timePosition);
}

// =============================================================================
// Tempo arithmetic
// =============================================================================

inline double secondsPerBeat(double bpm) {
    return 60.0 / bpm;
}

inline double secondsPerMeasure(double bpm, const TimeSignature& timeSignature) {
    return secondsPerBeat(bpm) * timeSignature.beatsPerMeasure;
}

/** Length in seconds of a number of whole measures. */
inline double durationOfMeasures(int measures, double bpm, const TimeSignature& timeSignature) {
    return measures * secondsPerMeasure(bpm, timeSignature);
}

/**
 * @brief Parse a "m:ss" duration string
 * @return Seconds, or a negative value when the string is empty, "0:00" or malformed
 */
inline double parseDurationString(const juce::String& duration) {
    auto text = duration.trim();
    if (text.isEmpty() || text == "0:00")
        return -1.0;

    int colon = text.indexOfChar(':');
    if (colon <= 0 || text.indexOfChar(colon + 1, ':') >= 0)
        return -1.0;

    auto minutes = text.substring(0, colon);
    auto seconds = text.substring(colon + 1);
    if (seconds.isEmpty() || !minutes.containsOnly("0123456789") ||
        !seconds.containsOnly("0123456789."))
        return -1.0;

    return minutes.getDoubleValue() * 60.0 + seconds.getDoubleValue();
}

}  // namespace MeasureUtils
}  // namespace virgo
