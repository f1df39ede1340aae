#pragma once

#include <juce_core/juce_core.h>

namespace virgo {

/**
 * @brief A point on the audio device's own sample clock
 *
 * samplePosition counts samples rendered since the output session started.
 * It is only meaningful for the session (and sample rate) that produced it.
 */
struct HardwareTimestamp {
    juce::int64 samplePosition = -1;
    double sampleRate = 0.0;

    bool isValid() const {
        return samplePosition >= 0 && sampleRate > 0.0;
    }

    double toSeconds() const {
        return isValid() ? static_cast<double>(samplePosition) / sampleRate : 0.0;
    }
};

}  // namespace virgo
