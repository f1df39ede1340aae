#pragma once

#include <juce_core/juce_core.h>

namespace virgo {

/**
 * @brief Monotonic clock shared by the timing and audio paths
 *
 * Beat times, hardware-clock anchors and input timestamps are all expressed in
 * seconds of one TimeSource so they can be compared directly.
 */
class TimeSource {
  public:
    virtual ~TimeSource() = default;

    virtual double nowSeconds() const = 0;
};

/**
 * @brief High resolution system clock (never jumps backwards)
 */
class SystemTimeSource : public TimeSource {
  public:
    double nowSeconds() const override {
        return juce::Time::getMillisecondCounterHiRes() * 0.001;
    }
};

}  // namespace virgo
