#pragma once

#include <juce_core/juce_core.h>

#include <vector>

#include "TypeIds.hpp"

namespace virgo {

/**
 * @brief Practice speed state with per-chart persistence
 *
 * The multiplier scales the chart tempo (0.75 = 75% speed). Saved speeds live
 * in a small JSON file keyed by chart id:
 *
 *   { "speedMultipliers": { "12": 0.75, "31": 1.25 } }
 *
 * A missing or unreadable file behaves like an empty one.
 */
class PracticeSettings {
  public:
    static constexpr double kMinSpeed = 0.25;
    static constexpr double kMaxSpeed = 1.5;
    static constexpr double kSpeedIncrement = 0.05;
    static constexpr double kDefaultSpeed = 1.0;

    static const std::vector<double>& speedPresets();

    /** Uses practice_settings.json in the configured settings folder. */
    PracticeSettings();
    explicit PracticeSettings(const juce::File& settingsFile);

    double getSpeed() const {
        return speedMultiplier_;
    }

    /** Clamp to [kMinSpeed, kMaxSpeed]. Non-finite values are ignored. */
    void setSpeed(double speed);
    void resetSpeed();

    double effectiveBPM(double baseBpm) const {
        return baseBpm * speedMultiplier_;
    }

    /** "75%" */
    juce::String formattedSpeed() const;

    /** "90 BPM" */
    juce::String formattedEffectiveBPM(double baseBpm) const;

    // Persistence
    double loadSpeed(ChartId chartId) const;
    bool saveSpeed(double speed, ChartId chartId);
    void loadAndApplySpeed(ChartId chartId);
    bool clearAllSavedSpeeds();

    const juce::File& getSettingsFile() const {
        return settingsFile_;
    }

    /** Settings folder from Config, or the user application data folder. */
    static juce::File getDefaultSettingsFolder();

  private:
    double speedMultiplier_ = kDefaultSpeed;
    juce::File settingsFile_;
};

}  // namespace virgo
