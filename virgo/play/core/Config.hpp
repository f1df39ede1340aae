#pragma once

#include <string>

namespace virgo {

/**
 * Configuration class for the playback core
 * Values are read when components are constructed, so change them before
 * building a MetronomeEngine or PlaybackCoordinator.
 */
class Config {
  public:
    static Config& getInstance();

    // Audio Output Configuration
    bool getAudioOutputEnabled() const {
        return audioOutputEnabled;
    }
    void setAudioOutputEnabled(bool enabled) {
        audioOutputEnabled = enabled;
    }

    std::string getPreferredOutputDevice() const {
        return preferredOutputDevice;
    }
    void setPreferredOutputDevice(const std::string& deviceName) {
        preferredOutputDevice = deviceName;
    }

    int getAudioLookaheadMs() const {
        return audioLookaheadMs;
    }
    void setAudioLookaheadMs(int ms) {
        audioLookaheadMs = ms;
    }

    // Metronome Configuration
    std::string getClickSamplePath() const {
        return clickSamplePath;
    }
    void setClickSamplePath(const std::string& path) {
        clickSamplePath = path;
    }

    float getMetronomeVolume() const {
        return metronomeVolume;
    }
    void setMetronomeVolume(float volume) {
        metronomeVolume = volume;
    }

    double getMinBpm() const {
        return minBpm;
    }
    void setMinBpm(double bpm) {
        minBpm = bpm;
    }

    double getMaxBpm() const {
        return maxBpm;
    }
    void setMaxBpm(double bpm) {
        maxBpm = bpm;
    }

    // Driver Configuration
    int getTimingPollIntervalMs() const {
        return timingPollIntervalMs;
    }
    void setTimingPollIntervalMs(int ms) {
        timingPollIntervalMs = ms;
    }

    int getPlaybackUpdateIntervalMs() const {
        return playbackUpdateIntervalMs;
    }
    void setPlaybackUpdateIntervalMs(int ms) {
        playbackUpdateIntervalMs = ms;
    }

    // Settings Storage
    std::string getSettingsFolder() const {
        return settingsFolder;
    }
    void setSettingsFolder(const std::string& folder) {
        settingsFolder = folder;
    }

    void saveToFile(const std::string& filename);
    void loadFromFile(const std::string& filename);

    /** Restore every value to its default. */
    void resetToDefaults();

  private:
    Config() = default;

    // Upper bounds accepted from a config file
    static constexpr double kMaxIntervalMs = 1000.0;
    static constexpr double kMaxBpmLimit = 1000.0;

    // Helper to parse a single config line
    void parseConfigLine(const std::string& key, const std::string& value);

    // Audio output settings
    bool audioOutputEnabled = true;          // Open an output device for the click
    std::string preferredOutputDevice = "";  // Preferred output device (empty = system default)
    int audioLookaheadMs = 20;               // Scheduling headroom added to hardware timestamps

    // Metronome settings
    std::string clickSamplePath = "";  // Click sample file (empty = synthesised click)
    float metronomeVolume = 0.7f;
    double minBpm = 40.0;   // Metronome tempo control range
    double maxBpm = 200.0;

    // Driver settings
    int timingPollIntervalMs = 1;       // Beat detection thread period (0 = driven by caller)
    int playbackUpdateIntervalMs = 16;  // Playback state refresh (0 = driven by caller)

    // Storage settings
    std::string settingsFolder = "";  // Practice/input settings (empty = user app data)
};

}  // namespace virgo
