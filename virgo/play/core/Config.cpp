#include "Config.hpp"

#include <cmath>
#include <fstream>
#include <iostream>

namespace virgo {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    audioOutputEnabled = true;
    preferredOutputDevice.clear();
    audioLookaheadMs = 20;
    clickSamplePath.clear();
    metronomeVolume = 0.7f;
    minBpm = 40.0;
    maxBpm = 200.0;
    timingPollIntervalMs = 1;
    playbackUpdateIntervalMs = 16;
    settingsFolder.clear();
}

void Config::saveToFile(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file for writing: " << filename << std::endl;
        return;
    }

    file << "audioOutputEnabled=" << (audioOutputEnabled ? 1 : 0) << std::endl;
    file << "preferredOutputDevice=" << preferredOutputDevice << std::endl;
    file << "audioLookaheadMs=" << audioLookaheadMs << std::endl;
    file << "clickSamplePath=" << clickSamplePath << std::endl;
    file << "metronomeVolume=" << metronomeVolume << std::endl;
    file << "minBpm=" << minBpm << std::endl;
    file << "maxBpm=" << maxBpm << std::endl;
    file << "timingPollIntervalMs=" << timingPollIntervalMs << std::endl;
    file << "playbackUpdateIntervalMs=" << playbackUpdateIntervalMs << std::endl;
    file << "settingsFolder=" << settingsFolder << std::endl;

    file.close();
    std::cout << "Config saved to: " << filename << std::endl;
}

void Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cout << "Config file not found, using defaults: " << filename << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        parseConfigLine(key, value);
    }

    file.close();

    if (minBpm > maxBpm) {
        std::cerr << "Config minBpm " << minBpm << " is above maxBpm " << maxBpm
                  << ", using the default range" << std::endl;
        minBpm = 40.0;
        maxBpm = 200.0;
    }
    std::cout << "Config loaded from: " << filename << std::endl;
}

void Config::parseConfigLine(const std::string& key, const std::string& value) {
    try {
        // Handle string values
        if (key == "preferredOutputDevice") {
            preferredOutputDevice = value;
            return;
        }
        if (key == "clickSamplePath") {
            clickSamplePath = value;
            return;
        }
        if (key == "settingsFolder") {
            settingsFolder = value;
            return;
        }

        // Handle numeric values
        double numValue = std::stod(value);

        auto inRange = [&](double low, double high) {
            if (std::isfinite(numValue) && numValue >= low && numValue <= high)
                return true;
            std::cerr << "Config value out of range, ignoring: " << key << "=" << value
                      << std::endl;
            return false;
        };

        if (key == "audioOutputEnabled") {
            audioOutputEnabled = (numValue != 0);
        } else if (key == "audioLookaheadMs") {
            if (inRange(0.0, kMaxIntervalMs))
                audioLookaheadMs = static_cast<int>(numValue);
        } else if (key == "metronomeVolume") {
            if (inRange(0.0, 1.0))
                metronomeVolume = static_cast<float>(numValue);
        } else if (key == "minBpm") {
            if (inRange(1.0, kMaxBpmLimit))
                minBpm = numValue;
        } else if (key == "maxBpm") {
            if (inRange(1.0, kMaxBpmLimit))
                maxBpm = numValue;
        } else if (key == "timingPollIntervalMs") {
            if (inRange(0.0, kMaxIntervalMs))
                timingPollIntervalMs = static_cast<int>(numValue);
        } else if (key == "playbackUpdateIntervalMs") {
            if (inRange(0.0, kMaxIntervalMs))
                playbackUpdateIntervalMs = static_cast<int>(numValue);
        }
        // Skip unknown keys silently
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config value: " << key << "=" << value << " (" << e.what()
                  << ")" << std::endl;
    }
}

}  // namespace virgo
