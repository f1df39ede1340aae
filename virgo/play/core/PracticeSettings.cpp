#include "PracticeSettings.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <stdexcept>

#include "Config.hpp"

namespace virgo {

namespace {

constexpr const char* kSpeedsKey = "speedMultipliers";

nlohmann::json readSettings(const juce::File& file) {
    if (!file.existsAsFile())
        return nlohmann::json::object();

    try {
        auto parsed = nlohmann::json::parse(file.loadFileAsString().toStdString());
        if (parsed.is_object())
            return parsed;
        DBG("PracticeSettings: ignoring non-object settings in " << file.getFullPathName());
    } catch (const std::exception& e) {
        DBG("PracticeSettings: failed to parse " << file.getFullPathName() << " (" << e.what()
                                                 << ")");
    }
    return nlohmann::json::object();
}

bool writeSettings(const juce::File& file, const nlohmann::json& json) {
    auto result = file.getParentDirectory().createDirectory();
    if (result.failed()) {
        DBG("PracticeSettings: cannot create settings folder: " << result.getErrorMessage());
        return false;
    }
    if (!file.replaceWithText(json.dump(2))) {
        DBG("PracticeSettings: failed to write " << file.getFullPathName());
        return false;
    }
    return true;
}

}  // namespace

const std::vector<double>& PracticeSettings::speedPresets() {
    static const std::vector<double> presets = {0.5, 0.75, 1.0, 1.25};
    return presets;
}

juce::File PracticeSettings::getDefaultSettingsFolder() {
    auto folder = Config::getInstance().getSettingsFolder();
    if (!folder.empty())
        return juce::File(folder);
    return juce::File::getSpecialLocation(juce::File::userApplicationDataDirectory)
        .getChildFile("Virgo");
}

PracticeSettings::PracticeSettings()
    : PracticeSettings(getDefaultSettingsFolder().getChildFile("practice_settings.json")) {}

PracticeSettings::PracticeSettings(const juce::File& settingsFile) : settingsFile_(settingsFile) {}

void PracticeSettings::setSpeed(double speed) {
    if (!std::isfinite(speed)) {
        DBG("PracticeSettings: ignoring non-finite speed");
        return;
    }
    speedMultiplier_ = juce::jlimit(kMinSpeed, kMaxSpeed, speed);
}

void PracticeSettings::resetSpeed() {
    setSpeed(kDefaultSpeed);
}

juce::String PracticeSettings::formattedSpeed() const {
    return juce::String(juce::roundToInt(speedMultiplier_ * 100.0)) + "%";
}

juce::String PracticeSettings::formattedEffectiveBPM(double baseBpm) const {
    return juce::String(static_cast<int>(effectiveBPM(baseBpm))) + " BPM";
}

// =============================================================================
// Persistence
// =============================================================================

double PracticeSettings::loadSpeed(ChartId chartId) const {
    auto json = readSettings(settingsFile_);
    auto key = std::to_string(chartId);

    if (!json.contains(kSpeedsKey) || !json[kSpeedsKey].is_object())
        return kDefaultSpeed;

    const auto& speeds = json[kSpeedsKey];
    auto it = speeds.find(key);
    if (it == speeds.end() || !it->is_number())
        return kDefaultSpeed;

    double saved = it->get<double>();
    return std::isfinite(saved) ? saved : kDefaultSpeed;
}

bool PracticeSettings::saveSpeed(double speed, ChartId chartId) {
    if (!std::isfinite(speed))
        return false;

    auto json = readSettings(settingsFile_);
    if (!json.contains(kSpeedsKey) || !json[kSpeedsKey].is_object())
        json[kSpeedsKey] = nlohmann::json::object();

    json[kSpeedsKey][std::to_string(chartId)] = speed;
    DBG("PracticeSettings: saved speed " << juce::roundToInt(speed * 100.0) << "% for chart "
                                         << chartId);
    return writeSettings(settingsFile_, json);
}

void PracticeSettings::loadAndApplySpeed(ChartId chartId) {
    setSpeed(loadSpeed(chartId));
}

bool PracticeSettings::clearAllSavedSpeeds() {
    auto json = readSettings(settingsFile_);
    json.erase(kSpeedsKey);
    DBG("PracticeSettings: cleared all saved speeds");
    return writeSettings(settingsFile_, json);
}

}  // namespace virgo
