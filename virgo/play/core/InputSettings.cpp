#include "InputSettings.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>

#include "PracticeSettings.hpp"

namespace virgo {

const KeyboardMapping& InputSettings::defaultKeyboardMapping() {
    static const KeyboardMapping mapping = {
        {"space", DrumType::Kick},  {"f", DrumType::Snare},        {"j", DrumType::HiHat},
        {"d", DrumType::Tom1},      {"k", DrumType::Tom2},         {"s", DrumType::Tom3},
        {"l", DrumType::Crash},     {"semicolon", DrumType::Ride}, {"g", DrumType::Cowbell}};
    return mapping;
}

const MidiMapping& InputSettings::defaultMidiMapping() {
    // General MIDI percussion notes
    static const MidiMapping mapping = {
        {36, DrumType::Kick},  {38, DrumType::Snare}, {42, DrumType::HiHat},
        {44, DrumType::HiHatPedal}, {45, DrumType::Tom3}, {47, DrumType::Tom2},
        {48, DrumType::Tom1},  {49, DrumType::Crash}, {51, DrumType::Ride},
        {56, DrumType::Cowbell}};
    return mapping;
}

InputSettings::InputSettings()
    : InputSettings(PracticeSettings::getDefaultSettingsFolder().getChildFile("input_settings.json")) {}

InputSettings::InputSettings(const juce::File& settingsFile) : settingsFile_(settingsFile) {
    load();
}

// =============================================================================
// Keyboard
// =============================================================================

std::optional<std::string> InputSettings::getKeyBinding(DrumType drum) const {
    for (const auto& [key, mapped] : keyboardMapping_) {
        if (mapped == drum)
            return key;
    }
    return std::nullopt;
}

void InputSettings::setKeyBinding(const std::string& key, DrumType drum) {
    for (auto it = keyboardMapping_.begin(); it != keyboardMapping_.end();) {
        if (it->second == drum)
            it = keyboardMapping_.erase(it);
        else
            ++it;
    }
    keyboardMapping_[key] = drum;
    save();
}

void InputSettings::removeKeyBinding(DrumType drum) {
    for (auto it = keyboardMapping_.begin(); it != keyboardMapping_.end();) {
        if (it->second == drum)
            it = keyboardMapping_.erase(it);
        else
            ++it;
    }
    save();
}

// =============================================================================
// MIDI
// =============================================================================

std::optional<std::uint8_t> InputSettings::getMidiBinding(DrumType drum) const {
    for (const auto& [note, mapped] : midiMapping_) {
        if (mapped == drum)
            return note;
    }
    return std::nullopt;
}

void InputSettings::setMidiBinding(std::uint8_t note, DrumType drum) {
    for (auto it = midiMapping_.begin(); it != midiMapping_.end();) {
        if (it->second == drum)
            it = midiMapping_.erase(it);
        else
            ++it;
    }
    midiMapping_[note] = drum;
    save();
}

void InputSettings::removeMidiBinding(DrumType drum) {
    for (auto it = midiMapping_.begin(); it != midiMapping_.end();) {
        if (it->second == drum)
            it = midiMapping_.erase(it);
        else
            ++it;
    }
    save();
}

void InputSettings::resetToDefaults() {
    keyboardMapping_ = defaultKeyboardMapping();
    midiMapping_ = defaultMidiMapping();
    save();
}

// =============================================================================
// Persistence
// =============================================================================

void InputSettings::load() {
    keyboardMapping_ = defaultKeyboardMapping();
    midiMapping_ = defaultMidiMapping();

    if (!settingsFile_.existsAsFile())
        return;

    try {
        auto json = nlohmann::json::parse(settingsFile_.loadFileAsString().toStdString());

        if (json.contains("keyboard") && json["keyboard"].is_object()) {
            KeyboardMapping keyboard;
            for (auto& [key, value] : json["keyboard"].items()) {
                if (!value.is_string())
                    continue;
                if (auto drum = drumTypeFromKey(value.get<std::string>()))
                    keyboard[key] = *drum;
            }
            keyboardMapping_ = std::move(keyboard);
        }

        if (json.contains("midi") && json["midi"].is_object()) {
            MidiMapping midi;
            for (auto& [key, value] : json["midi"].items()) {
                if (!value.is_string())
                    continue;
                int note = std::stoi(key);
                if (note < 0 || note > 127)
                    continue;
                if (auto drum = drumTypeFromKey(value.get<std::string>()))
                    midi[static_cast<std::uint8_t>(note)] = *drum;
            }
            midiMapping_ = std::move(midi);
        }
    } catch (const std::exception& e) {
        DBG("InputSettings: failed to load " << settingsFile_.getFullPathName() << " (" << e.what()
                                             << "), using defaults");
        keyboardMapping_ = defaultKeyboardMapping();
        midiMapping_ = defaultMidiMapping();
    }
}

bool InputSettings::save() const {
    nlohmann::json json;
    json["keyboard"] = nlohmann::json::object();
    json["midi"] = nlohmann::json::object();

    for (const auto& [key, drum] : keyboardMapping_)
        json["keyboard"][key] = getDrumTypeKey(drum);
    for (const auto& [note, drum] : midiMapping_)
        json["midi"][std::to_string(note)] = getDrumTypeKey(drum);

    auto result = settingsFile_.getParentDirectory().createDirectory();
    if (result.failed()) {
        DBG("InputSettings: cannot create settings folder: " << result.getErrorMessage());
        return false;
    }
    if (!settingsFile_.replaceWithText(json.dump(2))) {
        DBG("InputSettings: failed to write " << settingsFile_.getFullPathName());
        return false;
    }
    return true;
}

}  // namespace virgo
