#pragma once

#include <juce_core/juce_core.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

#include "DrumTypes.hpp"

namespace virgo {

// Key name ("space", "f", "semicolon") to drum
using KeyboardMapping = std::unordered_map<std::string, DrumType>;

// MIDI note number to drum
using MidiMapping = std::map<std::uint8_t, DrumType>;

/**
 * @brief Persistent keyboard and MIDI bindings for the drum kit
 *
 * Bindings are one-to-one: binding a key to a drum removes the drum's previous
 * key and the key's previous drum. Every change is written straight back to
 * the settings file:
 *
 *   { "keyboard": { "f": "snare", ... }, "midi": { "38": "snare", ... } }
 *
 * A missing file starts from the defaults. Entries naming unknown drums are
 * dropped on load.
 */
class InputSettings {
  public:
    static const KeyboardMapping& defaultKeyboardMapping();
    static const MidiMapping& defaultMidiMapping();

    /** Uses input_settings.json in the configured settings folder. */
    InputSettings();
    explicit InputSettings(const juce::File& settingsFile);

    // Keyboard
    std::optional<std::string> getKeyBinding(DrumType drum) const;
    void setKeyBinding(const std::string& key, DrumType drum);
    void removeKeyBinding(DrumType drum);
    const KeyboardMapping& getKeyboardMapping() const {
        return keyboardMapping_;
    }

    // MIDI
    std::optional<std::uint8_t> getMidiBinding(DrumType drum) const;
    void setMidiBinding(std::uint8_t note, DrumType drum);
    void removeMidiBinding(DrumType drum);
    const MidiMapping& getMidiMapping() const {
        return midiMapping_;
    }

    void resetToDefaults();

    /** Reload from disk. Falls back to the defaults when the file is missing or corrupt. */
    void load();
    bool save() const;

    const juce::File& getSettingsFile() const {
        return settingsFile_;
    }

  private:
    juce::File settingsFile_;
    KeyboardMapping keyboardMapping_;
    MidiMapping midiMapping_;
};

}  // namespace virgo
