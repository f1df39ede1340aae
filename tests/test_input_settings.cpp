#include <catch2/catch_test_macros.hpp>

#include "../virgo/play/core/Config.hpp"
#include "../virgo/play/core/InputSettings.hpp"
#include "TestEnvironment.hpp"

using namespace virgo;
using virgo::test::ScopedTempDirectory;

// ============================================================================
// Defaults
// ============================================================================

TEST_CASE("InputSettings - default keyboard mapping", "[input_settings]") {
    const auto& mapping = InputSettings::defaultKeyboardMapping();
    REQUIRE(mapping.at("space") == DrumType::Kick);
    REQUIRE(mapping.at("f") == DrumType::Snare);
    REQUIRE(mapping.at("j") == DrumType::HiHat);
    REQUIRE(mapping.at("semicolon") == DrumType::Ride);
}

TEST_CASE("InputSettings - default MIDI mapping follows General MIDI", "[input_settings]") {
    const auto& mapping = InputSettings::defaultMidiMapping();
    REQUIRE(mapping.at(36) == DrumType::Kick);
    REQUIRE(mapping.at(38) == DrumType::Snare);
    REQUIRE(mapping.at(42) == DrumType::HiHat);
    REQUIRE(mapping.at(49) == DrumType::Crash);
    REQUIRE(mapping.count(37) == 0);
}

TEST_CASE("InputSettings - missing file starts from defaults", "[input_settings]") {
    ScopedTempDirectory dir;
    InputSettings settings(dir.file("input.json"));
    REQUIRE(settings.getKeyboardMapping() == InputSettings::defaultKeyboardMapping());
    REQUIRE(settings.getMidiMapping() == InputSettings::defaultMidiMapping());
    REQUIRE(settings.getKeyBinding(DrumType::Snare) == std::string("f"));
    REQUIRE(settings.getMidiBinding(DrumType::Kick) == std::uint8_t{36});
}

// ============================================================================
// Bindings
// ============================================================================

TEST_CASE("InputSettings - key bindings are one-to-one", "[input_settings]") {
    ScopedTempDirectory dir;
    InputSettings settings(dir.file("input.json"));

    // Snare moves from "f" to "a"
    settings.setKeyBinding("a", DrumType::Snare);
    REQUIRE(settings.getKeyBinding(DrumType::Snare) == std::string("a"));
    REQUIRE(settings.getKeyboardMapping().count("f") == 0);

    // "j" leaves the hi-hat when given to the kick
    settings.setKeyBinding("j", DrumType::Kick);
    REQUIRE(settings.getKeyBinding(DrumType::Kick) == std::string("j"));
    REQUIRE_FALSE(settings.getKeyBinding(DrumType::HiHat).has_value());
    REQUIRE(settings.getKeyboardMapping().count("space") == 0);
}

TEST_CASE("InputSettings - MIDI bindings are one-to-one", "[input_settings]") {
    ScopedTempDirectory dir;
    InputSettings settings(dir.file("input.json"));

    settings.setMidiBinding(40, DrumType::Snare);
    REQUIRE(settings.getMidiBinding(DrumType::Snare) == std::uint8_t{40});
    REQUIRE(settings.getMidiMapping().count(38) == 0);

    settings.removeMidiBinding(DrumType::Snare);
    REQUIRE_FALSE(settings.getMidiBinding(DrumType::Snare).has_value());
}

TEST_CASE("InputSettings - remove key binding", "[input_settings]") {
    ScopedTempDirectory dir;
    InputSettings settings(dir.file("input.json"));
    settings.removeKeyBinding(DrumType::Crash);
    REQUIRE_FALSE(settings.getKeyBinding(DrumType::Crash).has_value());
    REQUIRE(settings.getKeyboardMapping().count("l") == 0);
}

// ============================================================================
// Persistence
// ============================================================================

TEST_CASE("InputSettings - changes are written immediately", "[input_settings]") {
    ScopedTempDirectory dir;
    auto file = dir.file("input.json");

    {
        InputSettings settings(file);
        settings.setKeyBinding("q", DrumType::Cowbell);
        settings.setMidiBinding(60, DrumType::Tom1);
    }
    REQUIRE(file.existsAsFile());

    InputSettings reloaded(file);
    REQUIRE(reloaded.getKeyBinding(DrumType::Cowbell) == std::string("q"));
    REQUIRE(reloaded.getMidiBinding(DrumType::Tom1) == std::uint8_t{60});
}

TEST_CASE("InputSettings - reset to defaults", "[input_settings]") {
    ScopedTempDirectory dir;
    auto file = dir.file("input.json");
    InputSettings settings(file);
    settings.setKeyBinding("z", DrumType::Kick);

    settings.resetToDefaults();
    REQUIRE(settings.getKeyboardMapping() == InputSettings::defaultKeyboardMapping());

    InputSettings reloaded(file);
    REQUIRE(reloaded.getKeyBinding(DrumType::Kick) == std::string("space"));
}

TEST_CASE("InputSettings - corrupt file falls back to defaults", "[input_settings]") {
    ScopedTempDirectory dir;
    auto file = dir.file("input.json");
    REQUIRE(file.replaceWithText("[[["));

    InputSettings settings(file);
    REQUIRE(settings.getKeyboardMapping() == InputSettings::defaultKeyboardMapping());
    REQUIRE(settings.getMidiMapping() == InputSettings::defaultMidiMapping());
}

TEST_CASE("InputSettings - unknown drums and bad notes are dropped", "[input_settings]") {
    ScopedTempDirectory dir;
    auto file = dir.file("input.json");
    REQUIRE(file.replaceWithText(R"({
        "keyboard": { "x": "snare", "y": "tambourine", "z": 5 },
        "midi": { "40": "kick", "200": "snare", "41": "gong" }
    })"));

    InputSettings settings(file);
    REQUIRE(settings.getKeyboardMapping().size() == 1);
    REQUIRE(settings.getKeyboardMapping().at("x") == DrumType::Snare);
    REQUIRE(settings.getMidiMapping().size() == 1);
    REQUIRE(settings.getMidiMapping().at(40) == DrumType::Kick);
}

TEST_CASE("InputSettings - default file lives in the settings folder", "[input_settings]") {
    ScopedTempDirectory dir;
    Config::getInstance().setSettingsFolder(dir.get().getFullPathName().toStdString());

    InputSettings settings;
    REQUIRE(settings.getSettingsFile() == dir.file("input_settings.json"));
}
