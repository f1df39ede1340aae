#include "DrumTypes.hpp"

namespace virgo {

// =============================================================================
// TimeSignature
// =============================================================================

const std::vector<TimeSignature>& TimeSignature::presets() {
    static const std::vector<TimeSignature> all = {{4, 4}, {3, 4}, {2, 4}, {6, 8},
                                                   {5, 4}, {7, 8}, {9, 8}, {12, 8}};
    return all;
}

std::optional<TimeSignature> TimeSignature::fromString(const juce::String& text) {
    auto trimmed = text.trim();
    int slash = trimmed.indexOfChar('/');
    if (slash <= 0 || slash == trimmed.length() - 1)
        return std::nullopt;

    auto numerator = trimmed.substring(0, slash).trim();
    auto denominator = trimmed.substring(slash + 1).trim();
    if (!numerator.containsOnly("0123456789") || !denominator.containsOnly("0123456789"))
        return std::nullopt;

    int beats = numerator.getIntValue();
    int value = denominator.getIntValue();
    if (beats < 1 || value < 1)
        return std::nullopt;

    return TimeSignature(beats, value);
}

// =============================================================================
// NoteInterval
// =============================================================================

bool needsStem(NoteInterval interval) {
    switch (interval) {
        case NoteInterval::Full:
        case NoteInterval::Half:
            return false;
        case NoteInterval::Quarter:
        case NoteInterval::Eighth:
        case NoteInterval::Sixteenth:
        case NoteInterval::ThirtySecond:
        case NoteInterval::SixtyFourth:
            return true;
    }
    return false;
}

bool needsFlag(NoteInterval interval) {
    return flagCount(interval) > 0;
}

int flagCount(NoteInterval interval) {
    switch (interval) {
        case NoteInterval::Full:
        case NoteInterval::Half:
        case NoteInterval::Quarter:
            return 0;
        case NoteInterval::Eighth:
            return 1;
        case NoteInterval::Sixteenth:
            return 2;
        case NoteInterval::ThirtySecond:
            return 3;
        case NoteInterval::SixtyFourth:
            return 4;
    }
    return 0;
}

const char* getNoteIntervalName(NoteInterval interval) {
    switch (interval) {
        case NoteInterval::Full:
            return "Full";
        case NoteInterval::Half:
            return "Half";
        case NoteInterval::Quarter:
            return "Quarter";
        case NoteInterval::Eighth:
            return "Eighth";
        case NoteInterval::Sixteenth:
            return "Sixteenth";
        case NoteInterval::ThirtySecond:
            return "Thirty Second";
        case NoteInterval::SixtyFourth:
            return "Sixty Fourth";
    }
    return "Unknown";
}

// =============================================================================
// DrumType
// =============================================================================

DrumType drumTypeFromNoteType(NoteType noteType) {
    switch (noteType) {
        case NoteType::Bass:
            return DrumType::Kick;
        case NoteType::Snare:
            return DrumType::Snare;
        case NoteType::HiHat:
        case NoteType::OpenHiHat:
            return DrumType::HiHat;
        case NoteType::Crash:
        case NoteType::China:
        case NoteType::Splash:
            return DrumType::Crash;
        case NoteType::Ride:
            return DrumType::Ride;
        case NoteType::HighTom:
            return DrumType::Tom1;
        case NoteType::MidTom:
            return DrumType::Tom2;
        case NoteType::LowTom:
            return DrumType::Tom3;
        case NoteType::Cowbell:
            return DrumType::Cowbell;
    }
    return DrumType::Snare;
}

const std::vector<DrumType>& allDrumTypes() {
    static const std::vector<DrumType> all = {
        DrumType::Kick, DrumType::Snare, DrumType::HiHat, DrumType::HiHatPedal, DrumType::Tom1,
        DrumType::Tom2, DrumType::Tom3,  DrumType::Crash, DrumType::Ride,       DrumType::Cowbell};
    return all;
}

const char* getDrumTypeName(DrumType drum) {
    switch (drum) {
        case DrumType::Kick:
            return "Kick Drum";
        case DrumType::Snare:
            return "Snare";
        case DrumType::HiHat:
            return "Hi-Hat";
        case DrumType::HiHatPedal:
            return "Hi-Hat Pedal";
        case DrumType::Crash:
            return "Crash";
        case DrumType::Ride:
            return "Ride";
        case DrumType::Tom1:
            return "High Tom";
        case DrumType::Tom2:
            return "Mid Tom";
        case DrumType::Tom3:
            return "Low Tom";
        case DrumType::Cowbell:
            return "Cowbell";
    }
    return "Unknown";
}

const char* getDrumTypeKey(DrumType drum) {
    switch (drum) {
        case DrumType::Kick:
            return "kick";
        case DrumType::Snare:
            return "snare";
        case DrumType::HiHat:
            return "hiHat";
        case DrumType::HiHatPedal:
            return "hiHatPedal";
        case DrumType::Crash:
            return "crash";
        case DrumType::Ride:
            return "ride";
        case DrumType::Tom1:
            return "tom1";
        case DrumType::Tom2:
            return "tom2";
        case DrumType::Tom3:
            return "tom3";
        case DrumType::Cowbell:
            return "cowbell";
    }
    return "unknown";
}

std::optional<DrumType> drumTypeFromKey(const juce::String& key) {
    for (auto drum : allDrumTypes()) {
        if (key == getDrumTypeKey(drum))
            return drum;
    }
    return std::nullopt;
}

int getDrumSortOrder(DrumType drum) {
    const auto& all = allDrumTypes();
    for (size_t i = 0; i < all.size(); ++i) {
        if (all[i] == drum)
            return static_cast<int>(i);
    }
    return static_cast<int>(all.size());
}

// =============================================================================
// Difficulty
// =============================================================================

const char* getDifficultyName(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:
            return "Easy";
        case Difficulty::Medium:
            return "Medium";
        case Difficulty::Hard:
            return "Hard";
        case Difficulty::Expert:
            return "Expert";
    }
    return "Unknown";
}

int getDefaultLevel(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:
            return 30;
        case Difficulty::Medium:
            return 50;
        case Difficulty::Hard:
            return 70;
        case Difficulty::Expert:
            return 90;
    }
    return 50;
}

}  // namespace virgo
