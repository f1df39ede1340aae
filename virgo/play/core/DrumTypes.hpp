#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <vector>

namespace virgo {

/**
 * @brief Measure structure: how many beats per bar and which note value gets a beat
 *
 * Constructing with beatsPerMeasure below 1 clamps it to 1. The fields are
 * public, so consumers that divide by the beat count rebuild the value through
 * the constructor.
 */
struct TimeSignature {
    int beatsPerMeasure = 4;
    int noteValue = 4;

    TimeSignature() = default;
    TimeSignature(int beats, int value) : beatsPerMeasure(juce::jmax(1, beats)), noteValue(value) {}

    static TimeSignature fourFour() {
        return {4, 4};
    }
    static TimeSignature threeFour() {
        return {3, 4};
    }

    /** The signatures a chart may declare (4/4, 3/4, 2/4, 6/8, 5/4, 7/8, 9/8, 12/8). */
    static const std::vector<TimeSignature>& presets();

    /**
     * @brief Parse the "n/d" form used by chart metadata
     * @return nullopt for malformed strings or a numerator below 1
     */
    static std::optional<TimeSignature> fromString(const juce::String& text);

    juce::String toString() const {
        return juce::String(beatsPerMeasure) + "/" + juce::String(noteValue);
    }

    bool operator==(const TimeSignature& other) const {
        return beatsPerMeasure == other.beatsPerMeasure && noteValue == other.noteValue;
    }
    bool operator!=(const TimeSignature& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Notated duration of a note
 */
enum class NoteInterval { Full, Half, Quarter, Eighth, Sixteenth, ThirtySecond, SixtyFourth };

/** Stemmed notes: everything shorter than a half note. */
bool needsStem(NoteInterval interval);

/** Flagged (beamable) notes: eighth and shorter. */
bool needsFlag(NoteInterval interval);

/** Number of flags drawn for a lone note (0 for quarter and longer). */
int flagCount(NoteInterval interval);

const char* getNoteIntervalName(NoteInterval interval);

/**
 * @brief Instrument vocabulary used by chart files
 */
enum class NoteType {
    Bass,
    Snare,
    HighTom,
    MidTom,
    LowTom,
    HiHat,
    OpenHiHat,
    Crash,
    Ride,
    China,
    Splash,
    Cowbell
};

/**
 * @brief Physical drum a player hits
 *
 * Several chart note types collapse onto one drum (china and splash play as crash).
 */
enum class DrumType { Kick, Snare, HiHat, HiHatPedal, Crash, Ride, Tom1, Tom2, Tom3, Cowbell };

/** Map a chart note type onto the drum that plays it. */
DrumType drumTypeFromNoteType(NoteType noteType);

/** All drums in display order. */
const std::vector<DrumType>& allDrumTypes();

const char* getDrumTypeName(DrumType drum);

/** Stable identifier used in settings files ("kick", "hiHat", ...). */
const char* getDrumTypeKey(DrumType drum);

std::optional<DrumType> drumTypeFromKey(const juce::String& key);

/** Ordering used when a beat lists several drums. */
int getDrumSortOrder(DrumType drum);

/**
 * @brief Chart difficulty
 */
enum class Difficulty { Easy, Medium, Hard, Expert };

const char* getDifficultyName(Difficulty difficulty);

/** Level assigned to a chart that does not declare one. */
int getDefaultLevel(Difficulty difficulty);

}  // namespace virgo
