#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <vector>

#include "DrumTypes.hpp"
#include "TypeIds.hpp"

namespace virgo {

/**
 * @brief One notated hit as delivered by the chart parser
 *
 * measureNumber is 1-based, measureOffset is the fraction of the measure
 * (0.0 = downbeat, 0.5 = halfway).
 */
struct Note {
    NoteInterval interval = NoteInterval::Quarter;
    NoteType noteType = NoteType::Snare;
    int measureNumber = 1;
    double measureOffset = 0.0;
};

/**
 * @brief Song metadata shared by all charts of a song
 */
struct Song {
    SongId id = INVALID_SONG_ID;
    juce::String title;
    juce::String artist;
    double bpm = 120.0;
    juce::String duration = "0:00";  // "m:ss", "0:00" = unknown
    juce::String genre;
    TimeSignature timeSignature;
    juce::String bgmFilePath;  // Backing track on disk (empty = none)
};

/**
 * @brief One difficulty of a song
 *
 * References its song by id only. A chart may declare its own time signature,
 * otherwise it inherits the song's.
 */
struct Chart {
    ChartId id = INVALID_CHART_ID;
    SongId songId = INVALID_SONG_ID;
    Difficulty difficulty = Difficulty::Medium;
    int level = 50;
    std::optional<TimeSignature> timeSignature;
    std::vector<Note> notes;
};

/**
 * @brief Flattened snapshot of everything playback needs from a chart
 *
 * Built once on load so gameplay never touches the store again.
 */
struct DrumTrack {
    ChartId chartId = INVALID_CHART_ID;
    juce::String title;
    juce::String artist;
    double bpm = 120.0;
    juce::String duration = "0:00";
    TimeSignature timeSignature;
    juce::String bgmFilePath;
    Difficulty difficulty = Difficulty::Medium;
};

}  // namespace virgo
