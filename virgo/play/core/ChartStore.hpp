#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <vector>

#include "ChartTypes.hpp"

namespace virgo {

/**
 * @brief In-memory store of songs and charts, addressed by id
 *
 * Charts point at their song by SongId; nothing holds pointers into the store.
 * A chart whose song was removed stays usable and reports placeholder metadata.
 */
class ChartStore {
  public:
    static constexpr const char* kUnknownTitle = "Unknown Song";
    static constexpr const char* kUnknownArtist = "Unknown Artist";
    static constexpr double kDefaultBpm = 120.0;
    static constexpr const char* kUnknownDuration = "0:00";

    ChartStore() = default;

    // Songs
    SongId addSong(Song song);
    bool removeSong(SongId songId);
    const Song* getSong(SongId songId) const;
    const std::vector<Song>& getSongs() const {
        return songs_;
    }

    // Charts
    ChartId addChart(Chart chart);
    bool removeChart(ChartId chartId);
    const Chart* getChart(ChartId chartId) const;
    std::vector<ChartId> getChartsForSong(SongId songId) const;

    /** Notes of a chart in chart order (empty for unknown ids). */
    const std::vector<Note>& getNotes(ChartId chartId) const;

    // Placeholder-aware accessors
    juce::String chartTitle(ChartId chartId) const;
    juce::String chartArtist(ChartId chartId) const;
    double chartBpm(ChartId chartId) const;
    juce::String chartDuration(ChartId chartId) const;

    /** Chart override, then song signature, then 4/4. */
    TimeSignature chartTimeSignature(ChartId chartId) const;

    /** Snapshot of what playback needs. nullopt when the chart does not exist. */
    std::optional<DrumTrack> makeDrumTrack(ChartId chartId) const;

    void clear();

  private:
    const Song* songForChart(ChartId chartId) const;

    std::vector<Song> songs_;
    std::vector<Chart> charts_;
    SongId nextSongId_ = 1;
    ChartId nextChartId_ = 1;
};

}  // namespace virgo
