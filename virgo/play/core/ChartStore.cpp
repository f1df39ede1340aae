#include "ChartStore.hpp"

#include <algorithm>
#include <cmath>

namespace virgo {

SongId ChartStore::addSong(Song song) {
    if (song.id == INVALID_SONG_ID || getSong(song.id) != nullptr)
        song.id = nextSongId_;
    nextSongId_ = juce::jmax(nextSongId_, song.id + 1);

    songs_.push_back(std::move(song));
    return songs_.back().id;
}

bool ChartStore::removeSong(SongId songId) {
    auto it = std::find_if(songs_.begin(), songs_.end(),
                           [songId](const Song& s) { return s.id == songId; });
    if (it == songs_.end())
        return false;

    // Charts are kept; their accessors fall back to placeholders
    songs_.erase(it);
    DBG("ChartStore: removed song " << songId);
    return true;
}

const Song* ChartStore::getSong(SongId songId) const {
    for (const auto& song : songs_) {
        if (song.id == songId)
            return &song;
    }
    return nullptr;
}

ChartId ChartStore::addChart(Chart chart) {
    if (chart.id == INVALID_CHART_ID || getChart(chart.id) != nullptr)
        chart.id = nextChartId_;
    nextChartId_ = juce::jmax(nextChartId_, chart.id + 1);

    charts_.push_back(std::move(chart));
    return charts_.back().id;
}

bool ChartStore::removeChart(ChartId chartId) {
    auto it = std::find_if(charts_.begin(), charts_.end(),
                           [chartId](const Chart& c) { return c.id == chartId; });
    if (it == charts_.end())
        return false;
    charts_.erase(it);
    return true;
}

const Chart* ChartStore::getChart(ChartId chartId) const {
    for (const auto& chart : charts_) {
        if (chart.id == chartId)
            return &chart;
    }
    return nullptr;
}

std::vector<ChartId> ChartStore::getChartsForSong(SongId songId) const {
    std::vector<ChartId> ids;
    for (const auto& chart : charts_) {
        if (chart.songId == songId)
            ids.push_back(chart.id);
    }
    return ids;
}

const std::vector<Note>& ChartStore::getNotes(ChartId chartId) const {
    static const std::vector<Note> empty;
    if (auto* chart = getChart(chartId))
        return chart->notes;
    return empty;
}

const Song* ChartStore::songForChart(ChartId chartId) const {
    auto* chart = getChart(chartId);
    return chart ? getSong(chart->songId) : nullptr;
}

// =============================================================================
// Placeholder-aware accessors
// =============================================================================

juce::String ChartStore::chartTitle(ChartId chartId) const {
    auto* song = songForChart(chartId);
    return song ? song->title : juce::String(kUnknownTitle);
}

juce::String ChartStore::chartArtist(ChartId chartId) const {
    auto* song = songForChart(chartId);
    return song ? song->artist : juce::String(kUnknownArtist);
}

double ChartStore::chartBpm(ChartId chartId) const {
    auto* song = songForChart(chartId);
    if (song == nullptr || !std::isfinite(song->bpm) || song->bpm <= 0.0)
        return kDefaultBpm;
    return song->bpm;
}

juce::String ChartStore::chartDuration(ChartId chartId) const {
    auto* song = songForChart(chartId);
    return song ? song->duration : juce::String(kUnknownDuration);
}

TimeSignature ChartStore::chartTimeSignature(ChartId chartId) const {
    if (auto* chart = getChart(chartId)) {
        if (chart->timeSignature)
            return *chart->timeSignature;
        if (auto* song = getSong(chart->songId))
            return song->timeSignature;
    }
    return TimeSignature::fourFour();
}

std::optional<DrumTrack> ChartStore::makeDrumTrack(ChartId chartId) const {
    auto* chart = getChart(chartId);
    if (chart == nullptr)
        return std::nullopt;

    DrumTrack track;
    track.chartId = chartId;
    track.title = chartTitle(chartId);
    track.artist = chartArtist(chartId);
    track.bpm = chartBpm(chartId);
    track.duration = chartDuration(chartId);
    track.timeSignature = chartTimeSignature(chartId);
    track.difficulty = chart->difficulty;
    if (auto* song = getSong(chart->songId))
        track.bgmFilePath = song->bgmFilePath;
    return track;
}

void ChartStore::clear() {
    songs_.clear();
    charts_.clear();
    nextSongId_ = 1;
    nextChartId_ = 1;
}

}  // namespace virgo
