#pragma once

#include <cstdint>

namespace virgo {

// Song identifiers
using SongId = int;
constexpr SongId INVALID_SONG_ID = -1;

// Chart identifiers (one chart = one difficulty of a song)
using ChartId = int;
constexpr ChartId INVALID_CHART_ID = -1;

// Drum beat identifiers, unique per computed beat sequence
using BeatId = std::uint64_t;

}  // namespace virgo
