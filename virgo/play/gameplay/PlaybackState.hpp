#pragma once

#include <optional>

#include "../core/TypeIds.hpp"

namespace virgo {

/**
 * @brief Lifecycle of one gameplay session
 *
 * Idle until the chart is loaded. Restart returns to Loaded, skipping or
 * reaching the end lands in Finished.
 */
enum class PlaybackPhase { Idle, Loaded, Playing, Paused, Finished };

inline const char* getPlaybackPhaseName(PlaybackPhase phase) {
    switch (phase) {
        case PlaybackPhase::Idle:
            return "Idle";
        case PlaybackPhase::Loaded:
            return "Loaded";
        case PlaybackPhase::Playing:
            return "Playing";
        case PlaybackPhase::Paused:
            return "Paused";
        case PlaybackPhase::Finished:
            return "Finished";
    }
    return "Unknown";
}

/**
 * @brief A point in the notation view
 */
struct LayoutPoint {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const LayoutPoint& other) const {
        return x == other.x && y == other.y;
    }
    bool operator!=(const LayoutPoint& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Snapshot of playback progress for the view layer
 */
struct PlaybackState {
    PlaybackPhase phase = PlaybackPhase::Idle;

    int currentBeat = 0;                // index into the sorted drum beats
    int totalBeatsElapsed = 0;          // never decreases while playing
    double playbackProgress = 0.0;      // [0, 1]
    int currentMeasureIndex = 0;        // zero-based
    double currentBeatPosition = 0.0;   // measure fraction, snapped to whole beats
    double rawBeatPosition = 0.0;       // measure fraction, continuous
    double pausedElapsedTime = 0.0;     // seconds played before the current session

    std::optional<BeatId> activeBeatId;
    std::optional<LayoutPoint> indicatorPosition;
};

}  // namespace virgo
