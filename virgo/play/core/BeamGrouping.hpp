#pragma once

#include <vector>

#include "DrumBeat.hpp"

namespace virgo {
namespace BeamGrouping {

/** Largest gap (in measures) between two notes that still share a beam. */
constexpr double kMaxConsecutiveInterval = 0.25;

/**
 * @brief Group consecutive flagged notes of the same measure into beams
 *
 * Walks the sorted beats once. A run of eighth-or-shorter notes inside one
 * measure, each no more than kMaxConsecutiveInterval after the previous one,
 * forms a group; runs of a single note are not beamed. Group ids are
 * "beam_<firstBeatId>_<n>" with n counting groups from 1, so they are unique
 * within one call.
 */
std::vector<BeamGroup> calculateBeamGroups(const std::vector<DrumBeat>& beats);

}  // namespace BeamGrouping
}  // namespace virgo
