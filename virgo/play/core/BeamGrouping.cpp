#include "BeamGrouping.hpp"

#include <cmath>

#include "MeasureUtils.hpp"

namespace virgo {
namespace BeamGrouping {

std::vector<BeamGroup> calculateBeamGroups(const std::vector<DrumBeat>& beats) {
    std::vector<BeamGroup> groups;
    std::vector<DrumBeat> current;
    int groupIndex = 0;

    auto flush = [&]() {
        if (current.size() >= 2) {
            ++groupIndex;
            BeamGroup group;
            group.id = "beam_" + juce::String(static_cast<juce::int64>(current.front().id)) + "_" +
                       juce::String(groupIndex);
            group.beats = std::move(current);
            groups.push_back(std::move(group));
        }
        current.clear();
    };

    for (const auto& beat : beats) {
        if (!needsFlag(beat.interval)) {
            flush();
            continue;
        }

        if (!current.empty()) {
            const auto& last = current.back();
            bool sameMeasure = MeasureUtils::measureIndex(beat.timePosition) ==
                               MeasureUtils::measureIndex(last.timePosition);
            double gap = std::abs(beat.timePosition - last.timePosition);
            if (!sameMeasure || gap > kMaxConsecutiveInterval)
                flush();
        }
        current.push_back(beat);
    }
    flush();

    return groups;
}

}  // namespace BeamGrouping
}  // namespace virgo
