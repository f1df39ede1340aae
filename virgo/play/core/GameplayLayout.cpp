#include "GameplayLayout.hpp"

#include <algorithm>

namespace virgo {
namespace GameplayLayout {

double noteYOffset(NotePosition position) {
    switch (position) {
        case NotePosition::AboveLine5:
            return -5.0 * kStaffLineSpacing;
        case NotePosition::Line5:
            return -4.0 * kStaffLineSpacing;
        case NotePosition::SpaceBetween4And5:
            return -3.5 * kStaffLineSpacing;
        case NotePosition::Line4:
            return -3.0 * kStaffLineSpacing;
        case NotePosition::SpaceBetween3And4:
            return -2.5 * kStaffLineSpacing;
        case NotePosition::Line3:
            return -2.0 * kStaffLineSpacing;
        case NotePosition::SpaceBetween2And3:
            return -1.5 * kStaffLineSpacing;
        case NotePosition::Line2:
            return -1.0 * kStaffLineSpacing;
        case NotePosition::SpaceBetween1And2:
            return -0.5 * kStaffLineSpacing;
        case NotePosition::Line1:
            return 0.0;
        case NotePosition::BelowLine1:
            return kStaffLineSpacing;
    }
    return 0.0;
}

NotePosition notePositionForDrum(DrumType drum) {
    switch (drum) {
        case DrumType::Crash:
            return NotePosition::AboveLine5;
        case DrumType::HiHat:
            return NotePosition::Line5;
        case DrumType::Ride:
            return NotePosition::SpaceBetween4And5;
        case DrumType::Tom1:
            return NotePosition::SpaceBetween3And4;
        case DrumType::Snare:
            return NotePosition::Line3;
        case DrumType::Tom2:
            return NotePosition::SpaceBetween2And3;
        case DrumType::Tom3:
            return NotePosition::Line2;
        case DrumType::Cowbell:
            return NotePosition::Line4;
        case DrumType::HiHatPedal:
        case DrumType::Kick:
            return NotePosition::BelowLine1;
    }
    return NotePosition::Line3;
}

double rowBaseY(int row) {
    return kBaseStaffY + row * (kRowHeight + kRowVerticalSpacing);
}

double noteYPosition(int row, NotePosition position) {
    return rowBaseY(row) + noteYOffset(position);
}

double staffCenterY(int row) {
    return noteYPosition(row, NotePosition::Line3);
}

double measureWidth(const TimeSignature& timeSignature) {
    return kBarLineWidth + (timeSignature.beatsPerMeasure + 1) * kUniformSpacing;
}

std::vector<MeasurePosition> calculateMeasurePositions(int totalMeasures,
                                                       const TimeSignature& timeSignature) {
    std::vector<MeasurePosition> positions;
    if (totalMeasures <= 0)
        return positions;

    positions.reserve(static_cast<size_t>(totalMeasures));
    const double width = measureWidth(timeSignature);
    int row = 0;
    double x = kLeftMargin;

    for (int measureIndex = 0; measureIndex < totalMeasures; ++measureIndex) {
        bool isLast = measureIndex == totalMeasures - 1;
        double needed = x + width + (isLast ? kLastMeasureTrailing : kMeasureSpacing);

        if (needed > kMaxRowWidth && measureIndex > 0) {
            ++row;
            x = kLeftMargin;
        }

        positions.push_back({row, x, measureIndex});
        x += width + kMeasureSpacing;
    }

    return positions;
}

double totalHeight(const std::vector<MeasurePosition>& positions) {
    int maxRow = 0;
    for (const auto& p : positions)
        maxRow = std::max(maxRow, p.row);
    return kBaseStaffY + (maxRow + 1) * (kRowHeight + kRowVerticalSpacing) + 100.0;
}

double preciseNoteXPosition(const MeasurePosition& measure, double beatPosition) {
    return measure.xOffset + kBarLineWidth + kUniformSpacing + beatPosition * kUniformSpacing;
}

double noteXPosition(const MeasurePosition& measure, int beatIndex) {
    return preciseNoteXPosition(measure, static_cast<double>(beatIndex));
}

}  // namespace GameplayLayout
}  // namespace virgo
