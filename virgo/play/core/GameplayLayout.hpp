#pragma once

#include <vector>

#include "DrumTypes.hpp"

namespace virgo {

/**
 * @brief Staff geometry for the scrolling notation view
 *
 * All values are in view points. The view layer draws; this namespace only
 * answers "where", so playback can cache positions once per chart.
 */
namespace GameplayLayout {

// Staff
constexpr double kStaffLineSpacing = 20.0;
constexpr int kStaffLineCount = 5;
constexpr double kStaffHeight = (kStaffLineCount - 1) * kStaffLineSpacing;

// Rows
constexpr double kMaxRowWidth = 900.0;
constexpr double kRowHeight = 200.0;
constexpr double kRowVerticalSpacing = 40.0;
constexpr double kBaseStaffY = 150.0 + kStaffHeight / 2.0;  // lowest staff line, first row

// Horizontal
constexpr double kLeftMargin = 100.0;     // clef + time signature + spacing
constexpr double kUniformSpacing = 50.0;  // between bar line and notes, and note to note
constexpr double kMeasureSpacing = 12.0;
constexpr double kLastMeasureTrailing = 20.0;
constexpr double kBarLineWidth = 2.0;

/**
 * @brief Where a measure sits on the page
 */
struct MeasurePosition {
    int row = 0;
    double xOffset = kLeftMargin;
    int measureIndex = 0;
};

/**
 * @brief Vertical slots on and between the staff lines, top to bottom
 */
enum class NotePosition {
    AboveLine5,
    Line5,
    SpaceBetween4And5,
    Line4,
    SpaceBetween3And4,
    Line3,
    SpaceBetween2And3,
    Line2,
    SpaceBetween1And2,
    Line1,
    BelowLine1
};

/** Offset of a slot from the lowest staff line (negative = up). */
double noteYOffset(NotePosition position);

/** Slot a drum is notated on. */
NotePosition notePositionForDrum(DrumType drum);

/** Y of the lowest staff line on a row. */
double rowBaseY(int row);

double noteYPosition(int row, NotePosition position);

/** Y of the middle staff line, where the playback indicator travels. */
double staffCenterY(int row);

/** bar + (beatsPerMeasure + 1) * spacing */
double measureWidth(const TimeSignature& timeSignature);

/**
 * @brief Lay measures out left to right, wrapping to a new row at kMaxRowWidth
 *
 * The first measure of a row is never wrapped, so a row always holds at least one.
 */
std::vector<MeasurePosition> calculateMeasurePositions(int totalMeasures,
                                                       const TimeSignature& timeSignature);

/** Total view height needed for a set of measure positions. */
double totalHeight(const std::vector<MeasurePosition>& positions);

/**
 * @brief X of a point inside a measure
 *
 * measureStart + barLineWidth + spacing + beatPosition * spacing, where
 * beatPosition is in beats from the bar line (2.5 = halfway between beats 3 and 4).
 * Notes and the playback indicator both go through here so they line up exactly.
 */
double preciseNoteXPosition(const MeasurePosition& measure, double beatPosition);

/** X of a whole beat index inside a measure. */
double noteXPosition(const MeasurePosition& measure, int beatIndex);

}  // namespace GameplayLayout
}  // namespace virgo
