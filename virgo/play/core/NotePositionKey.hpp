#pragma once

#include <cmath>
#include <cstddef>
#include <functional>

namespace virgo {

/**
 * @brief Grouping key for notes that sound at the same instant
 *
 * The offset is quantized to whole milliseconds of a measure so two notes
 * written as 0.333333 and 0.3333334 land on the same key.
 */
struct NotePositionKey {
    int measureNumber = 1;
    int measureOffsetMilliseconds = 0;

    NotePositionKey() = default;
    NotePositionKey(int measure, double measureOffset)
        : measureNumber(measure),
          measureOffsetMilliseconds(static_cast<int>(std::lround(measureOffset * 1000.0))) {}

    /** The quantized offset back as a measure fraction. */
    double getMeasureOffset() const {
        return measureOffsetMilliseconds / 1000.0;
    }

    bool operator==(const NotePositionKey& other) const {
        return measureNumber == other.measureNumber &&
               measureOffsetMilliseconds == other.measureOffsetMilliseconds;
    }
    bool operator!=(const NotePositionKey& other) const {
        return !(*this == other);
    }
    bool operator<(const NotePositionKey& other) const {
        if (measureNumber != other.measureNumber)
            return measureNumber < other.measureNumber;
        return measureOffsetMilliseconds < other.measureOffsetMilliseconds;
    }
};

struct NotePositionKeyHash {
    std::size_t operator()(const NotePositionKey& key) const {
        auto h1 = std::hash<int>{}(key.measureNumber);
        auto h2 = std::hash<int>{}(key.measureOffsetMilliseconds);
        return h1 ^ (h2 + 0x9e3779b9 + (h1 << 6) + (h1 >> 2));
    }
};

}  // namespace virgo
