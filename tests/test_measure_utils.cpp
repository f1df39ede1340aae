#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../virgo/play/core/MeasureUtils.hpp"

using namespace virgo;
using Catch::Approx;

TEST_CASE("MeasureUtils - one-based and zero-based conversions", "[measure_utils]") {
    REQUIRE(MeasureUtils::toZeroBasedIndex(1) == 0);
    REQUIRE(MeasureUtils::toOneBasedNumber(0) == 1);
    REQUIRE(MeasureUtils::timePosition(3, 0.25) == Approx(2.25));
}

TEST_CASE("MeasureUtils - index and offset split a time position", "[measure_utils]") {
    for (double tp : {0.0, 0.25, 0.999, 1.0, 2.5, 7.75, 12.125}) {
        REQUIRE(MeasureUtils::measureIndex(tp) == static_cast<int>(std::floor(tp)));
        REQUIRE(MeasureUtils::measureOffset(tp) == Approx(tp - MeasureUtils::measureIndex(tp)));
        REQUIRE(MeasureUtils::measureOffset(tp) >= 0.0);
        REQUIRE(MeasureUtils::measureOffset(tp) < 1.0);
    }
}

TEST_CASE("MeasureUtils - tempo arithmetic", "[measure_utils]") {
    for (double bpm : {40.0, 60.0, 90.0, 120.0, 133.5, 200.0}) {
        REQUIRE(MeasureUtils::secondsPerBeat(bpm) == Approx(60.0 / bpm));
        REQUIRE(MeasureUtils::durationOfMeasures(8, bpm, TimeSignature(3, 4)) ==
                Approx(8 * (60.0 / bpm) * 3));
    }
    REQUIRE(MeasureUtils::secondsPerMeasure(120.0, TimeSignature::fourFour()) == Approx(2.0));
}

TEST_CASE("MeasureUtils - duration strings", "[measure_utils]") {
    REQUIRE(MeasureUtils::parseDurationString("3:45") == Approx(225.0));
    REQUIRE(MeasureUtils::parseDurationString("0:30") == Approx(30.0));
    REQUIRE(MeasureUtils::parseDurationString("0:00") < 0.0);
    REQUIRE(MeasureUtils::parseDurationString("") < 0.0);
    REQUIRE(MeasureUtils::parseDurationString("abc") < 0.0);
    REQUIRE(MeasureUtils::parseDurationString("1:2:3") < 0.0);
}
