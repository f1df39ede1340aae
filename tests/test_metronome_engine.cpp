#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../virgo/play/core/Config.hpp"
#include "../virgo/play/engine/MetronomeEngine.hpp"
#include "TestEnvironment.hpp"

#include <limits>
#include <vector>

using namespace virgo;
using Catch::Approx;
using virgo::test::ManualTimeSource;

namespace {

class RecordingListener : public MetronomeListener {
  public:
    void metronomeBeat(int beatIndex, bool isAccented, double beatTimeSeconds) override {
        beats.push_back(beatIndex);
        accents.push_back(isAccented);
        times.push_back(beatTimeSeconds);
    }

    void metronomeStateChanged(bool isEnabled) override {
        states.push_back(isEnabled);
    }

    std::vector<int> beats;
    std::vector<bool> accents;
    std::vector<double> times;
    std::vector<bool> states;
};

struct MetronomeFixture {
    std::shared_ptr<ManualTimeSource> clock = std::make_shared<ManualTimeSource>(100.0);
    MetronomeEngine metronome{clock, 0, false};
    RecordingListener listener;

    MetronomeFixture() {
        metronome.addListener(&listener);
    }

    ~MetronomeFixture() {
        metronome.removeListener(&listener);
    }

    void advanceAndPoll(double seconds) {
        clock->advance(seconds);
        metronome.poll();
    }
};

}  // namespace

// ============================================================================
// Transport
// ============================================================================

TEST_CASE("MetronomeEngine - starts stopped at beat 0", "[metronome]") {
    MetronomeFixture f;
    REQUIRE_FALSE(f.metronome.isEnabled());
    REQUIRE(f.metronome.getCurrentBeat() == 0);
    REQUIRE_FALSE(f.metronome.getCurrentPlaybackTime().has_value());
    REQUIRE_FALSE(f.metronome.isTimingDriverRunning());
}

TEST_CASE("MetronomeEngine - ticks without an audio session", "[metronome]") {
    MetronomeFixture f;
    f.metronome.start(120.0, TimeSignature::fourFour());
    REQUIRE(f.metronome.isEnabled());
    REQUIRE_FALSE(f.metronome.getAudioScheduler().isSessionActive());

    f.metronome.poll();
    for (int i = 0; i < 5; ++i)
        f.advanceAndPoll(0.5);

    REQUIRE(f.listener.beats == std::vector<int>{0, 1, 2, 3, 0, 1});
    REQUIRE(f.listener.accents == std::vector<bool>{true, false, false, false, true, false});
    REQUIRE(f.listener.times.back() == Approx(102.5));
}

TEST_CASE("MetronomeEngine - state changes reach listeners", "[metronome]") {
    MetronomeFixture f;
    f.metronome.start(100.0, TimeSignature::fourFour());
    f.metronome.start(100.0, TimeSignature::fourFour());
    f.metronome.stop();
    f.metronome.stop();

    REQUIRE(f.listener.states == std::vector<bool>{true, false});
}

TEST_CASE("MetronomeEngine - toggle", "[metronome]") {
    MetronomeFixture f;
    f.metronome.toggle(90.0, TimeSignature::threeFour());
    REQUIRE(f.metronome.isEnabled());
    REQUIRE(f.metronome.getBpm() == Approx(90.0));
    REQUIRE(f.metronome.getTimeSignature() == TimeSignature::threeFour());

    f.metronome.toggle(90.0, TimeSignature::threeFour());
    REQUIRE_FALSE(f.metronome.isEnabled());
    REQUIRE(f.metronome.getCurrentBeat() == 0);
}

TEST_CASE("MetronomeEngine - scheduled resume", "[metronome]") {
    MetronomeFixture f;
    f.metronome.configure(120.0, TimeSignature::fourFour());
    f.metronome.startAt(100.5, 5);

    f.metronome.poll();
    REQUIRE(f.listener.beats.empty());
    REQUIRE_FALSE(f.metronome.getCurrentBeatProgress().has_value());

    f.advanceAndPoll(0.5);
    REQUIRE(f.listener.beats == std::vector<int>{1});
    REQUIRE(f.metronome.getCurrentBeatProgress()->totalBeats == Approx(5.0));
}

TEST_CASE("MetronomeEngine - removed listener gets nothing", "[metronome]") {
    MetronomeFixture f;
    f.metronome.removeListener(&f.listener);
    f.metronome.start(120.0, TimeSignature::fourFour());
    f.metronome.poll();
    REQUIRE(f.listener.beats.empty());
}

// ============================================================================
// Settings
// ============================================================================

TEST_CASE("MetronomeEngine - volume defaults to Config", "[metronome]") {
    Config::getInstance().setMetronomeVolume(0.4f);
    MetronomeEngine metronome(std::make_shared<ManualTimeSource>(), 0, false);
    REQUIRE(metronome.getVolume() == Approx(0.4f));
}

TEST_CASE("MetronomeEngine - volume is clamped", "[metronome]") {
    MetronomeFixture f;
    f.metronome.updateVolume(1.5f);
    REQUIRE(f.metronome.getVolume() == Approx(1.0f));
    f.metronome.updateVolume(-0.2f);
    REQUIRE(f.metronome.getVolume() == Approx(0.0f));
    f.metronome.updateVolume(0.3f);
    f.metronome.updateVolume(std::numeric_limits<float>::quiet_NaN());
    REQUIRE(f.metronome.getVolume() == Approx(0.3f));
}

TEST_CASE("MetronomeEngine - bpm is clamped to the configured range", "[metronome]") {
    MetronomeFixture f;
    f.metronome.updateBPM(20.0);
    REQUIRE(f.metronome.getBpm() == Approx(40.0));
    f.metronome.updateBPM(500.0);
    REQUIRE(f.metronome.getBpm() == Approx(200.0));
    f.metronome.updateBPM(-5.0);
    REQUIRE(f.metronome.getBpm() == Approx(40.0));
    f.metronome.updateBPM(std::numeric_limits<double>::infinity());
    REQUIRE(f.metronome.getBpm() == Approx(40.0));
    f.metronome.updateBPM(132.0);
    REQUIRE(f.metronome.getBpm() == Approx(132.0));

    // Range set the wrong way round still clamps
    Config::getInstance().setMinBpm(150.0);
    Config::getInstance().setMaxBpm(60.0);
    f.metronome.updateBPM(300.0);
    REQUIRE(f.metronome.getBpm() == Approx(150.0));
}

TEST_CASE("MetronomeEngine - time signature change while running", "[metronome]") {
    MetronomeFixture f;
    f.metronome.start(120.0, TimeSignature::fourFour());
    f.metronome.updateTimeSignature(TimeSignature::threeFour());

    REQUIRE(f.metronome.isEnabled());
    REQUIRE(f.metronome.getBpm() == Approx(120.0));
    REQUIRE(f.metronome.getTimeSignature() == TimeSignature::threeFour());

    f.metronome.poll();
    for (int i = 0; i < 3; ++i)
        f.advanceAndPoll(0.5);
    REQUIRE(f.listener.beats == std::vector<int>{0, 1, 2, 0});
}

TEST_CASE("MetronomeEngine - clicks record their gain", "[metronome]") {
    MetronomeFixture f;
    f.metronome.updateVolume(0.5f);

    f.metronome.testClick();
    REQUIRE(f.metronome.getAudioScheduler().getLastTickGain() == Approx(0.65f));

    f.metronome.start(120.0, TimeSignature::fourFour());
    f.metronome.poll();
    f.advanceAndPoll(0.5);
    REQUIRE(f.metronome.getAudioScheduler().getLastTickGain() == Approx(0.5f));
}
