#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../virgo/play/audio/AudioScheduler.hpp"
#include "../virgo/play/core/Config.hpp"
#include "TestEnvironment.hpp"

#include <cmath>
#include <limits>

using namespace virgo;
using Catch::Approx;
using virgo::test::ManualTimeSource;
using virgo::test::ScopedTempDirectory;

// ============================================================================
// Gain
// ============================================================================

TEST_CASE("AudioScheduler - tick gain", "[audio_scheduler]") {
    REQUIRE(AudioScheduler::computeTickGain(0.5f, false) == Approx(0.5f));
    REQUIRE(AudioScheduler::computeTickGain(0.5f, true) == Approx(0.65f));
    REQUIRE(AudioScheduler::computeTickGain(0.9f, true) == Approx(1.0f));
    REQUIRE(AudioScheduler::computeTickGain(0.0f, true) == 0.0f);
}

TEST_CASE("AudioScheduler - invalid volumes are sanitised", "[audio_scheduler]") {
    REQUIRE(AudioScheduler::computeTickGain(std::numeric_limits<float>::quiet_NaN(), true) == 0.0f);
    REQUIRE(AudioScheduler::computeTickGain(std::numeric_limits<float>::infinity(), false) == 0.0f);
    REQUIRE(AudioScheduler::computeTickGain(-std::numeric_limits<float>::infinity(), false) ==
            0.0f);
    REQUIRE(AudioScheduler::computeTickGain(-0.5f, false) == 0.0f);
    REQUIRE(AudioScheduler::computeTickGain(3.0f, false) == 1.0f);
}

// ============================================================================
// Without an audio session
// ============================================================================

TEST_CASE("AudioScheduler - disabled output never opens a device", "[audio_scheduler]") {
    auto clock = std::make_shared<ManualTimeSource>();
    AudioScheduler scheduler(clock, false);

    REQUIRE_FALSE(scheduler.resume());
    REQUIRE_FALSE(scheduler.isSessionActive());
    REQUIRE_FALSE(scheduler.convertToAudioEngineTime(clock->nowSeconds()).has_value());

    scheduler.stop();
    scheduler.stop();
    REQUIRE_FALSE(scheduler.isSessionActive());
}

TEST_CASE("AudioScheduler - ticks without a session are skipped quietly", "[audio_scheduler]") {
    AudioScheduler scheduler(std::make_shared<ManualTimeSource>(), false);

    scheduler.playTick(0.6f, false);
    REQUIRE(scheduler.getLastTickGain() == Approx(0.6f));

    scheduler.playTick(std::numeric_limits<float>::quiet_NaN(), true,
                       HardwareTimestamp{1000, 48000.0});
    REQUIRE(scheduler.getLastTickGain() == 0.0f);
    REQUIRE(scheduler.getDroppedClickCount() == 0);
}

TEST_CASE("AudioScheduler - lookahead comes from Config", "[audio_scheduler]") {
    Config::getInstance().setAudioLookaheadMs(35);
    AudioScheduler scheduler(std::make_shared<ManualTimeSource>(), false);
    REQUIRE(scheduler.getLookaheadSeconds() == Approx(0.035));
}

TEST_CASE("AudioScheduler - output flag defaults to Config", "[audio_scheduler]") {
    // The test environment disables audio output
    AudioScheduler scheduler(std::make_shared<ManualTimeSource>());
    REQUIRE_FALSE(scheduler.resume());
}

// ============================================================================
// Click samples
// ============================================================================

TEST_CASE("AudioScheduler - missing click sample fails", "[audio_scheduler]") {
    ScopedTempDirectory dir;
    AudioScheduler scheduler(std::make_shared<ManualTimeSource>(), false);

    auto result = scheduler.loadClickSample(dir.file("missing.wav"));
    REQUIRE(result.failed());
    REQUIRE(result.getErrorMessage().contains("not found"));
}

TEST_CASE("AudioScheduler - unreadable click sample fails", "[audio_scheduler]") {
    ScopedTempDirectory dir;
    auto file = dir.file("garbage.wav");
    REQUIRE(file.replaceWithText("this is not audio"));

    AudioScheduler scheduler(std::make_shared<ManualTimeSource>(), false);
    REQUIRE(scheduler.loadClickSample(file).failed());
}

TEST_CASE("AudioScheduler - loads a wav click sample", "[audio_scheduler]") {
    ScopedTempDirectory dir;
    auto file = dir.file("click.wav");

    juce::AudioBuffer<float> buffer(2, 256);
    for (int i = 0; i < 256; ++i) {
        buffer.setSample(0, i, 0.5f);
        buffer.setSample(1, i, -0.25f);
    }

    {
        juce::WavAudioFormat wavFormat;
        JUCE_BEGIN_IGNORE_WARNINGS_MSVC(4996)
        JUCE_BEGIN_IGNORE_WARNINGS_GCC_LIKE("-Wdeprecated-declarations")
        std::unique_ptr<juce::AudioFormatWriter> writer(
            wavFormat.createWriterFor(new juce::FileOutputStream(file), 44100.0, 2, 16, {}, 0));
        JUCE_END_IGNORE_WARNINGS_GCC_LIKE
        JUCE_END_IGNORE_WARNINGS_MSVC
        REQUIRE(writer != nullptr);
        REQUIRE(writer->writeFromAudioSampleBuffer(buffer, 0, 256));
    }

    AudioScheduler scheduler(std::make_shared<ManualTimeSource>(), false);
    auto result = scheduler.loadClickSample(file);
    REQUIRE(result.wasOk());
}

TEST_CASE("AudioScheduler - configured click sample is loaded on construction",
          "[audio_scheduler]") {
    ScopedTempDirectory dir;
    auto missing = dir.file("nothing_here.wav");
    Config::getInstance().setClickSamplePath(missing.getFullPathName().toStdString());

    // Falls back to the synthesised click without throwing
    AudioScheduler scheduler(std::make_shared<ManualTimeSource>(), false);
    scheduler.playTick(0.5f, false);
    REQUIRE(scheduler.getLastTickGain() == Approx(0.5f));
}
