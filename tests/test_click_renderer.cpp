#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../virgo/play/audio/ClickRenderer.hpp"

#include <cmath>

using namespace virgo;
using Catch::Approx;

namespace {

constexpr double kSampleRate = 48000.0;
constexpr int kBlockSize = 512;

// Renders one block into a stereo buffer
void renderBlock(ClickRenderer& renderer, juce::AudioBuffer<float>& buffer, double hostSeconds) {
    renderer.render(buffer.getArrayOfWritePointers(), buffer.getNumChannels(),
                    buffer.getNumSamples(), hostSeconds);
}

}  // namespace

// ============================================================================
// Synthesised clicks
// ============================================================================

TEST_CASE("ClickRenderer - synthesised clicks", "[click_renderer]") {
    auto normal = ClickRenderer::synthesiseClick(kSampleRate, false);
    auto accent = ClickRenderer::synthesiseClick(kSampleRate, true);

    REQUIRE(normal.getNumChannels() == 1);
    REQUIRE(normal.getNumSamples() ==
            static_cast<int>(kSampleRate * ClickRenderer::kClickLengthSeconds));
    REQUIRE(normal.getMagnitude(0, normal.getNumSamples()) > 0.1f);
    REQUIRE(normal.getMagnitude(0, normal.getNumSamples()) <= 1.0f);

    // Same envelope, different pitch
    bool differs = false;
    for (int i = 0; i < normal.getNumSamples() && !differs; ++i)
        differs = normal.getSample(0, i) != accent.getSample(0, i);
    REQUIRE(differs);
}

TEST_CASE("ClickRenderer - starts with the synthesised click", "[click_renderer]") {
    ClickRenderer renderer;
    REQUIRE(renderer.isUsingSynthesisedClick());
    REQUIRE(renderer.getSampleRate() == 0.0);
}

// ============================================================================
// Rendering
// ============================================================================

TEST_CASE("ClickRenderer - silent without clicks", "[click_renderer]") {
    ClickRenderer renderer;
    renderer.prepare(kSampleRate, kBlockSize);

    juce::AudioBuffer<float> buffer(2, kBlockSize);
    for (int ch = 0; ch < 2; ++ch)
        juce::FloatVectorOperations::fill(buffer.getWritePointer(ch), 0.7f, kBlockSize);

    renderBlock(renderer, buffer, 10.0);
    REQUIRE(buffer.getMagnitude(0, kBlockSize) == 0.0f);
    REQUIRE(renderer.getSamplePosition() == kBlockSize);
}

TEST_CASE("ClickRenderer - click starts at its sample offset", "[click_renderer]") {
    ClickRenderer renderer;
    renderer.prepare(kSampleRate, kBlockSize);
    REQUIRE(renderer.schedule(0.5f, false, 100));

    juce::AudioBuffer<float> buffer(2, kBlockSize);
    renderBlock(renderer, buffer, 10.0);

    REQUIRE(buffer.getMagnitude(0, 0, 100) == 0.0f);
    REQUIRE(buffer.getMagnitude(0, 100, kBlockSize - 100) > 0.0f);

    // Both channels carry the click
    for (int i = 100; i < kBlockSize; ++i)
        REQUIRE(buffer.getSample(0, i) == buffer.getSample(1, i));
}

TEST_CASE("ClickRenderer - click in a later block waits", "[click_renderer]") {
    ClickRenderer renderer;
    renderer.prepare(kSampleRate, kBlockSize);
    renderer.schedule(1.0f, true, kBlockSize + 10);

    juce::AudioBuffer<float> buffer(2, kBlockSize);
    renderBlock(renderer, buffer, 10.0);
    REQUIRE(buffer.getMagnitude(0, kBlockSize) == 0.0f);

    renderBlock(renderer, buffer, 10.0 + kBlockSize / kSampleRate);
    REQUIRE(buffer.getMagnitude(0, 0, 10) == 0.0f);
    REQUIRE(buffer.getMagnitude(0, 10, kBlockSize - 10) > 0.0f);
}

TEST_CASE("ClickRenderer - late and unscheduled clicks play immediately", "[click_renderer]") {
    ClickRenderer renderer;
    renderer.prepare(kSampleRate, kBlockSize);

    juce::AudioBuffer<float> buffer(2, kBlockSize);
    renderBlock(renderer, buffer, 10.0);

    renderer.schedule(1.0f, false, -1);
    renderBlock(renderer, buffer, 10.0 + kBlockSize / kSampleRate);
    REQUIRE(buffer.getMagnitude(0, kBlockSize) > 0.0f);
}

TEST_CASE("ClickRenderer - a finished click is counted", "[click_renderer]") {
    ClickRenderer renderer;
    renderer.prepare(kSampleRate, kBlockSize);
    renderer.schedule(1.0f, false, 0);

    juce::AudioBuffer<float> buffer(2, kBlockSize);
    const int clickLength = static_cast<int>(kSampleRate * ClickRenderer::kClickLengthSeconds);
    const int blocks = clickLength / kBlockSize + 1;

    for (int i = 0; i < blocks - 1; ++i)
        renderBlock(renderer, buffer, 10.0);
    REQUIRE(renderer.getRenderedClickCount() == 0);

    renderBlock(renderer, buffer, 10.0);
    REQUIRE(renderer.getRenderedClickCount() == 1);
}

TEST_CASE("ClickRenderer - loaded sample is mixed to mono", "[click_renderer]") {
    ClickRenderer renderer;

    juce::AudioBuffer<float> sample(2, 10);
    juce::FloatVectorOperations::fill(sample.getWritePointer(0), 1.0f, 10);
    sample.clear(1, 0, 10);
    renderer.setClickSample(sample);
    REQUIRE_FALSE(renderer.isUsingSynthesisedClick());

    renderer.prepare(kSampleRate, kBlockSize);
    renderer.schedule(1.0f, false, 0);

    juce::AudioBuffer<float> buffer(2, kBlockSize);
    renderBlock(renderer, buffer, 10.0);
    REQUIRE(buffer.getSample(0, 0) == Approx(0.5f));
    REQUIRE(buffer.getSample(1, 9) == Approx(0.5f));
    REQUIRE(buffer.getSample(0, 10) == 0.0f);

    renderer.useSynthesisedClick();
    REQUIRE(renderer.isUsingSynthesisedClick());
}

TEST_CASE("ClickRenderer - swapping the sample mid-click cuts the old voice", "[click_renderer]") {
    ClickRenderer renderer;
    renderer.prepare(kSampleRate, kBlockSize);
    renderer.schedule(1.0f, false, 0);

    // Half of the 1440-sample synthesised click
    juce::AudioBuffer<float> buffer(2, 1024);
    renderBlock(renderer, buffer, 10.0);
    REQUIRE(buffer.getMagnitude(0, 0, 1024) > 0.0f);

    juce::AudioBuffer<float> shortSample(1, 16);
    juce::FloatVectorOperations::fill(shortSample.getWritePointer(0), 0.5f, 16);
    renderer.setClickSample(shortSample);

    renderBlock(renderer, buffer, 10.1);
    REQUIRE(buffer.getMagnitude(0, 0, 1024) == 0.0f);
    REQUIRE(buffer.getMagnitude(1, 0, 1024) == 0.0f);
    REQUIRE(renderer.getRenderedClickCount() == 0);

    // New clicks play the new sample from its start
    renderer.schedule(1.0f, false, 0);
    renderBlock(renderer, buffer, 10.2);
    REQUIRE(buffer.getSample(0, 0) == Approx(0.5f));
    REQUIRE(buffer.getSample(0, 15) == Approx(0.5f));
    REQUIRE(buffer.getSample(0, 16) == 0.0f);
    REQUIRE(renderer.getRenderedClickCount() == 1);
}

TEST_CASE("ClickRenderer - full queue drops clicks", "[click_renderer]") {
    ClickRenderer renderer;
    renderer.prepare(kSampleRate, kBlockSize);

    int accepted = 0;
    for (int i = 0; i < ClickRenderer::kClickQueueSize + 10; ++i) {
        if (renderer.schedule(0.5f, false, i))
            ++accepted;
    }

    REQUIRE(accepted == ClickRenderer::kClickQueueSize - 1);
    REQUIRE(renderer.getDroppedClickCount() == 11);
}

TEST_CASE("ClickRenderer - many overlapping clicks keep rendering", "[click_renderer]") {
    ClickRenderer renderer;
    renderer.prepare(kSampleRate, kBlockSize);
    for (int i = 0; i < ClickRenderer::kMaxVoices * 2; ++i)
        renderer.schedule(0.1f, false, i * 4);

    juce::AudioBuffer<float> buffer(2, kBlockSize);
    renderBlock(renderer, buffer, 10.0);
    REQUIRE(buffer.getMagnitude(0, kBlockSize) > 0.0f);
    REQUIRE(renderer.getSamplePosition() == kBlockSize);
}

// ============================================================================
// Clock mapping
// ============================================================================

TEST_CASE("ClickRenderer - no mapping before the first block", "[click_renderer]") {
    ClickRenderer renderer;
    REQUIRE_FALSE(renderer.samplePositionForTime(1.0).has_value());

    renderer.prepare(kSampleRate, kBlockSize);
    REQUIRE_FALSE(renderer.samplePositionForTime(1.0).has_value());
}

TEST_CASE("ClickRenderer - maps clock time onto samples", "[click_renderer]") {
    ClickRenderer renderer;
    renderer.prepare(kSampleRate, kBlockSize);

    juce::AudioBuffer<float> buffer(2, kBlockSize);
    renderBlock(renderer, buffer, 10.0);

    REQUIRE(*renderer.samplePositionForTime(10.0) == 0);
    REQUIRE(*renderer.samplePositionForTime(10.5) == 24000);

    // The anchor moves with every block
    renderBlock(renderer, buffer, 20.0);
    REQUIRE(*renderer.samplePositionForTime(20.0) == kBlockSize);
    REQUIRE(*renderer.samplePositionForTime(21.0) == kBlockSize + 48000);

    REQUIRE_FALSE(renderer.samplePositionForTime(std::nan("")).has_value());
}

TEST_CASE("ClickRenderer - release forgets the clock", "[click_renderer]") {
    ClickRenderer renderer;
    renderer.prepare(kSampleRate, kBlockSize);

    juce::AudioBuffer<float> buffer(2, kBlockSize);
    renderBlock(renderer, buffer, 10.0);
    renderer.release();

    REQUIRE(renderer.getSampleRate() == 0.0);
    REQUIRE_FALSE(renderer.samplePositionForTime(10.0).has_value());
}
