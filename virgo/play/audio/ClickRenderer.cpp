#include "ClickRenderer.hpp"

#include <cmath>

namespace virgo {

juce::AudioBuffer<float> ClickRenderer::synthesiseClick(double sampleRate, bool accent) {
    int length = juce::jmax(1, static_cast<int>(sampleRate * kClickLengthSeconds));
    juce::AudioBuffer<float> buffer(1, length);

    const double frequency = accent ? kAccentFrequencyHz : kClickFrequencyHz;
    const double decaySeconds = kClickLengthSeconds / 5.0;
    auto* data = buffer.getWritePointer(0);

    for (int i = 0; i < length; ++i) {
        double t = i / sampleRate;
        double envelope = std::exp(-t / decaySeconds);
        data[i] = static_cast<float>(
            envelope * std::sin(juce::MathConstants<double>::twoPi * frequency * t));
    }
    return buffer;
}

// =============================================================================
// Click sounds
// =============================================================================

void ClickRenderer::setClickSample(const juce::AudioBuffer<float>& sample) {
    juce::AudioBuffer<float> mono(1, juce::jmax(1, sample.getNumSamples()));
    mono.clear();
    const int channels = sample.getNumChannels();
    for (int ch = 0; ch < channels; ++ch)
        mono.addFrom(0, 0, sample, ch, 0, sample.getNumSamples(), 1.0f / channels);

    const juce::SpinLock::ScopedLockType lock(samplesLock_);
    loadedSample_ = std::move(mono);
    hasLoadedSample_ = true;
    rebuildClickBuffers();
}

void ClickRenderer::useSynthesisedClick() {
    const juce::SpinLock::ScopedLockType lock(samplesLock_);
    loadedSample_.setSize(0, 0);
    hasLoadedSample_ = false;
    rebuildClickBuffers();
}

bool ClickRenderer::isUsingSynthesisedClick() const {
    const juce::SpinLock::ScopedLockType lock(samplesLock_);
    return !hasLoadedSample_;
}

void ClickRenderer::rebuildClickBuffers() {
    sampleGeneration_.fetch_add(1, std::memory_order_acq_rel);
    double sampleRate = getSampleRate();
    if (hasLoadedSample_) {
        normalClick_.makeCopyOf(loadedSample_);
        accentClick_.makeCopyOf(loadedSample_);
    } else if (sampleRate > 0.0) {
        normalClick_ = synthesiseClick(sampleRate, false);
        accentClick_ = synthesiseClick(sampleRate, true);
    }
}

// =============================================================================
// Producer side
// =============================================================================

bool ClickRenderer::schedule(float gain, bool accent, juce::int64 samplePosition) {
    if (!queue_.push({gain, accent, samplePosition})) {
        droppedClicks_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

// =============================================================================
// Audio thread
// =============================================================================

void ClickRenderer::prepare(double sampleRate, int maximumBlockSize) {
    juce::ignoreUnused(maximumBlockSize);

    sampleRate_.store(sampleRate, std::memory_order_release);
    samplePosition_.store(0, std::memory_order_release);
    for (auto& voice : voices_)
        voice.active = false;
    queue_.clear();

    {
        const juce::SpinLock::ScopedLockType lock(samplesLock_);
        rebuildClickBuffers();
    }
    {
        const juce::SpinLock::ScopedLockType lock(anchorLock_);
        anchorSample_ = -1;
    }
}

void ClickRenderer::release() {
    sampleRate_.store(0.0, std::memory_order_release);
    for (auto& voice : voices_)
        voice.active = false;
    queue_.clear();

    const juce::SpinLock::ScopedLockType lock(anchorLock_);
    anchorSample_ = -1;
}

void ClickRenderer::startVoice(const ScheduledClick& click, juce::int64 blockStart) {
    Voice* target = nullptr;
    for (auto& voice : voices_) {
        if (!voice.active) {
            target = &voice;
            break;
        }
    }

    // All busy: steal the voice that has played longest
    if (target == nullptr) {
        target = &voices_[0];
        for (auto& voice : voices_) {
            if (voice.readPosition > target->readPosition)
                target = &voice;
        }
    }

    target->active = true;
    target->accent = click.accent;
    target->gain = click.gain;
    target->startSample = click.samplePosition < blockStart ? blockStart : click.samplePosition;
    target->readPosition = 0;
    target->generation = sampleGeneration_.load(std::memory_order_acquire);
}

void ClickRenderer::render(float* const* outputs, int numChannels, int numSamples,
                           double hostSeconds) {
    const juce::int64 blockStart = samplePosition_.load(std::memory_order_relaxed);

    {
        const juce::SpinLock::ScopedTryLockType lock(anchorLock_);
        if (lock.isLocked()) {
            anchorSample_ = blockStart;
            anchorHostSeconds_ = hostSeconds;
        }
    }

    for (int ch = 0; ch < numChannels; ++ch) {
        if (outputs[ch] != nullptr)
            juce::FloatVectorOperations::clear(outputs[ch], numSamples);
    }

    ScheduledClick click;
    while (queue_.pop(click))
        startVoice(click, blockStart);

    const juce::SpinLock::ScopedTryLockType samplesLock(samplesLock_);
    if (samplesLock.isLocked()) {
        const auto generation = sampleGeneration_.load(std::memory_order_acquire);
        for (auto& voice : voices_) {
            if (!voice.active)
                continue;

            // Voices started on a replaced sound are cut, never read into the new buffer
            const auto& source = voice.accent ? accentClick_ : normalClick_;
            const int length = source.getNumSamples();
            if (voice.generation != generation || length == 0 || source.getNumChannels() == 0 ||
                voice.readPosition >= length) {
                voice.active = false;
                continue;
            }

            juce::int64 offset64 = voice.startSample - blockStart;
            if (offset64 >= numSamples)
                continue;  // Starts in a later block

            int offset = static_cast<int>(juce::jmax<juce::int64>(0, offset64));
            int count = juce::jmin(numSamples - offset, length - voice.readPosition);
            const float* src = source.getReadPointer(0, voice.readPosition);

            for (int ch = 0; ch < numChannels; ++ch) {
                if (outputs[ch] != nullptr)
                    juce::FloatVectorOperations::addWithMultiply(outputs[ch] + offset, src,
                                                                 voice.gain, count);
            }

            voice.readPosition += count;
            if (voice.readPosition >= length) {
                voice.active = false;
                renderedClicks_.fetch_add(1, std::memory_order_relaxed);
            }
        }
    }

    samplePosition_.store(blockStart + numSamples, std::memory_order_release);
}

// =============================================================================
// Clock mapping
// =============================================================================

std::optional<juce::int64> ClickRenderer::samplePositionForTime(double seconds) const {
    double sampleRate = getSampleRate();
    if (sampleRate <= 0.0 || !std::isfinite(seconds))
        return std::nullopt;

    const juce::SpinLock::ScopedLockType lock(anchorLock_);
    if (anchorSample_ < 0)
        return std::nullopt;

    auto offset = static_cast<juce::int64>(std::llround((seconds - anchorHostSeconds_) * sampleRate));
    return anchorSample_ + offset;
}

}  // namespace virgo
