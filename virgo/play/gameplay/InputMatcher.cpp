#include "InputMatcher.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "../core/MeasureUtils.hpp"

namespace virgo {

double getToleranceMs(TimingAccuracy accuracy) {
    switch (accuracy) {
        case TimingAccuracy::Perfect:
            return 25.0;
        case TimingAccuracy::Great:
            return 50.0;
        case TimingAccuracy::Good:
            return 100.0;
        case TimingAccuracy::Miss:
            return std::numeric_limits<double>::infinity();
    }
    return std::numeric_limits<double>::infinity();
}

double getScoreMultiplier(TimingAccuracy accuracy) {
    switch (accuracy) {
        case TimingAccuracy::Perfect:
            return 1.0;
        case TimingAccuracy::Great:
            return 0.8;
        case TimingAccuracy::Good:
            return 0.5;
        case TimingAccuracy::Miss:
            return 0.0;
    }
    return 0.0;
}

const char* getTimingAccuracyName(TimingAccuracy accuracy) {
    switch (accuracy) {
        case TimingAccuracy::Perfect:
            return "Perfect";
        case TimingAccuracy::Great:
            return "Great";
        case TimingAccuracy::Good:
            return "Good";
        case TimingAccuracy::Miss:
            return "Miss";
    }
    return "Unknown";
}

InputMatcher::InputMatcher(std::shared_ptr<TimeSource> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemTimeSource>()),
      keyboardMapping_(InputSettings::defaultKeyboardMapping()),
      midiMapping_(InputSettings::defaultMidiMapping()) {}

InputMatcher::~InputMatcher() {
    closeMidiInputs();
}

// =============================================================================
// Configuration
// =============================================================================

bool InputMatcher::configure(double bpm, const TimeSignature& requestedSignature,
                             const std::vector<Note>& notes) {
    const TimeSignature timeSignature(requestedSignature.beatsPerMeasure,
                                      requestedSignature.noteValue);

    if (!std::isfinite(bpm) || bpm <= 0.0) {
        DBG("InputMatcher: rejecting bpm " << bpm << ", keeping previous configuration");
        return false;
    }

    std::vector<Note> sorted(notes);
    std::stable_sort(sorted.begin(), sorted.end(), [](const Note& a, const Note& b) {
        if (a.measureNumber != b.measureNumber)
            return a.measureNumber < b.measureNumber;
        return a.measureOffset < b.measureOffset;
    });

    const double secondsPerMeasure = MeasureUtils::secondsPerMeasure(bpm, timeSignature);

    std::vector<ExpectedNote> expected;
    expected.reserve(sorted.size());
    for (size_t i = 0; i < sorted.size(); ++i) {
        const auto& note = sorted[i];
        double time = MeasureUtils::toZeroBasedIndex(note.measureNumber) * secondsPerMeasure +
                      note.measureOffset * secondsPerMeasure;
        expected.push_back({time, drumTypeFromNoteType(note.noteType), i});
    }
    std::stable_sort(expected.begin(), expected.end(),
                     [](const ExpectedNote& a, const ExpectedNote& b) { return a.time < b.time; });

    const juce::ScopedLock sl(lock_);
    bpm_ = bpm;
    timeSignature_ = timeSignature;
    secondsPerMeasure_ = secondsPerMeasure;
    notes_ = std::move(sorted);
    expected_ = std::move(expected);
    return true;
}

void InputMatcher::setKeyboardMapping(const KeyboardMapping& mapping) {
    const juce::ScopedLock sl(lock_);
    keyboardMapping_ = mapping;
}

void InputMatcher::setMIDIMapping(const MidiMapping& mapping) {
    const juce::ScopedLock sl(lock_);
    midiMapping_ = mapping;
}

KeyboardMapping InputMatcher::getKeyboardMapping() const {
    const juce::ScopedLock sl(lock_);
    return keyboardMapping_;
}

MidiMapping InputMatcher::getMIDIMapping() const {
    const juce::ScopedLock sl(lock_);
    return midiMapping_;
}

void InputMatcher::applySettings(const InputSettings& settings) {
    const juce::ScopedLock sl(lock_);
    keyboardMapping_ = settings.getKeyboardMapping();
    midiMapping_ = settings.getMidiMapping();
}

void InputMatcher::startListening(double songStartSeconds) {
    const juce::ScopedLock sl(lock_);
    songStartSeconds_ = songStartSeconds;
    listening_.store(true, std::memory_order_release);
}

void InputMatcher::stopListening() {
    const juce::ScopedLock sl(lock_);
    listening_.store(false, std::memory_order_release);
}

size_t InputMatcher::getNoteCount() const {
    const juce::ScopedLock sl(lock_);
    return notes_.size();
}

// =============================================================================
// Input processing
// =============================================================================

double InputMatcher::clampVelocity(double velocity) {
    if (std::isnan(velocity))
        return kMaxVelocity;
    return juce::jlimit(kMinVelocity, kMaxVelocity, velocity);
}

double InputMatcher::expectedTimeFor(int measureNumber, double measureOffset) const {
    const juce::ScopedLock sl(lock_);
    return MeasureUtils::toZeroBasedIndex(measureNumber) * secondsPerMeasure_ +
           measureOffset * secondsPerMeasure_;
}

std::optional<NoteMatchResult> InputMatcher::processKey(const std::string& key, double pressure,
                                                        double nowSeconds) {
    std::optional<DrumType> drum;
    {
        const juce::ScopedLock sl(lock_);
        auto it = keyboardMapping_.find(key);
        if (it != keyboardMapping_.end())
            drum = it->second;
    }
    if (!drum)
        return std::nullopt;
    return processHit(*drum, pressure, nowSeconds);
}

std::optional<NoteMatchResult> InputMatcher::processMidiMessage(const juce::MidiMessage& message,
                                                                double nowSeconds) {
    // Note-on with velocity 0 is a note-off
    if (!message.isNoteOn(false))
        return std::nullopt;

    std::optional<DrumType> drum;
    {
        const juce::ScopedLock sl(lock_);
        auto it = midiMapping_.find(static_cast<std::uint8_t>(message.getNoteNumber()));
        if (it != midiMapping_.end())
            drum = it->second;
    }
    if (!drum)
        return std::nullopt;
    return processHit(*drum, message.getVelocity() / 127.0, nowSeconds);
}

std::optional<NoteMatchResult> InputMatcher::processHit(DrumType drum, double velocity,
                                                        double nowSeconds) {
    const juce::ScopedLock sl(lock_);
    if (!isListening())
        return std::nullopt;

    InputHit hit{drum, clampVelocity(velocity), nowSeconds};
    auto result = gradeHit(hit, nowSeconds - songStartSeconds_);

    if (!results_.push(result))
        DBG("InputMatcher: result queue full, dropping result");

    for (auto* listener : listeners_) {
        listener->inputHitReceived(hit);
        listener->noteMatched(result);
    }
    return result;
}

NoteMatchResult InputMatcher::gradeHit(const InputHit& hit, double elapsed) const {
    NoteMatchResult result;
    result.hit = hit;

    // Where the hit landed in the chart
    const double secondsPerBeat = MeasureUtils::secondsPerBeat(bpm_);
    const double beatsPerMeasure = timeSignature_.beatsPerMeasure;
    // Hits before the song start are placed at its first beat
    double totalBeats = juce::jmax(0.0, elapsed) / secondsPerBeat;
    result.measureNumber = static_cast<int>(std::floor(totalBeats / beatsPerMeasure)) + 1;
    result.measureOffset = std::fmod(totalBeats, beatsPerMeasure) / beatsPerMeasure;

    // Closest note of the same drum inside the search window
    const double window = kSearchWindowMs / 1000.0;
    auto first = std::lower_bound(
        expected_.begin(), expected_.end(), elapsed - window,
        [](const ExpectedNote& note, double time) { return note.time < time; });

    const ExpectedNote* best = nullptr;
    double bestDistance = std::numeric_limits<double>::infinity();
    for (auto it = first; it != expected_.end() && it->time <= elapsed + window; ++it) {
        if (it->drum != hit.drumType)
            continue;
        double distance = std::abs(elapsed - it->time);
        if (distance < bestDistance) {
            bestDistance = distance;
            best = &*it;
        }
    }

    if (best == nullptr)
        return result;

    result.matchedNote = notes_[best->noteIndex];
    result.timingErrorMs = (elapsed - best->time) * 1000.0;

    double absError = std::abs(result.timingErrorMs);
    if (absError <= getToleranceMs(TimingAccuracy::Perfect))
        result.accuracy = TimingAccuracy::Perfect;
    else if (absError <= getToleranceMs(TimingAccuracy::Great))
        result.accuracy = TimingAccuracy::Great;
    else if (absError <= getToleranceMs(TimingAccuracy::Good))
        result.accuracy = TimingAccuracy::Good;
    else
        result.accuracy = TimingAccuracy::Miss;

    return result;
}

// =============================================================================
// MIDI devices
// =============================================================================

int InputMatcher::openAllMidiInputs() {
    closeMidiInputs();

    for (const auto& device : juce::MidiInput::getAvailableDevices()) {
        auto input = juce::MidiInput::openDevice(device.identifier, this);
        if (input == nullptr) {
            DBG("InputMatcher: failed to open MIDI input " << device.name);
            continue;
        }
        input->start();
        DBG("InputMatcher: listening to MIDI input " << device.name);
        midiInputs_.push_back(std::move(input));
    }
    return static_cast<int>(midiInputs_.size());
}

void InputMatcher::closeMidiInputs() {
    for (auto& input : midiInputs_)
        input->stop();
    midiInputs_.clear();
}

void InputMatcher::handleIncomingMidiMessage(juce::MidiInput* source,
                                             const juce::MidiMessage& message) {
    juce::ignoreUnused(source);
    processMidiMessage(message, clock_->nowSeconds());
}

// =============================================================================
// Results
// =============================================================================

void InputMatcher::addListener(InputMatcherListener* listener) {
    const juce::ScopedLock sl(lock_);
    if (listener && std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end())
        listeners_.push_back(listener);
}

void InputMatcher::removeListener(InputMatcherListener* listener) {
    const juce::ScopedLock sl(lock_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener), listeners_.end());
}

bool InputMatcher::popResult(NoteMatchResult& result) {
    return results_.pop(result);
}

}  // namespace virgo
