#pragma once

#include <juce_audio_devices/juce_audio_devices.h>

#include <atomic>
#include <memory>
#include <optional>
#include <vector>

#include "../audio/LockFreeQueue.hpp"
#include "../core/ChartTypes.hpp"
#include "../core/InputSettings.hpp"
#include "../engine/TimeSource.hpp"

namespace virgo {

/**
 * @brief How close a hit landed to its note
 */
enum class TimingAccuracy { Perfect, Great, Good, Miss };

/** Largest |error| in ms still graded at this accuracy (infinity for Miss). */
double getToleranceMs(TimingAccuracy accuracy);

double getScoreMultiplier(TimingAccuracy accuracy);

const char* getTimingAccuracyName(TimingAccuracy accuracy);

/**
 * @brief One drum strike from the keyboard or a MIDI kit
 */
struct InputHit {
    DrumType drumType = DrumType::Snare;
    double velocity = 1.0;          // [0.1, 1]
    double timestampSeconds = 0.0;  // TimeSource seconds
};

/**
 * @brief Grading of one hit against the chart
 */
struct NoteMatchResult {
    InputHit hit;
    std::optional<Note> matchedNote;
    TimingAccuracy accuracy = TimingAccuracy::Miss;
    int measureNumber = 1;       // 1-based position of the hit
    double measureOffset = 0.0;  // [0, 1)
    double timingErrorMs = 0.0;  // positive = late, 0 when nothing matched
};

/**
 * @brief Receives hits and their grading
 *
 * Called on the thread that delivered the input (MIDI thread for MIDI devices).
 */
class InputMatcherListener {
  public:
    virtual ~InputMatcherListener() = default;

    virtual void inputHitReceived(const InputHit& hit) {
        juce::ignoreUnused(hit);
    }

    virtual void noteMatched(const NoteMatchResult& result) = 0;
};

/**
 * @brief Matches player input against the expected note times of a chart
 *
 * A hit is matched to the closest note of the same drum within
 * kSearchWindowMs and graded by its timing error. Hits are only processed
 * between startListening() and stopListening().
 *
 * All public methods are thread safe.
 */
class InputMatcher : private juce::MidiInputCallback {
  public:
    static constexpr double kSearchWindowMs = 200.0;
    static constexpr double kMinVelocity = 0.1;
    static constexpr double kMaxVelocity = 1.0;
    static constexpr int kResultQueueSize = 256;

    explicit InputMatcher(std::shared_ptr<TimeSource> clock = nullptr);
    ~InputMatcher() override;

    /**
     * @brief Set tempo and the notes to match against
     * @return false when bpm is not finite and positive; the previous setup is kept
     */
    bool configure(double bpm, const TimeSignature& timeSignature, const std::vector<Note>& notes);

    // Mappings (full replacement)
    void setKeyboardMapping(const KeyboardMapping& mapping);
    void setMIDIMapping(const MidiMapping& mapping);
    KeyboardMapping getKeyboardMapping() const;
    MidiMapping getMIDIMapping() const;

    /** Take both mappings from persisted settings. */
    void applySettings(const InputSettings& settings);

    /**
     * @brief Begin grading hits
     * @param songStartSeconds TimeSource time at which measure 1 begins
     */
    void startListening(double songStartSeconds);
    void stopListening();
    bool isListening() const {
        return listening_.load(std::memory_order_acquire);
    }

    // Input entry points. Each returns the grading, or nullopt when the input
    // maps to no drum or the matcher is not listening.
    std::optional<NoteMatchResult> processKey(const std::string& key, double pressure,
                                              double nowSeconds);
    std::optional<NoteMatchResult> processMidiMessage(const juce::MidiMessage& message,
                                                      double nowSeconds);
    std::optional<NoteMatchResult> processHit(DrumType drum, double velocity, double nowSeconds);

    /** Non-finite becomes 1.0, everything else is clamped to [0.1, 1.0]. */
    static double clampVelocity(double velocity);

    /** Seconds from song start to a notated position at the configured tempo. */
    double expectedTimeFor(int measureNumber, double measureOffset) const;

    // MIDI devices
    /** Open every available MIDI input. Returns the number opened. */
    int openAllMidiInputs();
    void closeMidiInputs();

    // Results
    void addListener(InputMatcherListener* listener);
    void removeListener(InputMatcherListener* listener);

    /** Pop the oldest unread result (single consumer). */
    bool popResult(NoteMatchResult& result);

    size_t getNoteCount() const;

  private:
    struct ExpectedNote {
        double time = 0.0;
        DrumType drum = DrumType::Snare;
        size_t noteIndex = 0;
    };

    void handleIncomingMidiMessage(juce::MidiInput* source,
                                   const juce::MidiMessage& message) override;

    NoteMatchResult gradeHit(const InputHit& hit, double elapsed) const;

    std::shared_ptr<TimeSource> clock_;

    juce::CriticalSection lock_;
    double bpm_ = 120.0;
    TimeSignature timeSignature_;
    double secondsPerMeasure_ = 2.0;
    std::vector<Note> notes_;                 // sorted by position
    std::vector<ExpectedNote> expected_;      // sorted by time
    KeyboardMapping keyboardMapping_;
    MidiMapping midiMapping_;
    double songStartSeconds_ = 0.0;
    std::vector<InputMatcherListener*> listeners_;

    std::atomic<bool> listening_{false};
    LockFreeQueue<NoteMatchResult, kResultQueueSize> results_;
    std::vector<std::unique_ptr<juce::MidiInput>> midiInputs_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(InputMatcher)
};

}  // namespace virgo
