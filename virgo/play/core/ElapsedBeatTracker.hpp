#pragma once

namespace virgo {

/**
 * @brief Turns a wrapping beat-in-measure signal into a running beat count
 *
 * The metronome reports the local beat (0 .. beatsPerMeasure-1). Playback needs
 * a total that only grows. State is (lastLocalBeat, total):
 *
 * - first observation or a forward move: total = measureStart + local
 * - backward move (local < last): a measure boundary was crossed, so
 *   total = nextMeasureStart + local
 * - repeated value: nothing changes
 *
 * measureStart is total rounded down to a multiple of beatsPerMeasure.
 *
 * Not thread safe. Owned by PlaybackCoordinator and fed on its update thread.
 */
class ElapsedBeatTracker {
  public:
    explicit ElapsedBeatTracker(int beatsPerMeasure = 4);

    /** Change the measure length. Keeps the running total. */
    void setBeatsPerMeasure(int beatsPerMeasure);
    int getBeatsPerMeasure() const {
        return beatsPerMeasure_;
    }

    /**
     * @brief Feed one local beat observation
     * @return The running total after the observation
     */
    int observe(int localBeat);

    /** Continue counting from an absolute total, e.g. after a pause. */
    void seed(int totalBeats);

    /** Back to the state of a fresh tracker. */
    void reset();

    int getTotalBeats() const {
        return total_;
    }
    int getLastLocalBeat() const {
        return lastLocal_;
    }

  private:
    int beatsPerMeasure_;
    int lastLocal_ = -1;  // -1 = nothing observed yet
    int total_ = 0;
};

}  // namespace virgo
