#include <juce_core/juce_core.h>

#include <atomic>
#include <thread>
#include <vector>

#include "../virgo/play/engine/MetronomeEngine.hpp"
#include "../virgo/play/engine/TimingEngine.hpp"

using namespace virgo;

/**
 * @brief Timing driver thread tests
 *
 * Runs the TimingEngine and MetronomeEngine on the system clock with a real
 * HighResolutionTimer driver, with audio output disabled. Checks what holds
 * regardless of scheduling jitter: beats arrive without anyone polling, reads
 * from other threads stay in range and the driver always stops.
 */
class TimingEngineThreadsTest final : public juce::UnitTest {
  public:
    TimingEngineThreadsTest() : juce::UnitTest("TimingEngine Driver Thread Tests", "virgo") {}

    void runTest() override {
        testDriverDeliversBeats();
        testConcurrentReadersStayInRange();
        testRapidStartStop();
        testTempoChangeWhileRunning();
        testMetronomeWithoutAudio();
    }

  private:
    static constexpr int kPollIntervalMs = 1;

    void testDriverDeliversBeats() {
        beginTest("Driver thread delivers beats");

        TimingEngine engine(nullptr, kPollIntervalMs);
        std::atomic<int> beats{0};
        std::atomic<bool> outOfRange{false};
        engine.setBeatCallback([&](int beatIndex, bool isAccented, double) {
            if (beatIndex < 0 || beatIndex >= 4 || isAccented != (beatIndex == 0))
                outOfRange = true;
            ++beats;
        });

        // 10 beats per second
        engine.configure(600.0, TimeSignature::fourFour());
        engine.start();
        expect(engine.isDriverRunning(), "Driver should run while playing");

        juce::Thread::sleep(550);
        engine.stop();

        expect(beats.load() >= 3, "Expected several beats, got " + juce::String(beats.load()));
        expect(!outOfRange.load(), "Beat callback received an invalid beat");
        expect(!engine.isDriverRunning(), "Driver should stop with the engine");
        expectEquals(engine.getCurrentBeat(), 0);
    }

    void testConcurrentReadersStayInRange() {
        beginTest("Concurrent readers see beats in range");

        TimingEngine engine(nullptr, kPollIntervalMs);
        engine.configure(1200.0, TimeSignature(7, 8));
        engine.start();

        std::atomic<bool> running{true};
        std::atomic<int> badReads{0};
        std::vector<std::thread> readers;
        for (int i = 0; i < 4; ++i) {
            readers.emplace_back([&] {
                while (running.load()) {
                    int beat = engine.getCurrentBeat();
                    if (beat < 0 || beat >= 7)
                        ++badReads;
                    if (auto progress = engine.getCurrentBeatProgress()) {
                        if (progress->beatIndex < 0 || progress->beatIndex >= 7)
                            ++badReads;
                    }
                }
            });
        }

        juce::Thread::sleep(300);
        engine.stop();
        juce::Thread::sleep(20);
        running = false;
        for (auto& reader : readers)
            reader.join();

        expectEquals(badReads.load(), 0);
        expectEquals(engine.getCurrentBeat(), 0);
    }

    void testRapidStartStop() {
        beginTest("Rapid start/stop leaves the engine stopped");

        TimingEngine engine(nullptr, kPollIntervalMs);
        engine.configure(240.0, TimeSignature::fourFour());

        for (int i = 0; i < 100; ++i) {
            engine.start();
            if (i % 3 == 0)
                juce::Thread::sleep(1);
            engine.stop();
        }

        expect(!engine.isPlaying(), "Engine should be stopped");
        expect(!engine.isDriverRunning(), "No driver thread should be left running");
        expectEquals(engine.getCurrentBeat(), 0);
        expect(!engine.getCurrentPlaybackTime().has_value(), "No playback time when stopped");
    }

    void testTempoChangeWhileRunning() {
        beginTest("Tempo change while running keeps the count moving forward");

        TimingEngine engine(nullptr, kPollIntervalMs);
        engine.configure(300.0, TimeSignature::fourFour());
        engine.start();
        juce::Thread::sleep(100);

        auto before = engine.getCurrentBeatProgress();
        engine.configure(900.0, TimeSignature::fourFour());
        auto after = engine.getCurrentBeatProgress();

        expect(before.has_value() && after.has_value(), "Progress should be available");
        if (before && after)
            expect(after->totalBeats >= before->totalBeats, "Beat count went backwards");
        expect(engine.isPlaying(), "configure must not stop the engine");

        engine.stop();
    }

    class CountingListener : public MetronomeListener {
      public:
        void metronomeBeat(int, bool, double) override {
            ++beats;
        }

        void metronomeStateChanged(bool isEnabled) override {
            if (isEnabled)
                ++starts;
            else
                ++stops;
        }

        std::atomic<int> beats{0};
        std::atomic<int> starts{0};
        std::atomic<int> stops{0};
    };

    void testMetronomeWithoutAudio() {
        beginTest("Metronome ticks without an audio device");

        MetronomeEngine metronome(nullptr, kPollIntervalMs, false);
        CountingListener listener;
        metronome.addListener(&listener);

        metronome.start(600.0, TimeSignature::threeFour());
        expect(metronome.isTimingDriverRunning(), "Driver should run");
        expect(!metronome.getAudioScheduler().isSessionActive(), "No audio session expected");

        juce::Thread::sleep(450);
        metronome.removeListener(&listener);
        int beatsAtRemoval = listener.beats.load();

        juce::Thread::sleep(200);
        metronome.stop();

        expect(beatsAtRemoval >= 2, "Expected beats, got " + juce::String(beatsAtRemoval));
        expectEquals(listener.beats.load(), beatsAtRemoval);
        expectEquals(listener.starts.load(), 1);
        expectEquals(listener.stops.load(), 0);
        expect(!metronome.isTimingDriverRunning(), "Driver should stop with the metronome");
    }
};

static TimingEngineThreadsTest timingEngineThreadsTest;
