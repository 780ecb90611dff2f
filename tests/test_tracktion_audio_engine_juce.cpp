#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include "cadence/daw/core/Config.hpp"
#include "cadence/daw/engine/JuceHostScheduler.hpp"
#include "cadence/daw/engine/PlaybackEngine.hpp"
#include "cadence/daw/engine/TracktionAudioEngine.hpp"

using namespace cadence;

/**
 * @brief Tests for the Tracktion-backed audio engine and the transport on top of it
 *
 * One TracktionAudioEngine is created for the whole test: Tracktion's global
 * singletons do not survive repeated engine creation within one process.
 */
class TracktionAudioEngineTest final : public juce::UnitTest {
  public:
    TracktionAudioEngineTest() : juce::UnitTest("TracktionAudioEngine Tests", "cadence") {}

    void runTest() override {
        Config::getInstance().resetToDefaults();

        TracktionAudioEngine engine;
        beginTest("Engine initializes with the default tempo");
        expect(engine.initialize(), "Engine should initialize");
        expect(engine.isInitialized());
        expectWithinAbsoluteError(engine.getTempo(), 140.0, 0.001);

        testTickConversion(engine);
        testJumpAndTempo(engine);
        testLoopPoints(engine);
        testTransportThroughPlaybackEngine(engine);

        engine.shutdown();
        expect(!engine.isInitialized());
    }

  private:
    void testTickConversion(TracktionAudioEngine& engine) {
        beginTest("Ticks convert to sixteenth-note steps");

        expectWithinAbsoluteError(engine.ticksToSteps(240.0), 1.0, 1e-9);
        expectWithinAbsoluteError(engine.ticksToSteps(960.0 * 4.0), 16.0, 1e-9);
    }

    void testJumpAndTempo(TracktionAudioEngine& engine) {
        beginTest("Jumping moves the transport clock");

        expect(engine.setBPM(120.0));
        expectWithinAbsoluteError(engine.getTempo(), 120.0, 0.001);

        expect(engine.jumpToStep(16.0));
        // One bar of 4/4 at 120 BPM
        expectWithinAbsoluteError(engine.getPositionSeconds(), 2.0, 0.001);
        expectWithinAbsoluteError(engine.ticksToSteps(engine.getCurrentTick()), 16.0, 0.01);
    }

    void testLoopPoints(TracktionAudioEngine& engine) {
        beginTest("Loop points");

        expect(engine.setLoopPoints(0.0, 32.0));
        expect(!engine.setLoopPoints(8.0, 8.0), "Empty loop range should be rejected");
        expect(engine.setLoopEnabled(false));
        expect(engine.setLoopEnabled(true));
    }

    void testTransportThroughPlaybackEngine(TracktionAudioEngine& engine) {
        beginTest("PlaybackEngine drives the Tracktion transport");

        JuceHostScheduler scheduler;
        PlaybackEngine playback(engine, scheduler);

        expect(playback.play(0.0));
        juce::MessageManager::getInstance()->runDispatchLoopUntil(50);
        expect(engine.isPlaying(), "Transport should be playing after play()");

        expect(playback.pause());
        expect(!engine.isPlaying(), "Transport should be stopped after pause()");

        expect(playback.stop());
        expect(!engine.isPlaying());
        expectWithinAbsoluteError(playback.getCurrentPosition(), 0.0, 1e-9);

        playback.shutdown();
    }
};

// Register the test
static TracktionAudioEngineTest tracktionAudioEngineTest;
