#pragma once

#include <tracktion_engine/tracktion_engine.h>

#include <memory>

#include "AudioEngine.hpp"

namespace cadence {

/**
 * @brief AudioEngine backed by a Tracktion Engine Edit
 *
 * Owns a tracktion::Engine and one empty Edit whose transport and tempo
 * sequence carry the PlaybackEngine's commands. Steps are sixteenth notes;
 * the native clock is expressed in ticks at TICKS_PER_BEAT per quarter note.
 */
class TracktionAudioEngine : public AudioEngine {
  public:
    static constexpr double TICKS_PER_BEAT = 960.0;
    static constexpr double TICKS_PER_STEP = TICKS_PER_BEAT / 4.0;

    TracktionAudioEngine();
    ~TracktionAudioEngine() override;

    /**
     * @brief Create the engine, open the audio device and build the Edit
     * @return false if the Edit could not be created
     */
    bool initialize();
    void shutdown();

    bool isInitialized() const {
        return currentEdit_ != nullptr;
    }

    // ===== AudioEngine =====
    bool play(double startStep) override;
    bool pause() override;
    bool stop() override;
    bool jumpToStep(double step) override;
    bool setBPM(double bpm) override;
    bool setLoopPoints(double startStep, double endStep) override;
    bool setLoopEnabled(bool enabled) override;
    double getCurrentTick() const override;
    double ticksToSteps(double ticks) const override;

    // ===== Queries =====
    bool isPlaying() const;
    double getTempo() const;
    double getPositionSeconds() const;

  private:
    std::unique_ptr<tracktion::Engine> engine_;
    std::unique_ptr<tracktion::Edit> currentEdit_;

    tracktion::TimePosition stepToTime(double step) const;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TracktionAudioEngine)
};

}  // namespace cadence
