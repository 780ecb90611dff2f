#pragma once

namespace cadence {

/**
 * @brief Abstract audio engine facade driven by the PlaybackEngine
 *
 * This provides a clean abstraction over the actual audio engine implementation.
 * Concrete implementations (e.g., TracktionAudioEngine) inherit from this.
 *
 * All positions are in steps. Commands return false when the engine rejects
 * them; an implementation may also throw a std::exception. The PlaybackEngine
 * treats both as a failed command and leaves its transport state untouched.
 *
 * The clock accessors are polled every frame while playing and must be cheap.
 */
class AudioEngine {
  public:
    virtual ~AudioEngine() = default;

    // ===== Transport =====
    virtual bool play(double startStep) = 0;
    virtual bool pause() = 0;
    virtual bool stop() = 0;

    /** Relocate the playhead without stopping playback */
    virtual bool jumpToStep(double step) = 0;

    // ===== Tempo =====
    virtual bool setBPM(double bpm) = 0;

    // ===== Loop =====
    virtual bool setLoopPoints(double startStep, double endStep) = 0;
    virtual bool setLoopEnabled(bool enabled) = 0;

    // ===== Clock =====

    /** Authoritative playhead position in the engine's native tick unit */
    virtual double getCurrentTick() const = 0;

    /** Convert engine ticks to steps */
    virtual double ticksToSteps(double ticks) const = 0;
};

}  // namespace cadence
