#pragma once

#include <juce_core/juce_core.h>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "AudioEngine.hpp"
#include "HostScheduler.hpp"
#include "TransportEventBus.hpp"
#include "TransportState.hpp"

namespace cadence {

/**
 * @brief Options for PlaybackEngine::jumpToPosition
 */
struct JumpOptions {
    // While playing: pause, wait for the settle delay, restart at the target
    bool smooth = true;
    // When stopped: start playback from the target after the jump
    bool autoPlay = false;
};

/**
 * @brief Owner of the transport state machine (Stopped / Playing / Paused)
 *
 * The PlaybackEngine owns the single TransportState and is the only code that
 * mutates it. Commands delegate the audible work to the AudioEngine facade and
 * commit state only after the facade accepted the command; a rejected or
 * throwing facade call leaves the state untouched and the command returns
 * false.
 *
 * Data flow:
 *   UI -> command -> AudioEngine -> commit (clone, repair, swap) -> subscribers
 *   frame callback -> AudioEngine clock -> commit -> position-update
 *
 * While playing, a frame callback on the HostScheduler pulls the engine's
 * tick count and republishes the position when it moved by more than the
 * configured epsilon. The callback stops itself as soon as it sees the
 * transport not playing or the user scrubbing.
 *
 * Commands are guarded by an in-flight flag: a command issued while another
 * one is still talking to the AudioEngine (for example from inside an engine
 * callback) is rejected and logged instead of interleaving.
 *
 * Threading: all commands, scheduler callbacks and subscriber deliveries run
 * on the message thread. getState() may be called from any thread.
 */
class PlaybackEngine {
  public:
    PlaybackEngine(AudioEngine& audioEngine, HostScheduler& scheduler);
    PlaybackEngine(AudioEngine& audioEngine, HostScheduler& scheduler, double initialBpm);
    ~PlaybackEngine();

    // ===== Transport Commands =====

    /**
     * @brief Stopped|Paused -> Playing
     * @param startPosition Optional start step (clamped to >= 0); when omitted
     *                      playback resumes from the current position
     * @return false if already playing or the audio engine failed
     */
    bool play(std::optional<double> startPosition = std::nullopt);

    /** Playing -> Paused; the position stays at the last sampled value */
    bool pause();

    /**
     * @brief Any state -> Stopped
     * Re-homes the playhead to loopStart when looping with loopStart > 0,
     * otherwise to 0.
     */
    bool stop();

    /** Pause when playing, resume when paused, play from the playhead when stopped */
    bool togglePlayPause();

    /**
     * @brief Move the playhead
     * The position is committed before the audio engine confirms. When playing,
     * a smooth jump pauses the engine and restarts it at the target after the
     * settle delay; a direct jump relocates without stopping. A newer jump
     * replaces the pending restart of an older one.
     */
    bool jumpToPosition(double position, JumpOptions options = {});

    // ===== Ghost Playhead =====

    void setGhostPosition(double position);
    void clearGhostPosition();

    // ===== Settings =====

    /** Clamped to the configured BPM range; never moves the playhead */
    bool setBPM(double bpm);

    /** start = max(0, start); end = max(start + 1, end) */
    bool setLoopRange(double start, double end);

    bool setLoopEnabled(bool enabled);

    /**
     * @brief Hand the displayed position to the UI while the user drags
     * Setting the flag suspends position tracking; clearing it resumes
     * tracking when playing.
     */
    void setUserScrubbing(bool scrubbing);

    // ===== State Access =====

    /** Snapshot of the transport state */
    TransportState getState() const;

    double getCurrentPosition() const {
        return getState().currentPosition;
    }

    /** Ghost position while one is set, otherwise the committed position */
    double getDisplayPosition() const;

    bool isTransitionInFlight() const {
        return transitionInFlight_.load();
    }

    bool isPositionTrackingActive() const;

    bool hasPendingJumpRestart() const {
        return jumpRestartPending_;
    }

    // ===== Subscribers =====

    /**
     * @brief Register a subscriber
     * The current state is replayed to the new subscriber immediately with
     * reason "subscription". Keep the returned handle alive for as long as
     * events are wanted.
     */
    Subscription subscribe(TransportEventBus::Callback callback);

    /** Stop tracking, cancel delayed work and drop all subscribers */
    void shutdown();

  private:
    class ScopedTransition;

    AudioEngine& audioEngine_;
    HostScheduler& scheduler_;

    // The single source of truth
    mutable juce::CriticalSection stateLock_;
    TransportState state_;

    TransportEventBus eventBus_;

    std::atomic<bool> transitionInFlight_{false};
    bool isShutdown_ = false;

    // Smooth jump bookkeeping; a bumped generation cancels the pending callback
    int restartGeneration_ = 0;
    int scrubGeneration_ = 0;
    bool scrubHeldByJump_ = false;
    bool jumpRestartPending_ = false;
    double pendingRestartTarget_ = 0.0;

    // Tuning (from Config)
    double minBpm_;
    double maxBpm_;
    double positionEpsilon_;
    int frameIntervalMs_;
    int settleMs_;
    int scrubReleaseMs_;

    // Expires on destruction so scheduled callbacks never touch a dead engine
    std::shared_ptr<bool> alive_;

    TransportState commit(const std::function<void(TransportState&)>& mutator);
    bool callAudioEngine(const char* command, const std::function<bool()>& call);

    void emitStateChange(const std::string& reason, const TransportState& snapshot);
    void emitPositionUpdate(const TransportState& snapshot);
    void emitGhostPositionChange(const TransportState& snapshot);

    void startPositionTracking();
    void stopPositionTracking();
    void onFrame();

    void scheduleGuarded(int delayMs, std::function<void()> callback);
    void cancelPendingJumpRestart();
    void finishSmoothJump(int generation);
    void releaseJumpScrub(int generation);
    void applyUserScrubbing(bool scrubbing);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(PlaybackEngine)
};

}  // namespace cadence
