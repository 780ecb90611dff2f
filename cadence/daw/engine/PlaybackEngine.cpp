#include "PlaybackEngine.hpp"

#include <cmath>

#include "../core/Config.hpp"

namespace cadence {

// Rejects a command while another one is still talking to the AudioEngine
class PlaybackEngine::ScopedTransition {
  public:
    ScopedTransition(PlaybackEngine& owner, const char* command) : owner_(owner) {
        if (owner_.isShutdown_) {
            DBG("PlaybackEngine: " << command << " ignored after shutdown");
            return;
        }
        bool expected = false;
        acquired_ = owner_.transitionInFlight_.compare_exchange_strong(expected, true);
        if (!acquired_)
            juce::Logger::writeToLog(juce::String("PlaybackEngine: ") + command +
                                     " rejected, another transition is in flight");
    }

    ~ScopedTransition() {
        if (acquired_)
            owner_.transitionInFlight_.store(false);
    }

    bool acquired() const {
        return acquired_;
    }

  private:
    PlaybackEngine& owner_;
    bool acquired_ = false;

    JUCE_DECLARE_NON_COPYABLE(ScopedTransition)
};

PlaybackEngine::PlaybackEngine(AudioEngine& audioEngine, HostScheduler& scheduler)
    : PlaybackEngine(audioEngine, scheduler, Config::getInstance().getDefaultBpm()) {}

PlaybackEngine::PlaybackEngine(AudioEngine& audioEngine, HostScheduler& scheduler,
                               double initialBpm)
    : audioEngine_(audioEngine), scheduler_(scheduler), alive_(std::make_shared<bool>(true)) {
    auto& config = Config::getInstance();
    minBpm_ = config.getMinBpm();
    maxBpm_ = juce::jmax(minBpm_, config.getMaxBpm());
    positionEpsilon_ = config.getPositionEpsilon();
    frameIntervalMs_ = config.getPositionUpdateIntervalMs();
    settleMs_ = config.getSmoothJumpSettleMs();
    scrubReleaseMs_ = config.getScrubReleaseMs();

    state_.bpm = juce::jlimit(minBpm_, maxBpm_, initialBpm);
    state_.loopEnabled = config.getDefaultLoopEnabled();
    state_.loopStart = config.getDefaultLoopStart();
    state_.loopEnd = config.getDefaultLoopEnd();
    state_.lastUpdateTime = juce::Time::currentTimeMillis();
    state_.repairInvariants();

    DBG("PlaybackEngine initialized: bpm=" << state_.bpm << " loop=" << state_.loopStart << ".."
                                           << state_.loopEnd);
}

PlaybackEngine::~PlaybackEngine() {
    shutdown();
    alive_.reset();
}

// ===== Transport Commands =====

bool PlaybackEngine::play(std::optional<double> startPosition) {
    TransportState snapshot;
    {
        ScopedTransition transition(*this, "play");
        if (!transition.acquired())
            return false;

        const auto before = getState();
        if (before.playbackState == PlaybackState::Playing) {
            DBG("PlaybackEngine::play ignored, already playing");
            return false;
        }

        double target = before.currentPosition;
        if (startPosition) {
            target = juce::jmax(0.0, *startPosition);
            // Visible to the engine while it starts
            commit([target](TransportState& s) { s.currentPosition = target; });
        }

        if (!callAudioEngine("play", [this, target] { return audioEngine_.play(target); })) {
            if (startPosition) {
                const double previous = before.currentPosition;
                commit([previous](TransportState& s) { s.currentPosition = previous; });
            }
            return false;
        }

        snapshot = commit([](TransportState& s) { s.playbackState = PlaybackState::Playing; });
    }

    DBG("PlaybackEngine::play at step " << snapshot.currentPosition);
    startPositionTracking();
    emitStateChange("play", snapshot);
    return true;
}

bool PlaybackEngine::pause() {
    TransportState snapshot;
    {
        ScopedTransition transition(*this, "pause");
        if (!transition.acquired())
            return false;

        if (getState().playbackState != PlaybackState::Playing)
            return false;

        if (!callAudioEngine("pause", [this] { return audioEngine_.pause(); }))
            return false;

        cancelPendingJumpRestart();
        snapshot = commit([](TransportState& s) { s.playbackState = PlaybackState::Paused; });
    }

    DBG("PlaybackEngine::pause at step " << snapshot.currentPosition);
    stopPositionTracking();
    emitStateChange("pause", snapshot);
    return true;
}

bool PlaybackEngine::stop() {
    TransportState snapshot;
    {
        ScopedTransition transition(*this, "stop");
        if (!transition.acquired())
            return false;

        if (!callAudioEngine("stop", [this] { return audioEngine_.stop(); }))
            return false;

        cancelPendingJumpRestart();
        const auto now = juce::Time::currentTimeMillis();
        snapshot = commit([now](TransportState& s) {
            s.playbackState = PlaybackState::Stopped;
            s.currentPosition = (s.loopEnabled && s.loopStart > 0.0) ? s.loopStart : 0.0;
            s.lastStopTime = now;
        });
    }

    DBG("PlaybackEngine::stop, playhead re-homed to step " << snapshot.currentPosition);
    stopPositionTracking();
    emitStateChange("stop", snapshot);
    emitPositionUpdate(snapshot);
    return true;
}

bool PlaybackEngine::togglePlayPause() {
    const auto current = getState();
    switch (current.playbackState) {
        case PlaybackState::Playing:
            return pause();
        case PlaybackState::Paused:
            return play();
        case PlaybackState::Stopped:
            return play(current.currentPosition);
    }
    return false;
}

bool PlaybackEngine::jumpToPosition(double position, JumpOptions options) {
    if (!std::isfinite(position)) {
        juce::Logger::writeToLog("PlaybackEngine: jump to non-finite position rejected");
        return false;
    }

    const double target = juce::jmax(0.0, position);
    TransportState before;
    TransportState snapshot;
    {
        ScopedTransition transition(*this, "jumpToPosition");
        if (!transition.acquired())
            return false;

        before = getState();

        // Optimistic: the UI sees the target before the engine confirms
        commit([target](TransportState& s) { s.currentPosition = target; });

        bool accepted = false;
        int settleDelay = 0;
        if (before.isPlaying && options.smooth) {
            accepted = callAudioEngine("pause", [this] { return audioEngine_.pause(); });
            if (accepted) {
                cancelPendingJumpRestart();
                jumpRestartPending_ = true;
                pendingRestartTarget_ = target;
                const int generation = restartGeneration_;
                scheduleGuarded(settleMs_, [this, generation] { finishSmoothJump(generation); });
                settleDelay = settleMs_;
            }
        } else {
            accepted = callAudioEngine("jumpToStep",
                                       [this, target] { return audioEngine_.jumpToStep(target); });
            // A paused engine waiting for a smooth restart now restarts here
            if (accepted && jumpRestartPending_)
                pendingRestartTarget_ = target;
        }

        if (!accepted) {
            const double previous = before.currentPosition;
            commit([previous](TransportState& s) { s.currentPosition = previous; });
            return false;
        }

        snapshot = commit([](TransportState& s) { s.isUserScrubbing = true; });

        // A flag the user set stays theirs to clear
        if (!before.isUserScrubbing || scrubHeldByJump_) {
            scrubHeldByJump_ = true;
            const int scrubGeneration = ++scrubGeneration_;
            scheduleGuarded(settleDelay + scrubReleaseMs_,
                            [this, scrubGeneration] { releaseJumpScrub(scrubGeneration); });
        }
    }

    DBG("PlaybackEngine::jumpToPosition " << target << (options.smooth ? " (smooth)" : ""));
    if (!before.isUserScrubbing)
        emitStateChange("scrub-start", snapshot);
    emitPositionUpdate(snapshot);

    if (options.autoPlay && snapshot.playbackState == PlaybackState::Stopped)
        return play(target);

    return true;
}

// ===== Ghost Playhead =====

void PlaybackEngine::setGhostPosition(double position) {
    if (isShutdown_ || !std::isfinite(position))
        return;

    const double ghost = juce::jmax(0.0, position);
    auto snapshot = commit([ghost](TransportState& s) { s.ghostPosition = ghost; });
    emitGhostPositionChange(snapshot);
}

void PlaybackEngine::clearGhostPosition() {
    if (isShutdown_)
        return;

    auto snapshot = commit([](TransportState& s) { s.ghostPosition.reset(); });
    emitGhostPositionChange(snapshot);
}

// ===== Settings =====

bool PlaybackEngine::setBPM(double bpm) {
    if (std::isnan(bpm)) {
        juce::Logger::writeToLog("PlaybackEngine: setBPM(NaN) rejected");
        return false;
    }

    const double clamped = juce::jlimit(minBpm_, maxBpm_, bpm);
    TransportState snapshot;
    {
        ScopedTransition transition(*this, "setBPM");
        if (!transition.acquired())
            return false;

        if (!callAudioEngine("setBPM", [this, clamped] { return audioEngine_.setBPM(clamped); }))
            return false;

        snapshot = commit([clamped](TransportState& s) { s.bpm = clamped; });
    }

    DBG("PlaybackEngine::setBPM " << bpm << " -> " << clamped);
    emitStateChange("bpm-change", snapshot);
    return true;
}

bool PlaybackEngine::setLoopRange(double start, double end) {
    if (!std::isfinite(start) || std::isnan(end)) {
        juce::Logger::writeToLog("PlaybackEngine: setLoopRange with non-finite bounds rejected");
        return false;
    }

    const double loopStart = juce::jmax(0.0, start);
    const double loopEnd = juce::jmax(loopStart + 1.0, end);
    TransportState snapshot;
    {
        ScopedTransition transition(*this, "setLoopRange");
        if (!transition.acquired())
            return false;

        if (!callAudioEngine("setLoopPoints", [this, loopStart, loopEnd] {
                return audioEngine_.setLoopPoints(loopStart, loopEnd);
            }))
            return false;

        snapshot = commit([loopStart, loopEnd](TransportState& s) {
            s.loopStart = loopStart;
            s.loopEnd = loopEnd;
        });
    }

    DBG("PlaybackEngine::setLoopRange " << loopStart << ".." << loopEnd);
    emitStateChange("loop-change", snapshot);
    return true;
}

bool PlaybackEngine::setLoopEnabled(bool enabled) {
    TransportState snapshot;
    {
        ScopedTransition transition(*this, "setLoopEnabled");
        if (!transition.acquired())
            return false;

        if (!callAudioEngine("setLoopEnabled",
                             [this, enabled] { return audioEngine_.setLoopEnabled(enabled); }))
            return false;

        snapshot = commit([enabled](TransportState& s) { s.loopEnabled = enabled; });
    }

    emitStateChange("loop-change", snapshot);
    return true;
}

void PlaybackEngine::setUserScrubbing(bool scrubbing) {
    if (isShutdown_)
        return;

    // An explicit call overrides the release scheduled by a jump
    ++scrubGeneration_;
    scrubHeldByJump_ = false;
    applyUserScrubbing(scrubbing);
}

// ===== State Access =====

TransportState PlaybackEngine::getState() const {
    const juce::ScopedLock sl(stateLock_);
    return state_;
}

double PlaybackEngine::getDisplayPosition() const {
    const auto current = getState();
    return current.ghostPosition.value_or(current.currentPosition);
}

bool PlaybackEngine::isPositionTrackingActive() const {
    return !isShutdown_ && scheduler_.isFrameCallbackRunning();
}

// ===== Subscribers =====

Subscription PlaybackEngine::subscribe(TransportEventBus::Callback callback) {
    auto subscription = eventBus_.subscribe(std::move(callback));

    TransportEvent event;
    event.type = TransportEvent::Type::StateChange;
    event.reason = "subscription";
    event.state = getState();
    event.timestamp = juce::Time::currentTimeMillis();
    eventBus_.publishTo(subscription, event);

    return subscription;
}

void PlaybackEngine::shutdown() {
    if (isShutdown_)
        return;

    stopPositionTracking();
    isShutdown_ = true;
    ++restartGeneration_;
    ++scrubGeneration_;
    scrubHeldByJump_ = false;
    jumpRestartPending_ = false;
    eventBus_.clear();
    DBG("PlaybackEngine shut down");
}

// ===== Private =====

TransportState PlaybackEngine::commit(const std::function<void(TransportState&)>& mutator) {
    const juce::ScopedLock sl(stateLock_);
    TransportState next = state_;
    mutator(next);
    next.lastUpdateTime = juce::Time::currentTimeMillis();
    next.repairInvariants();
    state_ = next;
    return next;
}

bool PlaybackEngine::callAudioEngine(const char* command, const std::function<bool()>& call) {
    try {
        if (call())
            return true;
        juce::Logger::writeToLog(juce::String("PlaybackEngine: audio engine rejected ") + command);
    } catch (const std::exception& e) {
        juce::Logger::writeToLog(juce::String("PlaybackEngine: audio engine ") + command +
                                 " failed: " + e.what());
    } catch (...) {
        juce::Logger::writeToLog(juce::String("PlaybackEngine: audio engine ") + command +
                                 " failed with unknown exception");
    }
    return false;
}

void PlaybackEngine::emitStateChange(const std::string& reason, const TransportState& snapshot) {
    TransportEvent event;
    event.type = TransportEvent::Type::StateChange;
    event.reason = reason;
    event.state = snapshot;
    event.timestamp = snapshot.lastUpdateTime;
    eventBus_.publish(event);
}

void PlaybackEngine::emitPositionUpdate(const TransportState& snapshot) {
    TransportEvent event;
    event.type = TransportEvent::Type::PositionUpdate;
    event.state = snapshot;
    event.position = snapshot.currentPosition;
    event.timestamp = snapshot.lastUpdateTime;
    eventBus_.publish(event);
}

void PlaybackEngine::emitGhostPositionChange(const TransportState& snapshot) {
    TransportEvent event;
    event.type = TransportEvent::Type::GhostPositionChange;
    event.state = snapshot;
    event.position = snapshot.ghostPosition;
    event.timestamp = snapshot.lastUpdateTime;
    eventBus_.publish(event);
}

void PlaybackEngine::startPositionTracking() {
    if (isShutdown_ || scheduler_.isFrameCallbackRunning())
        return;

    std::weak_ptr<bool> alive = alive_;
    scheduler_.startFrameCallback(frameIntervalMs_, [this, alive] {
        if (alive.expired())
            return;
        onFrame();
    });
}

void PlaybackEngine::stopPositionTracking() {
    if (scheduler_.isFrameCallbackRunning())
        scheduler_.stopFrameCallback();
}

void PlaybackEngine::onFrame() {
    const auto current = getState();
    if (!current.isPlaying || current.isUserScrubbing) {
        stopPositionTracking();
        return;
    }

    double steps = 0.0;
    try {
        steps = audioEngine_.ticksToSteps(audioEngine_.getCurrentTick());
    } catch (const std::exception& e) {
        juce::Logger::writeToLog(juce::String("PlaybackEngine: reading engine clock failed: ") +
                                 e.what());
        return;
    } catch (...) {
        juce::Logger::writeToLog("PlaybackEngine: reading engine clock failed");
        return;
    }

    if (!std::isfinite(steps) || std::abs(steps - current.currentPosition) <= positionEpsilon_)
        return;

    auto snapshot = commit([steps](TransportState& s) { s.currentPosition = steps; });
    emitPositionUpdate(snapshot);
}

void PlaybackEngine::scheduleGuarded(int delayMs, std::function<void()> callback) {
    std::weak_ptr<bool> alive = alive_;
    scheduler_.callAfterDelay(delayMs, [alive, callback = std::move(callback)] {
        if (alive.expired())
            return;
        callback();
    });
}

void PlaybackEngine::cancelPendingJumpRestart() {
    ++restartGeneration_;
    jumpRestartPending_ = false;
}

void PlaybackEngine::finishSmoothJump(int generation) {
    if (isShutdown_ || !jumpRestartPending_ || generation != restartGeneration_)
        return;

    TransportState snapshot;
    {
        ScopedTransition transition(*this, "jump restart");
        if (!transition.acquired()) {
            // Try again once the current transition has finished
            scheduleGuarded(settleMs_, [this, generation] { finishSmoothJump(generation); });
            return;
        }

        jumpRestartPending_ = false;
        if (getState().playbackState != PlaybackState::Playing)
            return;

        const double target = pendingRestartTarget_;
        if (callAudioEngine("play", [this, target] { return audioEngine_.play(target); })) {
            DBG("PlaybackEngine: smooth jump resumed at step " << target);
            return;
        }

        snapshot = commit([](TransportState& s) { s.playbackState = PlaybackState::Paused; });
    }

    juce::Logger::writeToLog("PlaybackEngine: restart after smooth jump failed, transport paused");
    stopPositionTracking();
    emitStateChange("jump-restart-failed", snapshot);
}

void PlaybackEngine::releaseJumpScrub(int generation) {
    if (isShutdown_ || generation != scrubGeneration_)
        return;
    scrubHeldByJump_ = false;
    applyUserScrubbing(false);
}

void PlaybackEngine::applyUserScrubbing(bool scrubbing) {
    if (getState().isUserScrubbing == scrubbing)
        return;

    auto snapshot = commit([scrubbing](TransportState& s) { s.isUserScrubbing = scrubbing; });
    emitStateChange(scrubbing ? "scrub-start" : "scrub-end", snapshot);

    // Setting the flag needs no call here: the frame callback stops itself on its next tick
    if (!scrubbing && snapshot.isPlaying)
        startPositionTracking();
}

}  // namespace cadence
