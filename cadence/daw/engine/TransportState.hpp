#pragma once

#include <juce_core/juce_core.h>

#include <optional>
#include <string>

namespace cadence {

enum class PlaybackState { Stopped, Playing, Paused };

inline const char* toString(PlaybackState state) {
    switch (state) {
        case PlaybackState::Stopped:
            return "stopped";
        case PlaybackState::Playing:
            return "playing";
        case PlaybackState::Paused:
            return "paused";
    }
    return "unknown";
}

/**
 * @brief The transport record owned by the PlaybackEngine
 *
 * Subscribers and callers only ever see copies of this struct.
 *
 * Invariants (restored by repairInvariants on every commit):
 * - isPlaying == (playbackState == Playing)
 * - currentPosition >= 0
 * - loopEnd > loopStart >= 0
 */
struct TransportState {
    bool isPlaying = false;
    PlaybackState playbackState = PlaybackState::Stopped;
    double currentPosition = 0.0;  // Steps

    double bpm = 140.0;
    bool loopEnabled = true;
    double loopStart = 0.0;
    double loopEnd = 64.0;

    // UI interaction state
    bool isUserScrubbing = false;
    std::optional<double> ghostPosition;  // Preview playhead while dragging

    // Milliseconds since epoch
    juce::int64 lastUpdateTime = 0;
    juce::int64 lastStopTime = 0;

    void repairInvariants() {
        isPlaying = (playbackState == PlaybackState::Playing);
        currentPosition = juce::jmax(0.0, currentPosition);
        loopStart = juce::jmax(0.0, loopStart);
        if (loopEnd <= loopStart)
            loopEnd = loopStart + 1.0;
    }
};

/**
 * @brief Envelope delivered to transport subscribers
 */
struct TransportEvent {
    enum class Type { StateChange, PositionUpdate, GhostPositionChange };

    Type type = Type::StateChange;

    // StateChange: why the state changed ("play", "stop", "subscription", ...)
    std::string reason;

    // Snapshot taken when the event was published
    TransportState state;

    // PositionUpdate: committed position; GhostPositionChange: ghost or nullopt
    std::optional<double> position;

    juce::int64 timestamp = 0;
};

inline const char* toString(TransportEvent::Type type) {
    switch (type) {
        case TransportEvent::Type::StateChange:
            return "state-change";
        case TransportEvent::Type::PositionUpdate:
            return "position-update";
        case TransportEvent::Type::GhostPositionChange:
            return "ghost-position-change";
    }
    return "unknown";
}

}  // namespace cadence
