#pragma once

#include <functional>

namespace cadence {

/**
 * @brief The host's frame and timer services
 *
 * Everything scheduled through this interface runs on the same thread that
 * issues transport commands (the message thread in a JUCE host), so callbacks
 * never race with commands.
 */
class HostScheduler {
  public:
    virtual ~HostScheduler() = default;

    /**
     * @brief Start (or replace) the single repeating frame callback
     * @param intervalMs Period between frames
     */
    virtual void startFrameCallback(int intervalMs, std::function<void()> callback) = 0;

    /** Stop the frame callback; safe to call from inside it */
    virtual void stopFrameCallback() = 0;

    virtual bool isFrameCallbackRunning() const = 0;

    /** Run a callback once after a delay */
    virtual void callAfterDelay(int delayMs, std::function<void()> callback) = 0;
};

}  // namespace cadence
