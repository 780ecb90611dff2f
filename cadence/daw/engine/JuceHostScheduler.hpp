#pragma once

#include <juce_events/juce_events.h>

#include <functional>
#include <memory>

#include "HostScheduler.hpp"

namespace cadence {

/**
 * @brief HostScheduler running on the JUCE message thread
 *
 * The frame callback is a juce::Timer; one-shot delays go through
 * juce::Timer::callAfterDelay and are dropped if this scheduler has been
 * destroyed by the time they fire.
 */
class JuceHostScheduler : public HostScheduler, private juce::Timer {
  public:
    JuceHostScheduler();
    ~JuceHostScheduler() override;

    void startFrameCallback(int intervalMs, std::function<void()> callback) override;
    void stopFrameCallback() override;
    bool isFrameCallbackRunning() const override;
    void callAfterDelay(int delayMs, std::function<void()> callback) override;

  private:
    void timerCallback() override;

    std::function<void()> frameCallback_;

    // Expires on destruction so pending delayed callbacks become no-ops
    std::shared_ptr<bool> alive_;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(JuceHostScheduler)
};

}  // namespace cadence
