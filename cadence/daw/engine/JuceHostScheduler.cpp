#include "JuceHostScheduler.hpp"

namespace cadence {

JuceHostScheduler::JuceHostScheduler() : alive_(std::make_shared<bool>(true)) {}

JuceHostScheduler::~JuceHostScheduler() {
    stopTimer();
    alive_.reset();
}

void JuceHostScheduler::startFrameCallback(int intervalMs, std::function<void()> callback) {
    frameCallback_ = std::move(callback);
    startTimer(juce::jmax(1, intervalMs));
}

void JuceHostScheduler::stopFrameCallback() {
    stopTimer();
}

bool JuceHostScheduler::isFrameCallbackRunning() const {
    return isTimerRunning();
}

void JuceHostScheduler::callAfterDelay(int delayMs, std::function<void()> callback) {
    std::weak_ptr<bool> alive = alive_;
    juce::Timer::callAfterDelay(juce::jmax(0, delayMs), [alive, callback = std::move(callback)]() {
        if (alive.expired())
            return;
        callback();
    });
}

void JuceHostScheduler::timerCallback() {
    // Copy: the callback may stop or replace the frame callback
    auto callback = frameCallback_;
    if (callback)
        callback();
}

}  // namespace cadence
