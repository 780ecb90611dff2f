#pragma once

#include <functional>
#include <utility>
#include <vector>

#include "cadence/daw/engine/HostScheduler.hpp"

namespace cadence_test {

// HostScheduler driven by hand: frames and virtual time only advance when a test says so
class ManualHostScheduler : public cadence::HostScheduler {
  public:
    void startFrameCallback(int intervalMs, std::function<void()> callback) override {
        frameIntervalMs = intervalMs;
        frameCallback_ = std::move(callback);
        running_ = true;
        ++startCount;
    }
    void stopFrameCallback() override {
        running_ = false;
    }
    bool isFrameCallbackRunning() const override {
        return running_;
    }
    void callAfterDelay(int delayMs, std::function<void()> callback) override {
        pending_.push_back({nowMs_ + delayMs, std::move(callback)});
    }

    // Run one frame if the frame callback is running
    void tick() {
        if (!running_)
            return;
        auto callback = frameCallback_;
        if (callback)
            callback();
    }

    void tick(int frames) {
        for (int i = 0; i < frames; ++i)
            tick();
    }

    // Advance virtual time, firing due delayed callbacks in order
    void advance(int ms) {
        const int target = nowMs_ + ms;
        for (;;) {
            int next = -1;
            for (size_t i = 0; i < pending_.size(); ++i) {
                if (pending_[i].dueMs <= target &&
                    (next < 0 || pending_[i].dueMs < pending_[static_cast<size_t>(next)].dueMs))
                    next = static_cast<int>(i);
            }
            if (next < 0)
                break;

            auto entry = std::move(pending_[static_cast<size_t>(next)]);
            pending_.erase(pending_.begin() + next);
            nowMs_ = entry.dueMs;
            entry.callback();
        }
        nowMs_ = target;
    }

    size_t getNumPending() const {
        return pending_.size();
    }

    int frameIntervalMs = 0;
    int startCount = 0;

  private:
    struct Delayed {
        int dueMs;
        std::function<void()> callback;
    };

    std::function<void()> frameCallback_;
    bool running_ = false;
    int nowMs_ = 0;
    std::vector<Delayed> pending_;
};

}  // namespace cadence_test
