/**
 * @file cadence_transport_main.cpp
 * @brief Headless transport runner
 *
 * Drives a PlaybackEngine on top of the Tracktion audio engine for a fixed
 * time and prints every transport event with its musical position.
 *
 * Usage:
 *   cadence_transport [--config file] [--bpm 128] [--start 16] [--loop 0:64]
 *                     [--no-loop] [--seconds 8]
 */

#include <juce_core/juce_core.h>
#include <juce_events/juce_events.h>

#include <iostream>
#include <memory>

#include "cadence/cadence.hpp"
#include "core/Config.hpp"
#include "core/TimelineStore.hpp"
#include "engine/JuceHostScheduler.hpp"
#include "engine/PlaybackEngine.hpp"
#include "engine/TracktionAudioEngine.hpp"
#include "timeline/TimelineCoordinateSystem.hpp"

namespace {

struct TransportOptions {
    juce::String configFile;
    double bpm = 0.0;  // 0 = Config default
    double startStep = 0.0;
    double loopStart = -1.0;
    double loopEnd = -1.0;
    bool loopEnabled = true;
    int seconds = 8;
};

bool parseOptions(const juce::String& commandLine, TransportOptions& options) {
    auto args = juce::StringArray::fromTokens(commandLine, true);
    args.removeEmptyStrings();

    for (int i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        const bool hasValue = i + 1 < args.size();

        if (arg == "--config" && hasValue) {
            options.configFile = args[++i].unquoted();
        } else if (arg == "--bpm" && hasValue) {
            options.bpm = args[++i].getDoubleValue();
        } else if (arg == "--start" && hasValue) {
            options.startStep = args[++i].getDoubleValue();
        } else if (arg == "--loop" && hasValue) {
            auto range = args[++i];
            if (!range.containsChar(':')) {
                std::cerr << "ERROR: --loop expects start:end, got " << range << std::endl;
                return false;
            }
            options.loopStart = range.upToFirstOccurrenceOf(":", false, false).getDoubleValue();
            options.loopEnd = range.fromFirstOccurrenceOf(":", false, false).getDoubleValue();
        } else if (arg == "--no-loop") {
            options.loopEnabled = false;
        } else if (arg == "--seconds" && hasValue) {
            options.seconds = juce::jmax(1, args[++i].getIntValue());
        } else {
            std::cerr << "ERROR: unknown or incomplete option " << arg << std::endl;
            return false;
        }
    }
    return true;
}

}  // namespace

//==============================================================================
class CadenceTransportApplication : public juce::JUCEApplicationBase {
  public:
    const juce::String getApplicationName() override {
        return "Cadence Transport";
    }
    const juce::String getApplicationVersion() override {
        return CADENCE_VERSION;
    }
    bool moreThanOneInstanceAllowed() override {
        return true;
    }

    void initialise(const juce::String& commandLine) override {
        TransportOptions options;
        if (!parseOptions(commandLine, options)) {
            setApplicationReturnValue(2);
            quit();
            return;
        }

        auto& config = cadence::Config::getInstance();
        if (options.configFile.isNotEmpty()) {
            config.loadFromFile(options.configFile.toStdString());
        }

        audioEngine_ = std::make_unique<cadence::TracktionAudioEngine>();
        if (!audioEngine_->initialize()) {
            std::cerr << "ERROR: Failed to initialize Tracktion Engine" << std::endl;
            setApplicationReturnValue(1);
            quit();
            return;
        }

        timeline_ = std::make_unique<cadence::TimelineStore>();
        coordinates_ = std::make_unique<cadence::TimelineCoordinateSystem>(*timeline_);
        scheduler_ = std::make_unique<cadence::JuceHostScheduler>();
        playback_ = std::make_unique<cadence::PlaybackEngine>(*audioEngine_, *scheduler_);

        subscription_ = playback_->subscribe(
            [this](const cadence::TransportEvent& event) { printEvent(event); });

        if (options.bpm > 0.0) {
            playback_->setBPM(options.bpm);
        }
        // Keep the timeline tempo in step with the transport
        const auto& tempos = timeline_->getTempoMarkers();
        if (!tempos.empty()) {
            timeline_->updateTempoMarker(tempos.front().id, 0.0, playback_->getState().bpm);
        }

        if (options.loopStart >= 0.0) {
            playback_->setLoopRange(options.loopStart, options.loopEnd);
        }
        playback_->setLoopEnabled(options.loopEnabled);

        if (!playback_->play(options.startStep)) {
            std::cerr << "ERROR: Transport refused to start" << std::endl;
            setApplicationReturnValue(1);
            quit();
            return;
        }

        juce::Timer::callAfterDelay(options.seconds * 1000, [this] {
            if (playback_) {
                playback_->stop();
            }
            quit();
        });
    }

    void shutdown() override {
        subscription_.unsubscribe();
        if (playback_) {
            playback_->shutdown();
        }
        playback_.reset();
        scheduler_.reset();
        coordinates_.reset();
        timeline_.reset();
        audioEngine_.reset();
        std::cout << "Cadence transport shut down" << std::endl;
    }

    void systemRequestedQuit() override {
        quit();
    }

    void anotherInstanceStarted(const juce::String&) override {}
    void suspended() override {}
    void resumed() override {}
    void unhandledException(const std::exception* e, const juce::String&, int) override {
        std::cerr << "ERROR: Unhandled exception: " << (e != nullptr ? e->what() : "unknown")
                  << std::endl;
    }

  private:
    std::unique_ptr<cadence::TracktionAudioEngine> audioEngine_;
    std::unique_ptr<cadence::TimelineStore> timeline_;
    std::unique_ptr<cadence::TimelineCoordinateSystem> coordinates_;
    std::unique_ptr<cadence::JuceHostScheduler> scheduler_;
    std::unique_ptr<cadence::PlaybackEngine> playback_;
    cadence::Subscription subscription_;

    void printEvent(const cadence::TransportEvent& event) {
        const auto& state = event.state;
        const double step = event.position.value_or(state.currentPosition);

        std::cout << "[" << cadence::toString(event.type) << "]";
        if (!event.reason.empty()) {
            std::cout << " " << event.reason;
        }
        std::cout << " " << cadence::toString(state.playbackState) << " "
                  << coordinates_->formatPosition(step) << " ("
                  << coordinates_->formatTimecode(step) << ") bpm=" << state.bpm
                  << " loop=" << (state.loopEnabled ? "on " : "off ") << state.loopStart << ":"
                  << state.loopEnd << std::endl;
    }
};

//==============================================================================
START_JUCE_APPLICATION(CadenceTransportApplication)
