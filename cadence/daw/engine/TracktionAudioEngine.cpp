#include "TracktionAudioEngine.hpp"

#include <iostream>

#include "../core/Config.hpp"

namespace cadence {

TracktionAudioEngine::TracktionAudioEngine() = default;

TracktionAudioEngine::~TracktionAudioEngine() {
    shutdown();
}

bool TracktionAudioEngine::initialize() {
    try {
        engine_ = std::make_unique<tracktion::Engine>("Cadence");

        // Output only; the transport never records
        engine_->getDeviceManager().initialise(0, 2);

        auto editFile = juce::File::getSpecialLocation(juce::File::tempDirectory)
                            .getChildFile("cadence_transport.tracktionedit");
        if (editFile.existsAsFile()) {
            editFile.deleteFile();
        }

        currentEdit_ = tracktion::createEmptyEdit(*engine_, editFile);
        if (!currentEdit_) {
            std::cerr << "ERROR: Tracktion Engine initialized but no Edit was created" << std::endl;
            return false;
        }

        auto& config = Config::getInstance();
        setBPM(config.getDefaultBpm());
        setLoopPoints(config.getDefaultLoopStart(), config.getDefaultLoopEnd());
        setLoopEnabled(config.getDefaultLoopEnabled());

        std::cout << "Tracktion audio engine ready at " << getTempo() << " BPM" << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "ERROR: Failed to initialize Tracktion Engine: " << e.what() << std::endl;
        return false;
    }
}

void TracktionAudioEngine::shutdown() {
    // Stop transport and release playback context before destroying the Edit
    if (currentEdit_) {
        auto& transport = currentEdit_->getTransport();
        if (transport.isPlaying()) {
            transport.stop(false, false);
        }
        transport.freePlaybackContext();
        currentEdit_.reset();
    }

    if (engine_) {
        engine_->getDeviceManager().closeDevices();
        engine_.reset();
        std::cout << "Tracktion audio engine shut down" << std::endl;
    }
}

// ===== Transport =====

bool TracktionAudioEngine::play(double startStep) {
    if (!currentEdit_)
        return false;

    auto& transport = currentEdit_->getTransport();
    transport.setPosition(stepToTime(startStep));
    transport.play(false);
    DBG("TracktionAudioEngine::play from step " << startStep);
    return true;
}

bool TracktionAudioEngine::pause() {
    if (!currentEdit_)
        return false;

    // Tracktion has no pause; stopping without returning to the start keeps the playhead
    currentEdit_->getTransport().stop(false, false);
    return true;
}

bool TracktionAudioEngine::stop() {
    if (!currentEdit_)
        return false;

    currentEdit_->getTransport().stop(false, false);
    return true;
}

bool TracktionAudioEngine::jumpToStep(double step) {
    if (!currentEdit_)
        return false;

    currentEdit_->getTransport().setPosition(stepToTime(step));
    return true;
}

// ===== Tempo =====

bool TracktionAudioEngine::setBPM(double bpm) {
    if (!currentEdit_)
        return false;

    auto& tempoSeq = currentEdit_->tempoSequence;
    if (tempoSeq.getNumTempos() == 0)
        return false;

    auto tempo = tempoSeq.getTempo(0);
    if (!tempo)
        return false;

    tempo->setBpm(bpm);
    DBG("TracktionAudioEngine: tempo " << bpm << " BPM");
    return true;
}

// ===== Loop =====

bool TracktionAudioEngine::setLoopPoints(double startStep, double endStep) {
    if (!currentEdit_ || endStep <= startStep)
        return false;

    currentEdit_->getTransport().setLoopRange(
        tracktion::TimeRange(stepToTime(startStep), stepToTime(endStep)));
    return true;
}

bool TracktionAudioEngine::setLoopEnabled(bool enabled) {
    if (!currentEdit_)
        return false;

    currentEdit_->getTransport().looping = enabled;
    return true;
}

// ===== Clock =====

double TracktionAudioEngine::getCurrentTick() const {
    if (!currentEdit_)
        return 0.0;

    auto position = currentEdit_->getTransport().position.get();
    auto beats = currentEdit_->tempoSequence.timeToBeats(position).inBeats();
    return beats * TICKS_PER_BEAT;
}

double TracktionAudioEngine::ticksToSteps(double ticks) const {
    return ticks / TICKS_PER_STEP;
}

// ===== Queries =====

bool TracktionAudioEngine::isPlaying() const {
    if (currentEdit_) {
        return currentEdit_->getTransport().isPlaying();
    }
    return false;
}

double TracktionAudioEngine::getTempo() const {
    if (currentEdit_) {
        auto& tempoSeq = currentEdit_->tempoSequence;
        if (tempoSeq.getNumTempos() > 0) {
            if (auto tempo = tempoSeq.getTempo(0)) {
                return tempo->getBpm();
            }
        }
    }
    return Config::getInstance().getDefaultBpm();
}

double TracktionAudioEngine::getPositionSeconds() const {
    if (currentEdit_) {
        return currentEdit_->getTransport().position.get().inSeconds();
    }
    return 0.0;
}

tracktion::TimePosition TracktionAudioEngine::stepToTime(double step) const {
    auto beats = tracktion::BeatPosition::fromBeats(juce::jmax(0.0, step) / 4.0);
    return currentEdit_->tempoSequence.beatsToTime(beats);
}

}  // namespace cadence
