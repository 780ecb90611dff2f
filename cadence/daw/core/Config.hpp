#pragma once

#include <string>

namespace cadence {

/**
 * Configuration class to manage transport and timeline settings
 * Values are read by the engine and the timeline store at construction time
 */
class Config {
  public:
    static Config& getInstance();

    // Tempo Configuration
    double getDefaultBpm() const {
        return defaultBpm;
    }
    void setDefaultBpm(double bpm) {
        defaultBpm = bpm;
    }

    double getMinBpm() const {
        return minBpm;
    }
    void setMinBpm(double bpm) {
        minBpm = bpm;
    }

    double getMaxBpm() const {
        return maxBpm;
    }
    void setMaxBpm(double bpm) {
        maxBpm = bpm;
    }

    // Loop Configuration
    double getDefaultLoopStart() const {
        return defaultLoopStart;
    }
    void setDefaultLoopStart(double step) {
        defaultLoopStart = step;
    }

    double getDefaultLoopEnd() const {
        return defaultLoopEnd;
    }
    void setDefaultLoopEnd(double step) {
        defaultLoopEnd = step;
    }

    bool getDefaultLoopEnabled() const {
        return defaultLoopEnabled;
    }
    void setDefaultLoopEnabled(bool enabled) {
        defaultLoopEnabled = enabled;
    }

    // Position Tracking Configuration
    double getPositionEpsilon() const {
        return positionEpsilon;
    }
    void setPositionEpsilon(double epsilon) {
        positionEpsilon = epsilon;
    }

    int getPositionUpdateIntervalMs() const {
        return positionUpdateIntervalMs;
    }
    void setPositionUpdateIntervalMs(int intervalMs) {
        positionUpdateIntervalMs = intervalMs;
    }

    int getSmoothJumpSettleMs() const {
        return smoothJumpSettleMs;
    }
    void setSmoothJumpSettleMs(int settleMs) {
        smoothJumpSettleMs = settleMs;
    }

    int getScrubReleaseMs() const {
        return scrubReleaseMs;
    }
    void setScrubReleaseMs(int releaseMs) {
        scrubReleaseMs = releaseMs;
    }

    // Grid Configuration
    double getBaseStepWidth() const {
        return baseStepWidth;
    }
    void setBaseStepWidth(double width) {
        baseStepWidth = width;
    }

    double getMarkerSnapThreshold() const {
        return markerSnapThreshold;
    }
    void setMarkerSnapThreshold(double threshold) {
        markerSnapThreshold = threshold;
    }

    // Time Signature Configuration
    int getDefaultTimeSignatureNumerator() const {
        return defaultTimeSignatureNumerator;
    }
    void setDefaultTimeSignatureNumerator(int numerator) {
        defaultTimeSignatureNumerator = numerator;
    }

    int getDefaultTimeSignatureDenominator() const {
        return defaultTimeSignatureDenominator;
    }
    void setDefaultTimeSignatureDenominator(int denominator) {
        defaultTimeSignatureDenominator = denominator;
    }

    // Restore every value to its built-in default
    void resetToDefaults();

    // Save/Load Configuration
    void saveToFile(const std::string& filename);
    void loadFromFile(const std::string& filename);

  private:
    Config() = default;

    // Helper to parse a single config line
    void parseConfigLine(const std::string& key, const std::string& value);

    // Tempo settings
    double defaultBpm = 140.0;  // Tempo of a fresh transport and timeline
    double minBpm = 60.0;       // setBPM clamps to [minBpm, maxBpm]
    double maxBpm = 300.0;

    // Loop settings (steps)
    double defaultLoopStart = 0.0;
    double defaultLoopEnd = 64.0;  // 4 bars of 4/4
    bool defaultLoopEnabled = true;

    // Position tracking settings
    double positionEpsilon = 0.01;      // Minimum step delta that publishes an update
    int positionUpdateIntervalMs = 16;  // ~60fps frame callback
    int smoothJumpSettleMs = 50;        // Pause before restarting after a smooth jump
    int scrubReleaseMs = 100;           // Scrub flag hold time after a jump settles

    // Grid settings
    double baseStepWidth = 10.0;       // Pixels per step at zoom 1.0
    double markerSnapThreshold = 4.0;  // Steps

    // Time signature settings
    int defaultTimeSignatureNumerator = 4;
    int defaultTimeSignatureDenominator = 4;
};

}  // namespace cadence
