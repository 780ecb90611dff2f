#include "Config.hpp"

#include <fstream>
#include <iostream>

namespace cadence {

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

void Config::resetToDefaults() {
    *this = Config();
}

void Config::saveToFile(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file for writing: " << filename << std::endl;
        return;
    }

    file << "defaultBpm=" << defaultBpm << std::endl;
    file << "minBpm=" << minBpm << std::endl;
    file << "maxBpm=" << maxBpm << std::endl;
    file << "defaultLoopStart=" << defaultLoopStart << std::endl;
    file << "defaultLoopEnd=" << defaultLoopEnd << std::endl;
    file << "defaultLoopEnabled=" << (defaultLoopEnabled ? 1 : 0) << std::endl;
    file << "positionEpsilon=" << positionEpsilon << std::endl;
    file << "positionUpdateIntervalMs=" << positionUpdateIntervalMs << std::endl;
    file << "smoothJumpSettleMs=" << smoothJumpSettleMs << std::endl;
    file << "scrubReleaseMs=" << scrubReleaseMs << std::endl;
    file << "baseStepWidth=" << baseStepWidth << std::endl;
    file << "markerSnapThreshold=" << markerSnapThreshold << std::endl;
    file << "defaultTimeSignatureNumerator=" << defaultTimeSignatureNumerator << std::endl;
    file << "defaultTimeSignatureDenominator=" << defaultTimeSignatureDenominator << std::endl;

    file.close();
    std::cout << "Config saved to: " << filename << std::endl;
}

void Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cout << "Config file not found, using defaults: " << filename << std::endl;
        return;
    }

    std::string line;
    while (std::getline(file, line)) {
        size_t equalPos = line.find('=');
        if (equalPos == std::string::npos)
            continue;

        std::string key = line.substr(0, equalPos);
        std::string value = line.substr(equalPos + 1);

        parseConfigLine(key, value);
    }

    file.close();
    std::cout << "Config loaded from: " << filename << std::endl;
}

void Config::parseConfigLine(const std::string& key, const std::string& value) {
    try {
        double numValue = std::stod(value);

        if (key == "defaultBpm") {
            defaultBpm = numValue;
        } else if (key == "minBpm") {
            minBpm = numValue;
        } else if (key == "maxBpm") {
            maxBpm = numValue;
        } else if (key == "defaultLoopStart") {
            defaultLoopStart = numValue;
        } else if (key == "defaultLoopEnd") {
            defaultLoopEnd = numValue;
        } else if (key == "defaultLoopEnabled") {
            defaultLoopEnabled = (numValue != 0);
        } else if (key == "positionEpsilon") {
            positionEpsilon = numValue;
        } else if (key == "positionUpdateIntervalMs") {
            positionUpdateIntervalMs = static_cast<int>(numValue);
        } else if (key == "smoothJumpSettleMs") {
            smoothJumpSettleMs = static_cast<int>(numValue);
        } else if (key == "scrubReleaseMs") {
            scrubReleaseMs = static_cast<int>(numValue);
        } else if (key == "baseStepWidth") {
            baseStepWidth = numValue;
        } else if (key == "markerSnapThreshold") {
            markerSnapThreshold = numValue;
        } else if (key == "defaultTimeSignatureNumerator") {
            defaultTimeSignatureNumerator = static_cast<int>(numValue);
        } else if (key == "defaultTimeSignatureDenominator") {
            defaultTimeSignatureDenominator = static_cast<int>(numValue);
        }
        // Skip unknown keys silently
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config value: " << key << "=" << value << " (" << e.what()
                  << ")" << std::endl;
    }
}

}  // namespace cadence
