#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <fstream>
#include <string>

#include "cadence/daw/core/Config.hpp"

using Catch::Approx;
using cadence::Config;

namespace {

std::string tempConfigPath(const char* name) {
    return std::string("/tmp/") + name;
}

}  // namespace

TEST_CASE("Config defaults", "[config]") {
    auto& config = Config::getInstance();
    config.resetToDefaults();

    REQUIRE(config.getDefaultBpm() == Approx(140.0));
    REQUIRE(config.getMinBpm() == Approx(60.0));
    REQUIRE(config.getMaxBpm() == Approx(300.0));
    REQUIRE(config.getDefaultLoopStart() == 0.0);
    REQUIRE(config.getDefaultLoopEnd() == Approx(64.0));
    REQUIRE(config.getDefaultLoopEnabled());
    REQUIRE(config.getPositionEpsilon() == Approx(0.01));
    REQUIRE(config.getPositionUpdateIntervalMs() == 16);
    REQUIRE(config.getSmoothJumpSettleMs() == 50);
    REQUIRE(config.getScrubReleaseMs() == 100);
    REQUIRE(config.getBaseStepWidth() == Approx(10.0));
    REQUIRE(config.getMarkerSnapThreshold() == Approx(4.0));
    REQUIRE(config.getDefaultTimeSignatureNumerator() == 4);
    REQUIRE(config.getDefaultTimeSignatureDenominator() == 4);
}

TEST_CASE("Config save and load", "[config]") {
    auto& config = Config::getInstance();
    config.resetToDefaults();

    auto path = tempConfigPath("cadence_test_config.txt");
    config.setDefaultBpm(97.5);
    config.setDefaultLoopEnabled(false);
    config.setSmoothJumpSettleMs(80);
    config.setDefaultTimeSignatureNumerator(6);
    config.setDefaultTimeSignatureDenominator(8);
    config.saveToFile(path);

    config.resetToDefaults();
    REQUIRE(config.getDefaultBpm() == Approx(140.0));

    config.loadFromFile(path);
    REQUIRE(config.getDefaultBpm() == Approx(97.5));
    REQUIRE_FALSE(config.getDefaultLoopEnabled());
    REQUIRE(config.getSmoothJumpSettleMs() == 80);
    REQUIRE(config.getDefaultTimeSignatureNumerator() == 6);
    REQUIRE(config.getDefaultTimeSignatureDenominator() == 8);

    std::remove(path.c_str());
    config.resetToDefaults();
}

TEST_CASE("Config skips malformed and unknown lines", "[config]") {
    auto& config = Config::getInstance();
    config.resetToDefaults();

    auto path = tempConfigPath("cadence_test_config_malformed.txt");
    {
        std::ofstream file(path);
        file << "maxBpm=not-a-number" << std::endl;
        file << "no separator here" << std::endl;
        file << "someFutureKey=12" << std::endl;
        file << "minBpm=40" << std::endl;
    }

    config.loadFromFile(path);
    REQUIRE(config.getMaxBpm() == Approx(300.0));
    REQUIRE(config.getMinBpm() == Approx(40.0));

    std::remove(path.c_str());
    config.resetToDefaults();
}

TEST_CASE("Config load from a missing file keeps current values", "[config]") {
    auto& config = Config::getInstance();
    config.resetToDefaults();
    config.setScrubReleaseMs(250);

    config.loadFromFile(tempConfigPath("cadence_missing_config_file.txt"));
    REQUIRE(config.getScrubReleaseMs() == 250);

    config.resetToDefaults();
}
