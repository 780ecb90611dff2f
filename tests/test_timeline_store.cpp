#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "cadence/daw/core/Config.hpp"
#include "cadence/daw/core/TimelineStore.hpp"

using Catch::Approx;
using cadence::Config;
using cadence::MarkerType;
using cadence::TimelineStore;

TEST_CASE("TimelineStore starts with one tempo and one signature", "[timeline_store]") {
    Config::getInstance().resetToDefaults();
    TimelineStore store;

    REQUIRE(store.getTempoMarkers().size() == 1);
    REQUIRE(store.getTempoMarkers().front().position == 0.0);
    REQUIRE(store.getTempoMarkers().front().bpm == Approx(140.0));

    REQUIRE(store.getTimeSignatures().size() == 1);
    REQUIRE(store.getTimeSignatureAt(100.0).numerator == 4);
    REQUIRE(store.getTimeSignatureAt(100.0).denominator == 4);
    REQUIRE(store.getMarkers().empty());
    REQUIRE(store.isSnapToMarkersEnabled());
}

TEST_CASE("TimelineStore defaults follow Config", "[timeline_store]") {
    Config::getInstance().resetToDefaults();
    Config::getInstance().setDefaultBpm(96.0);
    Config::getInstance().setDefaultTimeSignatureNumerator(7);
    Config::getInstance().setDefaultTimeSignatureDenominator(8);

    TimelineStore store;
    REQUIRE(store.getTempoAt(0.0) == Approx(96.0));
    REQUIRE(store.getBeatsPerBarAt(0.0) == 7);
    REQUIRE(store.getStepsPerBarAt(0.0) == Approx(14.0));

    Config::getInstance().resetToDefaults();
}

TEST_CASE("TimelineStore time signatures", "[timeline_store]") {
    Config::getInstance().resetToDefaults();
    TimelineStore store;

    SECTION("Invalid signatures are rejected") {
        REQUIRE(store.addTimeSignature(16.0, 0, 4) == cadence::INVALID_TIMELINE_ID);
        REQUIRE(store.addTimeSignature(16.0, 3, 5) == cadence::INVALID_TIMELINE_ID);
        REQUIRE(store.addTimeSignature(16.0, 3, 64) == cadence::INVALID_TIMELINE_ID);
        REQUIRE(store.getTimeSignatures().size() == 1);
    }

    SECTION("Signatures stay sorted by position") {
        store.addTimeSignature(48.0, 5, 4);
        store.addTimeSignature(16.0, 3, 4);
        const auto& signatures = store.getTimeSignatures();
        REQUIRE(signatures.size() == 3);
        REQUIRE(signatures[1].position == 16.0);
        REQUIRE(signatures[2].position == 48.0);
        REQUIRE(store.getBeatsPerBarAt(20.0) == 3);
        REQUIRE(store.getBeatsPerBarAt(48.0) == 5);
    }

    SECTION("Adding at an occupied position replaces the entry") {
        auto first = store.addTimeSignature(16.0, 3, 4);
        auto second = store.addTimeSignature(16.0, 6, 8);
        REQUIRE(first == second);
        REQUIRE(store.getTimeSignatures().size() == 2);
        REQUIRE(store.getTimeSignatureAt(16.0).denominator == 8);
    }

    SECTION("The signature at step 0 cannot be removed") {
        auto anchor = store.getTimeSignatures().front().id;
        REQUIRE_FALSE(store.removeTimeSignature(anchor));

        auto change = store.addTimeSignature(32.0, 3, 4);
        REQUIRE(store.removeTimeSignature(change));
        REQUIRE(store.getTimeSignatures().size() == 1);
        REQUIRE_FALSE(store.removeTimeSignature(change));
    }

    SECTION("Updating the anchor keeps it at step 0") {
        auto anchor = store.getTimeSignatures().front().id;
        REQUIRE(store.updateTimeSignature(anchor, 24.0, 3, 4));
        REQUIRE(store.getTimeSignatures().front().position == 0.0);
        REQUIRE(store.getBeatsPerBarAt(0.0) == 3);
    }

    SECTION("Moving onto an occupied position swallows the entry there") {
        auto a = store.addTimeSignature(16.0, 3, 4);
        store.addTimeSignature(32.0, 5, 4);
        REQUIRE(store.updateTimeSignature(a, 32.0, 7, 8));
        REQUIRE(store.getTimeSignatures().size() == 2);
        REQUIRE(store.getTimeSignatureAt(32.0).numerator == 7);
        REQUIRE(store.getTimeSignatureAt(20.0).numerator == 4);
    }
}

TEST_CASE("TimelineStore tempo markers", "[timeline_store]") {
    Config::getInstance().resetToDefaults();
    TimelineStore store;

    REQUIRE(store.addTempoMarker(16.0, 0.0) == cadence::INVALID_TIMELINE_ID);
    REQUIRE(store.addTempoMarker(16.0, -90.0) == cadence::INVALID_TIMELINE_ID);

    auto id = store.addTempoMarker(16.0, 90.0);
    REQUIRE(id != cadence::INVALID_TIMELINE_ID);
    REQUIRE(store.getTempoAt(15.0) == Approx(140.0));
    REQUIRE(store.getTempoAt(16.0) == Approx(90.0));

    REQUIRE(store.updateTempoMarker(id, 32.0, 100.0));
    REQUIRE(store.getTempoAt(20.0) == Approx(140.0));
    REQUIRE(store.getTempoAt(32.0) == Approx(100.0));

    REQUIRE_FALSE(store.removeTempoMarker(store.getTempoMarkers().front().id));
    REQUIRE(store.removeTempoMarker(id));
    REQUIRE(store.getTempoAt(100.0) == Approx(140.0));
}

TEST_CASE("TimelineStore derives contiguous regions", "[timeline_store]") {
    Config::getInstance().resetToDefaults();
    TimelineStore store;
    store.addTempoMarker(32.0, 120.0);
    store.addTimeSignature(64.0, 3, 4);

    auto tempo = store.getTempoRegions();
    REQUIRE(tempo.size() == 2);
    REQUIRE(tempo[0].startStep == 0.0);
    REQUIRE(tempo[0].endStep == 32.0);
    REQUIRE(tempo[1].startStep == 32.0);
    REQUIRE(tempo[1].isOpenEnded());

    auto meter = store.getTimeSignatureRegions();
    REQUIRE(meter.size() == 2);
    REQUIRE(meter[0].endStep == meter[1].startStep);
    REQUIRE(meter[1].numerator == 3);
    REQUIRE(meter[1].isOpenEnded());
}

TEST_CASE("TimelineStore markers", "[timeline_store]") {
    Config::getInstance().resetToDefaults();
    TimelineStore store;

    auto verse = store.addMarker(16.0, "Verse", MarkerType::Section);
    auto chorus = store.addMarker(48.0, "Chorus", MarkerType::Section);
    store.addMarker(8.0, "Intro");

    SECTION("Markers stay sorted") {
        const auto& markers = store.getMarkers();
        REQUIRE(markers.size() == 3);
        REQUIRE(markers[0].name == "Intro");
        REQUIRE(markers[2].name == "Chorus");
    }

    SECTION("Range query is inclusive") {
        auto inRange = store.getMarkersInRange(16.0, 48.0);
        REQUIRE(inRange.size() == 2);
        REQUIRE(inRange[0].id == verse);
        REQUIRE(inRange[1].id == chorus);
    }

    SECTION("Nearest marker needs a distance strictly below the threshold") {
        auto nearest = store.getNearestMarker(18.0, 4.0);
        REQUIRE(nearest.has_value());
        REQUIRE(nearest->id == verse);

        REQUIRE_FALSE(store.getNearestMarker(20.0, 4.0).has_value());
        REQUIRE_FALSE(store.getNearestMarker(32.0, 4.0).has_value());
    }

    SECTION("Update and remove") {
        REQUIRE(store.updateMarker(verse, 60.0, "Bridge"));
        REQUIRE(store.getMarkers().back().name == "Bridge");
        REQUIRE(store.removeMarker(chorus));
        REQUIRE_FALSE(store.removeMarker(chorus));
        REQUIRE(store.getMarkers().size() == 2);
    }
}

TEST_CASE("TimelineStore revision bumps on every edit", "[timeline_store]") {
    Config::getInstance().resetToDefaults();
    TimelineStore store;

    auto revision = store.getRevision();
    store.addMarker(4.0, "A");
    REQUIRE(store.getRevision() > revision);

    revision = store.getRevision();
    store.setSnapToMarkers(false);
    REQUIRE(store.getRevision() > revision);
    REQUIRE_FALSE(store.isSnapToMarkersEnabled());

    revision = store.getRevision();
    store.reset();
    REQUIRE(store.getRevision() > revision);
    REQUIRE(store.getMarkers().empty());
}
