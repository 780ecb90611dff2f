#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cadence/core/interfaces/timeline_store_interface.hpp"

namespace cadence {

using TempoMarkerId = int;
using TimeSignatureId = int;
constexpr int INVALID_TIMELINE_ID = -1;

/**
 * @brief A tempo change starting at a step position
 */
struct TempoMarker {
    TempoMarkerId id = INVALID_TIMELINE_ID;
    double position = 0.0;
    double bpm = 120.0;
};

/**
 * @brief A time signature change starting at a step position
 */
struct TimeSignatureMarker {
    TimeSignatureId id = INVALID_TIMELINE_ID;
    double position = 0.0;
    int numerator = 4;
    int denominator = 4;
};

/**
 * @brief Ruler display settings
 */
struct TimelineDisplaySettings {
    bool snapToMarkers = true;
    bool showBars = true;
    bool showBeats = true;
    bool showSubdivisions = true;
};

/**
 * @brief Owns the tempo map, meter map and markers of the timeline
 *
 * Tempo markers and time signatures are kept sorted by position. The first
 * entry of each list sits at step 0 and cannot be removed, so the derived
 * regions always cover [0, infinity). Every edit bumps the revision, which
 * the coordinate system uses to invalidate its cache.
 */
class TimelineStore : public TimelineStoreInterface {
  public:
    TimelineStore();
    ~TimelineStore() override = default;

    // ===== Time Signatures =====

    /**
     * @brief Add a time signature change
     * @return New id, or the id of the replaced entry when one already sits at position
     */
    TimeSignatureId addTimeSignature(double position, int numerator, int denominator);

    /**
     * @brief Remove a time signature (the one at step 0 is protected)
     * @return true if removed
     */
    bool removeTimeSignature(TimeSignatureId id);

    bool updateTimeSignature(TimeSignatureId id, double position, int numerator, int denominator);

    const std::vector<TimeSignatureMarker>& getTimeSignatures() const {
        return timeSignatures_;
    }

    TimeSignature getTimeSignatureAt(double step) const;
    double getStepsPerBarAt(double step) const;
    int getBeatsPerBarAt(double step) const;

    // ===== Tempo =====

    TempoMarkerId addTempoMarker(double position, double bpm);
    bool removeTempoMarker(TempoMarkerId id);
    bool updateTempoMarker(TempoMarkerId id, double position, double bpm);

    const std::vector<TempoMarker>& getTempoMarkers() const {
        return tempoMarkers_;
    }

    // ===== Markers =====

    MarkerId addMarker(double position, const std::string& name,
                       MarkerType type = MarkerType::Bookmark);
    bool removeMarker(MarkerId id);
    bool updateMarker(MarkerId id, double position, const std::string& name);

    const std::vector<TimelineMarker>& getMarkers() const {
        return markers_;
    }

    /** Markers with start <= position <= end */
    std::vector<TimelineMarker> getMarkersInRange(double startStep, double endStep) const;

    // ===== Display Settings =====

    const TimelineDisplaySettings& getDisplaySettings() const {
        return displaySettings_;
    }
    void setDisplaySettings(const TimelineDisplaySettings& settings);
    void setSnapToMarkers(bool enabled);

    /**
     * @brief Back to a single default-tempo marker and one default signature
     */
    void reset();

    // ===== TimelineStoreInterface =====

    std::vector<TempoRegion> getTempoRegions() const override;
    std::vector<TimeSignatureRegion> getTimeSignatureRegions() const override;
    double getTempoAt(double step) const override;
    std::optional<TimelineMarker> getNearestMarker(double step, double threshold) const override;
    bool isSnapToMarkersEnabled() const override {
        return displaySettings_.snapToMarkers;
    }
    uint64_t getRevision() const override {
        return revision_;
    }

  private:
    std::vector<TempoMarker> tempoMarkers_;
    std::vector<TimeSignatureMarker> timeSignatures_;
    std::vector<TimelineMarker> markers_;
    TimelineDisplaySettings displaySettings_;

    int nextId_ = 1;
    uint64_t revision_ = 0;

    void sortTempoMarkers();
    void sortTimeSignatures();
    void sortMarkers();
    void touch() {
        ++revision_;
    }

    static bool isValidTimeSignature(int numerator, int denominator);
};

}  // namespace cadence
