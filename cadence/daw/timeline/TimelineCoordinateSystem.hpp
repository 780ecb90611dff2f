#pragma once

#include <juce_core/juce_core.h>

#include <cstdint>
#include <string>
#include <vector>

#include "cadence/core/interfaces/timeline_store_interface.hpp"
#include "cadence/core/timeline_types.hpp"

namespace cadence {

/**
 * @brief Conversions between steps, pixels, bars/beats and milliseconds
 *
 * Steps are the internal time unit (one sixteenth note). Tempo and time
 * signature may change at arbitrary step positions; both maps are read from
 * the TimelineStoreInterface and memoized per store revision, so an edit to
 * the store is picked up by the next call without any explicit notification.
 *
 * Bar numbering is continuous across time signature changes: the bar index
 * at a region start is the number of bars (a trailing partial bar included)
 * in all prior regions.
 *
 * Not thread-safe; call from the message thread.
 */
class TimelineCoordinateSystem {
  public:
    explicit TimelineCoordinateSystem(const TimelineStoreInterface& store);
    ~TimelineCoordinateSystem() = default;

    // ===== Step <-> Pixel =====

    double stepToPixel(double step, double zoom, double baseStepWidth) const;
    double stepToPixel(double step, double zoom = 1.0) const {
        return stepToPixel(step, zoom, defaultStepWidth_);
    }

    /** Exact inverse of stepToPixel; returns 0 for a non-positive step width */
    double pixelToStep(double pixel, double zoom, double baseStepWidth) const;
    double pixelToStep(double pixel, double zoom = 1.0) const {
        return pixelToStep(pixel, zoom, defaultStepWidth_);
    }

    // ===== Step <-> Bar/Beat =====

    BarBeatPosition stepToBarBeat(double step) const;
    double barBeatToStep(int bar, int beat = 0, double subdivision = 0.0) const;

    int getBarAtStep(double step) const {
        return stepToBarBeat(step).bar;
    }
    int getBeatAtStep(double step) const {
        return stepToBarBeat(step).beat;
    }

    // ===== Step <-> Milliseconds =====

    double stepToMs(double step) const;
    double msToStep(double ms) const;

    static double getMsPerStep(double bpm);
    double getTempoAt(double step) const;

    // ===== Grid =====

    /** Multiples of snapValue within [startStep, endStep] */
    std::vector<double> getGridSnapPositions(double startStep, double endStep,
                                             double snapValue) const;

    /** Bar starts within [startStep, endStep]; a signature change is reported once */
    std::vector<GridLine> getBarLinePositions(double startStep, double endStep) const;

    /** Beat starts within [startStep, endStep], excluding positions that are bar lines */
    std::vector<GridLine> getBeatLinePositions(double startStep, double endStep) const;

    // ===== Snapping =====

    static double snapToGrid(double step, double snapValue);
    double snapToBar(double step) const;
    double snapToBeat(double step) const;
    double snapToMarker(double step, double threshold) const;
    double snapToMarker(double step) const {
        return snapToMarker(step, defaultMarkerThreshold_);
    }

    // ===== Meter queries =====

    TimeSignature getTimeSignatureAt(double step) const;
    double getStepsPerBarAt(double step) const {
        return getTimeSignatureAt(step).getStepsPerBar();
    }
    int getBeatsPerBarAt(double step) const {
        return getTimeSignatureAt(step).numerator;
    }

    // ===== Formatting =====

    /** 1-based "bar:beat:subdivision", e.g. "1:1:1" */
    std::string formatPosition(double step) const;

    /** "MM:SS:mmm" derived from stepToMs */
    std::string formatTimecode(double step) const;

    /**
     * @brief Drop every memoized value
     * Needed only when the store cannot bump its revision for an edit.
     */
    void clearCache() const;

  private:
    // Region snapshot and prefix sums derived from one store revision
    struct RegionCache {
        bool valid = false;
        uint64_t revision = 0;
        std::vector<TempoRegion> tempoRegions;
        std::vector<double> msBeforeRegion;  // ms elapsed at each tempo region start
        std::vector<TimeSignatureRegion> meterRegions;
        std::vector<int> barsBeforeRegion;  // bar index at each meter region start
    };

    // Step width memo keyed on zoom and base width
    struct StepWidthCache {
        bool valid = false;
        double zoom = 0.0;
        double baseStepWidth = 0.0;
        double stepWidth = 0.0;
    };

    const TimelineStoreInterface& store_;
    double defaultStepWidth_;
    double defaultMarkerThreshold_;

    mutable RegionCache regions_;
    mutable StepWidthCache stepWidth_;

    const RegionCache& getRegions() const;
    void rebuildRegions() const;
    double getStepWidth(double zoom, double baseStepWidth) const;

    size_t findMeterRegion(double step) const;
    size_t findTempoRegionForStep(double step) const;

    static int countBars(const TimeSignatureRegion& region);

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(TimelineCoordinateSystem)
};

}  // namespace cadence
