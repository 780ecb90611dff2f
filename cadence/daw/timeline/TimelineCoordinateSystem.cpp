#include "TimelineCoordinateSystem.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

#include "../core/Config.hpp"

namespace cadence {

namespace {

// Absorbs floating point noise when a position lands on a bar or beat boundary
constexpr double kBoundaryTolerance = 1e-9;

// Largest number of lines a single grid query may produce
constexpr size_t kMaxGridLines = 100000;

int floorWithTolerance(double value) {
    return static_cast<int>(std::floor(value + kBoundaryTolerance));
}

}  // namespace

TimelineCoordinateSystem::TimelineCoordinateSystem(const TimelineStoreInterface& store)
    : store_(store) {
    auto& config = Config::getInstance();
    defaultStepWidth_ = config.getBaseStepWidth();
    defaultMarkerThreshold_ = config.getMarkerSnapThreshold();
}

// ===== Cache =====

void TimelineCoordinateSystem::clearCache() const {
    regions_ = RegionCache();
    stepWidth_ = StepWidthCache();
}

const TimelineCoordinateSystem::RegionCache& TimelineCoordinateSystem::getRegions() const {
    if (!regions_.valid || regions_.revision != store_.getRevision())
        rebuildRegions();
    return regions_;
}

void TimelineCoordinateSystem::rebuildRegions() const {
    RegionCache cache;
    cache.revision = store_.getRevision();
    cache.tempoRegions = store_.getTempoRegions();
    cache.meterRegions = store_.getTimeSignatureRegions();

    if (cache.tempoRegions.empty()) {
        DBG("TimelineCoordinateSystem: store returned no tempo regions, using default tempo");
        cache.tempoRegions.push_back({0.0, kOpenEnd, Config::getInstance().getDefaultBpm()});
    }
    if (cache.meterRegions.empty()) {
        DBG("TimelineCoordinateSystem: store returned no meter regions, using 4/4");
        cache.meterRegions.push_back({0.0, kOpenEnd, 4, 4});
    }

    double elapsedMs = 0.0;
    for (const auto& region : cache.tempoRegions) {
        cache.msBeforeRegion.push_back(elapsedMs);
        if (!region.isOpenEnded())
            elapsedMs += (region.endStep - region.startStep) * getMsPerStep(region.bpm);
    }

    int bars = 0;
    for (const auto& region : cache.meterRegions) {
        cache.barsBeforeRegion.push_back(bars);
        if (!region.isOpenEnded())
            bars += countBars(region);
    }

    cache.valid = true;
    regions_ = std::move(cache);
}

int TimelineCoordinateSystem::countBars(const TimeSignatureRegion& region) {
    double stepsPerBar = region.getTimeSignature().getStepsPerBar();
    double length = region.endStep - region.startStep;
    if (length <= 0.0 || stepsPerBar <= 0.0)
        return 0;
    // A trailing partial bar still occupies a bar number
    return static_cast<int>(std::ceil(length / stepsPerBar - kBoundaryTolerance));
}

double TimelineCoordinateSystem::getStepWidth(double zoom, double baseStepWidth) const {
    if (!stepWidth_.valid || stepWidth_.zoom != zoom ||
        stepWidth_.baseStepWidth != baseStepWidth) {
        stepWidth_.valid = true;
        stepWidth_.zoom = zoom;
        stepWidth_.baseStepWidth = baseStepWidth;
        stepWidth_.stepWidth = baseStepWidth * zoom;
    }
    return stepWidth_.stepWidth;
}

size_t TimelineCoordinateSystem::findMeterRegion(double step) const {
    const auto& meter = getRegions().meterRegions;
    auto it = std::upper_bound(
        meter.begin(), meter.end(), step,
        [](double value, const TimeSignatureRegion& region) { return value < region.startStep; });
    if (it == meter.begin())
        return 0;
    return static_cast<size_t>(std::distance(meter.begin(), it)) - 1;
}

size_t TimelineCoordinateSystem::findTempoRegionForStep(double step) const {
    const auto& tempo = getRegions().tempoRegions;
    auto it = std::upper_bound(
        tempo.begin(), tempo.end(), step,
        [](double value, const TempoRegion& region) { return value < region.startStep; });
    if (it == tempo.begin())
        return 0;
    return static_cast<size_t>(std::distance(tempo.begin(), it)) - 1;
}

// ===== Step <-> Pixel =====

double TimelineCoordinateSystem::stepToPixel(double step, double zoom,
                                             double baseStepWidth) const {
    return step * getStepWidth(zoom, baseStepWidth);
}

double TimelineCoordinateSystem::pixelToStep(double pixel, double zoom,
                                             double baseStepWidth) const {
    double stepWidth = getStepWidth(zoom, baseStepWidth);
    if (stepWidth <= 0.0)
        return 0.0;
    return pixel / stepWidth;
}

// ===== Step <-> Bar/Beat =====

BarBeatPosition TimelineCoordinateSystem::stepToBarBeat(double step) const {
    step = std::max(0.0, step);

    const auto& cache = getRegions();
    size_t index = findMeterRegion(step);
    const auto& region = cache.meterRegions[index];
    auto timeSignature = region.getTimeSignature();

    double stepsPerBar = timeSignature.getStepsPerBar();
    double stepsPerBeat = timeSignature.getStepsPerBeat();
    double offset = step - region.startStep;

    int barInRegion = std::max(0, floorWithTolerance(offset / stepsPerBar));
    double remaining = std::max(0.0, offset - barInRegion * stepsPerBar);

    int beat = std::clamp(floorWithTolerance(remaining / stepsPerBeat), 0,
                          timeSignature.getBeatsInBar() - 1);
    double subdivision = std::max(0.0, remaining - beat * stepsPerBeat);

    BarBeatPosition position;
    position.bar = cache.barsBeforeRegion[index] + barInRegion;
    position.beat = beat;
    position.subdivision = subdivision;
    position.timeSignature = timeSignature;
    return position;
}

double TimelineCoordinateSystem::barBeatToStep(int bar, int beat, double subdivision) const {
    bar = std::max(0, bar);

    const auto& cache = getRegions();
    size_t index = cache.meterRegions.size() - 1;
    for (size_t i = 0; i + 1 < cache.meterRegions.size(); ++i) {
        if (bar < cache.barsBeforeRegion[i + 1]) {
            index = i;
            break;
        }
    }

    const auto& region = cache.meterRegions[index];
    auto timeSignature = region.getTimeSignature();
    int barInRegion = bar - cache.barsBeforeRegion[index];

    double step = region.startStep + barInRegion * timeSignature.getStepsPerBar() +
                  beat * timeSignature.getStepsPerBeat() + subdivision;
    return std::max(0.0, step);
}

// ===== Step <-> Milliseconds =====

double TimelineCoordinateSystem::getMsPerStep(double bpm) {
    double msPerBeat = kMsPerMinute / bpm;
    return msPerBeat / kStepsPerQuarterNote;
}

double TimelineCoordinateSystem::stepToMs(double step) const {
    if (step <= 0.0)
        return 0.0;

    const auto& cache = getRegions();
    size_t index = findTempoRegionForStep(step);
    const auto& region = cache.tempoRegions[index];

    // Whole regions before the target come from the prefix sum, then the partial region
    return cache.msBeforeRegion[index] + (step - region.startStep) * getMsPerStep(region.bpm);
}

double TimelineCoordinateSystem::msToStep(double ms) const {
    if (ms <= 0.0)
        return 0.0;

    const auto& cache = getRegions();
    const auto& msBefore = cache.msBeforeRegion;

    // Last region whose start time is at or before ms; the open-ended tail absorbs the rest
    auto it = std::upper_bound(msBefore.begin(), msBefore.end(), ms);
    size_t index = (it == msBefore.begin())
                       ? 0
                       : static_cast<size_t>(std::distance(msBefore.begin(), it)) - 1;

    const auto& region = cache.tempoRegions[index];
    double remainingMs = ms - msBefore[index];
    return region.startStep + remainingMs / getMsPerStep(region.bpm);
}

double TimelineCoordinateSystem::getTempoAt(double step) const {
    return store_.getTempoAt(step);
}

// ===== Grid =====

std::vector<double> TimelineCoordinateSystem::getGridSnapPositions(double startStep,
                                                                   double endStep,
                                                                   double snapValue) const {
    std::vector<double> positions;
    if (snapValue <= 0.0 || !std::isfinite(endStep) || endStep < startStep)
        return positions;

    // Index-based so long ranges do not accumulate addition error
    auto first = static_cast<long long>(std::ceil(startStep / snapValue - kBoundaryTolerance));
    for (long long k = first;; ++k) {
        double position = k * snapValue;
        if (position > endStep + kBoundaryTolerance)
            break;
        if (positions.size() >= kMaxGridLines) {
            DBG("TimelineCoordinateSystem::getGridSnapPositions - capped at "
                << static_cast<int>(kMaxGridLines) << " positions");
            break;
        }
        positions.push_back(position);
    }

    return positions;
}

std::vector<GridLine> TimelineCoordinateSystem::getBarLinePositions(double startStep,
                                                                    double endStep) const {
    std::vector<GridLine> lines;
    if (!std::isfinite(endStep) || endStep < startStep) {
        DBG("TimelineCoordinateSystem::getBarLinePositions - unbounded or empty range");
        return lines;
    }

    for (const auto& region : getRegions().meterRegions) {
        if (region.startStep > endStep)
            break;
        if (region.endStep <= startStep)
            continue;

        auto timeSignature = region.getTimeSignature();
        double stepsPerBar = timeSignature.getStepsPerBar();
        double visibleStart = std::max(region.startStep, startStep);

        auto firstBar = static_cast<long long>(
            std::ceil((visibleStart - region.startStep) / stepsPerBar - kBoundaryTolerance));

        // Region end is exclusive: a bar at the boundary belongs to the next signature
        for (long long k = firstBar;; ++k) {
            double position = region.startStep + k * stepsPerBar;
            if (position >= region.endStep || position > endStep)
                break;
            if (lines.size() >= kMaxGridLines) {
                DBG("TimelineCoordinateSystem::getBarLinePositions - capped at "
                    << static_cast<int>(kMaxGridLines) << " lines");
                return lines;
            }
            lines.push_back({position, timeSignature});
        }
    }

    return lines;
}

std::vector<GridLine> TimelineCoordinateSystem::getBeatLinePositions(double startStep,
                                                                     double endStep) const {
    std::vector<GridLine> lines;
    if (!std::isfinite(endStep) || endStep < startStep) {
        DBG("TimelineCoordinateSystem::getBeatLinePositions - unbounded or empty range");
        return lines;
    }

    for (const auto& region : getRegions().meterRegions) {
        if (region.startStep > endStep)
            break;
        if (region.endStep <= startStep)
            continue;

        auto timeSignature = region.getTimeSignature();
        double stepsPerBar = timeSignature.getStepsPerBar();
        double stepsPerBeat = timeSignature.getStepsPerBeat();
        double visibleStart = std::max(region.startStep, startStep);

        // Beats restart at every bar; the bar line owns beat 0
        auto firstBar = static_cast<long long>(
            std::floor((visibleStart - region.startStep) / stepsPerBar + kBoundaryTolerance));

        bool regionDone = false;
        for (long long bar = firstBar; !regionDone; ++bar) {
            double barStart = region.startStep + bar * stepsPerBar;
            if (barStart >= region.endStep || barStart > endStep)
                break;

            for (int beat = 1; beat < timeSignature.getBeatsInBar(); ++beat) {
                double position = barStart + beat * stepsPerBeat;
                if (position >= region.endStep || position > endStep) {
                    regionDone = true;
                    break;
                }
                if (position < startStep - kBoundaryTolerance)
                    continue;
                if (lines.size() >= kMaxGridLines) {
                    DBG("TimelineCoordinateSystem::getBeatLinePositions - capped at "
                        << static_cast<int>(kMaxGridLines) << " lines");
                    return lines;
                }
                lines.push_back({position, timeSignature});
            }
        }
    }

    return lines;
}

// ===== Snapping =====

double TimelineCoordinateSystem::snapToGrid(double step, double snapValue) {
    if (snapValue <= 0.0)
        return step;
    return std::round(step / snapValue) * snapValue;
}

double TimelineCoordinateSystem::snapToBar(double step) const {
    auto position = stepToBarBeat(step);
    double barStart = barBeatToStep(position.bar, 0, 0.0);
    double nextBarStart = barBeatToStep(position.bar + 1, 0, 0.0);

    return (step - barStart < nextBarStart - step) ? barStart : nextBarStart;
}

double TimelineCoordinateSystem::snapToBeat(double step) const {
    auto position = stepToBarBeat(step);
    double beatStart = barBeatToStep(position.bar, position.beat, 0.0);

    // The last beat of a truncated bar ends at the next bar start
    double nextBarStart = barBeatToStep(position.bar + 1, 0, 0.0);
    double nextBeatStart =
        std::min(beatStart + position.timeSignature.getStepsPerBeat(), nextBarStart);

    return (step - beatStart < nextBeatStart - step) ? beatStart : nextBeatStart;
}

double TimelineCoordinateSystem::snapToMarker(double step, double threshold) const {
    if (!store_.isSnapToMarkersEnabled())
        return step;

    auto nearest = store_.getNearestMarker(step, threshold);
    if (nearest)
        return nearest->position;

    return step;
}

TimeSignature TimelineCoordinateSystem::getTimeSignatureAt(double step) const {
    const auto& meter = getRegions().meterRegions;
    return meter[findMeterRegion(std::max(0.0, step))].getTimeSignature();
}

// ===== Formatting =====

std::string TimelineCoordinateSystem::formatPosition(double step) const {
    auto position = stepToBarBeat(step);
    int subdivision = floorWithTolerance(position.subdivision);

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%d:%d:%d", position.bar + 1, position.beat + 1,
                  subdivision + 1);
    return std::string(buffer);
}

std::string TimelineCoordinateSystem::formatTimecode(double step) const {
    double ms = stepToMs(step);
    auto totalMs = static_cast<long long>(std::floor(ms));
    long long totalSeconds = totalMs / 1000;
    long long minutes = totalSeconds / 60;
    long long seconds = totalSeconds % 60;
    long long milliseconds = totalMs % 1000;

    char buffer[48];
    std::snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%03lld", minutes, seconds, milliseconds);
    return std::string(buffer);
}

}  // namespace cadence
