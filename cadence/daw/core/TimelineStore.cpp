#include "TimelineStore.hpp"

#include <juce_core/juce_core.h>

#include <algorithm>
#include <cmath>

#include "Config.hpp"

namespace cadence {

TimelineStore::TimelineStore() {
    reset();
}

bool TimelineStore::isValidTimeSignature(int numerator, int denominator) {
    if (numerator < 1 || denominator < 1 || denominator > 32)
        return false;
    // Denominator must be a power of two note value
    return (denominator & (denominator - 1)) == 0;
}

// ===== Time Signatures =====

TimeSignatureId TimelineStore::addTimeSignature(double position, int numerator, int denominator) {
    if (!isValidTimeSignature(numerator, denominator)) {
        DBG("TimelineStore::addTimeSignature - rejected " << numerator << "/" << denominator);
        return INVALID_TIMELINE_ID;
    }

    position = std::max(0.0, position);

    // A change at an occupied position replaces the existing one
    for (auto& ts : timeSignatures_) {
        if (ts.position == position) {
            ts.numerator = numerator;
            ts.denominator = denominator;
            touch();
            return ts.id;
        }
    }

    TimeSignatureMarker ts;
    ts.id = nextId_++;
    ts.position = position;
    ts.numerator = numerator;
    ts.denominator = denominator;
    timeSignatures_.push_back(ts);
    sortTimeSignatures();
    touch();
    return ts.id;
}

bool TimelineStore::removeTimeSignature(TimeSignatureId id) {
    auto it = std::find_if(timeSignatures_.begin(), timeSignatures_.end(),
                           [id](const TimeSignatureMarker& ts) { return ts.id == id; });

    // The signature at step 0 anchors the meter map
    if (it == timeSignatures_.end() || it == timeSignatures_.begin())
        return false;

    timeSignatures_.erase(it);
    touch();
    return true;
}

bool TimelineStore::updateTimeSignature(TimeSignatureId id, double position, int numerator,
                                        int denominator) {
    if (!isValidTimeSignature(numerator, denominator))
        return false;

    auto it = std::find_if(timeSignatures_.begin(), timeSignatures_.end(),
                           [id](const TimeSignatureMarker& ts) { return ts.id == id; });
    if (it == timeSignatures_.end())
        return false;

    // The anchor never moves off step 0
    position = (it == timeSignatures_.begin()) ? 0.0 : std::max(0.0, position);

    it->numerator = numerator;
    it->denominator = denominator;

    if (it->position != position) {
        it->position = position;
        // Moving onto an occupied position swallows the entry that was there
        timeSignatures_.erase(std::remove_if(timeSignatures_.begin(), timeSignatures_.end(),
                                             [id, position](const TimeSignatureMarker& ts) {
                                                 return ts.id != id && ts.position == position;
                                             }),
                              timeSignatures_.end());
        sortTimeSignatures();
    }

    touch();
    return true;
}

TimeSignature TimelineStore::getTimeSignatureAt(double step) const {
    const TimeSignatureMarker* current = &timeSignatures_.front();
    for (const auto& ts : timeSignatures_) {
        if (ts.position <= step)
            current = &ts;
        else
            break;
    }
    return {current->numerator, current->denominator};
}

double TimelineStore::getStepsPerBarAt(double step) const {
    return getTimeSignatureAt(step).getStepsPerBar();
}

int TimelineStore::getBeatsPerBarAt(double step) const {
    return getTimeSignatureAt(step).numerator;
}

// ===== Tempo =====

TempoMarkerId TimelineStore::addTempoMarker(double position, double bpm) {
    if (!(bpm > 0.0) || !std::isfinite(bpm)) {
        DBG("TimelineStore::addTempoMarker - rejected bpm " << bpm);
        return INVALID_TIMELINE_ID;
    }

    position = std::max(0.0, position);

    for (auto& tempo : tempoMarkers_) {
        if (tempo.position == position) {
            tempo.bpm = bpm;
            touch();
            return tempo.id;
        }
    }

    TempoMarker tempo;
    tempo.id = nextId_++;
    tempo.position = position;
    tempo.bpm = bpm;
    tempoMarkers_.push_back(tempo);
    sortTempoMarkers();
    touch();
    return tempo.id;
}

bool TimelineStore::removeTempoMarker(TempoMarkerId id) {
    auto it = std::find_if(tempoMarkers_.begin(), tempoMarkers_.end(),
                           [id](const TempoMarker& t) { return t.id == id; });
    if (it == tempoMarkers_.end() || it == tempoMarkers_.begin())
        return false;

    tempoMarkers_.erase(it);
    touch();
    return true;
}

bool TimelineStore::updateTempoMarker(TempoMarkerId id, double position, double bpm) {
    if (!(bpm > 0.0) || !std::isfinite(bpm))
        return false;

    auto it = std::find_if(tempoMarkers_.begin(), tempoMarkers_.end(),
                           [id](const TempoMarker& t) { return t.id == id; });
    if (it == tempoMarkers_.end())
        return false;

    position = (it == tempoMarkers_.begin()) ? 0.0 : std::max(0.0, position);
    it->bpm = bpm;

    if (it->position != position) {
        it->position = position;
        tempoMarkers_.erase(std::remove_if(tempoMarkers_.begin(), tempoMarkers_.end(),
                                           [id, position](const TempoMarker& t) {
                                               return t.id != id && t.position == position;
                                           }),
                            tempoMarkers_.end());
        sortTempoMarkers();
    }

    touch();
    return true;
}

double TimelineStore::getTempoAt(double step) const {
    const TempoMarker* current = &tempoMarkers_.front();
    for (const auto& tempo : tempoMarkers_) {
        if (tempo.position <= step)
            current = &tempo;
        else
            break;
    }
    return current->bpm;
}

// ===== Markers =====

MarkerId TimelineStore::addMarker(double position, const std::string& name, MarkerType type) {
    TimelineMarker marker;
    marker.id = nextId_++;
    marker.position = std::max(0.0, position);
    marker.name = name;
    marker.type = type;
    markers_.push_back(marker);
    sortMarkers();
    touch();
    return marker.id;
}

bool TimelineStore::removeMarker(MarkerId id) {
    auto it = std::find_if(markers_.begin(), markers_.end(),
                           [id](const TimelineMarker& m) { return m.id == id; });
    if (it == markers_.end())
        return false;

    markers_.erase(it);
    touch();
    return true;
}

bool TimelineStore::updateMarker(MarkerId id, double position, const std::string& name) {
    auto it = std::find_if(markers_.begin(), markers_.end(),
                           [id](const TimelineMarker& m) { return m.id == id; });
    if (it == markers_.end())
        return false;

    it->position = std::max(0.0, position);
    it->name = name;
    sortMarkers();
    touch();
    return true;
}

std::vector<TimelineMarker> TimelineStore::getMarkersInRange(double startStep,
                                                             double endStep) const {
    std::vector<TimelineMarker> result;
    for (const auto& marker : markers_) {
        if (marker.position >= startStep && marker.position <= endStep)
            result.push_back(marker);
    }
    return result;
}

std::optional<TimelineMarker> TimelineStore::getNearestMarker(double step,
                                                              double threshold) const {
    std::optional<TimelineMarker> nearest;
    double minDistance = threshold;

    for (const auto& marker : markers_) {
        double distance = std::abs(marker.position - step);
        if (distance < minDistance) {
            minDistance = distance;
            nearest = marker;
        }
    }

    return nearest;
}

// ===== Display Settings =====

void TimelineStore::setDisplaySettings(const TimelineDisplaySettings& settings) {
    displaySettings_ = settings;
    touch();
}

void TimelineStore::setSnapToMarkers(bool enabled) {
    displaySettings_.snapToMarkers = enabled;
    touch();
}

void TimelineStore::reset() {
    auto& config = Config::getInstance();

    tempoMarkers_.clear();
    timeSignatures_.clear();
    markers_.clear();

    TempoMarker tempo;
    tempo.id = nextId_++;
    tempo.position = 0.0;
    tempo.bpm = config.getDefaultBpm();
    tempoMarkers_.push_back(tempo);

    TimeSignatureMarker ts;
    ts.id = nextId_++;
    ts.position = 0.0;
    ts.numerator = config.getDefaultTimeSignatureNumerator();
    ts.denominator = config.getDefaultTimeSignatureDenominator();
    if (!isValidTimeSignature(ts.numerator, ts.denominator)) {
        ts.numerator = 4;
        ts.denominator = 4;
    }
    timeSignatures_.push_back(ts);

    touch();
}

// ===== Region Derivation =====

std::vector<TempoRegion> TimelineStore::getTempoRegions() const {
    std::vector<TempoRegion> regions;
    regions.reserve(tempoMarkers_.size());

    for (size_t i = 0; i < tempoMarkers_.size(); ++i) {
        TempoRegion region;
        region.startStep = tempoMarkers_[i].position;
        region.endStep =
            (i + 1 < tempoMarkers_.size()) ? tempoMarkers_[i + 1].position : kOpenEnd;
        region.bpm = tempoMarkers_[i].bpm;
        regions.push_back(region);
    }

    return regions;
}

std::vector<TimeSignatureRegion> TimelineStore::getTimeSignatureRegions() const {
    std::vector<TimeSignatureRegion> regions;
    regions.reserve(timeSignatures_.size());

    for (size_t i = 0; i < timeSignatures_.size(); ++i) {
        TimeSignatureRegion region;
        region.startStep = timeSignatures_[i].position;
        region.endStep =
            (i + 1 < timeSignatures_.size()) ? timeSignatures_[i + 1].position : kOpenEnd;
        region.numerator = timeSignatures_[i].numerator;
        region.denominator = timeSignatures_[i].denominator;
        regions.push_back(region);
    }

    return regions;
}

// ===== Sorting =====

void TimelineStore::sortTempoMarkers() {
    std::stable_sort(tempoMarkers_.begin(), tempoMarkers_.end(),
                     [](const TempoMarker& a, const TempoMarker& b) {
                         return a.position < b.position;
                     });
}

void TimelineStore::sortTimeSignatures() {
    std::stable_sort(timeSignatures_.begin(), timeSignatures_.end(),
                     [](const TimeSignatureMarker& a, const TimeSignatureMarker& b) {
                         return a.position < b.position;
                     });
}

void TimelineStore::sortMarkers() {
    std::stable_sort(markers_.begin(), markers_.end(),
                     [](const TimelineMarker& a, const TimelineMarker& b) {
                         return a.position < b.position;
                     });
}

}  // namespace cadence
