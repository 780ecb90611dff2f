#pragma once

#include <cmath>
#include <limits>
#include <string>

namespace cadence {

/**
 * @brief Timeline position types shared by the store and the coordinate system
 *
 * All positions are in steps (one step = one sixteenth note). Steps may be
 * fractional. Region end positions are exclusive; the last region of a list
 * ends at kOpenEnd.
 */

using MarkerId = int;
constexpr MarkerId INVALID_MARKER_ID = -1;

constexpr double kOpenEnd = std::numeric_limits<double>::infinity();

// Sixteenth-note resolution: a quarter note spans four steps
constexpr double kStepsPerQuarterNote = 4.0;
constexpr double kMsPerMinute = 60000.0;

struct TimeSignature {
    int numerator = 4;
    int denominator = 4;

    /** Beats are counted in quarter notes whatever the denominator */
    double getStepsPerBeat() const {
        return kStepsPerQuarterNote;
    }

    /** numerator * 4 * (4 / denominator) */
    double getStepsPerBar() const {
        return numerator * kStepsPerQuarterNote * (4.0 / denominator);
    }

    /** Beats started within one bar; the last one is shorter when the bar is not whole quarters */
    int getBeatsInBar() const {
        return static_cast<int>(std::ceil(getStepsPerBar() / kStepsPerQuarterNote - 1e-9));
    }

    bool operator==(const TimeSignature& other) const {
        return numerator == other.numerator && denominator == other.denominator;
    }
    bool operator!=(const TimeSignature& other) const {
        return !(*this == other);
    }
};

struct TempoRegion {
    double startStep = 0.0;
    double endStep = kOpenEnd;
    double bpm = 120.0;

    bool isOpenEnded() const {
        return endStep == kOpenEnd;
    }
};

struct TimeSignatureRegion {
    double startStep = 0.0;
    double endStep = kOpenEnd;
    int numerator = 4;
    int denominator = 4;

    TimeSignature getTimeSignature() const {
        return {numerator, denominator};
    }
    bool isOpenEnded() const {
        return endStep == kOpenEnd;
    }
};

/**
 * @brief Musical position; bar and beat are 0-indexed, subdivision is the
 * step offset inside the beat (fractional for fractional steps)
 */
struct BarBeatPosition {
    int bar = 0;
    int beat = 0;
    double subdivision = 0.0;
    TimeSignature timeSignature;
};

/**
 * @brief A bar or beat line produced for a renderer
 */
struct GridLine {
    double position = 0.0;
    TimeSignature timeSignature;
};

enum class MarkerType { Section, Loop, Bookmark, Arrangement };

struct TimelineMarker {
    MarkerId id = INVALID_MARKER_ID;
    double position = 0.0;
    std::string name;
    MarkerType type = MarkerType::Bookmark;
};

}  // namespace cadence
