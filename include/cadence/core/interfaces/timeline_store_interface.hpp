#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "cadence/core/timeline_types.hpp"

namespace cadence {

/**
 * @brief Read interface onto the timeline data (tempo, meter, markers)
 *
 * The TimelineCoordinateSystem consumes the timeline through this interface
 * only. Implementations must return regions sorted ascending, contiguous and
 * covering [0, infinity).
 */
class TimelineStoreInterface {
  public:
    virtual ~TimelineStoreInterface() = default;

    /**
     * @brief Ordered tempo regions; the last one ends at kOpenEnd
     */
    virtual std::vector<TempoRegion> getTempoRegions() const = 0;

    /**
     * @brief Ordered time signature regions; the last one ends at kOpenEnd
     */
    virtual std::vector<TimeSignatureRegion> getTimeSignatureRegions() const = 0;

    /**
     * @brief Tempo in effect at a step position
     */
    virtual double getTempoAt(double step) const = 0;

    /**
     * @brief Nearest marker strictly closer than threshold steps, if any
     */
    virtual std::optional<TimelineMarker> getNearestMarker(double step,
                                                           double threshold) const = 0;

    /**
     * @brief Whether snapping to markers is enabled in the display settings
     */
    virtual bool isSnapToMarkersEnabled() const = 0;

    /**
     * @brief Monotonic counter bumped by every edit; used as a cache key
     */
    virtual uint64_t getRevision() const = 0;
};

}  // namespace cadence
