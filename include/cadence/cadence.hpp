#pragma once

/**
 * @file cadence.hpp
 * @brief Main header for the Cadence transport and timeline API
 *
 * Cadence keeps a musical timeline (tempo map, meter map, markers) and a
 * playback transport in step units, one step being a sixteenth note.
 */

#include "cadence/core/interfaces/timeline_store_interface.hpp"
#include "cadence/core/timeline_types.hpp"

/**
 * @brief Current version of Cadence
 */
constexpr const char* CADENCE_VERSION = "1.0.0";
