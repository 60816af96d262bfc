/**
 * @file StatsCodec.h
 * @brief JSON encoder for the stats document
 *
 * The core exposes stats as typed snapshots; persisting or serving them is
 * the caller's business. collect() gathers one consistent set of copies from
 * a Conductor, encode() writes the document.
 */

#pragma once

#include <ArduinoJson.h>
#include <stdint.h>

#include "../core/actors/Conductor.h"

namespace cosmicled {
namespace codec {

/**
 * @brief Everything the stats document reports
 */
struct StatsData {
    hardware::PerformanceStats performance;
    actors::ConductorStats conductor;
    render::PoolStats pool;
    bool driverFaulted = false;
};

class StatsCodec {
public:
    /// Copy the current observer snapshots out of the conductor
    static StatsData collect(const actors::Conductor& conductor);

    /**
     * @brief Encode the stats document
     *
     * {
     *   "fps": { "current": 29.8, "average": 30.0 },
     *   "frame_time_ms": 33.3,
     *   "dropped_frames": 0,
     *   "frame_count": 100,
     *   "uptime_s": 3.3,
     *   "current_program": "cosmic",
     *   "plugin_faults": 0,
     *   "pool_overflows": 0,
     *   "driver": { "backend": "strip", "state": "live", "faulted": false,
     *               "pulse_mode": false, "reserved_core": true }
     * }
     */
    static void encode(const StatsData& stats, JsonObject& data);
};

} // namespace codec
} // namespace cosmicled
