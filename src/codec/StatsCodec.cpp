/**
 * @file StatsCodec.cpp
 * @brief Stats document encoder
 */

#include "StatsCodec.h"

namespace cosmicled {
namespace codec {

StatsData StatsCodec::collect(const actors::Conductor& conductor) {
    StatsData stats;
    stats.performance = conductor.getPerformance();
    stats.conductor = conductor.getStats();
    stats.pool = conductor.getPoolStats();
    stats.driverFaulted = conductor.isDriverFaulted();
    return stats;
}

void StatsCodec::encode(const StatsData& stats, JsonObject& data) {
    const hardware::PerformanceStats& perf = stats.performance;
    const actors::ConductorStats& loop = stats.conductor;

    JsonObject fps = data["fps"].to<JsonObject>();
    fps["current"] = perf.instantFps;
    fps["average"] = perf.fps;

    data["frame_time_ms"] = perf.avgFrameTimeUs / 1000.0f;
    data["dropped_frames"] = perf.droppedFrames;
    data["frame_count"] = perf.totalFrames;
    data["uptime_s"] = perf.uptimeMs / 1000.0f;
    data["current_program"] = static_cast<const char*>(loop.currentAnimation);
    data["plugin_faults"] = loop.pluginFaults;
    data["pool_overflows"] = stats.pool.overflows;

    JsonObject driver = data["driver"].to<JsonObject>();
    driver["backend"] = config::backendName(loop.backend);
    driver["state"] = hal::driverStateName(loop.driverState);
    driver["faulted"] = stats.driverFaulted;
    driver["pulse_mode"] = loop.capabilities.dedicatedPulse;
    driver["reserved_core"] = loop.capabilities.reservedCore;
}

} // namespace codec
} // namespace cosmicled
