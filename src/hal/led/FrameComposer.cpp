#include "FrameComposer.h"

#include <cmath>

namespace cosmicled {
namespace hal {

void composeFrame(const render::FrameBuffer& frame,
                  const render::GammaTable& gamma,
                  const render::IndexMap& map,
                  uint8_t brightness,
                  CRGB* out) {
    const uint32_t count = map.size();
    for (uint32_t i = 0; i < count; ++i) {
        const CRGB& src = frame[i];
        CRGB px(gamma.apply8(src.r), gamma.apply8(src.g), gamma.apply8(src.b));
        if (brightness != 255) {
            px.nscale8(brightness);
        }
        out[map.physical(i)] = px;
    }
}

uint8_t brightnessTo8(float value) {
    if (!(value > 0.0f)) return 0;   // also catches NaN
    if (value >= 1.0f) return 255;
    return static_cast<uint8_t>(std::lround(value * 255.0f));
}

void recordUpdateTiming(MatrixDriverStats& stats, uint32_t updateUs) {
    stats.frameCount++;
    stats.lastUpdateUs = updateUs;
    if (updateUs > stats.maxUpdateUs) {
        stats.maxUpdateUs = updateUs;
    }
    if (stats.frameCount == 1) {
        stats.avgUpdateUs = updateUs;
    } else {
        stats.avgUpdateUs = (stats.avgUpdateUs * 7 + updateUs) / 8;
    }
}

const char* driverStateName(DriverState state) {
    switch (state) {
        case DriverState::UNINITIALIZED: return "uninitialized";
        case DriverState::LIVE:          return "live";
        case DriverState::DEGRADED:      return "degraded";
        case DriverState::SHUT_DOWN:     return "shut_down";
    }
    return "unknown";
}

const char* driverResultName(DriverResult result) {
    switch (result) {
        case DriverResult::OK:             return "ok";
        case DriverResult::NOT_LIVE:       return "not_live";
        case DriverResult::SIZE_MISMATCH:  return "size_mismatch";
        case DriverResult::HARDWARE_ERROR: return "hardware_error";
    }
    return "unknown";
}

} // namespace hal
} // namespace cosmicled
