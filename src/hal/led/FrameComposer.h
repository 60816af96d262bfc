/**
 * @file FrameComposer.h
 * @brief Shared per-pixel output transform and update timing for drivers
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <FastLED.h>

#include "IMatrixDriver.h"
#include "../../core/render/LookupTables.h"

namespace cosmicled {
namespace hal {

/**
 * @brief Write a logical frame into a physical output array
 *
 * out[map.physical(i)] = scale8(gamma(frame[i]), brightness)
 *
 * @param frame Logical row-major frame (length == map.size())
 * @param gamma Gamma table for the output depth
 * @param map Logical -> physical index map
 * @param brightness Scale applied after gamma (255 = none)
 * @param out Output array of map.size() pixels
 */
void composeFrame(const render::FrameBuffer& frame,
                  const render::GammaTable& gamma,
                  const render::IndexMap& map,
                  uint8_t brightness,
                  CRGB* out);

/// Float brightness (0.0 - 1.0, clamped) to 8-bit
uint8_t brightnessTo8(float value);

/// Monotonic microseconds for update timing
inline uint32_t driverMicros() {
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

/**
 * @brief Record one successful update into driver stats
 */
void recordUpdateTiming(MatrixDriverStats& stats, uint32_t updateUs);

} // namespace hal
} // namespace cosmicled
