/**
 * @file RenderContext.h
 * @brief Per-frame inputs handed to animations
 *
 * Built by the conductor once per cycle from the active configuration
 * snapshot. Everything an animation may read is here; animations hold no
 * pointers into it across frames.
 */

#pragma once

#include <cstdint>
#include <FastLED.h>

#include "../../core/render/LookupTables.h"

namespace cosmicled {
namespace plugins {

struct RenderContext {
    // Timing
    uint32_t frameIndex = 0;            ///< Wraps to 0 after 0x7FFFFFFF
    float elapsedSeconds = 0.0f;        ///< Since the conductor started
    float deltaSeconds = 0.0f;          ///< Since the previous frame

    // Geometry
    uint16_t width = 0;
    uint16_t height = 0;

    // Tone (informational; the driver applies both)
    float brightness = 1.0f;
    float gamma = 1.0f;

    // Tuning
    const CRGBPalette16* palette = nullptr;
    float speed = 1.0f;
    float scale = 1.0f;
    float intensity = 1.0f;

    // Lookup table views
    const render::GammaTable* gammaTable = nullptr;
    const render::IndexMap* indexMap = nullptr;

    uint32_t pixelCount() const {
        return static_cast<uint32_t>(width) * static_cast<uint32_t>(height);
    }

    /// Logical (row-major) buffer position of (x, y)
    uint32_t xy(uint16_t x, uint16_t y) const {
        return static_cast<uint32_t>(y) * width + x;
    }

    /// Palette lookup with a [0,1] position
    CRGB paletteColor(float position, uint8_t level = 255) const {
        if (position < 0.0f) position = 0.0f;
        if (position > 1.0f) position = 1.0f;
        const uint8_t index = static_cast<uint8_t>(position * 240.0f);
        if (palette == nullptr) {
            return CRGB(CHSV(index, 255, level));
        }
        return ColorFromPalette(*palette, index, level, LINEARBLEND);
    }
};

} // namespace plugins
} // namespace cosmicled
