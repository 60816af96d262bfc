/**
 * @file FrameBuffer.h
 * @brief Pixel buffer type shared by the pool, plugins and drivers
 */

#pragma once

#include <FastLED.h>
#include <memory>
#include <vector>

namespace cosmicled {
namespace render {

/// One full frame, logical row-major order, pre-gamma/pre-brightness
using FrameBuffer = std::vector<CRGB>;

/// Exclusive ownership handle passed pool -> plugin -> driver -> pool
using FrameBufferPtr = std::unique_ptr<FrameBuffer>;

} // namespace render
} // namespace cosmicled
