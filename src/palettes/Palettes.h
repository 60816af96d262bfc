/**
 * @file Palettes.h
 * @brief Built-in palette table
 *
 * Index-addressed palettes shared by all animations. Configuration stores
 * a palette index; RenderContext carries the resolved CRGBPalette16.
 */

#pragma once

#include <FastLED.h>
#include <stdint.h>

namespace cosmicled {
namespace palettes {

/// Number of built-in palettes (must match the switch in getPalette())
constexpr uint8_t PALETTE_COUNT = 9;

/**
 * @brief Resolve a palette index
 * @param index Palette index; out-of-range falls back to palette 0
 */
CRGBPalette16 getPalette(uint8_t index);

} // namespace palettes
} // namespace cosmicled
