// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file limits.h
 * @brief Single source of truth for system-wide bounds
 *
 * Validation bounds for Configuration, registry sizes and pool sizing.
 * ConfigStore validation, the codecs and the drivers all reference these
 * constants; do not duplicate them elsewhere.
 */

#pragma once

#include <stdint.h>

namespace cosmicled {
namespace limits {

// ============================================================================
// Matrix Geometry
// ============================================================================

constexpr uint16_t MAX_MATRIX_DIMENSION = 256;

/// Upper bound on width * height for any backend
constexpr uint32_t MAX_PIXELS = 16384;

/// Largest strip a single output channel can drive (WS2812 at 800kHz)
constexpr uint16_t MAX_STRIP_LEDS = 2048;

/// Tallest scan panel row group the DMA engine addresses (1/32 scan)
constexpr uint16_t MAX_PANEL_ROWS = 64;

// ============================================================================
// Timing
// ============================================================================

constexpr uint16_t MIN_TARGET_FPS = 1;
constexpr uint16_t MAX_TARGET_FPS = 240;
constexpr uint16_t MAX_REFRESH_CAP_HZ = 1000;

// ============================================================================
// Backend Parameters
// ============================================================================

constexpr uint8_t MAX_CHAIN_LENGTH = 8;
constexpr uint8_t MAX_PARALLEL_CHAINS = 3;
constexpr uint8_t MIN_COLOR_DEPTH_BITS = 1;
constexpr uint8_t MAX_COLOR_DEPTH_BITS = 11;
constexpr uint8_t MAX_SLOWDOWN = 4;

// ============================================================================
// Tone
// ============================================================================

constexpr float MAX_GAMMA = 5.0f;
constexpr float MIN_SPEED = 0.1f;
constexpr float MAX_SPEED = 10.0f;
constexpr float MIN_SCALE = 0.1f;
constexpr float MAX_SCALE = 10.0f;

// ============================================================================
// Registries and Pools
// ============================================================================

/// Maximum number of registered animations
constexpr uint8_t MAX_ANIMATIONS = 32;

/// Maximum animation name length (including terminator)
constexpr uint8_t MAX_ANIMATION_NAME = 32;

/// Frame buffers kept by the pool in steady state
constexpr uint8_t FRAME_POOL_CAPACITY = 3;

/// Distinct gamma tables / index maps retained by the lookup cache
constexpr uint8_t LOOKUP_CACHE_ENTRIES = 4;

} // namespace limits
} // namespace cosmicled
