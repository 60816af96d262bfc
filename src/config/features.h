/**
 * @file features.h
 * @brief Compile-time feature flags for CosmicLED
 *
 * Flags can be overridden via build flags (-D FEATURE_X=0).
 */

#pragma once

// ============================================================================
// Backends
// ============================================================================

// HUB75 scan panel through ESP32-HUB75-MatrixPanel-I2S-DMA.
// When 0 the panel backend drives an in-memory double-buffered canvas.
#ifndef FEATURE_HUB75_DMA
#define FEATURE_HUB75_DMA 0
#endif

// ============================================================================
// Conductor
// ============================================================================

// Pin the conductor thread to the reserved core when the panel probe
// reports one (ESP32 only)
#ifndef FEATURE_CORE_PINNING
#define FEATURE_CORE_PINNING 1
#endif
