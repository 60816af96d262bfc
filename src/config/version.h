// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file version.h
 * @brief Version constants for the CosmicLED animation core
 *
 * Reported by the stats document and the simulation banner.
 */

#pragma once

#include <stdint.h>

#define COSMICLED_VERSION_MAJOR  1
#define COSMICLED_VERSION_MINOR  0
#define COSMICLED_VERSION_PATCH  0

/**
 * @brief Human-readable version string
 *
 * Overridable via build flag: -D COSMICLED_VERSION_STRING=\"1.0.1-beta\"
 */
#ifndef COSMICLED_VERSION_STRING
#define COSMICLED_VERSION_STRING "1.0.0"
#endif

/// MAJOR*10000 + MINOR*100 + PATCH
#define COSMICLED_VERSION_NUMBER \
    ((uint32_t)(COSMICLED_VERSION_MAJOR * 10000 + COSMICLED_VERSION_MINOR * 100 + COSMICLED_VERSION_PATCH))
