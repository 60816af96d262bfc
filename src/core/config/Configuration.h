// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Configuration.h
 * @brief Immutable matrix/animation configuration snapshot
 *
 * A Configuration is a plain value. It is never mutated once published by
 * ConfigStore; a control-plane change builds a new value and replaces the
 * active snapshot wholesale.
 *
 * Fields fall into three groups:
 * - Tone: brightness, gamma (applied by the driver via lookup tables)
 * - Geometry: width, height, wiring (index map inputs)
 * - Backend: selection plus chain/parallel/depth/slowdown/pulse/refresh
 *
 * Changing any backend-affecting field (see affectsBackend()) forces the
 * conductor to shut the driver down and rebuild it between frames.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>

namespace cosmicled {
namespace config {

/**
 * @brief Physical wiring of the pixel rows
 */
enum class WiringMode : uint8_t {
    LINEAR = 0,      ///< Every row runs left-to-right
    SERPENTINE = 1   ///< Odd rows run right-to-left
};

/**
 * @brief Output backend selection (closed set)
 */
enum class BackendType : uint8_t {
    STRIP = 0,       ///< Addressable strip (WS2811/WS2812 via FastLED)
    PANEL = 1,       ///< HUB75 scan panel (I2S DMA, double-buffered)
    SIMULATION = 2   ///< In-memory sink, no hardware
};

/**
 * @brief Backend-specific parameters
 *
 * Only the panel backend consumes chain/parallel/depth/slowdown/pulse/refresh.
 * The strip backend runs 8-bit channels and ignores the rest.
 */
struct BackendParams {
    int32_t chainLength = 1;        ///< Panels daisy-chained horizontally
    int32_t parallelChains = 1;     ///< Chains stacked vertically
    int32_t colorDepthBits = 8;     ///< Output PWM depth per channel
    int32_t slowdown = 0;           ///< Timing slowdown (0 = fastest clock)
    bool hardwarePulse = false;     ///< Request the dedicated pulse timing mode
    int32_t refreshCapHz = 0;       ///< Refresh cap (0 = uncapped; must be 0 for the panel)

    bool operator==(const BackendParams& other) const {
        return chainLength == other.chainLength &&
               parallelChains == other.parallelChains &&
               colorDepthBits == other.colorDepthBits &&
               slowdown == other.slowdown &&
               hardwarePulse == other.hardwarePulse &&
               refreshCapHz == other.refreshCapHz;
    }
    bool operator!=(const BackendParams& other) const { return !(*this == other); }
};

/**
 * @brief Complete configuration snapshot
 *
 * Integer fields are signed 32-bit so a settings document can carry any
 * out-of-range value through to validate() instead of failing to decode.
 */
struct Configuration {
    // Timing
    int32_t targetFps = 15;

    // Tone
    float brightness = 0.5f;        ///< 0.0 - 1.0
    float gamma = 2.2f;             ///< > 0

    // Geometry
    int32_t width = 10;
    int32_t height = 10;
    WiringMode wiring = WiringMode::SERPENTINE;

    // Backend
    BackendType backend = BackendType::STRIP;
    BackendParams params;

    // Animation tuning (read by plugins through RenderContext)
    float speed = 1.0f;
    float scale = 1.0f;
    float intensity = 1.0f;
    int32_t paletteIndex = 0;

    /**
     * @brief Pixel count for the active geometry
     */
    uint32_t pixelCount() const {
        return static_cast<uint32_t>(width) * static_cast<uint32_t>(height);
    }

    /**
     * @brief Frame interval in microseconds
     */
    uint32_t frameIntervalUs() const {
        return (targetFps > 0) ? (1000000UL / targetFps) : 1000000UL;
    }

    /**
     * @brief Output channel depth used for the gamma table
     *
     * The strip is always 8-bit. The panel takes 8-bit input and quantizes to
     * colorDepthBits in the driver, so its table depth is capped at 8.
     */
    uint8_t outputDepthBits() const {
        if (backend == BackendType::PANEL && params.colorDepthBits < 8) {
            return static_cast<uint8_t>(params.colorDepthBits);
        }
        return 8;
    }

    /**
     * @brief True if switching from this to other requires a driver rebuild
     */
    bool affectsBackend(const Configuration& other) const {
        return backend != other.backend ||
               width != other.width ||
               height != other.height ||
               params != other.params;
    }

    bool operator==(const Configuration& other) const;
    bool operator!=(const Configuration& other) const { return !(*this == other); }

    /// Default: 10x10 serpentine strip at 15 FPS
    static Configuration stripPreset();

    /// 64x64 progressive HUB75 panel at 30 FPS, 11-bit PWM, slowdown 4
    static Configuration panelPreset();
};

// ============================================================================
// Validation
// ============================================================================

static constexpr size_t MAX_ERROR_MSG = 128;

enum class ConfigStatus : uint8_t {
    OK = 0,
    INVALID = 1     ///< Rejected; the active snapshot is unchanged
};

/**
 * @brief Outcome of validate() / ConfigStore::replace()
 */
struct ConfigResult {
    ConfigStatus status;
    const char* field;              ///< Offending key, nullptr when OK
    char errorMsg[MAX_ERROR_MSG];

    ConfigResult() : status(ConfigStatus::OK), field(nullptr) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }

    bool ok() const { return status == ConfigStatus::OK; }
};

/**
 * @brief Check every invariant and documented bound
 *
 * Range problems are reported here and never clamped silently.
 */
ConfigResult validate(const Configuration& cfg);

// ============================================================================
// Name helpers (schema strings)
// ============================================================================

const char* wiringName(WiringMode mode);
const char* backendName(BackendType backend);
bool parseWiring(const char* name, WiringMode& out);
bool parseBackend(const char* name, BackendType& out);

} // namespace config
} // namespace cosmicled
