// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Configuration.cpp
 * @brief Presets, equality and validation for Configuration
 */

#include "Configuration.h"
#include "../../config/limits.h"
#include "../../palettes/Palettes.h"

#include <cmath>
#include <cstdio>
#include <cstring>

namespace cosmicled {
namespace config {

bool Configuration::operator==(const Configuration& other) const {
    return targetFps == other.targetFps &&
           brightness == other.brightness &&
           gamma == other.gamma &&
           width == other.width &&
           height == other.height &&
           wiring == other.wiring &&
           backend == other.backend &&
           params == other.params &&
           speed == other.speed &&
           scale == other.scale &&
           intensity == other.intensity &&
           paletteIndex == other.paletteIndex;
}

Configuration Configuration::stripPreset() {
    return Configuration();
}

Configuration Configuration::panelPreset() {
    Configuration cfg;
    cfg.targetFps = 30;
    cfg.width = 64;
    cfg.height = 64;
    cfg.wiring = WiringMode::LINEAR;
    cfg.backend = BackendType::PANEL;
    cfg.params.chainLength = 1;
    cfg.params.parallelChains = 1;
    cfg.params.colorDepthBits = 11;
    cfg.params.slowdown = 4;
    cfg.params.hardwarePulse = true;
    cfg.params.refreshCapHz = 0;
    return cfg;
}

// ============================================================================
// Validation
// ============================================================================

namespace {

bool reject(ConfigResult& result, const char* field, const char* fmt, double value) {
    result.status = ConfigStatus::INVALID;
    result.field = field;
    snprintf(result.errorMsg, MAX_ERROR_MSG, fmt, value);
    return false;
}

bool inRange(float v, float lo, float hi) {
    return std::isfinite(v) && v >= lo && v <= hi;
}

} // namespace

ConfigResult validate(const Configuration& cfg) {
    ConfigResult result;

    if (cfg.targetFps < limits::MIN_TARGET_FPS || cfg.targetFps > limits::MAX_TARGET_FPS) {
        reject(result, "target_fps", "target_fps out of range (1-240): %.0f", cfg.targetFps);
        return result;
    }
    if (!inRange(cfg.brightness, 0.0f, 1.0f)) {
        reject(result, "brightness", "brightness out of range (0.0-1.0): %.3f", cfg.brightness);
        return result;
    }
    if (!std::isfinite(cfg.gamma) || cfg.gamma <= 0.0f || cfg.gamma > limits::MAX_GAMMA) {
        reject(result, "gamma", "gamma out of range (0-5]: %.3f", cfg.gamma);
        return result;
    }
    if (cfg.width <= 0 || cfg.width > limits::MAX_MATRIX_DIMENSION) {
        reject(result, "width", "width out of range (1-256): %.0f", cfg.width);
        return result;
    }
    if (cfg.height <= 0 || cfg.height > limits::MAX_MATRIX_DIMENSION) {
        reject(result, "height", "height out of range (1-256): %.0f", cfg.height);
        return result;
    }
    if (cfg.pixelCount() > limits::MAX_PIXELS) {
        reject(result, "height", "width*height exceeds %.0f pixels", limits::MAX_PIXELS);
        return result;
    }
    if (cfg.wiring != WiringMode::LINEAR && cfg.wiring != WiringMode::SERPENTINE) {
        reject(result, "wiring", "unknown wiring mode %.0f", static_cast<int>(cfg.wiring));
        return result;
    }
    if (cfg.backend != BackendType::STRIP && cfg.backend != BackendType::PANEL &&
        cfg.backend != BackendType::SIMULATION) {
        reject(result, "backend", "unknown backend %.0f", static_cast<int>(cfg.backend));
        return result;
    }

    const BackendParams& p = cfg.params;
    if (p.chainLength < 1 || p.chainLength > limits::MAX_CHAIN_LENGTH) {
        reject(result, "chain_length", "chain_length out of range (1-8): %.0f", p.chainLength);
        return result;
    }
    if (p.parallelChains < 1 || p.parallelChains > limits::MAX_PARALLEL_CHAINS) {
        reject(result, "parallel_chains", "parallel_chains out of range (1-3): %.0f", p.parallelChains);
        return result;
    }
    if (p.colorDepthBits < limits::MIN_COLOR_DEPTH_BITS || p.colorDepthBits > limits::MAX_COLOR_DEPTH_BITS) {
        reject(result, "color_depth_bits", "color_depth_bits out of range (1-11): %.0f", p.colorDepthBits);
        return result;
    }
    if (p.slowdown < 0 || p.slowdown > limits::MAX_SLOWDOWN) {
        reject(result, "slowdown", "slowdown out of range (0-4): %.0f", p.slowdown);
        return result;
    }
    if (p.refreshCapHz < 0 || p.refreshCapHz > limits::MAX_REFRESH_CAP_HZ) {
        reject(result, "refresh_cap_hz", "refresh_cap_hz out of range (0-1000): %.0f", p.refreshCapHz);
        return result;
    }

    if (cfg.backend == BackendType::PANEL) {
        // The DMA engine refreshes continuously; the library only offers a
        // refresh floor (min_refresh_rate), so a ceiling cannot be honoured
        if (p.refreshCapHz != 0) {
            reject(result, "refresh_cap_hz", "refresh_cap_hz must be 0 for the panel backend: %.0f",
                   p.refreshCapHz);
            return result;
        }
        if (cfg.width % p.chainLength != 0) {
            reject(result, "chain_length", "width not divisible by chain_length %.0f", p.chainLength);
            return result;
        }
        if (cfg.height % p.parallelChains != 0) {
            reject(result, "parallel_chains", "height not divisible by parallel_chains %.0f", p.parallelChains);
            return result;
        }
        if (cfg.height / p.parallelChains > limits::MAX_PANEL_ROWS) {
            reject(result, "height", "panel rows per chain exceed %.0f", limits::MAX_PANEL_ROWS);
            return result;
        }
    }

    if (!inRange(cfg.speed, limits::MIN_SPEED, limits::MAX_SPEED)) {
        reject(result, "speed", "speed out of range (0.1-10): %.3f", cfg.speed);
        return result;
    }
    if (!inRange(cfg.scale, limits::MIN_SCALE, limits::MAX_SCALE)) {
        reject(result, "scale", "scale out of range (0.1-10): %.3f", cfg.scale);
        return result;
    }
    if (!inRange(cfg.intensity, 0.0f, 1.0f)) {
        reject(result, "intensity", "intensity out of range (0.0-1.0): %.3f", cfg.intensity);
        return result;
    }
    if (cfg.paletteIndex < 0 || cfg.paletteIndex >= palettes::PALETTE_COUNT) {
        reject(result, "palette", "palette index out of range: %.0f", cfg.paletteIndex);
        return result;
    }

    return result;
}

// ============================================================================
// Name helpers
// ============================================================================

const char* wiringName(WiringMode mode) {
    return (mode == WiringMode::SERPENTINE) ? "serpentine" : "linear";
}

const char* backendName(BackendType backend) {
    switch (backend) {
        case BackendType::STRIP:      return "strip";
        case BackendType::PANEL:      return "panel";
        case BackendType::SIMULATION: return "simulation";
    }
    return "unknown";
}

bool parseWiring(const char* name, WiringMode& out) {
    if (name == nullptr) return false;
    if (strcmp(name, "linear") == 0) {
        out = WiringMode::LINEAR;
        return true;
    }
    if (strcmp(name, "serpentine") == 0) {
        out = WiringMode::SERPENTINE;
        return true;
    }
    return false;
}

bool parseBackend(const char* name, BackendType& out) {
    if (name == nullptr) return false;
    if (strcmp(name, "strip") == 0) {
        out = BackendType::STRIP;
        return true;
    }
    if (strcmp(name, "panel") == 0) {
        out = BackendType::PANEL;
        return true;
    }
    if (strcmp(name, "simulation") == 0) {
        out = BackendType::SIMULATION;
        return true;
    }
    return false;
}

} // namespace config
} // namespace cosmicled
