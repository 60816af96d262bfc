/**
 * @file ConfigCodec.cpp
 * @brief Settings codec implementation
 */

#include "ConfigCodec.h"

#include <cstdint>
#include <cstdio>

namespace cosmicled {
namespace codec {

// ============================================================================
// Field Readers
// ============================================================================
// Each returns false (and fills errorMsg) on a type mismatch. An absent key
// leaves the output untouched.

static bool readInt(JsonObjectConst root, const char* key, int32_t& out, char* errorMsg) {
    if (!root.containsKey(key)) {
        return true;
    }
    if (!root[key].is<long>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Field '%s' must be an integer", key);
        return false;
    }
    // Saturated, never range-checked here: config::validate() rejects it
    const long value = root[key].as<long>();
    if (value > INT32_MAX) {
        out = INT32_MAX;
    } else if (value < INT32_MIN) {
        out = INT32_MIN;
    } else {
        out = static_cast<int32_t>(value);
    }
    return true;
}

static bool readFloat(JsonObjectConst root, const char* key, float& out, char* errorMsg) {
    if (!root.containsKey(key)) {
        return true;
    }
    if (!root[key].is<float>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Field '%s' must be a number", key);
        return false;
    }
    out = root[key].as<float>();
    return true;
}

static bool readBool(JsonObjectConst root, const char* key, bool& out, char* errorMsg) {
    if (!root.containsKey(key)) {
        return true;
    }
    if (!root[key].is<bool>()) {
        snprintf(errorMsg, MAX_ERROR_MSG, "Field '%s' must be a boolean", key);
        return false;
    }
    out = root[key].as<bool>();
    return true;
}

// ============================================================================
// Decode
// ============================================================================

ConfigDecodeResult ConfigCodec::decode(JsonObjectConst root) {
    return decode(root, config::Configuration::stripPreset());
}

ConfigDecodeResult ConfigCodec::decode(JsonObjectConst root, const config::Configuration& base) {
    ConfigDecodeResult result;
    result.config = base;

    if (root.isNull()) {
        snprintf(result.errorMsg, MAX_ERROR_MSG, "Settings document must be an object");
        return result;
    }

    config::Configuration& cfg = result.config;
    char* err = result.errorMsg;

    // Timing / tone / geometry
    if (!readInt(root, "target_fps", cfg.targetFps, err)) return result;
    if (!readFloat(root, "brightness", cfg.brightness, err)) return result;
    if (!readFloat(root, "gamma", cfg.gamma, err)) return result;
    if (!readInt(root, "width", cfg.width, err)) return result;
    if (!readInt(root, "height", cfg.height, err)) return result;

    if (root.containsKey("wiring")) {
        if (!root["wiring"].is<const char*>()) {
            snprintf(err, MAX_ERROR_MSG, "Field 'wiring' must be a string");
            return result;
        }
        const char* wiring = root["wiring"].as<const char*>();
        if (!config::parseWiring(wiring, cfg.wiring)) {
            snprintf(err, MAX_ERROR_MSG, "Unknown wiring '%s'", wiring);
            return result;
        }
    }

    // Backend
    if (root.containsKey("backend")) {
        if (!root["backend"].is<const char*>()) {
            snprintf(err, MAX_ERROR_MSG, "Field 'backend' must be a string");
            return result;
        }
        const char* backend = root["backend"].as<const char*>();
        if (!config::parseBackend(backend, cfg.backend)) {
            snprintf(err, MAX_ERROR_MSG, "Unknown backend '%s'", backend);
            return result;
        }
    }
    if (!readInt(root, "chain_length", cfg.params.chainLength, err)) return result;
    if (!readInt(root, "parallel_chains", cfg.params.parallelChains, err)) return result;
    if (!readInt(root, "color_depth_bits", cfg.params.colorDepthBits, err)) return result;
    if (!readInt(root, "slowdown", cfg.params.slowdown, err)) return result;
    if (!readBool(root, "hardware_pulse", cfg.params.hardwarePulse, err)) return result;
    if (!readInt(root, "refresh_cap_hz", cfg.params.refreshCapHz, err)) return result;

    // Animation tuning
    if (!readFloat(root, "speed", cfg.speed, err)) return result;
    if (!readFloat(root, "scale", cfg.scale, err)) return result;
    if (!readFloat(root, "intensity", cfg.intensity, err)) return result;
    if (!readInt(root, "palette", cfg.paletteIndex, err)) return result;

    result.success = true;
    return result;
}

// ============================================================================
// Encode
// ============================================================================

void ConfigCodec::encode(const config::Configuration& cfg, JsonObject& data) {
    data["target_fps"] = cfg.targetFps;
    data["brightness"] = cfg.brightness;
    data["gamma"] = cfg.gamma;
    data["width"] = cfg.width;
    data["height"] = cfg.height;
    data["wiring"] = config::wiringName(cfg.wiring);
    data["backend"] = config::backendName(cfg.backend);
    data["chain_length"] = cfg.params.chainLength;
    data["parallel_chains"] = cfg.params.parallelChains;
    data["color_depth_bits"] = cfg.params.colorDepthBits;
    data["slowdown"] = cfg.params.slowdown;
    data["hardware_pulse"] = cfg.params.hardwarePulse;
    data["refresh_cap_hz"] = cfg.params.refreshCapHz;
    data["speed"] = cfg.speed;
    data["scale"] = cfg.scale;
    data["intensity"] = cfg.intensity;
    data["palette"] = cfg.paletteIndex;
}

} // namespace codec
} // namespace cosmicled
