/**
 * @file ConfigCodec.h
 * @brief JSON codec for the settings document
 *
 * Single canonical location for reading settings JSON into a Configuration.
 * Type mismatches are decode errors; range checks belong to
 * config::validate() and run when the result is handed to ConfigStore.
 *
 * Rule: Only this module reads settings keys. Everything else consumes
 * config::Configuration.
 */

#pragma once

#include <ArduinoJson.h>
#include <stdint.h>
#include <cstddef>
#include <cstring>

#include "../core/config/Configuration.h"

namespace cosmicled {
namespace codec {

static constexpr size_t MAX_ERROR_MSG = 128;

/**
 * @brief Decode result with typed configuration and error
 */
struct ConfigDecodeResult {
    bool success;
    config::Configuration config;
    char errorMsg[MAX_ERROR_MSG];

    ConfigDecodeResult() : success(false) {
        memset(errorMsg, 0, sizeof(errorMsg));
    }
};

class ConfigCodec {
public:
    /**
     * @brief Decode a flat settings object
     *
     * Missing keys keep the stripPreset() defaults, unknown keys are ignored.
     */
    static ConfigDecodeResult decode(JsonObjectConst root);

    /**
     * @brief Decode on top of an existing configuration (partial update)
     */
    static ConfigDecodeResult decode(JsonObjectConst root, const config::Configuration& base);

    /**
     * @brief Write every key of cfg into data
     */
    static void encode(const config::Configuration& cfg, JsonObject& data);
};

} // namespace codec
} // namespace cosmicled
