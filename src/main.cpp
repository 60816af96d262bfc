// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file main.cpp
 * @brief CosmicLED entry points
 *
 * Firmware (Arduino): setup() builds the store, registry and conductor and
 * starts the loop thread; loop() prints the stats document every 5 seconds.
 *
 * Host (NATIVE_BUILD): cosmicled_sim [settings.json] [seconds] [animation]
 * runs the conductor headless on the calling thread and prints the stats
 * document when done.
 */

#include <ArduinoJson.h>

#include "config/features.h"
#include "config/version.h"
#include "core/config/ConfigStore.h"
#include "core/actors/Conductor.h"
#include "plugins/AnimationRegistry.h"
#include "effects/BuiltinAnimations.h"
#include "codec/ConfigCodec.h"
#include "codec/StatsCodec.h"

#ifdef NATIVE_BUILD
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#else
#include <Arduino.h>
#endif

#define CL_LOG_TAG "Main"
#include "utils/Log.h"

using namespace cosmicled;

#ifdef NATIVE_BUILD

// ============================================================================
// Host simulation
// ============================================================================

static constexpr float DEFAULT_RUN_SECONDS = 5.0f;

static bool loadSettings(const char* path, const config::Configuration& base,
                         config::Configuration& out) {
    std::ifstream file(path);
    if (!file) {
        CL_LOGE("Cannot open settings file '%s'", path);
        return false;
    }

    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, file);
    if (err) {
        CL_LOGE("Settings parse error: %s", err.c_str());
        return false;
    }

    // Keys absent from the file keep the simulation defaults
    codec::ConfigDecodeResult decoded = codec::ConfigCodec::decode(doc.as<JsonObjectConst>(), base);
    if (!decoded.success) {
        CL_LOGE("Settings decode error: %s", decoded.errorMsg);
        return false;
    }
    out = decoded.config;
    return true;
}

int main(int argc, char** argv) {
    CL_LOGI("CosmicLED %s (simulation)", COSMICLED_VERSION_STRING);

    config::Configuration initial = config::Configuration::stripPreset();
    initial.backend = config::BackendType::SIMULATION;

    config::ConfigStore store(initial);
    if (argc > 1) {
        config::Configuration loaded;
        if (!loadSettings(argv[1], initial, loaded)) {
            return 1;
        }
        config::ConfigResult result = store.replace(loaded);
        if (!result.ok()) {
            CL_LOGE("Settings rejected: %s", result.errorMsg);
            return 1;
        }
    }

    float seconds = DEFAULT_RUN_SECONDS;
    if (argc > 2) {
        seconds = static_cast<float>(atof(argv[2]));
        if (seconds <= 0.0f) {
            CL_LOGE("Invalid run time '%s'", argv[2]);
            return 1;
        }
    }

    plugins::AnimationRegistry registry;
    effects::registerBuiltinAnimations(registry);

    actors::Conductor conductor(store, registry);
    if (argc > 3 && !conductor.requestAnimation(argv[3])) {
        return 1;
    }

    const uint32_t cycles =
        static_cast<uint32_t>(seconds * store.get()->config.targetFps + 0.5f);
    const uint32_t executed = conductor.runFor(cycles);
    CL_LOGI("Ran %u cycles", static_cast<unsigned>(executed));

    JsonDocument out;
    JsonObject data = out.to<JsonObject>();
    codec::StatsCodec::encode(codec::StatsCodec::collect(conductor), data);
    conductor.stop();

    serializeJsonPretty(out, std::cout);
    std::cout << std::endl;
    return 0;
}

#else

// ============================================================================
// Firmware
// ============================================================================

static config::ConfigStore* s_store = nullptr;
static plugins::AnimationRegistry* s_registry = nullptr;
static actors::Conductor* s_conductor = nullptr;
static uint32_t s_lastStatsMs = 0;

void setup() {
    Serial.begin(115200);
    delay(200);
    CL_LOGI("CosmicLED %s", COSMICLED_VERSION_STRING);

#if FEATURE_HUB75_DMA
    s_store = new config::ConfigStore(config::Configuration::panelPreset());
#else
    s_store = new config::ConfigStore(config::Configuration::stripPreset());
#endif
    s_registry = new plugins::AnimationRegistry();
    effects::registerBuiltinAnimations(*s_registry);

    s_conductor = new actors::Conductor(*s_store, *s_registry);
    if (!s_conductor->start()) {
        CL_LOGE("Conductor failed to start");
    }
}

void loop() {
    const uint32_t now = millis();
    if (now - s_lastStatsMs >= 5000) {
        s_lastStatsMs = now;
        JsonDocument doc;
        JsonObject data = doc.to<JsonObject>();
        codec::StatsCodec::encode(codec::StatsCodec::collect(*s_conductor), data);
        serializeJson(doc, Serial);
        Serial.println();
    }
    delay(100);
}

#endif
