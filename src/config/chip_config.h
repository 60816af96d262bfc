/**
 * @file chip_config.h
 * @brief Pin assignments and core layout for the LED controller board
 *
 * All pins are overridable via -D build flags.
 */

#pragma once

#include <cstdint>

namespace chip {

/// Number of CPU cores (ESP32 / ESP32-S3)
constexpr uint8_t CPU_CORES = 2;

/// Core left free of the WiFi/network stack; the conductor pins here
constexpr uint8_t RENDER_CORE = 1;

namespace gpio {

    // Addressable strip data line (WS2812/WS2811 via RMT)
#ifdef CL_STRIP_DATA_PIN
    constexpr uint8_t STRIP_DATA = CL_STRIP_DATA_PIN;
#else
    constexpr uint8_t STRIP_DATA = 12;
#endif

    // Hardware pulse jumper: bridging these two pins enables the panel's
    // dedicated pulse timing mode
#ifdef CL_PULSE_PROBE_OUT
    constexpr uint8_t PULSE_PROBE_OUT = CL_PULSE_PROBE_OUT;
#else
    constexpr uint8_t PULSE_PROBE_OUT = 4;
#endif
#ifdef CL_PULSE_PROBE_IN
    constexpr uint8_t PULSE_PROBE_IN = CL_PULSE_PROBE_IN;
#else
    constexpr uint8_t PULSE_PROBE_IN = 18;
#endif

} // namespace gpio
} // namespace chip
