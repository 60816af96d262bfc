// SPDX-License-Identifier: Apache-2.0
// Copyright 2025-2026 SpectraSynq
/**
 * @file Log.h
 * @brief Unified logging for the CosmicLED animation core
 *
 * Consistent, colored logging with timestamps and component tags.
 *
 * Usage:
 *   #define CL_LOG_TAG "Conductor"
 *   #include "utils/Log.h"
 *
 *   CL_LOGI("Driver live: %ux%u", width, height);
 *   CL_LOGW("Pool overflow (%lu total)", overflows);
 *
 * Output format:
 *   [12345][INFO][Conductor] Driver live: 10x10
 *   [12346][WARN][FrameBufferPool] Pool overflow (1 total)
 */

#pragma once

#include <cstdio>
#include <cstdint>

// ============================================================================
// ANSI Color Constants
// ============================================================================

#define CL_ANSI_RESET      "\033[0m"

#define CL_CLR_GREEN       "\033[1;32m"   // Animation names, plugin switches
#define CL_CLR_YELLOW      "\033[1;33m"   // Driver/DMA diagnostics
#define CL_CLR_RED         "\033[1;31m"
#define CL_CLR_MAGENTA     "\033[1;35m"
#define CL_CLR_GRAY        "\033[0;37m"

#define CL_CLR_ERROR       CL_CLR_RED
#define CL_CLR_WARN        CL_CLR_MAGENTA
#define CL_CLR_INFO        CL_CLR_GREEN
#define CL_CLR_DEBUG       CL_CLR_GRAY

// ============================================================================
// Log Level Configuration
// ============================================================================
// Set via build flags:
//   -D CL_LOG_LEVEL=3   (0=None, 1=Error, 2=Warn, 3=Info, 4=Debug)

#ifndef CL_LOG_LEVEL
    #ifdef NDEBUG
        #define CL_LOG_LEVEL 2
    #else
        #define CL_LOG_LEVEL 3
    #endif
#endif

#define CL_LOG_LEVEL_NONE  0
#define CL_LOG_LEVEL_ERROR 1
#define CL_LOG_LEVEL_WARN  2
#define CL_LOG_LEVEL_INFO  3
#define CL_LOG_LEVEL_DEBUG 4

// ============================================================================
// Platform Detection
// ============================================================================

#ifdef ARDUINO
    #include <Arduino.h>
    #define CL_LOG_MILLIS()    millis()
    #define CL_LOG_PRINTF(...) Serial.printf(__VA_ARGS__)
#else
    // Host builds (simulation, unit tests)
    #include <chrono>
    static inline uint32_t _cl_host_millis() {
        static const auto s_origin = std::chrono::steady_clock::now();
        return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - s_origin).count());
    }
    #define CL_LOG_MILLIS()    _cl_host_millis()
    #define CL_LOG_PRINTF(...) printf(__VA_ARGS__)
#endif

// ============================================================================
// Core Logging Macros
// ============================================================================

#ifndef CL_LOG_TAG
    #define CL_LOG_TAG "CL"
#endif

#define CL_LOG_FORMAT(level_str, level_color, fmt) \
    "[%lu]" level_color "[" level_str "]" CL_ANSI_RESET "[" CL_LOG_TAG "] " fmt "\n"

#if CL_LOG_LEVEL >= CL_LOG_LEVEL_ERROR
    #define CL_LOGE(fmt, ...) \
        CL_LOG_PRINTF(CL_LOG_FORMAT("ERROR", CL_CLR_ERROR, fmt), \
                      (unsigned long)CL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CL_LOGE(fmt, ...) ((void)0)
#endif

#if CL_LOG_LEVEL >= CL_LOG_LEVEL_WARN
    #define CL_LOGW(fmt, ...) \
        CL_LOG_PRINTF(CL_LOG_FORMAT("WARN", CL_CLR_WARN, fmt), \
                      (unsigned long)CL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CL_LOGW(fmt, ...) ((void)0)
#endif

#if CL_LOG_LEVEL >= CL_LOG_LEVEL_INFO
    #define CL_LOGI(fmt, ...) \
        CL_LOG_PRINTF(CL_LOG_FORMAT("INFO", CL_CLR_INFO, fmt), \
                      (unsigned long)CL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CL_LOGI(fmt, ...) ((void)0)
#endif

#if CL_LOG_LEVEL >= CL_LOG_LEVEL_DEBUG
    #define CL_LOGD(fmt, ...) \
        CL_LOG_PRINTF(CL_LOG_FORMAT("DEBUG", CL_CLR_DEBUG, fmt), \
                      (unsigned long)CL_LOG_MILLIS(), ##__VA_ARGS__)
#else
    #define CL_LOGD(fmt, ...) ((void)0)
#endif

// ============================================================================
// Conditional Logging (Throttled)
// ============================================================================
// For logs on the per-frame path (plugin faults, driver retries)
//
// Usage:
//   static uint32_t lastLog = 0;
//   CL_LOG_THROTTLE(lastLog, 1000, CL_LOGW("Plugin fault: %s", name));

#define CL_LOG_THROTTLE(last_var, interval_ms, log_statement) \
    do { \
        uint32_t _now = CL_LOG_MILLIS(); \
        if (_now - (last_var) >= (interval_ms)) { \
            (last_var) = _now; \
            log_statement; \
        } \
    } while(0)
